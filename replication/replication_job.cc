/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <stdexcept>

#include "replication/replication_job.hh"

namespace replication {

std::string_view to_string(job_status status) noexcept {
    switch (status) {
    case job_status::pending:   return "pending";
    case job_status::probing:   return "probing";
    case job_status::streaming: return "streaming";
    case job_status::skipped:   return "skipped";
    case job_status::succeeded: return "succeeded";
    case job_status::failed:    return "failed";
    }
    return "unknown";
}

bool is_terminal(job_status status) noexcept {
    return status == job_status::skipped || status == job_status::succeeded || status == job_status::failed;
}

static bool transition_allowed(job_status from, job_status to) noexcept {
    switch (from) {
    case job_status::pending:
        return to == job_status::probing || to == job_status::failed;
    case job_status::probing:
        return to == job_status::skipped || to == job_status::streaming || to == job_status::failed;
    case job_status::streaming:
        return to == job_status::succeeded || to == job_status::failed;
    case job_status::skipped:
    case job_status::succeeded:
    case job_status::failed:
        return false;
    }
    return false;
}

replication_job::replication_job(uint64_t id, replication_request request)
    : _id(id)
    , _request(std::move(request)) {
}

void replication_job::transition_to(job_status next) {
    if (!transition_allowed(_status, next)) {
        throw std::logic_error(fmt::format("replication job {}: illegal transition {} -> {}", _id, _status, next));
    }
    _status = next;
    if (is_terminal(next)) {
        _finished = clock::now();
    }
}

void replication_job::fail(error_kind kind, seastar::sstring message) {
    transition_to(job_status::failed);
    _error = kind;
    _error_message = std::move(message);
}

job_result replication_job::result() const {
    auto end = _finished.value_or(clock::now());
    return job_result{
        .job_id = _id,
        .source = _request.source,
        .destination = _request.destination,
        .status = _status,
        .bytes_transferred = _progress.transferred,
        .chunks = _progress.chunks,
        .duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - _created),
        .error = _error,
        .error_message = _error_message,
        .attempts = _attempts,
    };
}

} // namespace replication
