/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <seastar/core/sstring.hh>

#include "replication/chunked_transfer.hh"
#include "replication/errors.hh"
#include "replication/object_identity.hh"
#include "replication/retry_controller.hh"

namespace replication {

enum class job_status : uint8_t {
    pending,
    probing,
    streaming,
    skipped,
    succeeded,
    failed,
};

std::string_view to_string(job_status status) noexcept;
bool is_terminal(job_status status) noexcept;

struct job_result {
    uint64_t job_id;
    object_identity source;
    object_identity destination;
    job_status status;
    uint64_t bytes_transferred = 0;
    unsigned chunks = 0;
    std::chrono::milliseconds duration{0};
    std::optional<error_kind> error;
    seastar::sstring error_message;
    attempt_counters attempts;
};

// One replication from admission to its single terminal status.
//
//   pending -> probing -> skipped
//                      -> streaming -> succeeded
//   pending | probing | streaming -> failed
//
// Any other transition is a bug and throws std::logic_error.
class replication_job {
    using clock = std::chrono::steady_clock;

    uint64_t _id;
    replication_request _request;
    job_status _status = job_status::pending;
    attempt_counters _attempts;
    transfer_progress _progress;
    std::optional<error_kind> _error;
    seastar::sstring _error_message;
    clock::time_point _created = clock::now();
    std::optional<clock::time_point> _finished;

public:
    replication_job(uint64_t id, replication_request request);

    uint64_t id() const noexcept { return _id; }
    const replication_request& request() const noexcept { return _request; }
    job_status status() const noexcept { return _status; }

    attempt_counters& attempts() noexcept { return _attempts; }
    transfer_progress& progress() noexcept { return _progress; }

    void transition_to(job_status next);
    void fail(error_kind kind, seastar::sstring message);

    job_result result() const;
};

} // namespace replication

template <>
struct fmt::formatter<replication::job_status> : fmt::formatter<std::string_view> {
    auto format(replication::job_status status, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(replication::to_string(status), ctx);
    }
};
