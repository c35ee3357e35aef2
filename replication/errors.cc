/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <seastar/core/abort_source.hh>
#include <seastar/core/semaphore.hh>
#include <seastar/core/sleep.hh>
#include <seastar/core/timed_out_error.hh>

#include "replication/errors.hh"
#include "utils/http_client_error_processing.hh"

namespace replication {

std::string_view to_string(error_kind kind) noexcept {
    switch (kind) {
    case error_kind::not_found:            return "not_found";
    case error_kind::access_denied:        return "access_denied";
    case error_kind::transient:            return "transient";
    case error_kind::retry_exhausted:      return "retry_exhausted";
    case error_kind::non_resumable_stream: return "non_resumable_stream";
    case error_kind::invalid_request:      return "invalid_request";
    case error_kind::io:                   return "io";
    case error_kind::cancelled:            return "cancelled";
    case error_kind::timeout:              return "timeout";
    case error_kind::internal:             return "internal";
    }
    return "internal";
}

replication_error::replication_error(error_kind kind, const std::string& msg)
    : std::runtime_error(msg)
    , _kind(kind) {
}

retry_exhausted_error::retry_exhausted_error(std::exception_ptr last_error, unsigned attempts)
    : replication_error(error_kind::retry_exhausted, fmt::format("giving up after {} attempts: {}", attempts, describe(last_error)))
    , _last_error(std::move(last_error))
    , _attempts(attempts) {
}

admission_rejected::admission_rejected(unsigned ceiling)
    : std::runtime_error(fmt::format("all {} replication slots are busy, retry later", ceiling)) {
}

error_kind classify(std::exception_ptr ex) noexcept {
    try {
        return utils::http::dispatch_exception<error_kind>(
            std::move(ex),
            [] (std::exception_ptr, std::string&&) { return error_kind::internal; },
            utils::http::make_handler<replication_error>([] (const replication_error& e) { return e.kind(); }),
            utils::http::make_handler<seastar::abort_requested_exception>([] (const seastar::abort_requested_exception&) {
                return error_kind::cancelled;
            }),
            // Waits and sleeps interrupted by an abort source.
            utils::http::make_handler<seastar::semaphore_aborted>([] (const seastar::semaphore_aborted&) { return error_kind::cancelled; }),
            utils::http::make_handler<seastar::sleep_aborted>([] (const seastar::sleep_aborted&) { return error_kind::cancelled; }),
            utils::http::make_handler<seastar::timed_out_error>([] (const seastar::timed_out_error&) { return error_kind::timeout; }));
    } catch (...) {
        return error_kind::internal;
    }
}

std::string describe(std::exception_ptr ex) {
    if (!ex) {
        return "no error";
    }
    try {
        std::rethrow_exception(std::move(ex));
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown exception";
    }
}

} // namespace replication
