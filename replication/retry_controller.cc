/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <numeric>
#include <seastar/core/sleep.hh>

#include "replication/errors.hh"
#include "replication/retry_controller.hh"

namespace replication {

logging::logger retry_log("retry");

std::string_view to_string(operation op) noexcept {
    switch (op) {
    case operation::open:        return "open";
    case operation::probe:       return "probe";
    case operation::create:      return "create";
    case operation::read_chunk:  return "read_chunk";
    case operation::write_chunk: return "write_chunk";
    case operation::finalize:    return "finalize";
    }
    return "unknown";
}

unsigned attempt_counters::total() const noexcept {
    return std::accumulate(attempts.begin(), attempts.end(), 0u);
}

sleep_function default_sleep() {
    return [] (std::chrono::milliseconds delay, seastar::abort_source* as) {
        if (as) {
            return seastar::sleep_abortable(delay, *as);
        }
        return seastar::sleep(delay);
    };
}

retry_controller::retry_controller(const retry_strategy& strategy, attempt_counters* counters, sleep_function sleep)
    : _strategy(strategy)
    , _counters(counters)
    , _sleep(std::move(sleep)) {
}

std::chrono::milliseconds retry_controller::on_failure(operation op, std::exception_ptr ex, unsigned attempt) const {
    try {
        std::rethrow_exception(ex);
    } catch (const replication_error& e) {
        if (!e.is_transient()) {
            retry_log.debug("{} failed with a non-retryable {} error: {}", op, e.kind(), e.what());
            throw;
        }
        if (!_strategy.should_retry(e, attempt)) {
            retry_log.warn("{} failed after {} attempts: {}", op, attempt, e.what());
            throw retry_exhausted_error(ex, attempt);
        }
        auto delay = _strategy.delay_before_attempt(attempt + 1);
        retry_log.warn("Attempt {}/{} of {} failed: {}. Retrying in {}ms", attempt, _strategy.max_attempts(), op, e.what(), delay.count());
        return delay;
    }
}

} // namespace replication
