/*
 * Copyright (C) 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <cmath>
#include <random>
#include <stdexcept>

#include "replication/retry_strategy.hh"
#include "replication/errors.hh"

using namespace std::chrono_literals;

namespace replication {

exponential_backoff_strategy::exponential_backoff_strategy(retry_policy policy)
    : _policy(policy) {
    if (_policy.max_attempts == 0) {
        throw std::invalid_argument("retry policy needs at least one attempt");
    }
    if (_policy.backoff_multiplier < 1.0) {
        throw std::invalid_argument("retry backoff multiplier must not be below 1.0");
    }
}

retryable exponential_backoff_strategy::should_retry(const replication_error& error, unsigned attempts_made) const {
    if (attempts_made >= _policy.max_attempts) {
        return retryable::no;
    }

    return retryable(error.is_transient());
}

std::chrono::milliseconds exponential_backoff_strategy::delay_before_attempt(unsigned attempt) const {
    if (attempt <= 1) {
        return 0ms;
    }

    constexpr auto longest = std::chrono::milliseconds::max();
    auto scale = std::pow(_policy.backoff_multiplier, static_cast<double>(attempt - 2));
    double ms = _policy.base_delay > 0ms ? _policy.base_delay.count() * scale : 0.0;
    // 2^63 is the first double past the range, everything below it rounds in range.
    if (ms >= static_cast<double>(longest.count())) {
        return longest;
    }
    auto delay = std::chrono::milliseconds(static_cast<int64_t>(std::llround(ms)));
    if (_policy.jitter > 0ms) {
        static thread_local std::default_random_engine engine{std::random_device{}()};
        std::uniform_int_distribution<int64_t> extra_dist(0, _policy.jitter.count());
        auto extra = std::chrono::milliseconds(extra_dist(engine));
        if (delay > longest - extra) {
            return longest;
        }
        delay += extra;
    }
    return delay;
}

} // namespace replication
