/*
 * Copyright (C) 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <seastar/util/bool_class.hh>

namespace replication {
using retryable = seastar::bool_class<struct is_retryable>;
class replication_error;

struct retry_policy {
    // Total tries, the first one included.
    unsigned max_attempts = 3;
    std::chrono::milliseconds base_delay = std::chrono::milliseconds(1000);
    double backoff_multiplier = 2.0;
    // Upper bound of a uniformly distributed extra delay. Zero keeps the
    // schedule deterministic.
    std::chrono::milliseconds jitter = std::chrono::milliseconds(0);
};

class retry_strategy {
public:
    virtual ~retry_strategy() = default;
    // Returns true if the error can be retried given the error and the number of attempts already made.
    [[nodiscard]] virtual retryable should_retry(const replication_error& error, unsigned attempts_made) const = 0;

    // Time to wait before the given attempt, counting from 1. Attempt 1 is never delayed.
    [[nodiscard]] virtual std::chrono::milliseconds delay_before_attempt(unsigned attempt) const = 0;

    [[nodiscard]] virtual unsigned max_attempts() const = 0;
};

class exponential_backoff_strategy : public retry_strategy {
    retry_policy _policy;

public:
    explicit exponential_backoff_strategy(retry_policy policy = {});

    [[nodiscard]] retryable should_retry(const replication_error& error, unsigned attempts_made) const override;

    // base_delay * backoff_multiplier^(attempt - 2), plus jitter when configured.
    [[nodiscard]] std::chrono::milliseconds delay_before_attempt(unsigned attempt) const override;

    [[nodiscard]] unsigned max_attempts() const override { return _policy.max_attempts; }

    const retry_policy& policy() const noexcept { return _policy; }
};
} // namespace replication
