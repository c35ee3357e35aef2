/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <array>
#include <chrono>
#include <exception>
#include <type_traits>
#include <seastar/core/abort_source.hh>
#include <seastar/core/coroutine.hh>
#include <seastar/core/future.hh>
#include <seastar/util/noncopyable_function.hh>

#include "replication/retry_strategy.hh"
#include "utils/log.hh"

namespace replication {

extern logging::logger retry_log;

// Remote operations the retry controller keeps separate attempt counts for.
enum class operation : uint8_t {
    open,
    probe,
    create,
    read_chunk,
    write_chunk,
    finalize,
};

inline constexpr size_t operations_count = 6;

std::string_view to_string(operation op) noexcept;

struct attempt_counters {
    std::array<unsigned, operations_count> attempts{};

    unsigned& operator[](operation op) noexcept { return attempts[static_cast<size_t>(op)]; }
    unsigned operator[](operation op) const noexcept { return attempts[static_cast<size_t>(op)]; }
    unsigned total() const noexcept;
};

using sleep_function = seastar::noncopyable_function<seastar::future<>(std::chrono::milliseconds, seastar::abort_source*)>;

// Sleeps on the reactor clock, waking up early with an exception when `as` is aborted.
sleep_function default_sleep();

class retry_controller {
    const retry_strategy& _strategy;
    attempt_counters* _counters;
    sleep_function _sleep;

    // Decides what to do after attempt number `attempt` of `op` failed with
    // `ex`: returns the delay before the next attempt, or throws the error to
    // surface (the original one, or retry_exhausted_error).
    std::chrono::milliseconds on_failure(operation op, std::exception_ptr ex, unsigned attempt) const;

    template <typename T>
    seastar::future<T> do_execute(operation op, seastar::noncopyable_function<seastar::future<T>()> func, seastar::abort_source* as) {
        unsigned attempt = 0;
        while (true) {
            if (as) {
                as->check();
            }
            ++attempt;
            if (_counters) {
                ++(*_counters)[op];
            }
            std::exception_ptr ex;
            try {
                co_return co_await func();
            } catch (...) {
                ex = std::current_exception();
            }
            auto delay = on_failure(op, std::move(ex), attempt);
            co_await _sleep(delay, as);
        }
    }

public:
    explicit retry_controller(const retry_strategy& strategy, attempt_counters* counters = nullptr, sleep_function sleep = default_sleep());

    // Runs func until it succeeds, fails with an error that is not transient,
    // or the strategy runs out of attempts.
    template <typename Func>
    requires std::is_invocable_v<Func&>
    auto execute(operation op, Func func, seastar::abort_source* as = nullptr) {
        using future_type = std::invoke_result_t<Func&>;
        return do_execute(op, seastar::noncopyable_function<future_type()>(std::move(func)), as);
    }

    // Records an attempt of op made outside execute(), e.g. a single read
    // of a stream that cannot be retried.
    void count_attempt(operation op) noexcept {
        if (_counters) {
            ++(*_counters)[op];
        }
    }

    const retry_strategy& strategy() const noexcept { return _strategy; }
};

} // namespace replication

template <>
struct fmt::formatter<replication::operation> : fmt::formatter<std::string_view> {
    auto format(replication::operation op, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(replication::to_string(op), ctx);
    }
};
