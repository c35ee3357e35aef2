/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <limits>
#include <stdexcept>
#include <utility>
#include <seastar/core/coroutine.hh>
#include <seastar/testing/test_case.hh>

#include "replication/errors.hh"
#include "replication/retry_controller.hh"
#include "replication/retry_strategy.hh"
#include "test/lib/recording_sleep.hh"

using namespace seastar;
using namespace replication;
using namespace std::chrono_literals;

static retry_policy one_two_policy() {
    return retry_policy{
        .max_attempts = 3,
        .base_delay = 1000ms,
        .backoff_multiplier = 2.0,
    };
}

SEASTAR_TEST_CASE(test_backoff_schedule) {
    exponential_backoff_strategy strategy(one_two_policy());
    BOOST_REQUIRE_EQUAL(strategy.delay_before_attempt(1).count(), 0);
    BOOST_REQUIRE_EQUAL(strategy.delay_before_attempt(2).count(), 1000);
    BOOST_REQUIRE_EQUAL(strategy.delay_before_attempt(3).count(), 2000);
    BOOST_REQUIRE_EQUAL(strategy.delay_before_attempt(4).count(), 4000);

    auto policy = one_two_policy();
    policy.jitter = 250ms;
    exponential_backoff_strategy jittered(policy);
    for (int i = 0; i < 100; ++i) {
        auto d = jittered.delay_before_attempt(3);
        BOOST_REQUIRE_GE(d.count(), 2000);
        BOOST_REQUIRE_LE(d.count(), 2250);
    }

    BOOST_REQUIRE_THROW(exponential_backoff_strategy(retry_policy{.max_attempts = 0}), std::invalid_argument);
    BOOST_REQUIRE_THROW(exponential_backoff_strategy(retry_policy{.backoff_multiplier = 0.5}), std::invalid_argument);
    co_return;
}

SEASTAR_TEST_CASE(test_backoff_saturates_at_longest_delay) {
    constexpr auto longest = std::chrono::milliseconds::max();
    exponential_backoff_strategy strategy(one_two_policy());
    BOOST_REQUIRE_EQUAL(strategy.delay_before_attempt(50).count(), 1000LL << 48);
    BOOST_REQUIRE(strategy.delay_before_attempt(2000) == longest);
    BOOST_REQUIRE(strategy.delay_before_attempt(std::numeric_limits<unsigned>::max()) == longest);

    auto policy = one_two_policy();
    policy.backoff_multiplier = 1e300;
    BOOST_REQUIRE(exponential_backoff_strategy(policy).delay_before_attempt(3) == longest);

    policy = one_two_policy();
    policy.jitter = 250ms;
    BOOST_REQUIRE(exponential_backoff_strategy(policy).delay_before_attempt(2000) == longest);

    policy = one_two_policy();
    policy.base_delay = 0ms;
    BOOST_REQUIRE_EQUAL(exponential_backoff_strategy(policy).delay_before_attempt(2000).count(), 0);
    co_return;
}

SEASTAR_TEST_CASE(test_transient_failures_are_retried_with_backoff) {
    exponential_backoff_strategy strategy(one_two_policy());
    tests::recording_sleep sleeps;
    attempt_counters counters;
    retry_controller retry(strategy, &counters, sleeps.fn());

    unsigned calls = 0;
    auto v = co_await retry.execute(operation::read_chunk, [&calls] {
        if (++calls < 3) {
            return make_exception_future<int>(replication_error(error_kind::transient, "connection reset"));
        }
        return make_ready_future<int>(42);
    });

    BOOST_REQUIRE_EQUAL(v, 42);
    BOOST_REQUIRE_EQUAL(calls, 3);
    BOOST_REQUIRE_EQUAL(counters[operation::read_chunk], 3);
    BOOST_REQUIRE_EQUAL(counters.total(), 3);
    BOOST_REQUIRE_EQUAL(sleeps.delays.size(), 2);
    BOOST_REQUIRE_EQUAL(sleeps.delays[0].count(), 1000);
    BOOST_REQUIRE_EQUAL(sleeps.delays[1].count(), 2000);
}

SEASTAR_TEST_CASE(test_retry_exhaustion) {
    exponential_backoff_strategy strategy(one_two_policy());
    tests::recording_sleep sleeps;
    attempt_counters counters;
    retry_controller retry(strategy, &counters, sleeps.fn());

    std::exception_ptr ex;
    try {
        co_await retry.execute(operation::write_chunk, [] {
            return make_exception_future<>(replication_error(error_kind::transient, "503 Slow Down"));
        });
    } catch (...) {
        ex = std::current_exception();
    }

    BOOST_REQUIRE(ex);
    BOOST_REQUIRE(classify(ex) == error_kind::retry_exhausted);
    try {
        std::rethrow_exception(ex);
    } catch (const retry_exhausted_error& e) {
        BOOST_REQUIRE_EQUAL(e.attempts(), 3);
        BOOST_REQUIRE(classify(e.last_error()) == error_kind::transient);
        BOOST_REQUIRE_NE(std::string(e.what()).find("503 Slow Down"), std::string::npos);
    }
    BOOST_REQUIRE_EQUAL(counters[operation::write_chunk], 3);
    BOOST_REQUIRE_EQUAL(sleeps.delays.size(), 2);
}

SEASTAR_TEST_CASE(test_fatal_errors_are_not_retried) {
    exponential_backoff_strategy strategy(one_two_policy());
    tests::recording_sleep sleeps;

    for (auto kind : {error_kind::not_found, error_kind::access_denied, error_kind::invalid_request, error_kind::io, error_kind::non_resumable_stream}) {
        attempt_counters counters;
        retry_controller retry(strategy, &counters, sleeps.fn());
        std::exception_ptr ex;
        try {
            co_await retry.execute(operation::open, [kind] {
                return make_exception_future<>(replication_error(kind, "fatal"));
            });
        } catch (...) {
            ex = std::current_exception();
        }
        BOOST_REQUIRE(classify(ex) == kind);
        BOOST_REQUIRE_EQUAL(counters[operation::open], 1);
    }

    attempt_counters counters;
    retry_controller retry(strategy, &counters, sleeps.fn());
    std::exception_ptr ex;
    try {
        co_await retry.execute(operation::probe, [] {
            return make_exception_future<>(std::runtime_error("bug"));
        });
    } catch (...) {
        ex = std::current_exception();
    }
    BOOST_REQUIRE(classify(ex) == error_kind::internal);
    BOOST_REQUIRE_EQUAL(counters[operation::probe], 1);
    BOOST_REQUIRE(sleeps.delays.empty());
}

SEASTAR_TEST_CASE(test_counters_are_kept_per_operation) {
    exponential_backoff_strategy strategy(one_two_policy());
    tests::recording_sleep sleeps;
    attempt_counters counters;
    retry_controller retry(strategy, &counters, sleeps.fn());

    // Two reads each failing once: every read gets its own budget.
    for (int i = 0; i < 2; ++i) {
        bool failed = false;
        co_await retry.execute(operation::read_chunk, [&failed] {
            if (!std::exchange(failed, true)) {
                return make_exception_future<>(replication_error(error_kind::transient, "timeout"));
            }
            return make_ready_future<>();
        });
    }
    co_await retry.execute(operation::finalize, [] { return make_ready_future<>(); });

    BOOST_REQUIRE_EQUAL(counters[operation::read_chunk], 4);
    BOOST_REQUIRE_EQUAL(counters[operation::finalize], 1);
    BOOST_REQUIRE_EQUAL(counters[operation::write_chunk], 0);
    BOOST_REQUIRE_EQUAL(sleeps.delays.size(), 2);
    BOOST_REQUIRE_EQUAL(sleeps.delays[0].count(), 1000);
    BOOST_REQUIRE_EQUAL(sleeps.delays[1].count(), 1000);
}

SEASTAR_TEST_CASE(test_abort_stops_retrying) {
    exponential_backoff_strategy strategy(one_two_policy());
    tests::recording_sleep sleeps;
    retry_controller retry(strategy, nullptr, sleeps.fn());
    abort_source as;

    unsigned calls = 0;
    std::exception_ptr ex;
    try {
        co_await retry.execute(operation::read_chunk, [&] {
            ++calls;
            as.request_abort();
            return make_exception_future<>(replication_error(error_kind::transient, "reset"));
        }, &as);
    } catch (...) {
        ex = std::current_exception();
    }
    BOOST_REQUIRE_EQUAL(calls, 1);
    BOOST_REQUIRE(classify(ex) == error_kind::cancelled);
}
