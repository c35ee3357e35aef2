/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <utility>
#include <vector>
#include <seastar/core/coroutine.hh>
#include <seastar/testing/test_case.hh>

#include "replication/chunked_transfer.hh"
#include "replication/errors.hh"
#include "test/lib/log.hh"
#include "test/lib/memory_store.hh"
#include "test/lib/random_utils.hh"
#include "test/lib/recording_sleep.hh"

using namespace seastar;
using namespace replication;
using namespace std::chrono_literals;

namespace {

struct transfer_env {
    tests::memory_store src;
    tests::memory_store dst;
    tests::recording_sleep sleeps;
    exponential_backoff_strategy strategy{retry_policy{.max_attempts = 3, .base_delay = 1000ms, .backoff_multiplier = 2.0}};
    attempt_counters counters;
    retry_controller retry{strategy, &counters, sleeps.fn()};
    transfer_progress progress;
    object_identity src_id{store_kind::memory, "source-bucket", "dir/object"};
    object_identity dst_id{store_kind::memory, "target-bucket", "dir/object"};

    explicit transfer_env(std::string data) {
        src.put(src_id.bucket(), src_id.key(), std::move(data));
    }

    future<> run(size_t chunk_size, abort_source& as) {
        auto stream = co_await src.open(src_id, nullptr);
        auto writer = co_await dst.create_writer(dst_id, stream->info(), nullptr);
        chunked_transfer transfer(*stream, *writer, chunk_size, retry, progress);
        std::exception_ptr ex;
        try {
            co_await transfer.run(as);
        } catch (...) {
            ex = std::current_exception();
        }
        co_await stream->close();
        if (ex) {
            std::rethrow_exception(ex);
        }
    }

    future<> run(size_t chunk_size) {
        abort_source as;
        co_await run(chunk_size, as);
    }

    future<std::exception_ptr> run_failing(size_t chunk_size) {
        std::exception_ptr ex;
        try {
            co_await run(chunk_size);
        } catch (...) {
            ex = std::current_exception();
        }
        BOOST_REQUIRE(ex);
        co_return ex;
    }

    const tests::memory_store::stored_object* copy() const {
        return dst.find(dst_id.bucket(), dst_id.key());
    }
};

} // anonymous namespace

SEASTAR_TEST_CASE(test_thirteen_bytes_in_chunks_of_eight) {
    transfer_env env("Hello, World!");
    co_await env.run(8);

    auto* obj = env.copy();
    BOOST_REQUIRE(obj);
    BOOST_REQUIRE_EQUAL(obj->data, "Hello, World!");
    BOOST_REQUIRE_EQUAL(env.progress.chunks, 2);
    BOOST_REQUIRE_EQUAL(env.progress.transferred, 13);
    BOOST_REQUIRE_EQUAL(env.src.calls(operation::read_chunk), 2);
    BOOST_REQUIRE_EQUAL(env.dst.calls(operation::write_chunk), 2);
    BOOST_REQUIRE_EQUAL(env.dst.calls(operation::finalize), 1);
    BOOST_REQUIRE_EQUAL(env.dst.finalized_writes(), 1);
    BOOST_REQUIRE_EQUAL(env.dst.final_chunks(), 1);
    BOOST_REQUIRE(env.sleeps.delays.empty());
}

SEASTAR_TEST_CASE(test_unknown_size_source_ends_on_empty_read) {
    transfer_env env("Hello, World!");
    env.src.set_unknown_size(true);
    co_await env.run(8);

    BOOST_REQUIRE_EQUAL(env.copy()->data, "Hello, World!");
    BOOST_REQUIRE(!env.progress.total);
    BOOST_REQUIRE_EQUAL(env.progress.chunks, 2);
    BOOST_REQUIRE_EQUAL(env.progress.transferred, 13);
    BOOST_REQUIRE_EQUAL(env.src.calls(operation::read_chunk), 3);
    BOOST_REQUIRE_EQUAL(env.dst.calls(operation::write_chunk), 2);
    // The end is only known after the last chunk went out.
    BOOST_REQUIRE_EQUAL(env.dst.final_chunks(), 0);
    BOOST_REQUIRE_EQUAL(env.dst.finalized_writes(), 1);
}

SEASTAR_TEST_CASE(test_unknown_size_empty_source) {
    transfer_env env("");
    env.src.set_unknown_size(true);
    co_await env.run(8);

    BOOST_REQUIRE(env.copy());
    BOOST_REQUIRE(env.copy()->data.empty());
    BOOST_REQUIRE_EQUAL(env.progress.chunks, 0);
    BOOST_REQUIRE_EQUAL(env.src.calls(operation::read_chunk), 1);
    BOOST_REQUIRE_EQUAL(env.dst.calls(operation::write_chunk), 0);
}

SEASTAR_TEST_CASE(test_chunk_operations_and_memory_are_bounded) {
    const std::vector<std::pair<size_t, size_t>> cases = {{1000, 64}, {1024, 64}, {1, 8192}, {8193, 8192}};
    for (auto [size, chunk] : cases) {
        testlog.info("size={} chunk={}", size, chunk);
        transfer_env env(tests::random::get_bytes(size));
        co_await env.run(chunk);

        auto expected_chunks = (size + chunk - 1) / chunk;
        BOOST_REQUIRE_EQUAL(env.progress.chunks, expected_chunks);
        BOOST_REQUIRE_EQUAL(env.src.calls(operation::read_chunk), expected_chunks);
        BOOST_REQUIRE_EQUAL(env.dst.calls(operation::write_chunk), expected_chunks);
        BOOST_REQUIRE_LE(env.progress.peak_buffered, chunk);
        BOOST_REQUIRE(env.copy());
        BOOST_REQUIRE(env.copy()->data == env.src.find(env.src_id.bucket(), env.src_id.key())->data);
    }
}

SEASTAR_TEST_CASE(test_empty_object) {
    transfer_env env("");
    co_await env.run(8);

    BOOST_REQUIRE(env.copy());
    BOOST_REQUIRE(env.copy()->data.empty());
    BOOST_REQUIRE_EQUAL(env.progress.chunks, 0);
    BOOST_REQUIRE_EQUAL(env.dst.calls(operation::write_chunk), 0);
    BOOST_REQUIRE_EQUAL(env.dst.calls(operation::finalize), 1);
}

SEASTAR_TEST_CASE(test_retried_write_does_not_duplicate_data) {
    transfer_env env("0123456789abcdefghij");
    // Second chunk fails once, then goes through.
    env.dst.inject(operation::write_chunk, error_kind::transient, 1, 1);
    co_await env.run(8);

    BOOST_REQUIRE_EQUAL(env.copy()->data, "0123456789abcdefghij");
    BOOST_REQUIRE_EQUAL(env.dst.calls(operation::write_chunk), 4);
    BOOST_REQUIRE_EQUAL(env.counters[operation::write_chunk], 4);
    BOOST_REQUIRE_EQUAL(env.sleeps.delays.size(), 1);
    BOOST_REQUIRE_EQUAL(env.sleeps.delays[0].count(), 1000);
}

SEASTAR_TEST_CASE(test_resumable_source_read_is_retried) {
    transfer_env env("0123456789abcdefghij");
    env.src.inject(operation::read_chunk, error_kind::transient, 2, 2);
    co_await env.run(8);

    BOOST_REQUIRE_EQUAL(env.copy()->data, "0123456789abcdefghij");
    BOOST_REQUIRE_EQUAL(env.counters[operation::read_chunk], 5);
    BOOST_REQUIRE_EQUAL(env.sleeps.delays.size(), 2);
    BOOST_REQUIRE_EQUAL(env.sleeps.delays[0].count(), 1000);
    BOOST_REQUIRE_EQUAL(env.sleeps.delays[1].count(), 2000);
}

SEASTAR_TEST_CASE(test_non_resumable_source_failure_aborts_write) {
    transfer_env env("0123456789abcdefghij");
    env.src.set_resumable(false);
    env.src.inject(operation::read_chunk, error_kind::transient, 1, 1);
    auto ex = co_await env.run_failing(8);

    BOOST_REQUIRE(classify(ex) == error_kind::non_resumable_stream);
    BOOST_REQUIRE_EQUAL(env.src.calls(operation::read_chunk), 2);
    BOOST_REQUIRE_EQUAL(env.counters[operation::read_chunk], 2);
    BOOST_REQUIRE(!env.copy());
    BOOST_REQUIRE_EQUAL(env.dst.aborted_writes(), 1);
    BOOST_REQUIRE_EQUAL(env.dst.finalized_writes(), 0);
    BOOST_REQUIRE(env.sleeps.delays.empty());
}

SEASTAR_TEST_CASE(test_exhausted_write_aborts_destination) {
    transfer_env env("0123456789abcdefghij");
    env.dst.inject(operation::write_chunk, error_kind::transient, std::nullopt);
    auto ex = co_await env.run_failing(8);

    BOOST_REQUIRE(classify(ex) == error_kind::retry_exhausted);
    BOOST_REQUIRE_EQUAL(env.dst.calls(operation::write_chunk), 3);
    BOOST_REQUIRE(!env.copy());
    BOOST_REQUIRE_EQUAL(env.dst.aborted_writes(), 1);
}

SEASTAR_TEST_CASE(test_failed_finalize_leaves_no_object) {
    transfer_env env("0123456789abcdefghij");
    env.dst.inject(operation::finalize, error_kind::access_denied);
    auto ex = co_await env.run_failing(8);

    BOOST_REQUIRE(classify(ex) == error_kind::access_denied);
    BOOST_REQUIRE_EQUAL(env.dst.calls(operation::finalize), 1);
    BOOST_REQUIRE(!env.copy());
    BOOST_REQUIRE_EQUAL(env.dst.aborted_writes(), 1);
}

SEASTAR_TEST_CASE(test_cancelled_transfer_leaves_no_object) {
    transfer_env env(tests::random::get_bytes(100));
    abort_source as;
    as.request_abort();
    std::exception_ptr ex;
    try {
        co_await env.run(8, as);
    } catch (...) {
        ex = std::current_exception();
    }

    BOOST_REQUIRE(classify(ex) == error_kind::cancelled);
    BOOST_REQUIRE_EQUAL(env.dst.calls(operation::write_chunk), 0);
    BOOST_REQUIRE(!env.copy());
    BOOST_REQUIRE_EQUAL(env.dst.aborted_writes(), 1);
}

SEASTAR_TEST_CASE(test_zero_chunk_size_is_refused) {
    transfer_env env("x");
    auto stream = co_await env.src.open(env.src_id, nullptr);
    auto writer = co_await env.dst.create_writer(env.dst_id, stream->info(), nullptr);
    BOOST_REQUIRE_THROW(chunked_transfer(*stream, *writer, 0, env.retry, env.progress), std::invalid_argument);
    co_await stream->close();
}
