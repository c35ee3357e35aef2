/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <stdexcept>
#include <seastar/core/coroutine.hh>
#include <seastar/core/timer.hh>
#include <seastar/coroutine/exception.hh>

#include "replication/orchestrator.hh"

namespace replication {

static logging::logger olog("replication");

admission_policy admission_policy_from_string(std::string_view name) {
    if (name == "queue") {
        return admission_policy::queue;
    }
    if (name == "reject") {
        return admission_policy::reject;
    }
    throw std::invalid_argument(fmt::format("unknown admission policy '{}'", name));
}

std::string_view to_string(admission_policy policy) noexcept {
    return policy == admission_policy::queue ? "queue" : "reject";
}

orchestrator::orchestrator(orchestrator_config cfg, store_registry& stores, sleep_function sleep)
    : _cfg(std::move(cfg))
    , _stores(stores)
    , _default_retry(_cfg.retry)
    , _sleep(std::move(sleep))
    , _slots(_cfg.concurrency_ceiling)
    , _jobs("replication_jobs") {
    if (_cfg.chunk_size == 0) {
        throw std::invalid_argument("chunk size must be positive");
    }
    if (_cfg.concurrency_ceiling == 0) {
        throw std::invalid_argument("concurrency ceiling must be positive");
    }
}

unsigned orchestrator::in_flight() const noexcept {
    return _cfg.concurrency_ceiling - _slots.available_units();
}

void orchestrator::account(const replication_job& job) {
    switch (job.status()) {
    case job_status::succeeded:
        ++_stats.succeeded;
        break;
    case job_status::skipped:
        ++_stats.skipped;
        break;
    default:
        ++_stats.failed;
        break;
    }
}

seastar::future<> orchestrator::run_job(replication_job& job, retry_controller& retry, seastar::abort_source& as) {
    const auto& source = job.request().source;
    const auto& destination = job.request().destination;

    job.transition_to(job_status::probing);
    auto& source_store = _stores.get(source.kind());
    auto& destination_store = _stores.get(destination.kind());

    auto stream = co_await retry.execute(operation::open, [&] {
        return source_store.open(source, &as);
    }, &as);

    std::exception_ptr ex;
    try {
        const auto& info = stream->info();
        auto probe = co_await retry.execute(operation::probe, [&] {
            return destination_store.exists(destination, info, &as);
        }, &as);
        olog.debug("Job {}: destination {} is {}", job.id(), destination, probe);

        if (probe == probe_result::present_matching) {
            olog.info("Job {}: {} already holds {}, skipping", job.id(), destination, source);
            job.transition_to(job_status::skipped);
        } else {
            job.transition_to(job_status::streaming);
            auto writer = co_await retry.execute(operation::create, [&] {
                return destination_store.create_writer(destination, info, &as);
            }, &as);
            chunked_transfer transfer(*stream, *writer, _cfg.chunk_size, retry, job.progress());
            co_await transfer.run(as);
            job.transition_to(job_status::succeeded);
        }
    } catch (...) {
        ex = std::current_exception();
    }

    try {
        co_await stream->close();
    } catch (...) {
        olog.warn("Job {}: failed to close source stream: {}", job.id(), std::current_exception());
    }
    if (ex) {
        co_await seastar::coroutine::return_exception_ptr(std::move(ex));
    }
}

seastar::future<job_result> orchestrator::replicate(replication_request request, job_options opts) {
    auto holder = _jobs.hold();
    replication_job job(_next_job_id++, std::move(request));
    olog.info("Job {}: replicating {} to {}", job.id(), job.request().source, job.request().destination);

    seastar::abort_source as;
    auto on_parent_abort = [&as] () noexcept {
        if (!as.abort_requested()) {
            as.request_abort();
        }
    };
    auto shutdown_sub = _shutdown.subscribe(on_parent_abort);
    seastar::optimized_optional<seastar::abort_source::subscription> caller_sub;
    if (opts.as) {
        caller_sub = opts.as->subscribe(on_parent_abort);
    }
    if (_shutdown.abort_requested() || (opts.as && opts.as->abort_requested())) {
        on_parent_abort();
    }

    bool timed_out = false;
    seastar::timer<seastar::lowres_clock> deadline([&] {
        timed_out = true;
        olog.warn("Job {}: deadline expired, cancelling", job.id());
        on_parent_abort();
    });
    if (auto timeout = opts.timeout ? opts.timeout : _cfg.job_timeout) {
        deadline.arm(*timeout);
    }

    std::optional<seastar::semaphore_units<>> slot;
    std::exception_ptr ex;
    if (_cfg.admission == admission_policy::reject) {
        slot = seastar::try_get_units(_slots, 1);
        if (!slot) {
            ++_stats.rejected;
            olog.info("Job {}: rejected, {} jobs already in flight", job.id(), in_flight());
            throw admission_rejected(_cfg.concurrency_ceiling);
        }
    } else {
        if (_slots.available_units() <= 0) {
            ++_stats.queued;
            olog.debug("Job {}: queued behind {} in-flight jobs", job.id(), in_flight());
        }
        try {
            slot = co_await seastar::get_units(_slots, 1, as);
        } catch (...) {
            ex = std::current_exception();
        }
    }

    if (!ex) {
        ++_stats.admitted;
        _stats.peak_in_flight = std::max(_stats.peak_in_flight, in_flight());

        std::optional<exponential_backoff_strategy> override_strategy;
        if (opts.retry) {
            override_strategy.emplace(*opts.retry);
        }
        retry_controller retry(override_strategy ? *override_strategy : _default_retry, &job.attempts(),
                [this] (std::chrono::milliseconds delay, seastar::abort_source* sleep_as) {
                    return _sleep(delay, sleep_as);
                });
        try {
            co_await run_job(job, retry, as);
        } catch (...) {
            ex = std::current_exception();
        }
        _stats.bytes_transferred += job.progress().transferred;
        slot.reset();
    }
    deadline.cancel();

    if (ex) {
        auto kind = timed_out ? error_kind::timeout : classify(ex);
        auto message = timed_out ? seastar::sstring("job deadline expired") : seastar::sstring(describe(ex));
        job.fail(kind, message);
        olog.warn("Job {}: failed ({}): {}", job.id(), kind, message);
    } else {
        olog.info("Job {}: {} after {} bytes in {} chunks", job.id(), job.status(), job.progress().transferred, job.progress().chunks);
    }
    account(job);
    co_return job.result();
}

void orchestrator::request_stop() noexcept {
    if (!_shutdown.abort_requested()) {
        olog.info("Stopping, cancelling {} in-flight and {} queued jobs", in_flight(), waiting());
        _shutdown.request_abort();
    }
}

seastar::future<> orchestrator::stop() {
    request_stop();
    co_await _jobs.close();
}

} // namespace replication
