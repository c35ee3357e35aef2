/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <chrono>
#include <optional>
#include <seastar/core/abort_source.hh>
#include <seastar/core/future.hh>
#include <seastar/core/gate.hh>
#include <seastar/core/semaphore.hh>

#include "replication/replication_job.hh"
#include "replication/retry_controller.hh"
#include "replication/retry_strategy.hh"
#include "replication/store_registry.hh"

namespace replication {

enum class admission_policy : uint8_t {
    // Wait for a free slot.
    queue,
    // Fail fast with admission_rejected.
    reject,
};

admission_policy admission_policy_from_string(std::string_view name);
std::string_view to_string(admission_policy policy) noexcept;

struct orchestrator_config {
    size_t chunk_size = 8192;
    retry_policy retry;
    unsigned concurrency_ceiling = 4;
    admission_policy admission = admission_policy::queue;
    // Whole-job deadline, admission wait included. Expiry cancels the job.
    std::optional<std::chrono::milliseconds> job_timeout;
};

struct job_options {
    // Replaces the process-wide retry policy for this job only.
    std::optional<retry_policy> retry;
    std::optional<std::chrono::milliseconds> timeout;
    // Caller-side cancellation, e.g. a disconnected client.
    seastar::abort_source* as = nullptr;
};

struct orchestrator_stats {
    uint64_t admitted = 0;
    uint64_t queued = 0;
    uint64_t rejected = 0;
    uint64_t succeeded = 0;
    uint64_t skipped = 0;
    uint64_t failed = 0;
    uint64_t bytes_transferred = 0;
    unsigned peak_in_flight = 0;
};

// Runs replication jobs: probe, then skip or stream, then finalize. At most
// `concurrency_ceiling` jobs are probing or streaming at any time.
class orchestrator {
    orchestrator_config _cfg;
    store_registry& _stores;
    exponential_backoff_strategy _default_retry;
    sleep_function _sleep;
    seastar::semaphore _slots;
    seastar::gate _jobs;
    seastar::abort_source _shutdown;
    uint64_t _next_job_id = 1;
    orchestrator_stats _stats;

    seastar::future<> run_job(replication_job& job, retry_controller& retry, seastar::abort_source& as);
    void account(const replication_job& job);

public:
    orchestrator(orchestrator_config cfg, store_registry& stores, sleep_function sleep = default_sleep());

    // Never retries the job as a whole. Failures of the job are reported in
    // the result; only admission_rejected (and gate_closed_exception after
    // stop()) are thrown.
    seastar::future<job_result> replicate(replication_request request, job_options opts = {});

    // Cancels every running or queued job without waiting. Jobs submitted
    // afterwards fail as cancelled.
    void request_stop() noexcept;

    // Cancels every running or queued job and waits for them to finish.
    seastar::future<> stop();

    const orchestrator_config& config() const noexcept { return _cfg; }
    const orchestrator_stats& stats() const noexcept { return _stats; }
    unsigned in_flight() const noexcept;
    size_t waiting() const noexcept { return _slots.waiters(); }
};

} // namespace replication
