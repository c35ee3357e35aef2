/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <chrono>
#include <optional>
#include <seastar/core/future.hh>
#include <seastar/core/lowres_clock.hh>
#include <seastar/core/shared_future.hh>
#include <seastar/core/sstring.hh>

#include "replication/store_registry.hh"

namespace api {

struct store_health {
    replication::store_kind kind;
    seastar::sstring bucket;
    // Empty when the store was not probed.
    seastar::sstring status;
    seastar::sstring error;

    bool healthy() const noexcept { return error.empty(); }
};

struct health_report {
    store_health source;
    store_health destination;
    // Seconds since the epoch of the probe that produced this report.
    int64_t timestamp;

    bool healthy() const noexcept { return source.healthy() && destination.healthy(); }
};

struct health_config {
    replication::store_kind source_kind;
    // Empty to skip probing the source store.
    seastar::sstring source_bucket;
    replication::store_kind destination_kind;
    seastar::sstring destination_bucket;
    std::chrono::milliseconds ttl{10000};
    std::chrono::milliseconds probe_timeout{5000};
};

// Probes the control planes of the configured stores and reuses the outcome
// for `ttl`. Concurrent callers share one probe.
class health_checker {
    using clock = seastar::lowres_clock;

    health_config _cfg;
    replication::store_registry& _stores;
    std::optional<health_report> _cached;
    clock::time_point _cached_at;
    std::optional<seastar::shared_future<health_report>> _probe;

    seastar::future<store_health> probe(replication::store_kind kind, seastar::sstring bucket);
    seastar::future<health_report> probe_all();

public:
    health_checker(health_config cfg, replication::store_registry& stores);

    seastar::future<health_report> check();
};

} // namespace api
