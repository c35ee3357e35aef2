/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <seastar/core/abort_source.hh>
#include <seastar/core/coroutine.hh>
#include <seastar/core/timer.hh>

#include "api/health.hh"
#include "replication/errors.hh"
#include "utils/log.hh"

using namespace seastar;

namespace api {

static logging::logger hlog("health");

health_checker::health_checker(health_config cfg, replication::store_registry& stores)
    : _cfg(std::move(cfg))
    , _stores(stores) {
}

future<store_health> health_checker::probe(replication::store_kind kind, sstring bucket) {
    store_health h{
        .kind = kind,
        .bucket = bucket,
    };
    if (bucket.empty()) {
        h.status = "not_checked";
        co_return h;
    }
    abort_source as;
    timer<lowres_clock> deadline([&as] {
        as.request_abort();
    });
    deadline.arm(_cfg.probe_timeout);
    std::exception_ptr ex;
    try {
        co_await _stores.get(kind).check_health(bucket, &as);
    } catch (...) {
        ex = std::current_exception();
    }
    deadline.cancel();
    if (ex) {
        h.status = "unreachable";
        h.error = as.abort_requested() ? sstring("health probe timed out") : sstring(replication::describe(ex));
        hlog.warn("{} bucket {} is unreachable: {}", kind, bucket, h.error);
    } else {
        h.status = "reachable";
    }
    co_return h;
}

future<health_report> health_checker::probe_all() {
    auto source = co_await probe(_cfg.source_kind, _cfg.source_bucket);
    auto destination = co_await probe(_cfg.destination_kind, _cfg.destination_bucket);
    health_report report{
        .source = std::move(source),
        .destination = std::move(destination),
        .timestamp = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count(),
    };
    _cached = report;
    _cached_at = clock::now();
    hlog.debug("Health probed: {}", report.healthy() ? "healthy" : "unhealthy");
    co_return report;
}

future<health_report> health_checker::check() {
    if (_cached && clock::now() - _cached_at < _cfg.ttl) {
        co_return *_cached;
    }
    if (!_probe || _probe->available()) {
        _probe.emplace(probe_all());
    }
    co_return co_await _probe->get_future();
}

} // namespace api
