/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <csignal>
#include <seastar/core/app-template.hh>
#include <seastar/core/condition-variable.hh>
#include <seastar/core/coroutine.hh>
#include <seastar/core/reactor.hh>
#include <seastar/net/inet_address.hh>

#include "api/api.hh"
#include "api/health.hh"
#include "config/service_config.hh"
#include "replication/orchestrator.hh"
#include "replication/store_registry.hh"
#include "stores/fs_store.hh"
#include "stores/s3_store.hh"
#include "utils/http.hh"
#include "utils/log.hh"
#include "utils/s3/client.hh"

using namespace seastar;

static logging::logger startlog("init");

namespace {

class stop_signal {
    bool _caught = false;
    condition_variable _cond;

    void signaled() {
        if (_caught) {
            return;
        }
        _caught = true;
        _cond.broadcast();
    }

public:
    stop_signal() {
        engine().handle_signal(SIGINT, [this] { signaled(); });
        engine().handle_signal(SIGTERM, [this] { signaled(); });
    }
    ~stop_signal() {
        // There is no way to unregister a handler, so leave harmless ones behind.
        engine().handle_signal(SIGINT, [] {});
        engine().handle_signal(SIGTERM, [] {});
    }
    future<> wait() {
        return _cond.wait([this] { return _caught; });
    }
};

std::string_view masked(const std::string& secret) {
    return secret.empty() ? "<unset>" : "<redacted>";
}

void log_effective_config(const config::service_config& cfg) {
    startlog.info("Replicating {} -> {} (bucket {})", cfg.source_store, cfg.destination_store, cfg.target_bucket);
    startlog.info("chunk_size={} max_retries={} retry_delay={}s retry_backoff={} retry_jitter={}s",
            cfg.chunk_size, cfg.max_retries, cfg.retry_delay, cfg.retry_backoff, cfg.retry_jitter);
    startlog.info("concurrency_ceiling={} admission_policy={} job_timeout={}s multipart_part_size={} health_cache_ttl={}s",
            cfg.concurrency_ceiling, cfg.admission_policy, cfg.job_timeout, cfg.multipart_part_size, cfg.health_cache_ttl);
    startlog.info("aws_access_key_id={} aws_secret_access_key={} aws_session_token={} aws_region={} s3_endpoint={}",
            masked(cfg.aws_access_key_id), masked(cfg.aws_secret_access_key), masked(cfg.aws_session_token), cfg.aws_region, cfg.effective_s3_endpoint());
    startlog.info("gcs_hmac_access_id={} gcs_hmac_secret={} gcs_endpoint={} filesystem_root={}",
            masked(cfg.gcs_hmac_access_id), masked(cfg.gcs_hmac_secret), cfg.gcs_endpoint, cfg.filesystem_root);
}

shared_ptr<s3::client> make_s3_client(const std::string& endpoint, s3::aws_config creds) {
    auto url = utils::http::parse_simple_url(endpoint);
    auto ep = make_lw_shared<s3::endpoint_config>(s3::endpoint_config{
        .port = url.port,
        .use_https = url.is_https(),
        .aws = std::move(creds),
        .max_connections = std::nullopt,
    });
    startlog.debug("S3 client for {}:{} (https={})", url.host, url.port, url.is_https());
    return s3::client::make(url.host, std::move(ep));
}

void add_store(replication::store_registry& stores, replication::store_kind kind, const config::service_config& cfg) {
    if (stores.contains(kind)) {
        return;
    }
    stores::s3_store_config s3cfg{
        .part_size = cfg.multipart_part_size,
    };
    switch (kind) {
    case replication::store_kind::s3:
        stores.emplace<stores::s3_store>(kind, make_s3_client(cfg.effective_s3_endpoint(), s3::aws_config{
            .access_key_id = cfg.aws_access_key_id,
            .secret_access_key = cfg.aws_secret_access_key,
            .session_token = cfg.aws_session_token,
            .region = cfg.aws_region,
        }), s3cfg);
        break;
    case replication::store_kind::gcs:
        // GCS interoperability mode accepts SigV4 signed with HMAC keys and region "auto".
        stores.emplace<stores::s3_store>(kind, make_s3_client(cfg.gcs_endpoint, s3::aws_config{
            .access_key_id = cfg.gcs_hmac_access_id,
            .secret_access_key = cfg.gcs_hmac_secret,
            .session_token = {},
            .region = "auto",
        }), s3cfg);
        break;
    case replication::store_kind::filesystem:
        stores.emplace<stores::fs_store>(cfg.filesystem_root);
        break;
    case replication::store_kind::memory:
        throw std::invalid_argument("the memory store is only available to tests");
    }
}

future<int> serve(const config::service_config& cfg) {
    replication::store_registry stores;
    add_store(stores, cfg.source_kind(), cfg);
    add_store(stores, cfg.destination_kind(), cfg);

    replication::orchestrator orch(cfg.make_orchestrator_config(), stores);
    api::health_checker health(api::health_config{
        .source_kind = cfg.source_kind(),
        .source_bucket = cfg.health_source_bucket,
        .destination_kind = cfg.destination_kind(),
        .destination_bucket = cfg.target_bucket,
        .ttl = cfg.health_ttl(),
    }, stores);
    api::http_context ctx{
        .orch = orch,
        .health = health,
        .source_kind = cfg.source_kind(),
        .destination_kind = cfg.destination_kind(),
        .destination_bucket = cfg.target_bucket,
    };
    api::server srv(ctx);
    stop_signal stop;

    int ret = 0;
    try {
        co_await srv.start(socket_address(net::inet_address(cfg.host), cfg.port));
        startlog.info("Ready to replicate, listening on {}:{}", cfg.host, cfg.port);
        co_await stop.wait();
        startlog.info("Shutting down");
    } catch (...) {
        startlog.error("Startup failed: {}", std::current_exception());
        ret = 1;
    }

    // Handlers wait on their jobs, so those are cancelled before the server
    // drains its connections.
    orch.request_stop();
    co_await srv.stop();
    co_await orch.stop();
    co_await stores.close();
    const auto& stats = orch.stats();
    startlog.info("Jobs: {} succeeded, {} skipped, {} failed, {} rejected; {} bytes transferred",
            stats.succeeded, stats.skipped, stats.failed, stats.rejected, stats.bytes_transferred);
    co_return ret;
}

} // anonymous namespace

int main(int argc, char** argv) {
    app_template::seastar_options opts;
    opts.name = "objrepl";
    opts.description = "Replicates objects between S3, GCS and local filesystem stores on demand.";
    app_template app(std::move(opts));
    config::add_options(app.add_options());

    return app.run(argc, argv, [&app] () -> future<int> {
        config::service_config cfg;
        try {
            cfg = config::load(app.configuration());
        } catch (const config::configuration_error& e) {
            for (const auto& problem : e.problems()) {
                startlog.error("Configuration error: {}", problem);
            }
            co_return 1;
        }
        if (cfg.debug) {
            logging::logger_registry().set_all_loggers_level(logging::log_level::debug);
        }
        log_effective_config(cfg);
        co_return co_await serve(cfg);
    });
}
