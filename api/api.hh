/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <memory>
#include <seastar/core/future.hh>
#include <seastar/core/sstring.hh>
#include <seastar/http/httpd.hh>
#include <seastar/net/socket_defs.hh>

#include "api/health.hh"
#include "replication/object_identity.hh"
#include "replication/orchestrator.hh"

namespace api {

// State shared by the HTTP handlers of every shard. The orchestrator and the
// health checker live on shard 0 and are only touched there.
struct http_context {
    replication::orchestrator& orch;
    health_checker& health;
    replication::store_kind source_kind;
    replication::store_kind destination_kind;
    seastar::sstring destination_bucket;
    // Seconds suggested to rejected callers.
    unsigned retry_after = 1;
};

replication::replication_request make_replication_request(const http_context& ctx, const seastar::sstring& bucket, const seastar::sstring& key);

void set_routes(seastar::httpd::routes& r, http_context& ctx);

// The HTTP trigger, listening on every shard.
class server {
    http_context& _ctx;
    seastar::httpd::http_server_control _http;
    std::unique_ptr<seastar::httpd::handler_base> _not_found;

public:
    explicit server(http_context& ctx);

    seastar::future<> start(seastar::socket_address addr);
    seastar::future<> stop();
};

} // namespace api
