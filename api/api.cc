/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <optional>
#include <seastar/core/coroutine.hh>
#include <seastar/core/smp.hh>

#include "api/api.hh"
#include "api/json.hh"
#include "replication/errors.hh"
#include "utils/log.hh"

using namespace seastar;

namespace api {

static logging::logger alog("api");

replication::replication_request make_replication_request(const http_context& ctx, const sstring& bucket, const sstring& key) {
    std::string_view dest_key(key);
    while (dest_key.starts_with('/')) {
        dest_key.remove_prefix(1);
    }
    if (dest_key.empty()) {
        throw request_error(http::reply::status_type::bad_request, "validation_error", "Invalid request payload",
                {{"s3_key", {"Invalid value."}}});
    }
    return replication::replication_request{
        .source = replication::object_identity(ctx.source_kind, bucket, key),
        .destination = replication::object_identity(ctx.destination_kind, ctx.destination_bucket, sstring(dest_key.data(), dest_key.size())),
    };
}

static std::unique_ptr<http::reply> json_reply(std::unique_ptr<http::reply> rep, http::reply::status_type status, sstring body) {
    rep->set_status(status);
    rep->write_body("json", std::move(body));
    return rep;
}

// Logs every request and its outcome, and turns exceptions escaping serve()
// into JSON error replies.
class json_handler : public httpd::handler_base {
protected:
    http_context& _ctx;

    virtual future<std::unique_ptr<http::reply>> serve(std::unique_ptr<http::request> req, std::unique_ptr<http::reply> rep) = 0;

public:
    explicit json_handler(http_context& ctx) : _ctx(ctx) {}

    future<std::unique_ptr<http::reply>> handle(const sstring& path, std::unique_ptr<http::request> req, std::unique_ptr<http::reply> rep) override {
        auto method = req->_method;
        auto url = path;
        alog.info("Incoming request: {} {}", method, url);
        std::exception_ptr ex;
        try {
            rep = co_await serve(std::move(req), std::move(rep));
        } catch (...) {
            ex = std::current_exception();
        }
        if (ex) {
            rep = std::make_unique<http::reply>();
            try {
                std::rethrow_exception(ex);
            } catch (const request_error& e) {
                alog.debug("Refused {} {}: {}", method, url, e.what());
                rep = json_reply(std::move(rep), e.status(), error_json(e, now_seconds()));
            } catch (...) {
                alog.error("Unexpected error serving {} {}: {}", method, url, std::current_exception());
                rep = json_reply(std::move(rep), http::reply::status_type::internal_server_error,
                        error_json("internal_server_error", "An unexpected error occurred", now_seconds()));
            }
        }
        alog.info("Response: {} {} {}", method, url, static_cast<int>(rep->_status));
        co_return std::move(rep);
    }
};

class replicate_handler final : public json_handler {
protected:
    future<std::unique_ptr<http::reply>> serve(std::unique_ptr<http::request> req, std::unique_ptr<http::reply> rep) override {
        auto payload = parse_replicate_payload(req->get_header("Content-Type"), req->content);
        auto request = make_replication_request(_ctx, payload.s3_bucket, payload.s3_key);
        alog.debug("Replicating {} to {}", request.source, request.destination);

        auto* ctx = &_ctx;
        std::optional<replication::job_result> result;
        std::optional<std::string> rejected;
        try {
            result = co_await smp::submit_to(0, [ctx, request = std::move(request)] () mutable {
                return ctx->orch.replicate(std::move(request));
            });
        } catch (const replication::admission_rejected& e) {
            rejected = e.what();
        }
        if (rejected) {
            alog.warn("Rejected replication of {}/{}: {}", payload.s3_bucket, payload.s3_key, *rejected);
            rep->add_header("Retry-After", seastar::format("{}", _ctx.retry_after));
            co_return json_reply(std::move(rep), http::reply::status_type::service_unavailable,
                    rejected_json(*rejected, _ctx.retry_after, now_seconds()));
        }
        // The job outcome is in the body, failed jobs included.
        co_return json_reply(std::move(rep), http::reply::status_type::ok, job_result_json(*result, now_seconds()));
    }

public:
    using json_handler::json_handler;
};

class health_handler final : public json_handler {
protected:
    future<std::unique_ptr<http::reply>> serve(std::unique_ptr<http::request>, std::unique_ptr<http::reply> rep) override {
        auto* ctx = &_ctx;
        auto report = co_await smp::submit_to(0, [ctx] {
            return ctx->health.check();
        });
        auto status = report.healthy() ? http::reply::status_type::ok : http::reply::status_type::service_unavailable;
        co_return json_reply(std::move(rep), status, health_json(report, replication::replicator_version()));
    }

public:
    using json_handler::json_handler;
};

class not_found_handler final : public json_handler {
protected:
    future<std::unique_ptr<http::reply>> serve(std::unique_ptr<http::request>, std::unique_ptr<http::reply> rep) override {
        return make_ready_future<std::unique_ptr<http::reply>>(json_reply(std::move(rep), http::reply::status_type::not_found,
                error_json("endpoint_not_found", "The requested endpoint does not exist", now_seconds())));
    }

public:
    using json_handler::json_handler;
};

void set_routes(httpd::routes& r, http_context& ctx) {
    r.put(httpd::operation_type::POST, "/v1/replicate", new replicate_handler(ctx));
    r.put(httpd::operation_type::GET, "/health", new health_handler(ctx));
}

server::server(http_context& ctx)
    : _ctx(ctx)
    , _not_found(std::make_unique<not_found_handler>(ctx)) {
}

future<> server::start(socket_address addr) {
    co_await _http.start("replication-api");
    co_await _http.set_routes([this] (httpd::routes& r) {
        set_routes(r, _ctx);
        r.add_default_handler(_not_found.get());
    });
    co_await _http.listen(addr);
    alog.info("Listening on {}", addr);
}

future<> server::stop() {
    return _http.stop();
}

} // namespace api
