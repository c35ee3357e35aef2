/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <chrono>
#include <ctime>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <seastar/core/abort_source.hh>
#include <seastar/core/shared_ptr.hh>
#include <seastar/core/sstring.hh>
#include <seastar/core/temporary_buffer.hh>
#include <seastar/http/client.hh>
#include <seastar/http/reply.hh>
#include <seastar/http/request.hh>

#include "utils/s3/utils/client_utils.hh"

namespace s3 {

using s3_clock = std::chrono::steady_clock;

struct aws_config {
    std::string access_key_id;
    std::string secret_access_key;
    std::string session_token;
    std::string region;
};

struct endpoint_config {
    unsigned port;
    bool use_https;
    // Requests are sent unsigned when there are no credentials.
    std::optional<aws_config> aws;
    std::optional<unsigned> max_connections;
};

using endpoint_config_ptr = seastar::lw_shared_ptr<endpoint_config>;

using object_metadata = std::map<seastar::sstring, seastar::sstring>;

struct object_head {
    uint64_t size = 0;
    // As returned by the service, quotes included.
    seastar::sstring etag;
    std::time_t last_modified = 0;
    object_metadata metadata;
};

seastar::future<> ignore_reply(const seastar::http::reply& rep, seastar::input_stream<char>&& in_);

// Buffers making up one request body.
using body_buffers = std::vector<seastar::temporary_buffer<char>>;

size_t body_size(const body_buffers& bufs) noexcept;

class client : public seastar::enable_shared_from_this<client> {
public:
    struct io_stats {
        uint64_t ops = 0;
        uint64_t bytes = 0;
        std::chrono::duration<double> duration = std::chrono::duration<double>(0);

        void update(uint64_t len, std::chrono::duration<double> lat) {
            ops++;
            bytes += len;
            duration += lat;
        }
    };

private:
    struct private_tag {};

    std::string _host;
    endpoint_config_ptr _cfg;
    seastar::http::experimental::client _http;
    io_stats _read_stats;
    io_stats _write_stats;

    void authorize(seastar::http::request& req);

    friend class multipart_upload;

public:
    client(std::string host, endpoint_config_ptr cfg, private_tag);
    static seastar::shared_ptr<client> make(std::string host, endpoint_config_ptr cfg);

    const std::string& host() const noexcept { return _host; }
    const io_stats& read_stats() const noexcept { return _read_stats; }
    const io_stats& write_stats() const noexcept { return _write_stats; }

    // Sends a signed request. Failures are reported as aws::aws_exception,
    // except for aborts which keep the abort source's exception.
    seastar::future<> make_request(seastar::http::request req,
                                   seastar::http::experimental::client::reply_handler handle,
                                   std::optional<seastar::http::reply::status_type> expected = std::nullopt,
                                   seastar::abort_source* as = nullptr);

    seastar::future<object_head> get_object_header(seastar::sstring object_name, seastar::abort_source* as = nullptr);
    seastar::future<uint64_t> get_object_size(seastar::sstring object_name, seastar::abort_source* as = nullptr);

    // With if_match set the read fails with PreconditionFailed once the
    // object no longer carries that entity tag.
    seastar::future<seastar::temporary_buffer<char>> get_object_contiguous(seastar::sstring object_name,
                                                                            std::optional<range> range = {},
                                                                            std::optional<seastar::sstring> if_match = {},
                                                                            seastar::abort_source* as = nullptr);

    seastar::future<> put_object(seastar::sstring object_name, body_buffers bufs, const object_metadata& metadata = {}, seastar::abort_source* as = nullptr);
    seastar::future<> delete_object(seastar::sstring object_name, seastar::abort_source* as = nullptr);

    seastar::future<> head_bucket(seastar::sstring bucket, seastar::abort_source* as = nullptr);

    seastar::future<> close();
};

} // namespace s3
