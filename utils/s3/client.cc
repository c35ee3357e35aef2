/*
 * Copyright (C) 2022-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <algorithm>
#include <cctype>
#include <fmt/format.h>
#include <exception>
#include <memory>
#include <stdexcept>
#include <strings.h>
#include <seastar/core/coroutine.hh>
#include <seastar/core/future.hh>
#include <seastar/core/iostream.hh>
#include <seastar/core/temporary_buffer.hh>
#include <seastar/coroutine/exception.hh>
#include <seastar/util/short_streams.hh>
#include <seastar/http/request.hh>
#include <seastar/http/exception.hh>
#include <seastar/http/url.hh>
#include "utils/s3/aws_error.hh"
#include "utils/s3/client.hh"
#include "utils/http.hh"
#include "utils/aws_sigv4.hh"
#include "utils/http_client_error_processing.hh"
#include "utils/log.hh"

using namespace seastar;
using namespace std::chrono_literals;

namespace s3 {

static logging::logger s3l("s3");

future<> ignore_reply(const http::reply& rep, input_stream<char>&& in_) {
    auto in = std::move(in_);
    co_await util::skip_entire_stream(in);
}

size_t body_size(const body_buffers& bufs) noexcept {
    size_t ret = 0;
    for (const auto& b : bufs) {
        ret += b.size();
    }
    return ret;
}

client::client(std::string host, endpoint_config_ptr cfg, private_tag)
        : _host(std::move(host))
        , _cfg(std::move(cfg))
        , _http(std::make_unique<utils::http::dns_connection_factory>(_host, _cfg->port, _cfg->use_https, s3l),
                _cfg->max_connections.value_or(16),
                http::experimental::client::retry_requests::no) {
}

shared_ptr<client> client::make(std::string endpoint, endpoint_config_ptr cfg) {
    return seastar::make_shared<client>(std::move(endpoint), std::move(cfg), private_tag{});
}

void client::authorize(http::request& req) {
    if (!_cfg->aws) {
        return;
    }
    const auto& creds = *_cfg->aws;

    auto time_point_str = utils::aws::format_time_point(std::chrono::system_clock::now());
    auto time_point_st = time_point_str.substr(0, 8);
    req._headers["x-amz-date"] = time_point_str;
    req._headers["x-amz-content-sha256"] = sstring(utils::aws::unsigned_content.data(), utils::aws::unsigned_content.size());
    if (!creds.session_token.empty()) {
        req._headers["x-amz-security-token"] = creds.session_token;
    }
    std::map<std::string_view, std::string_view> signed_headers;
    sstring signed_headers_list = "";
    // AWS requires all x-... and Host: headers to be signed
    signed_headers["host"] = req._headers["Host"];
    for (const auto& [name, value] : req._headers) {
        if (name.starts_with("x-")) {
            signed_headers[name] = value;
        }
    }
    unsigned header_nr = signed_headers.size();
    for (const auto& h : signed_headers) {
        signed_headers_list += seastar::format("{}{}", h.first, header_nr == 1 ? "" : ";");
        header_nr--;
    }
    sstring query_string = "";
    std::map<std::string_view, std::string_view> query_parameters;
    for (const auto& q : req.query_parameters) {
        query_parameters[q.first] = q.second;
    }
    unsigned query_nr = query_parameters.size();
    for (const auto& q : query_parameters) {
        query_string += seastar::format("{}={}{}", http::internal::url_encode(q.first), http::internal::url_encode(q.second), query_nr == 1 ? "" : "&");
        query_nr--;
    }
    auto sig = utils::aws::get_signature(
        creds.secret_access_key,
        req._url, req._method,
        signed_headers_list, signed_headers,
        utils::aws::unsigned_content,
        creds.region, "s3", query_string);
    req._headers["Authorization"] = seastar::format("AWS4-HMAC-SHA256 Credential={}/{}/{}/s3/aws4_request,SignedHeaders={},Signature={}", creds.access_key_id, time_point_st, creds.region, signed_headers_list, sig);
}

// Everything that fails a request leaves this client as an aws_exception, so
// callers deal with a single error type. Aborts are the exception to the
// rule, they keep their own type.
static std::exception_ptr map_s3_client_exception(std::exception_ptr ex, abort_source* as) {
    if (as && as->abort_requested()) {
        return ex;
    }
    using namespace utils::http;
    return dispatch_exception<std::exception_ptr>(std::move(ex),
        [] (std::exception_ptr e, std::string&& original_message) {
            return std::make_exception_ptr(aws::aws_exception(aws::aws_error(aws::aws_error_type::UNKNOWN,
                    original_message.empty() ? fmt::format("{}", e) : std::move(original_message), aws::retryable::no)));
        },
        make_handler<aws::aws_exception>([] (const aws::aws_exception&) {
            return std::current_exception();
        }),
        make_handler<abort_requested_exception>([] (const abort_requested_exception&) {
            return std::current_exception();
        }),
        make_handler<httpd::unexpected_status_error>([] (const httpd::unexpected_status_error& e) {
            return std::make_exception_ptr(aws::aws_exception(aws::aws_error::from_http_code(e.status())));
        }),
        make_handler<std::system_error>([] (const std::system_error& e) {
            return std::make_exception_ptr(aws::aws_exception(aws::aws_error::from_system_error(e)));
        }));
}

future<> client::make_request(http::request req, http::experimental::client::reply_handler handle, std::optional<http::reply::status_type> expected, seastar::abort_source* as) {
    // The http client does not check the abort source on entry, and if
    // we're already aborted when we get here we will paradoxally not be
    // interrupted. So do a quick preemptive check.
    if (as && as->abort_requested()) {
        co_await coroutine::return_exception_ptr(as->abort_requested_exception_ptr());
    }
    authorize(req);

    http::experimental::client::reply_handler checked = [handler = std::move(handle), expected = expected.value_or(http::reply::status_type::ok)] (const http::reply& rep, input_stream<char>&& in) mutable -> future<> {
        auto payload = std::move(in);
        auto status_class = http::reply::classify_status(rep._status);

        if (status_class != http::reply::status_class::informational && status_class != http::reply::status_class::success) {
            auto from_status = aws::aws_error::from_http_code(rep._status);
            std::optional<aws::aws_error> possible_error = aws::aws_error::parse(co_await util::read_entire_stream_contiguous(payload));
            if (possible_error && possible_error->get_error_type() != aws::aws_error_type::UNKNOWN) {
                co_await coroutine::return_exception(aws::aws_exception(std::move(possible_error.value())));
            }
            if (possible_error) {
                // Unknown error code, let the status decide whether it is worth retrying
                from_status = aws::aws_error(from_status.get_error_type(), possible_error->get_error_message(), from_status.is_retryable());
            }
            co_await coroutine::return_exception(aws::aws_exception(std::move(from_status)));
        }

        if (rep._status != expected) {
            co_await coroutine::return_exception(httpd::unexpected_status_error(rep._status));
        }
        co_await handler(rep, std::move(payload));
    };

    std::exception_ptr ex;
    try {
        co_await (as ? _http.make_request(std::move(req), std::move(checked), *as, std::nullopt) : _http.make_request(std::move(req), std::move(checked), std::nullopt));
    } catch (...) {
        ex = std::current_exception();
    }
    if (ex) {
        co_await coroutine::return_exception_ptr(map_s3_client_exception(std::move(ex), as));
    }
}

// TODO: possibly move this to seastar's http subsystem.
static std::time_t parse_http_last_modified_time(const sstring& object_name, sstring last_modified) {
    std::tm tm = {0};

    // format conforms to HTTP-date, defined in the specification (RFC 7231).
    if (strptime(last_modified.c_str(), "%a, %d %b %Y %H:%M:%S %Z", &tm) == nullptr) {
        s3l.warn("Unable to parse {} as Last-Modified for {}", last_modified, object_name);
    } else {
        s3l.trace("Successfully parsed {} as Last-modified for {}", last_modified, object_name);
    }
    return timegm(&tm);
}

static constexpr std::string_view metadata_header_prefixes[] = {"x-amz-meta-", "x-goog-meta-"};

static std::optional<sstring> metadata_key_of(std::string_view header) {
    for (auto prefix : metadata_header_prefixes) {
        if (header.size() > prefix.size() && strncasecmp(header.data(), prefix.data(), prefix.size()) == 0) {
            std::string key(header.substr(prefix.size()));
            std::ranges::transform(key, key.begin(), [] (unsigned char c) { return std::tolower(c); });
            return sstring(key.data(), key.size());
        }
    }
    return std::nullopt;
}

future<object_head> client::get_object_header(sstring object_name, seastar::abort_source* as) {
    s3l.trace("HEAD {}", object_name);
    auto req = http::request::make("HEAD", _host, object_name);
    object_head head;
    co_await make_request(std::move(req), [&head, &object_name] (const http::reply& rep, input_stream<char>&& in_) mutable -> future<> {
        head.size = rep.content_length;
        head.etag = rep.get_header("ETag");
        if (auto lm = rep.get_header("Last-Modified"); !lm.empty()) {
            head.last_modified = parse_http_last_modified_time(object_name, std::move(lm));
        }
        for (const auto& [name, value] : rep._headers) {
            if (auto key = metadata_key_of(name)) {
                head.metadata.emplace(std::move(*key), value);
            }
        }
        return make_ready_future<>(); // it's HEAD with no body
    }, http::reply::status_type::ok, as);
    co_return head;
}

future<uint64_t> client::get_object_size(sstring object_name, seastar::abort_source* as) {
    auto head = co_await get_object_header(std::move(object_name), as);
    co_return head.size;
}

future<temporary_buffer<char>> client::get_object_contiguous(sstring object_name, std::optional<range> range, std::optional<sstring> if_match, seastar::abort_source* as) {
    auto req = http::request::make("GET", _host, object_name);
    http::reply::status_type expected = http::reply::status_type::ok;
    if (range) {
        if (range->len == 0) {
            co_return temporary_buffer<char>();
        }
        auto end_bytes = range->off + range->len - 1;
        if (end_bytes < range->off) {
            throw std::overflow_error("End of the range exceeds 64-bits");
        }
        auto range_header = seastar::format("bytes={}-{}", range->off, end_bytes);
        s3l.trace("GET {} contiguous range='{}'", object_name, range_header);
        req._headers["Range"] = std::move(range_header);
        expected = http::reply::status_type::partial_content;
    } else {
        s3l.trace("GET {} contiguous", object_name);
    }
    if (if_match) {
        req._headers["If-Match"] = *if_match;
    }

    size_t off = 0;
    std::optional<temporary_buffer<char>> ret;
    co_await make_request(std::move(req), [this, &off, &ret, &object_name, start = s3_clock::now()] (const http::reply& rep, input_stream<char>&& in_) mutable -> future<> {
        auto in = std::move(in_);
        ret = temporary_buffer<char>(rep.content_length);
        off = 0;
        s3l.trace("Consume {} bytes for {}", ret->size(), object_name);
        co_await in.consume([&off, &ret] (temporary_buffer<char> buf) mutable {
            if (buf.empty()) {
                return make_ready_future<consumption_result<char>>(stop_consuming(std::move(buf)));
            }

            size_t to_copy = std::min(ret->size() - off, buf.size());
            if (to_copy > 0) {
                std::copy_n(buf.get(), to_copy, ret->get_write() + off);
                off += to_copy;
            }
            return make_ready_future<consumption_result<char>>(continue_consuming());
        });
        _read_stats.update(off, s3_clock::now() - start);
    }, expected, as);
    ret->trim(off);
    s3l.trace("Consumed {} bytes of {}", off, object_name);
    co_return std::move(*ret);
}

future<> client::put_object(sstring object_name, body_buffers bufs, const object_metadata& metadata, seastar::abort_source* as) {
    s3l.trace("PUT {}", object_name);
    auto req = http::request::make("PUT", _host, object_name);
    for (const auto& [key, value] : metadata) {
        req._headers[seastar::format("x-amz-meta-{}", key)] = value;
    }
    auto len = body_size(bufs);
    req.write_body("bin", len, [bufs = std::move(bufs)] (output_stream<char>&& out_) -> future<> {
        auto out = std::move(out_);
        std::exception_ptr ex;
        try {
            for (const auto& buf : bufs) {
                co_await out.write(buf.get(), buf.size());
            }
            co_await out.flush();
        } catch (...) {
            ex = std::current_exception();
        }
        co_await out.close();
        if (ex) {
            co_await coroutine::return_exception_ptr(std::move(ex));
        }
    });
    co_await make_request(std::move(req), [this, len, start = s3_clock::now()] (const http::reply& rep, input_stream<char>&& in) {
        _write_stats.update(len, s3_clock::now() - start);
        return ignore_reply(rep, std::move(in));
    }, http::reply::status_type::ok, as);
}

future<> client::delete_object(sstring object_name, seastar::abort_source* as) {
    s3l.trace("DELETE {}", object_name);
    auto req = http::request::make("DELETE", _host, object_name);
    co_await make_request(std::move(req), ignore_reply, http::reply::status_type::no_content, as);
}

future<> client::head_bucket(sstring bucket, seastar::abort_source* as) {
    // see https://docs.aws.amazon.com/AmazonS3/latest/API/API_HeadBucket.html
    s3l.trace("HEAD bucket {}", bucket);
    auto req = http::request::make("HEAD", _host, seastar::format("/{}", bucket));
    co_await make_request(std::move(req), ignore_reply, http::reply::status_type::ok, as);
}

future<> client::close() {
    co_await _http.close();
}

} // s3 namespace
