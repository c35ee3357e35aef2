/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <algorithm>
#include <stdexcept>
#include <seastar/core/coroutine.hh>
#include <seastar/coroutine/exception.hh>

#include "replication/errors.hh"
#include "stores/s3_store.hh"
#include "utils/http_client_error_processing.hh"
#include "utils/log.hh"
#include "utils/s3/aws_error.hh"
#include "utils/s3/client_helpers/multipart_upload.hh"

using namespace seastar;
using namespace replication;

namespace stores {

static logging::logger s3log("s3_store");

static error_kind kind_of(const aws::aws_error& e) {
    switch (e.get_error_type()) {
    case aws::aws_error_type::NO_SUCH_KEY:
    case aws::aws_error_type::NO_SUCH_BUCKET:
    case aws::aws_error_type::NO_SUCH_UPLOAD:
    case aws::aws_error_type::RESOURCE_NOT_FOUND:
    case aws::aws_error_type::HTTP_NOT_FOUND:
    case aws::aws_error_type::HTTP_MOVED_PERMANENTLY:
        return error_kind::not_found;
    case aws::aws_error_type::ACCESS_DENIED:
    case aws::aws_error_type::INVALID_ACCESS_KEY_ID:
    case aws::aws_error_type::SIGNATURE_DOES_NOT_MATCH:
    case aws::aws_error_type::EXPIRED_TOKEN:
    case aws::aws_error_type::HTTP_FORBIDDEN:
    case aws::aws_error_type::HTTP_UNAUTHORIZED:
        return error_kind::access_denied;
    // The source object was replaced while it was being read.
    case aws::aws_error_type::PRECONDITION_FAILED:
    case aws::aws_error_type::HTTP_PRECONDITION_FAILED:
        return error_kind::non_resumable_stream;
    case aws::aws_error_type::INVALID_ACTION:
    case aws::aws_error_type::INVALID_ARGUMENT:
    case aws::aws_error_type::INVALID_REQUEST:
    case aws::aws_error_type::INVALID_RANGE:
    case aws::aws_error_type::ENTITY_TOO_SMALL:
    case aws::aws_error_type::INVALID_PART:
    case aws::aws_error_type::INVALID_PART_ORDER:
    case aws::aws_error_type::HTTP_BAD_REQUEST:
    case aws::aws_error_type::HTTP_RANGE_NOT_SATISFIABLE:
        return error_kind::invalid_request;
    default:
        return e.is_retryable() ? error_kind::transient : error_kind::io;
    }
}

std::exception_ptr map_s3_error(std::exception_ptr ex) {
    using namespace utils::http;
    return dispatch_exception<std::exception_ptr>(std::move(ex),
        [] (std::exception_ptr e, std::string&&) {
            return e;
        },
        make_handler<replication_error>([] (const replication_error&) {
            return std::current_exception();
        }),
        make_handler<abort_requested_exception>([] (const abort_requested_exception&) {
            return std::current_exception();
        }),
        make_handler<aws::aws_exception>([] (const aws::aws_exception& e) {
            return std::make_exception_ptr(replication_error(kind_of(e.error()), fmt::format("S3 request failed: {}", e.what())));
        }));
}

template <typename T>
static future<T> translated(future<T> f) {
    return f.handle_exception([] (std::exception_ptr ex) {
        return make_exception_future<T>(map_s3_error(std::move(ex)));
    });
}

static sstring unquoted(const sstring& etag) {
    std::string_view v(etag);
    if (v.size() >= 2 && v.front() == '"' && v.back() == '"') {
        v = v.substr(1, v.size() - 2);
    }
    return sstring(v.data(), v.size());
}

static object_info info_of(const s3::object_head& head) {
    object_info info{
        .size = head.size,
        .metadata = head.metadata,
    };
    if (!head.etag.empty()) {
        info.fingerprint = unquoted(head.etag);
    }
    return info;
}

// Reads an object with ranged GETs, keeping one read-ahead window in memory.
// Every read is pinned to the entity tag seen when the object was opened.
class s3_source_stream final : public source_stream {
    shared_ptr<s3::client> _client;
    sstring _object_name;
    sstring _etag;
    object_info _info;
    size_t _read_ahead;
    uint64_t _window_off = 0;
    temporary_buffer<char> _window;

public:
    s3_source_stream(shared_ptr<s3::client> cln, sstring object_name, const s3::object_head& head, size_t read_ahead)
        : _client(std::move(cln))
        , _object_name(std::move(object_name))
        , _etag(head.etag)
        , _info(info_of(head))
        , _read_ahead(read_ahead)
    {}

    const object_info& info() const noexcept override { return _info; }
    bool resumable() const noexcept override { return true; }

    future<temporary_buffer<char>> read(uint64_t offset, size_t len, abort_source* as) override {
        auto size = *_info.size;
        if (offset >= size || len == 0) {
            co_return temporary_buffer<char>();
        }
        if (offset < _window_off || offset >= _window_off + _window.size()) {
            _window = {};
            auto want = std::min<uint64_t>(std::max(len, _read_ahead), size - offset);
            std::optional<sstring> if_match;
            if (!_etag.empty()) {
                if_match = _etag;
            }
            _window = co_await translated(_client->get_object_contiguous(_object_name, s3::range{offset, want}, std::move(if_match), as));
            _window_off = offset;
        }
        auto pos = offset - _window_off;
        co_return _window.share(pos, std::min<size_t>(len, _window.size() - pos));
    }

    future<> close() override {
        _window = {};
        return make_ready_future<>();
    }
};

// Buffers written chunks up to one part and ships full parts as a multipart
// upload. An object that never fills a part goes out with a single PUT.
class s3_object_writer final : public s3::multipart_upload, public object_writer {
    s3::body_buffers _bufs;
    size_t _buffered = 0;
    uint64_t _accepted = 0;
    size_t _part_size;
    unsigned _next_part = 1;
    bool _done = false;

    s3::body_buffers shared_buffers() {
        s3::body_buffers ret;
        ret.reserve(_bufs.size());
        for (auto& b : _bufs) {
            ret.push_back(b.share());
        }
        return ret;
    }

    future<> flush_part(abort_source* as) {
        if (_next_part > s3::aws_maximum_parts) {
            throw replication_error(error_kind::invalid_request, fmt::format("{} needs more than {} parts of {} bytes", _object_name, s3::aws_maximum_parts, _part_size));
        }
        if (!upload_started()) {
            co_await translated(start_upload(as));
        }
        // Buffers are kept until the part is acknowledged, so a failed part
        // goes out again on the next attempt under the same number.
        co_await translated(upload_part(_next_part, shared_buffers(), as));
        _bufs.clear();
        _buffered = 0;
        ++_next_part;
    }

public:
    s3_object_writer(shared_ptr<s3::client> cln, sstring object_name, object_metadata metadata, size_t part_size)
        : multipart_upload(std::move(cln), std::move(object_name), std::move(metadata))
        , _part_size(part_size)
    {}

    future<> write(chunk c, abort_source* as) override {
        if (_done) {
            throw std::logic_error(fmt::format("write to a closed writer of {}", _object_name));
        }
        auto len = c.bytes.size();
        if (c.offset + len > _accepted) {
            if (c.offset != _accepted) {
                throw replication_error(error_kind::invalid_request, fmt::format("chunk at offset {} does not follow offset {}", c.offset, _accepted));
            }
            _bufs.push_back(std::move(c.bytes));
            _buffered += len;
            _accepted += len;
        }
        if (_buffered >= _part_size) {
            co_await flush_part(as);
        }
    }

    future<> finalize(abort_source* as) override {
        if (_done) {
            co_return;
        }
        if (!upload_started() && _next_part == 1) {
            s3log.trace("Writer fallback to plain PUT for {}", _object_name);
            co_await translated(_client->put_object(_object_name, shared_buffers(), _metadata, as));
        } else {
            if (_buffered > 0) {
                co_await flush_part(as);
            }
            co_await translated(finalize_upload(as));
        }
        _bufs.clear();
        _buffered = 0;
        _done = true;
        s3log.debug("Committed {} ({} bytes)", _object_name, _accepted);
    }

    future<> abort() override {
        if (_done) {
            co_return;
        }
        _done = true;
        _bufs.clear();
        _buffered = 0;
        if (upload_started()) {
            s3log.debug("Aborting incomplete multipart upload of {}", _object_name);
            co_await translated(abort_upload());
        }
    }

    size_t buffered_bytes() const noexcept override {
        return _buffered;
    }
};

s3_store::s3_store(store_kind kind, shared_ptr<s3::client> client, s3_store_config cfg)
    : _kind(kind)
    , _client(std::move(client))
    , _cfg(cfg) {
    if (_kind != store_kind::s3 && _kind != store_kind::gcs) {
        throw std::invalid_argument(fmt::format("{} is not an S3 compatible store", _kind));
    }
    if (_cfg.part_size < s3::aws_minimum_part_size) {
        throw std::invalid_argument(fmt::format("part size {} is below the minimum of {}", _cfg.part_size, s3::aws_minimum_part_size));
    }
    if (_cfg.read_ahead == 0) {
        throw std::invalid_argument("read-ahead must be positive");
    }
}

future<std::unique_ptr<source_stream>> s3_store::open(const object_identity& id, abort_source* as) {
    auto name = s3::make_object_name(id.bucket(), id.key());
    auto head = co_await translated(_client->get_object_header(name, as));
    s3log.trace("Opened {}: size={} etag={}", id, head.size, head.etag);
    co_return std::make_unique<s3_source_stream>(_client, std::move(name), head, _cfg.read_ahead);
}

future<probe_result> s3_store::exists(const object_identity& id, const object_info& expected, abort_source* as) {
    auto name = s3::make_object_name(id.bucket(), id.key());
    std::optional<s3::object_head> head;
    try {
        head = co_await translated(_client->get_object_header(std::move(name), as));
    } catch (const replication_error& e) {
        if (e.kind() != error_kind::not_found) {
            throw;
        }
    }
    if (!head) {
        co_return probe_result::absent;
    }
    co_return compare_with_source(info_of(*head), expected);
}

future<std::unique_ptr<object_writer>> s3_store::create_writer(const object_identity& id, const object_info& source, abort_source* as) {
    if (as) {
        as->check();
    }
    auto md = make_replication_metadata(source, fmt::format("{}", id));
    co_return std::make_unique<s3_object_writer>(_client, s3::make_object_name(id.bucket(), id.key()), std::move(md), _cfg.part_size);
}

future<> s3_store::check_health(const sstring& bucket, abort_source* as) {
    return translated(_client->head_bucket(bucket, as));
}

future<> s3_store::close() {
    const auto& rd = _client->read_stats();
    const auto& wr = _client->write_stats();
    s3log.info("{} store at {}: read {} bytes in {} requests ({:.3f}s), wrote {} bytes in {} requests ({:.3f}s)",
               _kind, _client->host(), rd.bytes, rd.ops, rd.duration.count(), wr.bytes, wr.ops, wr.duration.count());
    return _client->close();
}

} // namespace stores
