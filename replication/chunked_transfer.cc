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

#include "replication/chunked_transfer.hh"
#include "replication/errors.hh"

namespace replication {

static logging::logger tlog("transfer");

chunked_transfer::chunked_transfer(source_stream& source, object_writer& destination, size_t chunk_size, retry_controller& retry, transfer_progress& progress)
    : _source(source)
    , _destination(destination)
    , _chunk_size(chunk_size)
    , _retry(retry)
    , _progress(progress) {
    if (_chunk_size == 0) {
        throw std::invalid_argument("chunk size must be positive");
    }
}

seastar::future<seastar::temporary_buffer<char>> chunked_transfer::read_chunk(uint64_t offset, size_t len, seastar::abort_source& as) {
    if (_source.resumable()) {
        co_return co_await _retry.execute(operation::read_chunk, [this, offset, len, &as] {
            return _source.read(offset, len, &as);
        }, &as);
    }

    // A stream that cannot be repositioned is read exactly once. Retrying it
    // would risk a torn object, so a failure here ends the transfer.
    _retry.count_attempt(operation::read_chunk);
    std::exception_ptr ex;
    try {
        co_return co_await _source.read(offset, len, &as);
    } catch (const replication_error& e) {
        if (!e.is_transient()) {
            throw;
        }
        ex = std::current_exception();
    }
    throw replication_error(error_kind::non_resumable_stream,
            fmt::format("source stream failed at offset {} and cannot be resumed: {}", offset, describe(ex)));
}

seastar::future<> chunked_transfer::copy(seastar::abort_source& as) {
    const auto& info = _source.info();
    _progress.total = info.size;
    uint64_t offset = 0;

    while (true) {
        as.check();

        size_t want = _chunk_size;
        if (info.size) {
            if (offset >= *info.size) {
                break;
            }
            want = std::min<uint64_t>(want, *info.size - offset);
        }

        auto bytes = co_await read_chunk(offset, want, as);
        if (bytes.empty()) {
            if (info.size) {
                throw replication_error(error_kind::non_resumable_stream,
                        fmt::format("source ended at offset {} before its advertised size {}", offset, *info.size));
            }
            break;
        }
        if (bytes.size() > want) {
            bytes.trim(want);
        }

        auto len = bytes.size();
        bool is_final = info.size && offset + len == *info.size;
        _progress.peak_buffered = std::max(_progress.peak_buffered, len + _destination.buffered_bytes());

        co_await _retry.execute(operation::write_chunk, [this, offset, &bytes, is_final, &as] {
            return _destination.write(chunk{offset, bytes.share(), is_final}, &as);
        }, &as);

        _progress.peak_buffered = std::max(_progress.peak_buffered, _destination.buffered_bytes());
        offset += len;
        _progress.transferred = offset;
        ++_progress.chunks;
        tlog.trace("Chunk {} accepted: offset={} size={}", _progress.chunks, offset - len, len);
    }

    as.check();
    co_await _retry.execute(operation::finalize, [this, &as] {
        return _destination.finalize(&as);
    }, &as);
}

seastar::future<> chunked_transfer::run(seastar::abort_source& as) {
    tlog.debug("Starting transfer: size={}, chunk_size={}, policy={}",
               _source.info().size ? fmt::to_string(*_source.info().size) : "unknown", _chunk_size,
               _source.resumable() ? "per-chunk retry" : "single attempt per chunk (non-resumable source)");

    std::exception_ptr ex;
    try {
        co_await copy(as);
    } catch (...) {
        ex = std::current_exception();
    }
    if (ex) {
        tlog.debug("Transfer failed after {} bytes, discarding destination write: {}", _progress.transferred, ex);
        try {
            co_await _destination.abort();
        } catch (...) {
            tlog.warn("Failed to discard incomplete destination write: {}", std::current_exception());
        }
        co_await seastar::coroutine::return_exception_ptr(std::move(ex));
    }
}

} // namespace replication
