/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <cerrno>
#include <random>
#include <seastar/core/coroutine.hh>
#include <seastar/core/file.hh>
#include <seastar/core/fstream.hh>
#include <seastar/core/seastar.hh>
#include <seastar/coroutine/exception.hh>
#include <seastar/util/file.hh>

#include "replication/errors.hh"
#include "stores/fs_store.hh"
#include "utils/log.hh"

using namespace seastar;
using namespace replication;
namespace fs = std::filesystem;

namespace stores {

static logging::logger fslog("fs_store");

static error_kind kind_of_errno(int code, bool allow_transient) {
    switch (code) {
    case ENOENT:
    case ENOTDIR:
        return error_kind::not_found;
    case EACCES:
    case EPERM:
    case EROFS:
        return error_kind::access_denied;
    case EAGAIN:
    case EINTR:
    case EBUSY:
        return allow_transient ? error_kind::transient : error_kind::io;
    default:
        return error_kind::io;
    }
}

void throw_fs_error(const std::system_error& e, const fs::path& path) {
    throw replication_error(kind_of_errno(e.code().value(), true), fmt::format("{}: {}", path.native(), e.code().message()));
}

// Output streams cannot be retried after a failure, so errors of the writer
// are never reported as transient.
[[noreturn]] static void throw_write_error(const std::system_error& e, const fs::path& path) {
    throw replication_error(kind_of_errno(e.code().value(), false), fmt::format("{}: {}", path.native(), e.code().message()));
}

static void check_component(std::string_view what, const fs::path& p) {
    for (const auto& part : p) {
        if (part == "..") {
            throw replication_error(error_kind::invalid_request, fmt::format("{} '{}' must not contain '..'", what, p.native()));
        }
    }
}

static sstring dump_metadata(const object_metadata& md) {
    sstring out;
    for (const auto& [k, v] : md) {
        out += k + "=" + v + "\n";
    }
    return out;
}

static object_metadata parse_metadata(std::string_view body) {
    object_metadata md;
    while (!body.empty()) {
        auto eol = body.find('\n');
        auto line = body.substr(0, eol);
        body = eol == std::string_view::npos ? std::string_view() : body.substr(eol + 1);
        auto eq = line.find('=');
        if (eq == std::string_view::npos) {
            continue;
        }
        md.emplace(sstring(line.substr(0, eq)), sstring(line.substr(eq + 1)));
    }
    return md;
}

static future<> write_small_file(fs::path path, sstring content) {
    auto f = co_await open_file_dma(path.native(), open_flags::wo | open_flags::create | open_flags::truncate);
    auto out = co_await make_file_output_stream(std::move(f));
    std::exception_ptr ex;
    try {
        co_await out.write(content);
        co_await out.flush();
    } catch (...) {
        ex = std::current_exception();
    }
    co_await out.close();
    if (ex) {
        co_await coroutine::return_exception_ptr(std::move(ex));
    }
}

static sstring fingerprint_of(const stat_data& st) {
    auto mtime = std::chrono::duration_cast<std::chrono::nanoseconds>(st.time_modified.time_since_epoch()).count();
    return fmt::format("{}-{}", st.size, mtime);
}

class fs_source_stream final : public source_stream {
    fs::path _path;
    file _file;
    object_info _info;

public:
    fs_source_stream(fs::path path, file f, object_info info)
        : _path(std::move(path))
        , _file(std::move(f))
        , _info(std::move(info))
    {}

    const object_info& info() const noexcept override { return _info; }
    bool resumable() const noexcept override { return true; }

    future<temporary_buffer<char>> read(uint64_t offset, size_t len, abort_source* as) override {
        if (as) {
            as->check();
        }
        if (_info.size && offset >= *_info.size) {
            co_return temporary_buffer<char>();
        }
        try {
            auto buf = co_await _file.dma_read_bulk<char>(offset, len);
            if (buf.size() > len) {
                buf.trim(len);
            }
            co_return buf;
        } catch (const std::system_error& e) {
            throw_fs_error(e, _path);
        }
    }

    future<> close() override {
        return _file.close();
    }
};

class fs_object_writer final : public object_writer {
    fs::path _path;
    fs::path _staging;
    fs::path _md_path;
    fs::path _md_staging;
    object_metadata _metadata;
    std::optional<output_stream<char>> _out;
    uint64_t _accepted = 0;
    bool _done = false;

public:
    fs_object_writer(fs::path path, fs::path staging, object_metadata md, output_stream<char> out)
        : _path(std::move(path))
        , _staging(std::move(staging))
        , _md_path(fs_store::metadata_path_of(_path))
        , _md_staging(_staging.native() + ".replication")
        , _metadata(std::move(md))
        , _out(std::move(out))
    {}

    future<> write(chunk c, abort_source* as) override {
        if (as) {
            as->check();
        }
        if (_done || !_out) {
            throw std::logic_error(fmt::format("write to a closed writer of {}", _path.native()));
        }
        auto len = c.bytes.size();
        if (c.offset + len <= _accepted) {
            co_return;
        }
        if (c.offset != _accepted) {
            throw replication_error(error_kind::invalid_request, fmt::format("chunk at offset {} does not follow offset {}", c.offset, _accepted));
        }
        try {
            co_await _out->write(c.bytes.get(), len);
        } catch (const std::system_error& e) {
            throw_write_error(e, _staging);
        }
        _accepted += len;
    }

    future<> finalize(abort_source* as) override {
        if (as) {
            as->check();
        }
        if (_done) {
            co_return;
        }
        if (!_out) {
            throw std::logic_error(fmt::format("finalize of {} after a failed commit", _path.native()));
        }
        try {
            auto out = std::move(*_out);
            _out.reset();
            std::exception_ptr ex;
            try {
                co_await out.flush();
            } catch (...) {
                ex = std::current_exception();
            }
            co_await out.close();
            if (ex) {
                std::rethrow_exception(ex);
            }

            // The sidecar of the previous object goes first and the new one
            // is placed last, so an interrupted commit never pairs the new
            // source fingerprint with other bytes.
            co_await write_small_file(_md_staging, dump_metadata(_metadata));
            if (co_await file_exists(_md_path.native())) {
                co_await remove_file(_md_path.native());
            }
            co_await rename_file(_staging.native(), _path.native());
            co_await rename_file(_md_staging.native(), _md_path.native());
        } catch (const std::system_error& e) {
            throw_write_error(e, _path);
        }
        _done = true;
        fslog.debug("Committed {} ({} bytes)", _path.native(), _accepted);
    }

    future<> abort() override {
        if (_done) {
            co_return;
        }
        _done = true;
        if (_out) {
            auto out = std::move(*_out);
            _out.reset();
            try {
                co_await out.close();
            } catch (...) {
                fslog.debug("Closing aborted output of {}: {}", _staging.native(), std::current_exception());
            }
        }
        for (const auto& p : {_staging, _md_staging}) {
            if (co_await file_exists(p.native())) {
                co_await remove_file(p.native());
            }
        }
        fslog.debug("Discarded partial write of {}", _path.native());
    }
};

fs_store::fs_store(fs::path root)
    : _root(std::move(root)) {
}

fs::path fs_store::path_of(const object_identity& id) const {
    fs::path bucket(std::string_view(id.bucket()));
    if (bucket.has_parent_path() || bucket == "..") {
        throw replication_error(error_kind::invalid_request, fmt::format("invalid bucket name '{}'", id.bucket()));
    }
    auto key = std::string_view(id.key());
    while (!key.empty() && key.front() == '/') {
        key.remove_prefix(1);
    }
    fs::path rel(key);
    check_component("key", rel);
    if (rel.empty() || !rel.has_filename()) {
        throw replication_error(error_kind::invalid_request, fmt::format("invalid object key '{}'", id.key()));
    }
    return _root / bucket / rel;
}

fs::path fs_store::metadata_path_of(const fs::path& object_path) {
    return object_path.parent_path() / ("." + object_path.filename().native() + ".replication");
}

future<std::unique_ptr<source_stream>> fs_store::open(const object_identity& id, abort_source* as) {
    auto path = path_of(id);
    try {
        auto st = co_await file_stat(path.native());
        if (st.type != directory_entry_type::regular) {
            throw replication_error(error_kind::invalid_request, fmt::format("{} is not a regular file", path.native()));
        }
        auto f = co_await open_file_dma(path.native(), open_flags::ro);
        object_info info{
            .size = st.size,
            .fingerprint = fingerprint_of(st),
        };
        fslog.trace("Opened {}: size={} fingerprint={}", path.native(), st.size, *info.fingerprint);
        co_return std::make_unique<fs_source_stream>(std::move(path), std::move(f), std::move(info));
    } catch (const std::system_error& e) {
        throw_fs_error(e, path);
    }
}

future<probe_result> fs_store::exists(const object_identity& id, const object_info& expected, abort_source* as) {
    auto path = path_of(id);
    if (as) {
        as->check();
    }
    try {
        if (!co_await file_exists(path.native())) {
            co_return probe_result::absent;
        }
        auto st = co_await file_stat(path.native());
        object_info existing{
            .size = st.size,
            .fingerprint = fingerprint_of(st),
        };
        auto md_path = metadata_path_of(path);
        if (co_await file_exists(md_path.native())) {
            auto body = co_await util::read_entire_file_contiguous(md_path);
            existing.metadata = parse_metadata(body);
        }
        co_return compare_with_source(existing, expected);
    } catch (const std::system_error& e) {
        throw_fs_error(e, path);
    }
}

future<std::unique_ptr<object_writer>> fs_store::create_writer(const object_identity& id, const object_info& source, abort_source* as) {
    auto path = path_of(id);
    if (as) {
        as->check();
    }
    static thread_local std::default_random_engine engine{std::random_device{}()};
    auto staging = fs::path(fmt::format("{}.partial-{:08x}", path.native(), std::uniform_int_distribution<uint32_t>()(engine)));
    try {
        co_await recursive_touch_directory(path.parent_path().native());
        auto f = co_await open_file_dma(staging.native(), open_flags::wo | open_flags::create | open_flags::truncate);
        auto out = co_await make_file_output_stream(std::move(f));
        auto md = make_replication_metadata(source, fmt::format("{}", id));
        co_return std::make_unique<fs_object_writer>(std::move(path), std::move(staging), std::move(md), std::move(out));
    } catch (const std::system_error& e) {
        throw_write_error(e, staging);
    }
}

future<> fs_store::check_health(const sstring& bucket, abort_source* as) {
    auto dir = _root / std::string_view(bucket);
    try {
        auto st = co_await file_stat(dir.native());
        if (st.type != directory_entry_type::directory) {
            throw replication_error(error_kind::not_found, fmt::format("{} is not a directory", dir.native()));
        }
    } catch (const std::system_error& e) {
        throw_fs_error(e, dir);
    }
}

future<> fs_store::close() {
    return make_ready_future<>();
}

} // namespace stores
