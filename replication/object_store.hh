/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <seastar/core/abort_source.hh>
#include <seastar/core/future.hh>
#include <seastar/core/sstring.hh>
#include <seastar/core/temporary_buffer.hh>

#include "replication/object_identity.hh"

namespace replication {

// User metadata keys recorded on every replicated object. The prober compares
// the recorded source fingerprint to decide whether a copy can be skipped.
inline constexpr std::string_view source_fingerprint_key = "source-fingerprint";
inline constexpr std::string_view source_size_key = "source-size";
inline constexpr std::string_view source_object_key = "source-object";
inline constexpr std::string_view replicated_at_key = "replication-timestamp";
inline constexpr std::string_view replicator_version_key = "replicator-version";

using object_metadata = std::map<seastar::sstring, seastar::sstring>;

struct object_info {
    // Unknown for unbounded sources.
    std::optional<uint64_t> size;
    // Entity tag, version id or content hash, when the store provides one.
    std::optional<seastar::sstring> fingerprint;
    object_metadata metadata;
};

// Transient unit of transfer.
struct chunk {
    uint64_t offset;
    seastar::temporary_buffer<char> bytes;
    bool is_final;
};

class source_stream {
public:
    virtual ~source_stream() = default;

    virtual const object_info& info() const noexcept = 0;

    // A resumable stream can be read again from any offset after a failed
    // read. A non-resumable one must be read strictly sequentially and is
    // unusable after its first failure.
    virtual bool resumable() const noexcept = 0;

    // Reads up to len bytes starting at offset. An empty buffer means end of data.
    virtual seastar::future<seastar::temporary_buffer<char>> read(uint64_t offset, size_t len, seastar::abort_source* as) = 0;

    virtual seastar::future<> close() = 0;
};

class source_reader {
public:
    virtual ~source_reader() = default;

    virtual seastar::future<std::unique_ptr<source_stream>> open(const object_identity& id, seastar::abort_source* as) = 0;
};

enum class probe_result : uint8_t {
    absent,
    present_matching,
    present_differing,
};

class destination_prober {
public:
    virtual ~destination_prober() = default;

    virtual seastar::future<probe_result> exists(const object_identity& id, const object_info& expected, seastar::abort_source* as) = 0;
};

// In-progress write of one destination object. Nothing becomes visible at the
// destination identity before finalize() succeeds.
class object_writer {
public:
    virtual ~object_writer() = default;

    // Chunks are written in stream order. Writing a chunk that has already
    // been accepted again is a no-op, so a retried write never duplicates data.
    virtual seastar::future<> write(chunk c, seastar::abort_source* as) = 0;

    virtual seastar::future<> finalize(seastar::abort_source* as) = 0;

    // Discards everything written so far. Must be safe to call after a failed
    // write or finalize, and more than once.
    virtual seastar::future<> abort() = 0;

    // Bytes currently held by the writer on top of the chunk being written.
    virtual size_t buffered_bytes() const noexcept { return 0; }
};

class destination_writer {
public:
    virtual ~destination_writer() = default;

    // `source` describes the object being copied; its size and fingerprint are
    // recorded as destination metadata.
    virtual seastar::future<std::unique_ptr<object_writer>> create_writer(const object_identity& id, const object_info& source, seastar::abort_source* as) = 0;
};

// A concrete store usable both as a replication source and a destination.
class object_store : public source_reader, public destination_prober, public destination_writer {
public:
    virtual store_kind kind() const noexcept = 0;

    // Cheap reachability check of the store's control plane for the given bucket.
    virtual seastar::future<> check_health(const seastar::sstring& bucket, seastar::abort_source* as) = 0;

    virtual seastar::future<> close() = 0;
};

std::string_view replicator_version() noexcept;

// Shared decision for stores that record replication metadata on the destination.
probe_result compare_with_source(const object_info& destination, const object_info& expected) noexcept;

// Metadata recorded on a destination object replicated from `source`.
object_metadata make_replication_metadata(const object_info& source, const seastar::sstring& source_name);

} // namespace replication

template <>
struct fmt::formatter<replication::probe_result> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }
    auto format(replication::probe_result r, fmt::format_context& ctx) const {
        switch (r) {
        case replication::probe_result::absent:
            return fmt::format_to(ctx.out(), "absent");
        case replication::probe_result::present_matching:
            return fmt::format_to(ctx.out(), "present_matching");
        case replication::probe_result::present_differing:
            return fmt::format_to(ctx.out(), "present_differing");
        }
        return fmt::format_to(ctx.out(), "unknown");
    }
};
