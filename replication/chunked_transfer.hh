/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <cstdint>
#include <optional>
#include <seastar/core/abort_source.hh>
#include <seastar/core/future.hh>

#include "replication/object_store.hh"
#include "replication/retry_controller.hh"

namespace replication {

struct transfer_progress {
    std::optional<uint64_t> total;
    uint64_t transferred = 0;
    unsigned chunks = 0;
    // Largest amount of object data held at once, the chunk in flight plus
    // whatever the destination writer buffers.
    size_t peak_buffered = 0;
};

// Moves one object from a source stream to a destination writer, one chunk
// at a time, and commits the writer once every chunk has been accepted. On
// any failure the writer is aborted before the error is rethrown.
class chunked_transfer {
    source_stream& _source;
    object_writer& _destination;
    size_t _chunk_size;
    retry_controller& _retry;
    transfer_progress& _progress;

    seastar::future<seastar::temporary_buffer<char>> read_chunk(uint64_t offset, size_t len, seastar::abort_source& as);
    seastar::future<> copy(seastar::abort_source& as);

public:
    chunked_transfer(source_stream& source, object_writer& destination, size_t chunk_size, retry_controller& retry, transfer_progress& progress);

    seastar::future<> run(seastar::abort_source& as);
};

} // namespace replication
