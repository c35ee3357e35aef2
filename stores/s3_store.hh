/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <exception>
#include <seastar/core/shared_ptr.hh>

#include "replication/object_store.hh"
#include "utils/s3/client.hh"

namespace stores {

struct s3_store_config {
    // Size of the multipart upload parts. Also the largest amount of data a
    // writer holds before sending it out.
    size_t part_size = 5 << 20;
    // Bytes fetched per ranged GET when reading a source object.
    size_t read_ahead = 1 << 20;
};

// Object store talking the S3 REST protocol. Serves both AWS S3 and Google
// Cloud Storage, the latter through its S3 compatible XML API.
class s3_store final : public replication::object_store {
    replication::store_kind _kind;
    seastar::shared_ptr<s3::client> _client;
    s3_store_config _cfg;

public:
    s3_store(replication::store_kind kind, seastar::shared_ptr<s3::client> client, s3_store_config cfg = {});

    replication::store_kind kind() const noexcept override { return _kind; }

    seastar::future<std::unique_ptr<replication::source_stream>> open(const replication::object_identity& id, seastar::abort_source* as) override;
    seastar::future<replication::probe_result> exists(const replication::object_identity& id, const replication::object_info& expected, seastar::abort_source* as) override;
    seastar::future<std::unique_ptr<replication::object_writer>> create_writer(const replication::object_identity& id, const replication::object_info& source, seastar::abort_source* as) override;
    seastar::future<> check_health(const seastar::sstring& bucket, seastar::abort_source* as) override;
    seastar::future<> close() override;
};

// Translates a failure reported by the S3 client into a replication_error.
// Aborts and errors that are already classified pass through unchanged.
std::exception_ptr map_s3_error(std::exception_ptr ex);

} // namespace stores
