/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <filesystem>
#include <system_error>

#include "replication/object_store.hh"

namespace stores {

// Object store backed by a local directory tree: a bucket is a directory
// below the root, a key a relative path inside it. Replication metadata of a
// destination object lives in a hidden sidecar file next to it.
class fs_store final : public replication::object_store {
    std::filesystem::path _root;

public:
    explicit fs_store(std::filesystem::path root);

    replication::store_kind kind() const noexcept override { return replication::store_kind::filesystem; }

    std::filesystem::path path_of(const replication::object_identity& id) const;
    static std::filesystem::path metadata_path_of(const std::filesystem::path& object_path);

    seastar::future<std::unique_ptr<replication::source_stream>> open(const replication::object_identity& id, seastar::abort_source* as) override;
    seastar::future<replication::probe_result> exists(const replication::object_identity& id, const replication::object_info& expected, seastar::abort_source* as) override;
    seastar::future<std::unique_ptr<replication::object_writer>> create_writer(const replication::object_identity& id, const replication::object_info& source, seastar::abort_source* as) override;
    seastar::future<> check_health(const seastar::sstring& bucket, seastar::abort_source* as) override;
    seastar::future<> close() override;
};

// Maps a failed filesystem call onto the replication error taxonomy.
[[noreturn]] void throw_fs_error(const std::system_error& e, const std::filesystem::path& path);

} // namespace stores
