/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <stdexcept>

#include "replication/object_identity.hh"

namespace replication {

std::string_view to_string(store_kind kind) noexcept {
    switch (kind) {
    case store_kind::s3:         return "s3";
    case store_kind::gcs:        return "gcs";
    case store_kind::filesystem: return "filesystem";
    case store_kind::memory:     return "memory";
    }
    return "unknown";
}

std::string_view scheme_of(store_kind kind) noexcept {
    switch (kind) {
    case store_kind::s3:         return "s3";
    case store_kind::gcs:        return "gs";
    case store_kind::filesystem: return "file";
    case store_kind::memory:     return "mem";
    }
    return "unknown";
}

store_kind store_kind_from_string(std::string_view name) {
    if (name == "s3") {
        return store_kind::s3;
    }
    if (name == "gcs" || name == "gs") {
        return store_kind::gcs;
    }
    if (name == "filesystem" || name == "file") {
        return store_kind::filesystem;
    }
    if (name == "memory") {
        return store_kind::memory;
    }
    throw std::invalid_argument(fmt::format("unknown store kind '{}'", name));
}

object_identity::object_identity(store_kind kind, seastar::sstring bucket, seastar::sstring key)
    : _kind(kind)
    , _bucket(std::move(bucket))
    , _key(std::move(key)) {
    if (_bucket.empty()) {
        throw std::invalid_argument("object identity requires a bucket");
    }
    if (_key.empty()) {
        throw std::invalid_argument("object identity requires a key");
    }
}

} // namespace replication
