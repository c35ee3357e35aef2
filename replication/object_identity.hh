/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <cstdint>
#include <string_view>
#include <fmt/format.h>
#include <seastar/core/sstring.hh>

namespace replication {

enum class store_kind : uint8_t {
    s3,
    gcs,
    filesystem,
    memory,
};

std::string_view to_string(store_kind kind) noexcept;
// URL-style scheme used when printing identities, e.g. "gs" for gcs.
std::string_view scheme_of(store_kind kind) noexcept;
store_kind store_kind_from_string(std::string_view name);

// Addresses one object within one store. Immutable once constructed.
class object_identity {
    store_kind _kind;
    seastar::sstring _bucket;
    seastar::sstring _key;

public:
    object_identity(store_kind kind, seastar::sstring bucket, seastar::sstring key);

    store_kind kind() const noexcept { return _kind; }
    const seastar::sstring& bucket() const noexcept { return _bucket; }
    const seastar::sstring& key() const noexcept { return _key; }

    bool operator==(const object_identity&) const = default;
};

struct replication_request {
    object_identity source;
    object_identity destination;
};

} // namespace replication

template <>
struct fmt::formatter<replication::store_kind> : fmt::formatter<std::string_view> {
    auto format(replication::store_kind kind, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(replication::to_string(kind), ctx);
    }
};

template <>
struct fmt::formatter<replication::object_identity> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }
    auto format(const replication::object_identity& id, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{}://{}/{}", replication::scheme_of(id.kind()), id.bucket(), id.key());
    }
};
