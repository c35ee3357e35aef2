/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <chrono>

#include "replication/object_store.hh"

namespace replication {

std::string_view replicator_version() noexcept {
    return "1.0.0";
}

probe_result compare_with_source(const object_info& destination, const object_info& expected) noexcept {
    // Without a source fingerprint there is no way to prove the existing
    // object is the same one, so it gets overwritten.
    if (!expected.fingerprint) {
        return probe_result::present_differing;
    }
    if (expected.size && destination.size && *expected.size != *destination.size) {
        return probe_result::present_differing;
    }
    auto recorded = destination.metadata.find(seastar::sstring(source_fingerprint_key));
    if (recorded != destination.metadata.end() && recorded->second == *expected.fingerprint) {
        return probe_result::present_matching;
    }
    if (destination.fingerprint && *destination.fingerprint == *expected.fingerprint) {
        return probe_result::present_matching;
    }
    return probe_result::present_differing;
}

object_metadata make_replication_metadata(const object_info& source, const seastar::sstring& source_name) {
    object_metadata md;
    if (source.fingerprint) {
        md.emplace(source_fingerprint_key, *source.fingerprint);
    }
    if (source.size) {
        md.emplace(source_size_key, fmt::to_string(*source.size));
    }
    md.emplace(source_object_key, source_name);
    auto now = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch());
    md.emplace(replicated_at_key, fmt::to_string(now.count()));
    md.emplace(replicator_version_key, replicator_version());
    return md;
}

} // namespace replication
