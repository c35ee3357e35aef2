/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <stdexcept>
#include <seastar/core/coroutine.hh>

#include "replication/errors.hh"
#include "replication/store_registry.hh"
#include "utils/log.hh"

namespace replication {

static logging::logger rlog("store_registry");

void store_registry::add(std::unique_ptr<object_store> store) {
    auto kind = store->kind();
    auto [it, inserted] = _stores.emplace(kind, std::move(store));
    if (!inserted) {
        throw std::invalid_argument(fmt::format("a {} store is already registered", kind));
    }
    rlog.debug("Registered {} store", kind);
}

object_store& store_registry::get(store_kind kind) const {
    auto it = _stores.find(kind);
    if (it == _stores.end()) {
        throw replication_error(error_kind::invalid_request, fmt::format("no {} store is configured", kind));
    }
    return *it->second;
}

bool store_registry::contains(store_kind kind) const noexcept {
    return _stores.contains(kind);
}

seastar::future<> store_registry::close() {
    for (auto& [kind, store] : _stores) {
        try {
            co_await store->close();
        } catch (...) {
            rlog.warn("Failed to close {} store: {}", kind, std::current_exception());
        }
    }
}

} // namespace replication
