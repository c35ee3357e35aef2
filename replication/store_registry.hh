/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <map>
#include <memory>
#include <seastar/core/future.hh>

#include "replication/object_store.hh"

namespace replication {

// Owns the concrete stores of the process, one per store kind.
class store_registry {
    std::map<store_kind, std::unique_ptr<object_store>> _stores;

public:
    template <typename Store, typename... Args>
    Store& emplace(Args&&... args) {
        auto store = std::make_unique<Store>(std::forward<Args>(args)...);
        auto& ref = *store;
        add(std::move(store));
        return ref;
    }

    void add(std::unique_ptr<object_store> store);

    // Throws replication_error(invalid_request) when no store of this kind is configured.
    object_store& get(store_kind kind) const;
    bool contains(store_kind kind) const noexcept;

    seastar::future<> close();
};

} // namespace replication
