/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <chrono>
#include <vector>
#include <seastar/core/abort_source.hh>
#include <seastar/core/future.hh>

#include "replication/retry_controller.hh"

namespace tests {

// Stands in for the backoff sleep: remembers the requested delays and
// returns at once.
struct recording_sleep {
    std::vector<std::chrono::milliseconds> delays;

    replication::sleep_function fn() {
        return [this] (std::chrono::milliseconds delay, seastar::abort_source* as) {
            delays.push_back(delay);
            if (as && as->abort_requested()) {
                return seastar::make_exception_future<>(seastar::abort_requested_exception());
            }
            return seastar::make_ready_future<>();
        };
    }
};

} // namespace tests
