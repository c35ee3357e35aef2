/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <seastar/core/on_internal_error.hh>
#include "utils/log.hh"

namespace utils {
extern logging::logger assert_log;
}

#define OBJREPL_STRINGIFY_IMPL(l) #l
#define OBJREPL_STRINGIFY(l) OBJREPL_STRINGIFY_IMPL(l)

// Unlike assert(), stays enabled in release builds and reports through
// seastar's internal error machinery, which aborts or throws per configuration.
#define OBJREPL_ASSERT(x)                                                                                      \
    do {                                                                                                       \
        if (!(x)) [[unlikely]] {                                                                               \
            seastar::on_internal_error(::utils::assert_log, "Assertion failed: " #x " at " __FILE__ ":"        \
                                                            OBJREPL_STRINGIFY(__LINE__));                 \
        }                                                                                                      \
    } while (0)
