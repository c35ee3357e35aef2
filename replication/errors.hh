/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <fmt/format.h>

namespace replication {

// Every failure of a store operation is classified into one of these kinds
// where it happens. Only `transient` is retried.
enum class error_kind : uint8_t {
    not_found,
    access_denied,
    transient,
    retry_exhausted,
    non_resumable_stream,
    invalid_request,
    io,
    cancelled,
    timeout,
    internal,
};

std::string_view to_string(error_kind kind) noexcept;

class replication_error : public std::runtime_error {
    error_kind _kind;

public:
    replication_error(error_kind kind, const std::string& msg);

    error_kind kind() const noexcept { return _kind; }
    bool is_transient() const noexcept { return _kind == error_kind::transient; }
};

class retry_exhausted_error : public replication_error {
    std::exception_ptr _last_error;
    unsigned _attempts;

public:
    retry_exhausted_error(std::exception_ptr last_error, unsigned attempts);

    const std::exception_ptr& last_error() const noexcept { return _last_error; }
    unsigned attempts() const noexcept { return _attempts; }
};

// Thrown by the orchestrator when the concurrency ceiling is reached and the
// admission policy is `reject`. Callers are expected to try again later.
class admission_rejected : public std::runtime_error {
public:
    explicit admission_rejected(unsigned ceiling);
};

// Classifies an arbitrary exception. Unknown exception types are `internal`.
error_kind classify(std::exception_ptr ex) noexcept;

std::string describe(std::exception_ptr ex);

} // namespace replication

template <>
struct fmt::formatter<replication::error_kind> : fmt::formatter<std::string_view> {
    auto format(replication::error_kind kind, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(replication::to_string(kind), ctx);
    }
};
