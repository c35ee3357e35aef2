/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <exception>
#include <optional>
#include <string>
#include <system_error>
#include <type_traits>
#include <seastar/http/reply.hh>
#include <seastar/util/bool_class.hh>

namespace utils::http {

using retryable = seastar::bool_class<struct is_retryable>;

// 408, 429 and 5xx statuses are worth another attempt.
retryable from_http_code(seastar::http::reply::status_type http_code);

// Connection-level failures (refused, reset, unreachable, timed out) are worth another attempt.
retryable from_system_error(const std::system_error& system_error);

template <typename Exc, typename F>
struct typed_handler {
    static_assert(std::is_base_of_v<std::exception, Exc>, "typed_handler can only handle std::exception types");
    using return_type = std::invoke_result_t<F, const Exc&>;

    F func;

    std::optional<return_type> try_handle(const std::exception& e) const {
        if (auto p = dynamic_cast<const Exc*>(&e)) {
            return func(*p);
        }
        return std::nullopt;
    }
};

template <typename Exc, typename F>
auto make_handler(F&& f) {
    return typed_handler<Exc, std::decay_t<F>>{std::forward<F>(f)};
}

namespace detail {

// Next exception down a std::nested_exception chain, or null at the bottom.
inline std::exception_ptr nested_of(const std::exception& e) {
    try {
        std::rethrow_if_nested(e);
    } catch (...) {
        return std::current_exception();
    }
    return nullptr;
}

} // namespace detail

// Walks eptr and the exceptions nested in it, outermost first, and returns
// the result of the first handler matching one of them. Handlers are tried
// in argument order and run while the matched exception is the current one,
// so std::current_exception() inside a handler refers to it. When nothing
// matches, default_handler gets the innermost exception and the message of
// the outermost one.
template <typename R, typename DefaultHandler, typename... Handlers>
R dispatch_exception(std::exception_ptr eptr, DefaultHandler default_handler, Handlers&&... handlers) {
    static_assert(std::is_same_v<R, std::invoke_result_t<DefaultHandler, std::exception_ptr, std::string&&>>,
                  "Default handler must return R");
    static_assert((std::is_same_v<R, typename std::decay_t<Handlers>::return_type> && ...),
                  "All handlers must return R");

    std::string outer_message;
    while (eptr) {
        std::exception_ptr nested;
        try {
            std::rethrow_exception(eptr);
        } catch (const std::exception& e) {
            if (outer_message.empty()) {
                outer_message = e.what();
            }
            std::optional<R> result;
            if ((... || (result = handlers.try_handle(e)).has_value())) {
                return std::move(*result);
            }
            nested = detail::nested_of(e);
        } catch (...) {
            // Not a std::exception, nothing to match or unwrap.
        }
        if (!nested) {
            break;
        }
        eptr = std::move(nested);
    }
    return default_handler(std::move(eptr), std::move(outer_message));
}

} // namespace utils::http
