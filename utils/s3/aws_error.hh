/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <seastar/core/sstring.hh>
#include <seastar/http/reply.hh>

#include "utils/http_client_error_processing.hh"

namespace aws {

enum class aws_error_type : uint8_t {
    OK,
    // Codes reported in the XML body of a failed request
    INTERNAL_FAILURE,
    INVALID_ACTION,
    INVALID_ARGUMENT,
    INVALID_REQUEST,
    ACCESS_DENIED,
    INVALID_ACCESS_KEY_ID,
    SIGNATURE_DOES_NOT_MATCH,
    EXPIRED_TOKEN,
    REQUEST_TIME_TOO_SKEWED,
    NO_SUCH_BUCKET,
    NO_SUCH_KEY,
    NO_SUCH_UPLOAD,
    RESOURCE_NOT_FOUND,
    PRECONDITION_FAILED,
    INVALID_RANGE,
    ENTITY_TOO_SMALL,
    INVALID_PART,
    INVALID_PART_ORDER,
    SLOW_DOWN,
    SERVICE_UNAVAILABLE,
    THROTTLING,
    REQUEST_TIMEOUT,
    // Derived from the HTTP status when the body carries no error
    HTTP_BAD_REQUEST,
    HTTP_UNAUTHORIZED,
    HTTP_FORBIDDEN,
    HTTP_NOT_FOUND,
    HTTP_MOVED_PERMANENTLY,
    HTTP_REQUEST_TIMEOUT,
    HTTP_PRECONDITION_FAILED,
    HTTP_RANGE_NOT_SATISFIABLE,
    HTTP_TOO_MANY_REQUESTS,
    HTTP_INTERNAL_SERVER_ERROR,
    HTTP_BAD_GATEWAY,
    HTTP_SERVICE_UNAVAILABLE,
    HTTP_GATEWAY_TIMEOUT,
    // Transport level
    NETWORK_CONNECTION,
    UNKNOWN,
};

using retryable = utils::http::retryable;

class aws_error {
    aws_error_type _type{aws_error_type::OK};
    std::string _message;
    retryable _is_retryable{retryable::no};

public:
    aws_error() = default;
    aws_error(aws_error_type error_type, retryable is_retryable);
    aws_error(aws_error_type error_type, std::string error_message, retryable is_retryable);

    aws_error_type get_error_type() const noexcept { return _type; }
    const std::string& get_error_message() const noexcept { return _message; }
    retryable is_retryable() const noexcept { return _is_retryable; }

    // Extracts the error from an S3 XML error body. Returns nothing when the
    // body is empty or not an error document.
    static std::optional<aws_error> parse(seastar::sstring&& body);
    static aws_error from_http_code(seastar::http::reply::status_type http_code);
    static aws_error from_system_error(const std::system_error& system_error);
};

class aws_exception : public std::exception {
    aws_error _error;

public:
    explicit aws_exception(aws_error&& error) noexcept : _error(std::move(error)) {}

    const char* what() const noexcept override { return _error.get_error_message().c_str(); }
    const aws_error& error() const noexcept { return _error; }
};

// Error codes S3 and S3-compatible services report, by their wire name.
extern const std::unordered_map<std::string_view, const aws_error> aws_error_map;

} // namespace aws

template <>
struct fmt::formatter<aws::aws_error_type> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }
    auto format(aws::aws_error_type type, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{}", static_cast<unsigned>(type));
    }
};
