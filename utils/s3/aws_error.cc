/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#if __has_include(<rapidxml.h>)
#include <rapidxml.h>
#else
#include <rapidxml/rapidxml.hpp>
#endif
#include <memory>
#include <fmt/format.h>

#include "utils/s3/aws_error.hh"

namespace aws {

aws_error::aws_error(aws_error_type error_type, retryable is_retryable)
    : _type(error_type)
    , _is_retryable(is_retryable) {
}

aws_error::aws_error(aws_error_type error_type, std::string error_message, retryable is_retryable)
    : _type(error_type)
    , _message(std::move(error_message))
    , _is_retryable(is_retryable) {
}

std::optional<aws_error> aws_error::parse(seastar::sstring&& body) {
    if (body.empty()) {
        return std::nullopt;
    }

    auto doc = std::make_unique<rapidxml::xml_document<>>();
    try {
        doc->parse<0>(body.data());
    } catch (const rapidxml::parse_error&) {
        return std::nullopt;
    }

    const auto* error_node = doc->first_node("Error");
    if (!error_node) {
        if (const auto* response = doc->first_node("ErrorResponse")) {
            error_node = response->first_node("Error");
        }
    }
    if (!error_node) {
        return std::nullopt;
    }

    const auto* code_node = error_node->first_node("Code");
    const auto* message_node = error_node->first_node("Message");
    if (!code_node) {
        return std::nullopt;
    }
    std::string_view code(code_node->value(), code_node->value_size());
    std::string message = message_node ? std::string(message_node->value(), message_node->value_size()) : std::string(code);

    if (auto it = aws_error_map.find(code); it != aws_error_map.end()) {
        return aws_error(it->second.get_error_type(), fmt::format("{}: {}", code, message), it->second.is_retryable());
    }
    return aws_error(aws_error_type::UNKNOWN, fmt::format("{}: {}", code, message), retryable::no);
}

aws_error aws_error::from_http_code(seastar::http::reply::status_type http_code) {
    using status = seastar::http::reply::status_type;
    auto message = fmt::format("HTTP status {}", static_cast<int>(http_code));
    auto is_retryable = utils::http::from_http_code(http_code);
    switch (http_code) {
    case status::bad_request:
        return {aws_error_type::HTTP_BAD_REQUEST, std::move(message), is_retryable};
    case status::unauthorized:
        return {aws_error_type::HTTP_UNAUTHORIZED, std::move(message), is_retryable};
    case status::forbidden:
        return {aws_error_type::HTTP_FORBIDDEN, std::move(message), is_retryable};
    case status::not_found:
        return {aws_error_type::HTTP_NOT_FOUND, std::move(message), is_retryable};
    case status::moved_permanently:
        return {aws_error_type::HTTP_MOVED_PERMANENTLY, std::move(message), is_retryable};
    default:
        break;
    }
    switch (static_cast<int>(http_code)) {
    case 408:
        return {aws_error_type::HTTP_REQUEST_TIMEOUT, std::move(message), is_retryable};
    case 412:
        return {aws_error_type::HTTP_PRECONDITION_FAILED, std::move(message), is_retryable};
    case 416:
        return {aws_error_type::HTTP_RANGE_NOT_SATISFIABLE, std::move(message), is_retryable};
    case 429:
        return {aws_error_type::HTTP_TOO_MANY_REQUESTS, std::move(message), is_retryable};
    case 500:
        return {aws_error_type::HTTP_INTERNAL_SERVER_ERROR, std::move(message), is_retryable};
    case 502:
        return {aws_error_type::HTTP_BAD_GATEWAY, std::move(message), is_retryable};
    case 503:
        return {aws_error_type::HTTP_SERVICE_UNAVAILABLE, std::move(message), is_retryable};
    case 504:
        return {aws_error_type::HTTP_GATEWAY_TIMEOUT, std::move(message), is_retryable};
    default:
        return {aws_error_type::UNKNOWN, std::move(message), is_retryable};
    }
}

aws_error aws_error::from_system_error(const std::system_error& system_error) {
    auto is_retryable = utils::http::from_system_error(system_error);
    return {is_retryable ? aws_error_type::NETWORK_CONNECTION : aws_error_type::UNKNOWN,
            fmt::format("{} ({})", system_error.what(), system_error.code().value()), is_retryable};
}

const std::unordered_map<std::string_view, const aws_error> aws_error_map{
    {"InternalError", aws_error(aws_error_type::INTERNAL_FAILURE, retryable::yes)},
    {"InternalFailure", aws_error(aws_error_type::INTERNAL_FAILURE, retryable::yes)},
    {"InvalidAction", aws_error(aws_error_type::INVALID_ACTION, retryable::no)},
    {"InvalidArgument", aws_error(aws_error_type::INVALID_ARGUMENT, retryable::no)},
    {"InvalidRequest", aws_error(aws_error_type::INVALID_REQUEST, retryable::no)},
    {"AccessDenied", aws_error(aws_error_type::ACCESS_DENIED, retryable::no)},
    {"InvalidAccessKeyId", aws_error(aws_error_type::INVALID_ACCESS_KEY_ID, retryable::no)},
    {"SignatureDoesNotMatch", aws_error(aws_error_type::SIGNATURE_DOES_NOT_MATCH, retryable::no)},
    {"ExpiredToken", aws_error(aws_error_type::EXPIRED_TOKEN, retryable::no)},
    {"RequestTimeTooSkewed", aws_error(aws_error_type::REQUEST_TIME_TOO_SKEWED, retryable::yes)},
    {"NoSuchBucket", aws_error(aws_error_type::NO_SUCH_BUCKET, retryable::no)},
    {"NoSuchKey", aws_error(aws_error_type::NO_SUCH_KEY, retryable::no)},
    {"NoSuchUpload", aws_error(aws_error_type::NO_SUCH_UPLOAD, retryable::no)},
    {"ResourceNotFound", aws_error(aws_error_type::RESOURCE_NOT_FOUND, retryable::no)},
    {"PreconditionFailed", aws_error(aws_error_type::PRECONDITION_FAILED, retryable::no)},
    {"InvalidRange", aws_error(aws_error_type::INVALID_RANGE, retryable::no)},
    {"EntityTooSmall", aws_error(aws_error_type::ENTITY_TOO_SMALL, retryable::no)},
    {"InvalidPart", aws_error(aws_error_type::INVALID_PART, retryable::no)},
    {"InvalidPartOrder", aws_error(aws_error_type::INVALID_PART_ORDER, retryable::no)},
    {"SlowDown", aws_error(aws_error_type::SLOW_DOWN, retryable::yes)},
    {"ServiceUnavailable", aws_error(aws_error_type::SERVICE_UNAVAILABLE, retryable::yes)},
    {"Throttling", aws_error(aws_error_type::THROTTLING, retryable::yes)},
    {"ThrottlingException", aws_error(aws_error_type::THROTTLING, retryable::yes)},
    {"RequestTimeout", aws_error(aws_error_type::REQUEST_TIMEOUT, retryable::yes)},
};

} // namespace aws
