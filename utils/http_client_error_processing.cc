/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <cerrno>

#include "utils/http_client_error_processing.hh"

namespace utils::http {

retryable from_http_code(seastar::http::reply::status_type http_code) {
    switch (static_cast<int>(http_code)) {
    case 408: // request timeout
    case 429: // too many requests
    case 500:
    case 502:
    case 503:
    case 504:
        return retryable::yes;
    default:
        return retryable::no;
    }
}

retryable from_system_error(const std::system_error& system_error) {
    if (system_error.code().category() != std::system_category()) {
        return retryable::no;
    }
    switch (system_error.code().value()) {
    case ECONNRESET:
    case ECONNREFUSED:
    case ECONNABORTED:
    case EPIPE:
    case ETIMEDOUT:
    case EHOSTUNREACH:
    case ENETUNREACH:
    case ENETDOWN:
    case EAGAIN:
        return retryable::yes;
    default:
        return retryable::no;
    }
}

} // namespace utils::http
