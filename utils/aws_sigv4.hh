/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <array>
#include <chrono>
#include <map>
#include <string>
#include <string_view>

// AWS Signature Version 4 request signing.
// https://docs.aws.amazon.com/IAM/latest/UserGuide/create-signed-request.html
namespace utils::aws {

using hmac_sha256_digest = std::array<char, 32>;

inline constexpr std::string_view unsigned_content = "UNSIGNED-PAYLOAD";

// Hash of an empty payload, as required for requests without a body.
inline constexpr std::string_view empty_content_sha256 = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

// Formats a time point as the ISO8601 basic format used in x-amz-date, e.g. 20150830T123600Z
std::string format_time_point(std::chrono::system_clock::time_point tp);

hmac_sha256_digest hmac_sha256(std::string_view key, std::string_view msg);

std::string sha256_hex(std::string_view payload);

std::string hex(std::string_view bytes);

hmac_sha256_digest derive_signing_key(std::string_view secret_access_key, std::string_view datestamp, std::string_view region, std::string_view service);

// Builds the canonical request out of the given pieces and signs it. The
// x-amz-date header must be among the signed headers; it provides the
// timestamp of the signature. Header names must be lower case.
std::string get_signature(std::string_view secret_access_key,
                          std::string_view canonical_uri,
                          std::string_view method,
                          std::string_view signed_headers_str,
                          const std::map<std::string_view, std::string_view>& signed_headers_map,
                          std::string_view payload_hash,
                          std::string_view region,
                          std::string_view service,
                          std::string_view query_string);

} // namespace utils::aws
