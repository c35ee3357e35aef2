/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <ctime>
#include <iterator>
#include <stdexcept>
#include <fmt/format.h>
#include <gnutls/crypto.h>

#include "utils/aws_sigv4.hh"

namespace utils::aws {

std::string format_time_point(std::chrono::system_clock::time_point tp) {
    std::time_t time_point_repr = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf;
    ::gmtime_r(&time_point_repr, &tm_buf);
    char buf[sizeof("20150830T123600Z")];
    std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &tm_buf);
    return buf;
}

hmac_sha256_digest hmac_sha256(std::string_view key, std::string_view msg) {
    hmac_sha256_digest digest;
    int ret = gnutls_hmac_fast(GNUTLS_MAC_SHA256, key.data(), key.size(), msg.data(), msg.size(), digest.data());
    if (ret) {
        throw std::runtime_error(fmt::format("Computing HMAC failed ({}): {}", ret, gnutls_strerror(ret)));
    }
    return digest;
}

std::string sha256_hex(std::string_view payload) {
    std::array<char, 32> digest;
    int ret = gnutls_hash_fast(GNUTLS_DIG_SHA256, payload.data(), payload.size(), digest.data());
    if (ret) {
        throw std::runtime_error(fmt::format("Computing SHA256 failed ({}): {}", ret, gnutls_strerror(ret)));
    }
    return hex(std::string_view(digest.data(), digest.size()));
}

std::string hex(std::string_view bytes) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string ret;
    ret.reserve(bytes.size() * 2);
    for (unsigned char c : bytes) {
        ret.push_back(digits[c >> 4]);
        ret.push_back(digits[c & 0xf]);
    }
    return ret;
}

static std::string_view as_view(const hmac_sha256_digest& digest) {
    return std::string_view(digest.data(), digest.size());
}

hmac_sha256_digest derive_signing_key(std::string_view secret_access_key, std::string_view datestamp, std::string_view region, std::string_view service) {
    auto date = hmac_sha256("AWS4" + std::string(secret_access_key), datestamp);
    auto region_key = hmac_sha256(as_view(date), region);
    auto service_key = hmac_sha256(as_view(region_key), service);
    return hmac_sha256(as_view(service_key), "aws4_request");
}

static std::string_view trim(std::string_view v) {
    while (!v.empty() && v.front() == ' ') {
        v.remove_prefix(1);
    }
    while (!v.empty() && v.back() == ' ') {
        v.remove_suffix(1);
    }
    return v;
}

std::string get_signature(std::string_view secret_access_key,
                          std::string_view canonical_uri,
                          std::string_view method,
                          std::string_view signed_headers_str,
                          const std::map<std::string_view, std::string_view>& signed_headers_map,
                          std::string_view payload_hash,
                          std::string_view region,
                          std::string_view service,
                          std::string_view query_string) {
    auto amz_date = signed_headers_map.find("x-amz-date");
    if (amz_date == signed_headers_map.end() || amz_date->second.size() < 8) {
        throw std::invalid_argument("x-amz-date header is missing from the signed headers");
    }
    auto datestamp = amz_date->second.substr(0, 8);

    std::string canonical_headers;
    for (const auto& [name, value] : signed_headers_map) {
        fmt::format_to(std::back_inserter(canonical_headers), "{}:{}\n", name, trim(value));
    }

    auto canonical_request = fmt::format("{}\n{}\n{}\n{}\n{}\n{}",
            method, canonical_uri, query_string, canonical_headers, signed_headers_str, payload_hash);
    auto credential_scope = fmt::format("{}/{}/{}/aws4_request", datestamp, region, service);
    auto string_to_sign = fmt::format("AWS4-HMAC-SHA256\n{}\n{}\n{}", amz_date->second, credential_scope, sha256_hex(canonical_request));

    auto signing_key = derive_signing_key(secret_access_key, datestamp, region, service);
    auto signature = hmac_sha256(as_view(signing_key), string_to_sign);
    return hex(as_view(signature));
}

} // namespace utils::aws
