/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <map>
#include <stdexcept>
#include <string_view>
#include <vector>
#include <seastar/core/sstring.hh>
#include <seastar/http/reply.hh>

#include "api/health.hh"
#include "replication/replication_job.hh"

namespace api {

// A request the trigger refuses before it reaches the orchestrator.
class request_error : public std::runtime_error {
    seastar::http::reply::status_type _status;
    seastar::sstring _error;
    std::map<seastar::sstring, std::vector<seastar::sstring>> _details;

public:
    request_error(seastar::http::reply::status_type status, seastar::sstring error, const std::string& message,
            std::map<seastar::sstring, std::vector<seastar::sstring>> details = {});

    seastar::http::reply::status_type status() const noexcept { return _status; }
    const seastar::sstring& error() const noexcept { return _error; }
    const std::map<seastar::sstring, std::vector<seastar::sstring>>& details() const noexcept { return _details; }
};

struct replicate_payload {
    seastar::sstring s3_bucket;
    seastar::sstring s3_key;
};

int64_t now_seconds() noexcept;

// True for application/json and application/<anything>+json.
bool is_json_content_type(std::string_view content_type) noexcept;

// Validates the body of POST /v1/replicate. Both fields are required,
// must be strings and are trimmed; blank values are refused.
replicate_payload parse_replicate_payload(std::string_view content_type, std::string_view body);

seastar::sstring job_result_json(const replication::job_result& result, int64_t timestamp);
seastar::sstring rejected_json(const std::string& message, unsigned retry_after, int64_t timestamp);
seastar::sstring error_json(const request_error& e, int64_t timestamp);
seastar::sstring error_json(std::string_view error, std::string_view message, int64_t timestamp);
seastar::sstring health_json(const health_report& report, std::string_view version);

} // namespace api
