/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <algorithm>
#include <cctype>
#include <chrono>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <fmt/format.h>

#include "api/json.hh"

using namespace seastar;

namespace api {

using json_writer = rapidjson::Writer<rapidjson::StringBuffer>;

request_error::request_error(http::reply::status_type status, sstring error, const std::string& message,
        std::map<sstring, std::vector<sstring>> details)
    : std::runtime_error(message)
    , _status(status)
    , _error(std::move(error))
    , _details(std::move(details)) {
}

int64_t now_seconds() noexcept {
    return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

static std::string_view trim(std::string_view v) noexcept {
    constexpr std::string_view blanks = " \t\r\n\f\v";
    auto b = v.find_first_not_of(blanks);
    if (b == std::string_view::npos) {
        return {};
    }
    auto e = v.find_last_not_of(blanks);
    return v.substr(b, e - b + 1);
}

bool is_json_content_type(std::string_view content_type) noexcept {
    auto mime = trim(content_type.substr(0, content_type.find(';')));
    std::string lower(mime);
    std::ranges::transform(lower, lower.begin(), [] (unsigned char c) { return std::tolower(c); });
    if (lower == "application/json") {
        return true;
    }
    return lower.starts_with("application/") && lower.ends_with("+json");
}

replicate_payload parse_replicate_payload(std::string_view content_type, std::string_view body) {
    if (!is_json_content_type(content_type)) {
        throw request_error(http::reply::status_type::bad_request, "invalid_content_type", "Content-Type must be application/json");
    }

    std::map<sstring, std::vector<sstring>> details;
    auto invalid = [&details] {
        return request_error(http::reply::status_type::bad_request, "validation_error", "Invalid request payload", std::move(details));
    };

    rapidjson::Document doc;
    doc.Parse(body.data(), body.size());
    if (doc.HasParseError()) {
        details["_schema"].push_back(fmt::format("Invalid JSON at offset {}: {}", doc.GetErrorOffset(), rapidjson::GetParseError_En(doc.GetParseError())));
        throw invalid();
    }
    if (!doc.IsObject()) {
        details["_schema"].push_back("Invalid input type.");
        throw invalid();
    }

    replicate_payload payload;
    auto field = [&] (const char* name, sstring& out) {
        auto it = doc.FindMember(name);
        if (it == doc.MemberEnd() || it->value.IsNull()) {
            details[name].push_back("Missing data for required field.");
            return;
        }
        if (!it->value.IsString()) {
            details[name].push_back("Not a valid string.");
            return;
        }
        auto v = trim(std::string_view(it->value.GetString(), it->value.GetStringLength()));
        if (v.empty()) {
            details[name].push_back("Invalid value.");
            return;
        }
        out = sstring(v.data(), v.size());
    };
    field("s3_bucket", payload.s3_bucket);
    field("s3_key", payload.s3_key);
    if (!details.empty()) {
        throw invalid();
    }
    return payload;
}

static void write_string(json_writer& w, std::string_view v) {
    w.String(v.data(), static_cast<rapidjson::SizeType>(v.size()));
}

static void write_field(json_writer& w, const char* key, std::string_view v) {
    w.Key(key);
    write_string(w, v);
}

static sstring to_sstring(const rapidjson::StringBuffer& buf) {
    return sstring(buf.GetString(), buf.GetSize());
}

sstring job_result_json(const replication::job_result& result, int64_t timestamp) {
    rapidjson::StringBuffer buf;
    json_writer w(buf);
    w.StartObject();
    write_field(w, "status", replication::to_string(result.status));
    w.Key("job_id");
    w.Uint64(result.job_id);
    write_field(w, "source", fmt::format("{}", result.source));
    write_field(w, "destination", fmt::format("{}", result.destination));
    w.Key("bytes_transferred");
    w.Uint64(result.bytes_transferred);
    w.Key("chunks");
    w.Uint(result.chunks);
    w.Key("duration_seconds");
    w.Double(std::chrono::duration<double>(result.duration).count());
    w.Key("attempts");
    w.StartObject();
    for (size_t i = 0; i < replication::operations_count; ++i) {
        auto op = static_cast<replication::operation>(i);
        if (result.attempts[op]) {
            w.Key(replication::to_string(op).data());
            w.Uint(result.attempts[op]);
        }
    }
    w.EndObject();
    w.Key("timestamp");
    w.Int64(timestamp);
    if (result.error) {
        w.Key("error");
        w.StartObject();
        write_field(w, "kind", replication::to_string(*result.error));
        write_field(w, "message", result.error_message);
        w.EndObject();
    }
    w.EndObject();
    return to_sstring(buf);
}

sstring rejected_json(const std::string& message, unsigned retry_after, int64_t timestamp) {
    rapidjson::StringBuffer buf;
    json_writer w(buf);
    w.StartObject();
    write_field(w, "status", "rejected");
    w.Key("error");
    w.StartObject();
    write_field(w, "kind", "overloaded");
    write_field(w, "message", message);
    w.EndObject();
    w.Key("retry_after");
    w.Uint(retry_after);
    w.Key("timestamp");
    w.Int64(timestamp);
    w.EndObject();
    return to_sstring(buf);
}

sstring error_json(const request_error& e, int64_t timestamp) {
    rapidjson::StringBuffer buf;
    json_writer w(buf);
    w.StartObject();
    write_field(w, "error", e.error());
    write_field(w, "message", e.what());
    if (!e.details().empty()) {
        w.Key("details");
        w.StartObject();
        for (const auto& [field, messages] : e.details()) {
            w.Key(field.data(), static_cast<rapidjson::SizeType>(field.size()));
            w.StartArray();
            for (const auto& m : messages) {
                write_string(w, m);
            }
            w.EndArray();
        }
        w.EndObject();
    }
    w.Key("timestamp");
    w.Int64(timestamp);
    w.EndObject();
    return to_sstring(buf);
}

sstring error_json(std::string_view error, std::string_view message, int64_t timestamp) {
    rapidjson::StringBuffer buf;
    json_writer w(buf);
    w.StartObject();
    write_field(w, "error", error);
    write_field(w, "message", message);
    w.Key("timestamp");
    w.Int64(timestamp);
    w.EndObject();
    return to_sstring(buf);
}

static void write_store(json_writer& w, const char* key, const store_health& h) {
    w.Key(key);
    w.StartObject();
    write_field(w, "store", replication::to_string(h.kind));
    if (!h.bucket.empty()) {
        write_field(w, "bucket", h.bucket);
    }
    write_field(w, "status", h.status);
    if (!h.error.empty()) {
        write_field(w, "error", h.error);
    }
    w.EndObject();
}

sstring health_json(const health_report& report, std::string_view version) {
    rapidjson::StringBuffer buf;
    json_writer w(buf);
    w.StartObject();
    write_field(w, "status", report.healthy() ? "healthy" : "unhealthy");
    write_field(w, "version", version);
    w.Key("timestamp");
    w.Int64(report.timestamp);
    write_store(w, "source", report.source);
    write_store(w, "destination", report.destination);
    w.EndObject();
    return to_sstring(buf);
}

} // namespace api
