/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <strings.h>
#include <boost/lexical_cast.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <yaml-cpp/yaml.h>

#include "config/service_config.hh"
#include "utils/http.hh"
#include "utils/log.hh"

namespace bpo = boost::program_options;

namespace config {

static logging::logger cfglog("config");

configuration_error::configuration_error(std::vector<std::string> problems)
    : std::runtime_error(fmt::format("invalid configuration: {}", fmt::join(problems, "; ")))
    , _problems(std::move(problems)) {
}

env_lookup process_environment() {
    return [] (std::string_view name) -> std::optional<std::string> {
        if (const char* v = std::getenv(std::string(name).c_str())) {
            return std::string(v);
        }
        return std::nullopt;
    };
}

namespace {

template <typename T>
T parse_number(std::string_view name, std::string_view value) {
    if constexpr (std::is_unsigned_v<T>) {
        if (!value.empty() && value.front() == '-') {
            throw configuration_error({fmt::format("{}: '{}' must not be negative", name, value)});
        }
    }
    try {
        return boost::lexical_cast<T>(std::string(value));
    } catch (const boost::bad_lexical_cast&) {
        throw configuration_error({fmt::format("{}: '{}' is not a valid number", name, value)});
    }
}

bool parse_bool(std::string_view name, std::string_view value) {
    for (auto yes : {"true", "1", "yes", "on"}) {
        if (strcasecmp(std::string(value).c_str(), yes) == 0) {
            return true;
        }
    }
    for (auto no : {"false", "0", "no", "off", ""}) {
        if (strcasecmp(std::string(value).c_str(), no) == 0) {
            return false;
        }
    }
    throw configuration_error({fmt::format("{}: '{}' is not a boolean", name, value)});
}

struct option {
    std::string_view name;
    std::string_view env;
    std::string_view help;
    std::function<void(service_config&, std::string_view)> set;

    std::string cli_name() const {
        std::string ret(name);
        std::ranges::replace(ret, '_', '-');
        return ret;
    }
};

template <typename T>
option number(std::string_view name, std::string_view env, std::string_view help, T service_config::*field) {
    return option{name, env, help, [name, field] (service_config& cfg, std::string_view v) {
        cfg.*field = parse_number<T>(name, v);
    }};
}

option text(std::string_view name, std::string_view env, std::string_view help, std::string service_config::*field) {
    return option{name, env, help, [field] (service_config& cfg, std::string_view v) {
        cfg.*field = std::string(v);
    }};
}

const std::vector<option>& options() {
    static const std::vector<option> opts = {
        number("chunk_size", "CHUNK_SIZE", "Bytes moved per chunk read and write", &service_config::chunk_size),
        number("max_retries", "MAX_RETRIES", "Maximum attempts of every remote operation", &service_config::max_retries),
        number("retry_delay", "RETRY_DELAY", "Seconds to wait before the first retry", &service_config::retry_delay),
        number("retry_backoff", "RETRY_BACKOFF", "Multiplier applied to the delay after every retry", &service_config::retry_backoff),
        number("retry_jitter", "RETRY_JITTER", "Upper bound in seconds of the random delay added to each retry", &service_config::retry_jitter),
        number("concurrency_ceiling", "CONCURRENCY_CEILING", "Maximum number of replication jobs running at once", &service_config::concurrency_ceiling),
        text("admission_policy", "ADMISSION_POLICY", "What to do with jobs over the ceiling: queue or reject", &service_config::admission_policy),
        number("job_timeout", "JOB_TIMEOUT", "Deadline in seconds of a whole job, 0 for none", &service_config::job_timeout),
        text("host", "HOST", "Address the HTTP trigger listens on", &service_config::host),
        number("port", "PORT", "Port the HTTP trigger listens on", &service_config::port),
        option{"debug", "DEBUG", "Log at debug level", [] (service_config& cfg, std::string_view v) {
            cfg.debug = parse_bool("debug", v);
        }},
        text("source_store", "SOURCE_STORE", "Store objects are read from: s3 or filesystem", &service_config::source_store),
        text("aws_access_key_id", "AWS_ACCESS_KEY_ID", "AWS access key id", &service_config::aws_access_key_id),
        text("aws_secret_access_key", "AWS_SECRET_ACCESS_KEY", "AWS secret access key", &service_config::aws_secret_access_key),
        text("aws_session_token", "AWS_SESSION_TOKEN", "AWS session token", &service_config::aws_session_token),
        text("aws_region", "AWS_REGION", "AWS region", &service_config::aws_region),
        text("s3_endpoint", "S3_ENDPOINT", "S3 endpoint URL, defaults to the regional AWS endpoint", &service_config::s3_endpoint),
        text("destination_store", "DESTINATION_STORE", "Store objects are written to: gcs, s3 or filesystem", &service_config::destination_store),
        text("target_bucket", "TARGET_GCS_BUCKET", "Destination bucket", &service_config::target_bucket),
        text("gcs_hmac_access_id", "GCS_HMAC_ACCESS_ID", "GCS HMAC key access id", &service_config::gcs_hmac_access_id),
        text("gcs_hmac_secret", "GCS_HMAC_SECRET", "GCS HMAC key secret", &service_config::gcs_hmac_secret),
        text("gcs_endpoint", "GCS_ENDPOINT", "GCS XML API endpoint URL", &service_config::gcs_endpoint),
        text("filesystem_root", "FILESYSTEM_ROOT", "Directory holding the buckets of the filesystem store", &service_config::filesystem_root),
        number("multipart_part_size", "MULTIPART_PART_SIZE", "Part size of multipart uploads", &service_config::multipart_part_size),
        number("health_cache_ttl", "HEALTH_CACHE_TTL", "Seconds a health check result is reused", &service_config::health_cache_ttl),
        text("health_source_bucket", "HEALTH_SOURCE_BUCKET", "Source bucket probed by the health check", &service_config::health_source_bucket),
    };
    return opts;
}

const option* find_option(std::string_view name) {
    auto& opts = options();
    auto it = std::ranges::find(opts, name, &option::name);
    return it == opts.end() ? nullptr : &*it;
}

} // anonymous namespace

void service_config::apply_yaml(const YAML::Node& root) {
    if (!root || root.IsNull()) {
        return;
    }
    if (!root.IsMap()) {
        throw configuration_error({"configuration file must contain a mapping"});
    }
    for (const auto& entry : root) {
        auto key = entry.first.as<std::string>();
        auto* opt = find_option(key);
        if (!opt) {
            cfglog.warn("Ignoring unknown configuration option '{}'", key);
            continue;
        }
        if (!entry.second.IsScalar()) {
            throw configuration_error({fmt::format("{}: expected a scalar value", key)});
        }
        opt->set(*this, entry.second.Scalar());
    }
}

void service_config::apply_yaml_file(const std::filesystem::path& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.native());
    } catch (const YAML::Exception& e) {
        throw configuration_error({fmt::format("cannot load {}: {}", path.native(), e.what())});
    }
    apply_yaml(root);
    cfglog.debug("Loaded configuration file {}", path.native());
}

void service_config::apply_environment(const env_lookup& env) {
    for (const auto& opt : options()) {
        if (auto v = env(opt.env)) {
            opt.set(*this, *v);
        }
    }
}

void service_config::apply_options(const bpo::variables_map& vm) {
    for (const auto& opt : options()) {
        auto name = opt.cli_name();
        if (vm.count(name)) {
            opt.set(*this, vm[name].as<std::string>());
        }
    }
}

static bool is_known(std::string_view name, std::initializer_list<std::string_view> allowed) {
    return std::ranges::find(allowed, name) != allowed.end();
}

void service_config::validate() const {
    std::vector<std::string> problems;
    auto require = [&] (bool ok, std::string problem) {
        if (!ok) {
            problems.push_back(std::move(problem));
        }
    };

    require(chunk_size > 0, "chunk_size must be positive");
    require(max_retries > 0, "max_retries must be at least 1");
    require(retry_delay >= 0, "retry_delay must not be negative");
    require(retry_backoff >= 1.0, "retry_backoff must be at least 1.0");
    require(retry_jitter >= 0, "retry_jitter must not be negative");
    require(concurrency_ceiling > 0, "concurrency_ceiling must be positive");
    require(is_known(admission_policy, {"queue", "reject"}), fmt::format("admission_policy '{}' is not one of queue, reject", admission_policy));
    require(job_timeout >= 0, "job_timeout must not be negative");
    require(health_cache_ttl >= 0, "health_cache_ttl must not be negative");
    require(port > 0, "port must be positive");
    require(!target_bucket.empty(), "target_bucket (TARGET_GCS_BUCKET) is required");

    bool source_ok = is_known(source_store, {"s3", "filesystem", "file"});
    bool destination_ok = is_known(destination_store, {"gcs", "gs", "s3", "filesystem", "file"});
    require(source_ok, fmt::format("source_store '{}' is not one of s3, filesystem", source_store));
    require(destination_ok, fmt::format("destination_store '{}' is not one of gcs, s3, filesystem", destination_store));

    auto check_url = [&] (std::string_view name, const std::string& url) {
        try {
            utils::http::parse_simple_url(url);
        } catch (const std::invalid_argument&) {
            problems.push_back(fmt::format("{} '{}' is not a valid URL", name, url));
        }
    };

    auto uses = [&] (replication::store_kind kind) {
        return (source_ok && source_kind() == kind) || (destination_ok && destination_kind() == kind);
    };
    if (uses(replication::store_kind::s3)) {
        require(!aws_access_key_id.empty(), "aws_access_key_id (AWS_ACCESS_KEY_ID) is required for S3");
        require(!aws_secret_access_key.empty(), "aws_secret_access_key (AWS_SECRET_ACCESS_KEY) is required for S3");
        require(!aws_region.empty(), "aws_region (AWS_REGION) is required for S3");
        check_url("s3_endpoint", effective_s3_endpoint());
    }
    if (uses(replication::store_kind::gcs)) {
        require(!gcs_hmac_access_id.empty(), "gcs_hmac_access_id (GCS_HMAC_ACCESS_ID) is required for GCS");
        require(!gcs_hmac_secret.empty(), "gcs_hmac_secret (GCS_HMAC_SECRET) is required for GCS");
        check_url("gcs_endpoint", gcs_endpoint);
    }
    if (uses(replication::store_kind::filesystem)) {
        require(!filesystem_root.empty(), "filesystem_root (FILESYSTEM_ROOT) is required for the filesystem store");
    }
    if (destination_ok && destination_kind() != replication::store_kind::filesystem) {
        require(multipart_part_size >= (5 << 20), fmt::format("multipart_part_size {} is below the 5 MiB minimum", multipart_part_size));
    }

    if (!problems.empty()) {
        throw configuration_error(std::move(problems));
    }
}

replication::store_kind service_config::source_kind() const {
    return replication::store_kind_from_string(source_store);
}

replication::store_kind service_config::destination_kind() const {
    return replication::store_kind_from_string(destination_store);
}

std::string service_config::effective_s3_endpoint() const {
    if (!s3_endpoint.empty()) {
        return s3_endpoint;
    }
    return fmt::format("https://s3.{}.amazonaws.com", aws_region);
}

static std::chrono::milliseconds seconds_to_ms(double seconds) {
    return std::chrono::milliseconds(std::llround(seconds * 1000));
}

replication::orchestrator_config service_config::make_orchestrator_config() const {
    replication::orchestrator_config cfg;
    cfg.chunk_size = chunk_size;
    cfg.retry = replication::retry_policy{
        .max_attempts = max_retries,
        .base_delay = seconds_to_ms(retry_delay),
        .backoff_multiplier = retry_backoff,
        .jitter = seconds_to_ms(retry_jitter),
    };
    cfg.concurrency_ceiling = concurrency_ceiling;
    cfg.admission = replication::admission_policy_from_string(admission_policy);
    if (job_timeout > 0) {
        cfg.job_timeout = seconds_to_ms(job_timeout);
    }
    return cfg;
}

std::chrono::milliseconds service_config::health_ttl() const {
    return seconds_to_ms(health_cache_ttl);
}

void add_options(bpo::options_description_easy_init opts) {
    opts("config-file", bpo::value<std::string>(), "YAML configuration file");
    for (const auto& opt : options()) {
        auto name = opt.cli_name();
        opts(name.c_str(), bpo::value<std::string>(), std::string(opt.help).c_str());
    }
}

service_config load(const bpo::variables_map& vm, const env_lookup& env) {
    service_config cfg;
    if (vm.count("config-file")) {
        cfg.apply_yaml_file(vm["config-file"].as<std::string>());
    }
    cfg.apply_environment(env);
    cfg.apply_options(vm);
    cfg.validate();
    return cfg;
}

} // namespace config
