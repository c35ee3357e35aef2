/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include <boost/program_options.hpp>

#include "replication/object_identity.hh"
#include "replication/orchestrator.hh"

namespace YAML {
class Node;
}

namespace config {

class configuration_error : public std::runtime_error {
    std::vector<std::string> _problems;

public:
    explicit configuration_error(std::vector<std::string> problems);

    const std::vector<std::string>& problems() const noexcept { return _problems; }
};

using env_lookup = std::function<std::optional<std::string>(std::string_view)>;

// Reads the process environment.
env_lookup process_environment();

struct service_config {
    size_t chunk_size = 8192;
    unsigned max_retries = 3;
    double retry_delay = 1.0;
    double retry_backoff = 2.0;
    double retry_jitter = 0;
    unsigned concurrency_ceiling = 4;
    std::string admission_policy = "queue";
    // Seconds, 0 disables the deadline.
    double job_timeout = 300;

    std::string host = "0.0.0.0";
    uint16_t port = 8080;
    bool debug = false;

    std::string source_store = "s3";
    std::string aws_access_key_id;
    std::string aws_secret_access_key;
    std::string aws_session_token;
    std::string aws_region = "us-east-1";
    // Defaults to the regional AWS endpoint.
    std::string s3_endpoint;

    std::string destination_store = "gcs";
    std::string target_bucket;
    std::string gcs_hmac_access_id;
    std::string gcs_hmac_secret;
    std::string gcs_endpoint = "https://storage.googleapis.com";

    std::string filesystem_root;
    size_t multipart_part_size = 5 << 20;
    double health_cache_ttl = 10;
    // Source bucket probed by GET /health. Left empty, only the destination is probed.
    std::string health_source_bucket;

    // Each source overrides the settings it mentions.
    void apply_yaml(const YAML::Node& root);
    void apply_yaml_file(const std::filesystem::path& path);
    void apply_environment(const env_lookup& env);
    void apply_options(const boost::program_options::variables_map& vm);

    // Throws configuration_error listing every problem found.
    void validate() const;

    replication::store_kind source_kind() const;
    replication::store_kind destination_kind() const;
    std::string effective_s3_endpoint() const;
    replication::orchestrator_config make_orchestrator_config() const;
    std::chrono::milliseconds health_ttl() const;
};

// Registers the command line options understood by apply_options().
void add_options(boost::program_options::options_description_easy_init opts);

// defaults < YAML file named by --config-file < environment < command line
service_config load(const boost::program_options::variables_map& vm, const env_lookup& env = process_environment());

} // namespace config
