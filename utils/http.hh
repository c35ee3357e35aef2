/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include <seastar/core/lowres_clock.hh>
#include <seastar/core/semaphore.hh>
#include <seastar/core/shared_ptr.hh>
#include <seastar/http/client.hh>
#include <seastar/net/inet_address.hh>
#include <seastar/net/tls.hh>

#include "utils/log.hh"

namespace utils::http {

seastar::future<seastar::shared_ptr<seastar::tls::certificate_credentials>> system_trust_credentials();

// Connection factory for the seastar http client talking to one object store
// endpoint. Resolved addresses are reused until the shortest DNS TTL among them
// expires, and new connections are spread over all of them. A failed connect
// drops the addresses so the next connection resolves the host again. Numeric
// hosts are never resolved.
class dns_connection_factory : public seastar::http::experimental::connection_factory {
    std::string _host;
    uint16_t _port;
    bool _use_https;
    logging::logger& _logger;
    seastar::shared_ptr<seastar::tls::certificate_credentials> _creds;
    bool _creds_loaded = false;
    std::optional<seastar::net::inet_address> _numeric_host;
    std::vector<seastar::net::inet_address> _addresses;
    size_t _next_address = 0;
    seastar::lowres_clock::time_point _addresses_expire;
    seastar::semaphore _resolve_sem{1};

    bool addresses_valid() const noexcept;
    seastar::future<> resolve();
    seastar::future<seastar::net::inet_address> pick_address();
    seastar::future<seastar::shared_ptr<seastar::tls::certificate_credentials>> credentials();
    void forget_addresses() noexcept;

public:
    dns_connection_factory(std::string host, uint16_t port, bool use_https, logging::logger& logger,
            seastar::shared_ptr<seastar::tls::certificate_credentials> creds = {});

    seastar::future<seastar::connected_socket> make(seastar::abort_source*) override;
};

struct url_info {
    std::string scheme;
    std::string host;
    std::string path;
    uint16_t port;

    bool is_https() const;
};

// Parses http[s]://host[:port][/path]; IPv6 hosts come in brackets. Throws
// std::invalid_argument on other schemes, malformed URLs and ports outside
// 1..65535.
url_info parse_simple_url(std::string_view uri);

} // namespace utils::http
