/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "http.hh"

#include <algorithm>
#include <cctype>
#include <ranges>
#include <boost/regex.hpp>
#include <fmt/ranges.h>
#include <seastar/core/coroutine.hh>
#include <seastar/coroutine/exception.hh>
#include <seastar/net/api.hh>
#include <seastar/net/dns.hh>

using namespace seastar;

namespace utils::http {

future<shared_ptr<tls::certificate_credentials>> system_trust_credentials() {
    static thread_local shared_ptr<tls::certificate_credentials> system_trust_credentials;
    if (!system_trust_credentials) {
        // can race, and overwrite the object. that is fine.
        auto cred = make_shared<tls::certificate_credentials>();
        co_await cred->set_system_trust();
        system_trust_credentials = std::move(cred);
    }
    co_return system_trust_credentials;
}

static std::optional<net::inet_address> numeric_address(const std::string& host) {
    try {
        return net::inet_address(host);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
}

dns_connection_factory::dns_connection_factory(std::string host, uint16_t port, bool use_https, logging::logger& logger,
        shared_ptr<tls::certificate_credentials> creds)
    : _host(std::move(host))
    , _port(port)
    , _use_https(use_https)
    , _logger(logger)
    , _creds(std::move(creds))
    , _numeric_host(numeric_address(_host))
{}

bool dns_connection_factory::addresses_valid() const noexcept {
    return !_addresses.empty() && lowres_clock::now() < _addresses_expire;
}

void dns_connection_factory::forget_addresses() noexcept {
    _addresses.clear();
    _next_address = 0;
}

future<> dns_connection_factory::resolve() {
    auto hent = co_await net::dns::get_host_by_name(_host, net::inet_address::family::INET);
    if (hent.addr_entries.empty()) {
        throw std::runtime_error(fmt::format("Host {} has no addresses", _host));
    }
    auto ttl = std::ranges::min(hent.addr_entries | std::views::transform(&net::hostent::address_entry::ttl));
    _addresses = hent.addr_entries | std::views::transform(&net::hostent::address_entry::addr) | std::ranges::to<std::vector>();
    _next_address = 0;
    // A zero TTL makes the record usable for the connection in progress only
    // (RFC 1035, 3.2.1), so the addresses expire right away.
    _addresses_expire = lowres_clock::now() + ttl;
    _logger.debug("Resolved {} to {} (ttl {}s)", _host, _addresses, ttl.count());
}

future<net::inet_address> dns_connection_factory::pick_address() {
    if (_numeric_host) {
        co_return *_numeric_host;
    }
    if (!addresses_valid()) [[unlikely]] {
        auto units = co_await get_units(_resolve_sem, 1);
        if (!addresses_valid()) {
            co_await resolve();
        }
    }
    co_return _addresses[_next_address++ % _addresses.size()];
}

future<shared_ptr<tls::certificate_credentials>> dns_connection_factory::credentials() {
    if (!_use_https) {
        co_return nullptr;
    }
    if (!_creds_loaded) [[unlikely]] {
        if (!_creds) {
            _creds = co_await system_trust_credentials();
        }
        _creds_loaded = true;
    }
    co_return _creds;
}

future<connected_socket> dns_connection_factory::make(abort_source*) {
    auto addr = socket_address(co_await pick_address(), _port);
    auto creds = co_await credentials();
    std::exception_ptr ex;
    try {
        if (creds) {
            _logger.debug("Making new HTTPS connection addr={} host={}", addr, _host);
            co_return co_await tls::connect(creds, addr, tls::tls_options{.server_name = _host});
        }
        _logger.debug("Making new HTTP connection addr={} host={}", addr, _host);
        co_return co_await seastar::connect(addr, {}, transport::TCP);
    } catch (...) {
        ex = std::current_exception();
    }
    _logger.debug("Connecting to {} ({}) failed, host will be resolved again: {}", addr, _host, ex);
    forget_addresses();
    co_return co_await coroutine::return_exception_ptr(std::move(ex));
}

bool url_info::is_https() const {
    return scheme == "https";
}

url_info parse_simple_url(std::string_view uri) {
    // Numeric IPv6 hosts are bracketed when followed by a port, like
    // http://[2001:db8:4006:812::200e]:8080
    static const boost::regex simple_url(R"(([a-zA-Z][a-zA-Z0-9+.-]*)://(\[[^\]]+\]|[^/:?#\[\]]+)(?::(\d{1,5}))?(/.*)?)");

    boost::smatch m;
    std::string tmp(uri);
    if (!boost::regex_match(tmp, m, simple_url)) {
        throw std::invalid_argument(fmt::format("Could not parse URI {}", uri));
    }

    auto scheme = m[1].str();
    std::ranges::transform(scheme, scheme.begin(), [] (unsigned char c) { return std::tolower(c); });
    if (scheme != "http" && scheme != "https") {
        throw std::invalid_argument(fmt::format("Unsupported scheme '{}' in URI {}", scheme, uri));
    }

    auto host = m[2].str();
    if (host.front() == '[') {
        host = host.substr(1, host.size() - 2);
    }

    unsigned long port = scheme == "https" ? 443 : 80;
    if (m[3].matched) {
        port = std::stoul(m[3].str());
        if (port == 0 || port > 65535) {
            throw std::invalid_argument(fmt::format("Port {} out of range in URI {}", port, uri));
        }
    }

    return url_info {
        .scheme = std::move(scheme),
        .host = std::move(host),
        .path = m[4].str(),
        .port = static_cast<uint16_t>(port),
    };
}

} // namespace utils::http
