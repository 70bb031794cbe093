/*
 * Copyright (C) 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "http.hh"

#include <cctype>
#include <charconv>
#include <fmt/format.h>
#include <seastar/core/coroutine.hh>
#include <seastar/net/api.hh>
#include <seastar/net/dns.hh>
#include <seastar/net/inet_address.hh>

namespace utils::http {

using namespace seastar;

std::optional<url_parts> parse_url(std::string_view url) {
    url_parts parts;
    constexpr std::string_view http_scheme = "http://";
    constexpr std::string_view https_scheme = "https://";
    if (url.starts_with(https_scheme)) {
        parts.is_https = true;
        url.remove_prefix(https_scheme.size());
    } else if (url.starts_with(http_scheme)) {
        url.remove_prefix(http_scheme.size());
    } else {
        return std::nullopt;
    }

    url = url.substr(0, url.find('#'));
    auto path_start = url.find_first_of("/?");
    auto authority = url.substr(0, path_start);
    if (path_start == std::string_view::npos) {
        parts.path = "/";
    } else if (url[path_start] != '/') {
        parts.path = fmt::format("/{}", url.substr(path_start));
    } else {
        parts.path = std::string(url.substr(path_start));
    }

    if (authority.find('@') != std::string_view::npos) {
        return std::nullopt;
    }
    std::string_view port_str;
    bool has_port = false;
    if (authority.starts_with('[')) {
        // [v6 address] or [v6 address]:port
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return std::nullopt;
        }
        auto rest = authority.substr(close + 1);
        if (!rest.empty()) {
            if (rest.front() != ':') {
                return std::nullopt;
            }
            port_str = rest.substr(1);
            has_port = true;
        }
        authority = authority.substr(1, close - 1);
        if (authority.find_first_of("[]") != std::string_view::npos) {
            return std::nullopt;
        }
    } else {
        if (authority.find_first_of("[]") != std::string_view::npos) {
            return std::nullopt;
        }
        auto colon = authority.rfind(':');
        if (colon != std::string_view::npos) {
            port_str = authority.substr(colon + 1);
            has_port = true;
            authority = authority.substr(0, colon);
            if (authority.find(':') != std::string_view::npos) {
                // unbracketed v6 address
                return std::nullopt;
            }
        }
    }
    if (has_port) {
        unsigned port = 0;
        auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
        if (port_str.empty() || ec != std::errc() || ptr != port_str.data() + port_str.size() || port == 0 || port > 65535) {
            return std::nullopt;
        }
        parts.port = port;
    } else {
        parts.port = parts.is_https ? 443 : 80;
    }
    if (authority.empty()) {
        return std::nullopt;
    }
    parts.host = std::string(authority);
    return parts;
}

std::string host_header(const url_parts& parts) {
    auto host = parts.host.find(':') == std::string::npos ? parts.host : fmt::format("[{}]", parts.host);
    auto default_port = parts.is_https ? 443u : 80u;
    if (parts.port == default_port) {
        return host;
    }
    return fmt::format("{}:{}", host, parts.port);
}

std::string url_join(std::initializer_list<std::string_view> parts) {
    std::string res;
    if (parts.size() && parts.begin()->starts_with('/')) {
        res = "/";
    }
    bool first = true;
    for (auto part : parts) {
        if (part.starts_with('/')) {
            part.remove_prefix(1);
        }
        if (part.ends_with('/')) {
            part.remove_suffix(1);
        }
        if (part.empty()) {
            continue;
        }
        if (!first) {
            res += '/';
        }
        res += part;
        first = false;
    }
    return res;
}

std::string form_encode(std::string_view value) {
    static constexpr char hex[] = "0123456789ABCDEF";
    std::string res;
    res.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '*' || c == '-' || c == '.' || c == '_') {
            res += c;
        } else if (c == ' ') {
            res += '+';
        } else {
            res += '%';
            res += hex[c >> 4];
            res += hex[c & 0xf];
        }
    }
    return res;
}

std::string make_query_string(const std::vector<std::pair<std::string, std::string>>& params) {
    std::string res;
    for (const auto& [key, value] : params) {
        if (!res.empty()) {
            res += '&';
        }
        res += form_encode(key);
        res += '=';
        res += form_encode(value);
    }
    return res;
}

dns_connection_factory::dns_connection_factory(std::string host, unsigned port, bool use_https, seastar::logger& logger)
    : _host(std::move(host))
    , _port(port)
    , _use_https(use_https)
    , _logger(logger)
{}

future<socket_address> dns_connection_factory::resolve() {
    if (auto numeric = net::inet_address::parse_numerical(sstring(_host.data(), _host.size()))) {
        co_return socket_address(*numeric, _port);
    }
    auto addr = co_await net::dns::resolve_name(sstring(_host.data(), _host.size()), net::inet_address::family::INET);
    _logger.debug("{} resolved to {}", _host, addr);
    co_return socket_address(addr, _port);
}

future<shared_ptr<tls::certificate_credentials>> dns_connection_factory::system_trust_credentials() {
    if (!_creds) {
        auto creds = make_shared<tls::certificate_credentials>();
        co_await creds->set_system_trust();
        _creds = std::move(creds);
    }
    co_return _creds;
}

future<connected_socket> dns_connection_factory::make(abort_source*) {
    auto addr = co_await resolve();
    if (!_use_https) {
        co_return co_await seastar::connect(addr);
    }
    auto creds = co_await system_trust_credentials();
    co_return co_await tls::connect(std::move(creds), addr, tls::tls_options{.server_name = sstring(_host.data(), _host.size())});
}

} // namespace utils::http
