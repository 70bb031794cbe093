/*
 * Copyright (C) 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <seastar/http/client.hh>
#include <seastar/net/tls.hh>
#include <seastar/util/log.hh>

namespace utils::http {

struct url_parts {
    bool is_https = false;
    // Name or address, v6 addresses without their brackets
    std::string host;
    unsigned port = 0;
    // Always starts with '/'
    std::string path;
};

// Splits an absolute http:// or https:// URL. The query string is kept as part
// of the path and the fragment is dropped. Returns std::nullopt if the URL has
// another scheme, userinfo, an empty host, a malformed [v6] host or an
// invalid port.
std::optional<url_parts> parse_url(std::string_view url);

// Value of the Host header for parts: the host, bracketed if it is a v6
// address, and the port unless it is the scheme's default
std::string host_header(const url_parts& parts);

// Joins URL parts with single slashes, trimming one leading and one trailing
// slash from every part and dropping empty parts. A leading slash on the first
// part is kept.
std::string url_join(std::initializer_list<std::string_view> parts);

// application/x-www-form-urlencoded encoding of a single key or value
std::string form_encode(std::string_view value);

std::string make_query_string(const std::vector<std::pair<std::string, std::string>>& params);

// Opens plain or TLS connections to a host whose address is resolved through
// DNS for every new connection.
class dns_connection_factory : public seastar::http::experimental::connection_factory {
    std::string _host;
    unsigned _port;
    bool _use_https;
    seastar::logger& _logger;
    seastar::shared_ptr<seastar::tls::certificate_credentials> _creds;

    seastar::future<seastar::socket_address> resolve();
    seastar::future<seastar::shared_ptr<seastar::tls::certificate_credentials>> system_trust_credentials();
public:
    dns_connection_factory(std::string host, unsigned port, bool use_https, seastar::logger& logger);

    seastar::future<seastar::connected_socket> make(seastar::abort_source*) override;
};

} // namespace utils::http
