/*
 * Copyright (C) 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "http_credentials_fetcher.hh"

#include <seastar/core/coroutine.hh>
#include <seastar/http/client.hh>
#include <seastar/http/reply.hh>
#include <seastar/http/request.hh>
#include <seastar/util/log.hh>
#include <seastar/util/short_streams.hh>

#include "seastarx.hh"
#include "tvm_error.hh"
#include "utils/http.hh"

namespace tvm {

static seastar::logger fetcher_logger("tvm_fetcher");

std::string http_credentials_fetcher::request_target(const std::string& path, const identity& ow) {
    auto query = utils::http::make_query_string({{"owNamespace", ow.ns}, {"owAuth", ow.auth}});
    return fmt::format("{}{}{}", path, path.find('?') == std::string::npos ? '?' : '&', query);
}

future<credentials> http_credentials_fetcher::fetch(const std::string& url, const identity& ow) {
    auto parts = utils::http::parse_url(url);
    if (!parts) {
        throw configuration_error(fmt::format("Invalid TVM endpoint url: {}", url));
    }
    fetcher_logger.debug("Requesting credentials from {} for namespace {}", url, ow.ns);

    auto host = utils::http::host_header(*parts);
    auto factory = std::make_unique<utils::http::dns_connection_factory>(parts->host, parts->port, parts->is_https, fetcher_logger);
    http::experimental::client http_client(std::move(factory), 1, http::experimental::client::retry_requests::no);

    auto req = http::request::make("GET", sstring(host), sstring(request_target(parts->path, ow)));
    req._headers["Accept"] = "application/json";

    std::optional<http::reply::status_type> status;
    sstring body;
    std::exception_ptr ex;
    try {
        co_await http_client.make_request(
            std::move(req),
            [&status, &body](const http::reply& rep, input_stream<char>&& in) -> future<> {
                auto input = std::move(in);
                status = rep._status;
                body = co_await util::read_entire_stream_contiguous(input);
            },
            std::nullopt);
    } catch (...) {
        ex = std::current_exception();
    }
    co_await http_client.close();
    if (ex) {
        throw transport_error(fmt::format("Could not reach TVM at {}: {}", url, ex));
    }

    auto st = status.value();
    if (http::reply::classify_status(st) != http::reply::status_class::success) {
        fetcher_logger.debug("TVM at {} answered with status {}", url, static_cast<int>(st));
        throw remote_fetch_error(st, std::string(body));
    }

    std::optional<credentials> creds;
    try {
        creds.emplace(credentials::parse(std::string_view(body.data(), body.size())));
    } catch (const rjson::error& e) {
        throw remote_fetch_error(st, std::string(body), fmt::format("invalid credentials: {}", e.what()));
    }
    fetcher_logger.info("Retrieved credentials from {} for namespace {}, expiring at {}", url, ow.ns, creds->expiration().value_or("<unknown>"));
    co_return std::move(*creds);
}

} // namespace tvm
