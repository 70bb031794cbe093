/*
 * Copyright (C) 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "tvm_client.hh"

#include <seastar/core/coroutine.hh>
#include <seastar/util/log.hh>

#include "http_credentials_fetcher.hh"
#include "seastarx.hh"
#include "tvm_error.hh"
#include "utils/http.hh"

namespace tvm {

static seastar::logger client_logger("tvm_client");

std::string make_cache_key(const identity& ow, std::string_view url) {
    return fmt::format("{}{}{}", ow.ns, cache_key_separator, url);
}

static const config& validated(const config& cfg) {
    cfg.validate();
    return cfg;
}

tvm_client::tvm_client(config cfg, std::unique_ptr<credentials_fetcher> fetcher, std::shared_ptr<credentials_cache> cache)
    : _ow(validated(cfg).ow)
    , _api_url(std::move(cfg.api_url))
    , _fetcher(std::move(fetcher))
    , _cache(std::move(cache))
{
    if (!_fetcher) {
        throw configuration_error("tvm_client requires a credentials fetcher");
    }
    if (!_cache) {
        throw configuration_error("tvm_client requires a credentials cache");
    }
}

tvm_client tvm_client::make(config cfg) {
    cfg.validate();
    auto cache = std::make_shared<credentials_cache>(cfg.cache_file.resolve());
    return tvm_client(std::move(cfg), std::make_unique<http_credentials_fetcher>(), std::move(cache));
}

std::string tvm_client::endpoint_url(endpoint_kind endpoint) const {
    return utils::http::url_join({_api_url, endpoint_suffix(endpoint)});
}

std::string tvm_client::cache_key(endpoint_kind endpoint) const {
    return make_cache_key(_ow, endpoint_url(endpoint));
}

future<credentials> tvm_client::get_credentials(endpoint_kind endpoint) {
    auto url = endpoint_url(endpoint);
    auto key = make_cache_key(_ow, url);

    if (auto cached = co_await _cache->get(key)) {
        co_return std::move(*cached);
    }

    auto creds = co_await _fetcher->fetch(url, _ow);
    try {
        co_await _cache->set(key, creds);
    } catch (const std::exception& e) {
        client_logger.warn("Could not cache {} credentials for namespace {}: {}", endpoint, _ow.ns, e.what());
    }
    co_return creds;
}

} // namespace tvm
