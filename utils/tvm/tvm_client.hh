/*
 * Copyright (C) 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <seastar/core/future.hh>

#include "config.hh"
#include "credentials_cache.hh"
#include "credentials_fetcher.hh"

namespace tvm {

// <namespace>|<endpoint url>
std::string make_cache_key(const identity& ow, std::string_view url);

/*
 * Client for the token vending machine.
 *
 * Credentials are served from the cache while they are fresh and fetched from
 * the TVM otherwise, in which case they are written back to the cache. Failing
 * to write the cache does not fail the call. Concurrent misses for the same
 * endpoint are not coalesced: each of them fetches and the last write wins.
 */
class tvm_client {
    identity _ow;
    std::string _api_url;
    std::unique_ptr<credentials_fetcher> _fetcher;
    std::shared_ptr<credentials_cache> _cache;
public:
    // Throws configuration_error if cfg is invalid. The cache may be shared
    // with other clients; cfg.cache_file is not used.
    tvm_client(config cfg, std::unique_ptr<credentials_fetcher> fetcher, std::shared_ptr<credentials_cache> cache);

    // Client talking HTTP(S) to cfg.api_url and caching in cfg.cache_file
    static tvm_client make(config cfg);

    seastar::future<credentials> get_credentials(endpoint_kind endpoint);

    // Temporary credentials for the namespace's prefix of the shared S3 bucket
    seastar::future<credentials> get_aws_s3_credentials() { return get_credentials(endpoint_kind::aws_s3); }
    // SAS urls of the namespace's private and public Azure blob containers
    seastar::future<credentials> get_azure_blob_credentials() { return get_credentials(endpoint_kind::azure_blob); }

    [[nodiscard]] std::string endpoint_url(endpoint_kind endpoint) const;
    [[nodiscard]] std::string cache_key(endpoint_kind endpoint) const;
    [[nodiscard]] const std::string& api_url() const noexcept { return _api_url; }
    [[nodiscard]] const std::string& ns() const noexcept { return _ow.ns; }
    [[nodiscard]] const credentials_cache& cache() const noexcept { return *_cache; }
};

} // namespace tvm
