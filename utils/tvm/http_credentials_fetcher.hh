/*
 * Copyright (C) 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include "credentials_fetcher.hh"

namespace tvm {

/*
 * Fetches credentials over HTTP(S) with
 * GET <url>?owNamespace=<namespace>&owAuth=<auth>.
 * Every fetch opens its own connection and closes it before returning.
 */
class http_credentials_fetcher final : public credentials_fetcher {
public:
    [[nodiscard]] seastar::future<credentials> fetch(const std::string& url, const identity& ow) override;
    [[nodiscard]] const char* get_name() const override { return "http_credentials_fetcher"; }

    // Request target (path and query) sent for url
    static std::string request_target(const std::string& path, const identity& ow);
};

} // namespace tvm
