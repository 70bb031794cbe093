/*
 * Copyright (C) 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <string>

#include <seastar/core/future.hh>

#include "creds.hh"

namespace tvm {

/*
 * Retrieves credentials from the token vending machine. Implementations do not
 * retry: every failure is reported to the caller right away.
 */
class credentials_fetcher {
public:
    virtual ~credentials_fetcher() = default;

    /*
     * Requests credentials from the fully resolved endpoint url on behalf of
     * ow. Fails with remote_fetch_error when the service rejects the request
     * and with transport_error when it cannot be reached.
     */
    [[nodiscard]] virtual seastar::future<credentials> fetch(const std::string& url, const identity& ow) = 0;
    [[nodiscard]] virtual const char* get_name() const = 0;
};

} // namespace tvm
