/*
 * Copyright (C) 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "utils/rjson.hh"

namespace tvm {

using clock_type = std::chrono::system_clock;

// Splits the namespace from the endpoint url in cache keys; never valid in a namespace
inline constexpr char cache_key_separator = '|';

// OpenWhisk identity the credentials are issued for
struct identity {
    std::string ns;
    std::string auth;
};

enum class endpoint_kind {
    aws_s3,
    azure_blob,
};

// Path of the endpoint relative to the TVM api url, e.g. "aws/s3"
std::string_view endpoint_suffix(endpoint_kind kind) noexcept;
std::string_view endpoint_name(endpoint_kind kind) noexcept;
std::optional<endpoint_kind> endpoint_from_name(std::string_view name) noexcept;

// Parses an ISO-8601 UTC timestamp such as 2019-08-20T09:51:58.123Z or
// 2019-08-20T11:51:58+02:00. Returns std::nullopt on anything else.
std::optional<clock_type::time_point> parse_iso8601(std::string_view str);
std::string format_iso8601(clock_type::time_point tp);

/*
 * Credentials as returned by the token vending machine: a JSON object which
 * always carries an "expiration" timestamp. Everything else is backend
 * specific and passed through untouched.
 */
class credentials {
    rjson::value _blob;
public:
    explicit credentials(rjson::value blob);
    credentials(const credentials& o);
    credentials(credentials&&) noexcept = default;
    credentials& operator=(const credentials& o);
    credentials& operator=(credentials&&) noexcept = default;

    // Throws rjson::error if str is not a JSON object
    static credentials parse(std::string_view str);

    [[nodiscard]] const rjson::value& blob() const noexcept { return _blob; }
    [[nodiscard]] std::optional<std::string_view> expiration() const;
    [[nodiscard]] std::optional<clock_type::time_point> expires_at() const;
    [[nodiscard]] std::string to_json() const { return rjson::print(_blob); }

    bool operator==(const credentials& o) const { return _blob == o._blob; }
};

// Temporary credentials restricted to the <namespace>/ prefix of a shared bucket
struct aws_s3_credentials {
    std::string access_key_id;
    std::string secret_access_key;
    std::string session_token;
    std::string bucket;
    clock_type::time_point expires_at;

    static aws_s3_credentials from(const credentials& creds);
};

// Signed URLs to a private and a publicly readable blob container
struct azure_blob_credentials {
    std::string sas_url_private;
    std::string sas_url_public;
    clock_type::time_point expires_at;

    static azure_blob_credentials from(const credentials& creds);
};

} // namespace tvm

template <> struct fmt::formatter<tvm::endpoint_kind> : fmt::formatter<std::string_view> {
    auto format(tvm::endpoint_kind kind, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(tvm::endpoint_name(kind), ctx);
    }
};
