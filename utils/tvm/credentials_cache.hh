/*
 * Copyright (C) 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <chrono>
#include <exception>
#include <filesystem>
#include <optional>
#include <string>

#include <seastar/core/future.hh>

#include "creds.hh"

namespace tvm {

// Outcome of a cache lookup. A degraded lookup is a miss caused by an
// unreadable or malformed cache file.
class cache_lookup {
public:
    enum class status {
        hit,
        miss,
        degraded,
    };
private:
    status _status;
    std::optional<credentials> _creds;
    std::exception_ptr _cause;

    cache_lookup(status s, std::optional<credentials> creds, std::exception_ptr cause)
        : _status(s), _creds(std::move(creds)), _cause(std::move(cause)) {}
public:
    static cache_lookup hit(credentials creds) { return {status::hit, std::move(creds), nullptr}; }
    static cache_lookup miss() { return {status::miss, std::nullopt, nullptr}; }
    static cache_lookup degraded(std::exception_ptr cause) { return {status::degraded, std::nullopt, std::move(cause)}; }

    [[nodiscard]] status get_status() const noexcept { return _status; }
    // Engaged only on a hit
    [[nodiscard]] const std::optional<credentials>& creds() const noexcept { return _creds; }
    [[nodiscard]] std::optional<credentials> release_creds() && noexcept { return std::move(_creds); }
    [[nodiscard]] std::exception_ptr cause() const noexcept { return _cause; }
};

/*
 * Credentials persisted in a single JSON file, one entry per cache key.
 *
 * Lookups never fail: a missing, unreadable or malformed file reads as empty.
 * Every set() rewrites the whole file after merging the new entry into what
 * was read from it. Nothing coordinates concurrent writers, including ones in
 * other processes, so racing writers can lose each other's unrelated entries.
 */
class credentials_cache {
    std::optional<std::filesystem::path> _path;

    // Throws if the file is missing, unreadable or not a JSON object
    seastar::future<rjson::value> load() const;
public:
    // Cached credentials are not handed out during the last minute before they expire
    static constexpr std::chrono::seconds freshness_buffer{60};

    // std::nullopt disables caching: lookups always miss and set() writes nothing
    explicit credentials_cache(std::optional<std::filesystem::path> path);

    [[nodiscard]] bool enabled() const noexcept { return _path.has_value(); }
    [[nodiscard]] const std::optional<std::filesystem::path>& path() const noexcept { return _path; }

    // Entries without a parsable expiration are never fresh
    [[nodiscard]] static bool is_fresh(const credentials& creds, clock_type::time_point now);

    seastar::future<cache_lookup> lookup(std::string key) const;
    // Fresh credentials stored under key, if any
    seastar::future<std::optional<credentials>> get(std::string key) const;
    // Fails if the file cannot be written
    seastar::future<> set(std::string key, credentials creds);
};

} // namespace tvm
