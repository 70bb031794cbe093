/*
 * Copyright (C) 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <seastar/core/future.hh>

#include "creds.hh"

namespace YAML {
class Node;
}

namespace tvm {

// Adobe I/O token vending machine
inline constexpr std::string_view default_api_url = "https://adobeio.adobeioruntime.net/apis/tvm";

// <temp directory>/.tvmCache
std::filesystem::path default_cache_file();

/*
 * Where credentials are cached. Left untouched it points to the default cache
 * file, disabled() turns caching off and at() picks an explicit file. An empty
 * explicit path disables caching as well.
 */
class cache_file_option {
public:
    enum class mode {
        use_default,
        disabled,
        explicit_path,
    };
private:
    mode _mode = mode::use_default;
    std::filesystem::path _path;

    cache_file_option(mode m, std::filesystem::path path) : _mode(m), _path(std::move(path)) {}
public:
    cache_file_option() = default;

    static cache_file_option disabled() { return {mode::disabled, {}}; }
    static cache_file_option at(std::filesystem::path path) { return {mode::explicit_path, std::move(path)}; }

    [[nodiscard]] mode get_mode() const noexcept { return _mode; }
    // The file to use, std::nullopt when caching is off
    [[nodiscard]] std::optional<std::filesystem::path> resolve() const;
};

struct config {
    identity ow;
    std::string api_url{default_api_url};
    cache_file_option cache_file;

    // Throws configuration_error describing the first invalid field
    void validate() const;

    /*
     * ow:
     *   namespace: <namespace>
     *   auth: <auth key>
     * api_url: <url>          # optional
     * cache_file: <path>      # optional, false, ~ or "" disable caching
     *
     * Throws configuration_error. The result is not validated.
     */
    static config decode(const YAML::Node& node);
};

// Reads and decodes a YAML config file, see config::decode()
seastar::future<config> read_config_file(std::filesystem::path path);

} // namespace tvm
