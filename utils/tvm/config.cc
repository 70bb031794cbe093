/*
 * Copyright (C) 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "config.hh"

#include <system_error>
#include <yaml-cpp/yaml.h>
#include <seastar/core/coroutine.hh>

#include "seastarx.hh"
#include "tvm_error.hh"
#include "utils/file_io.hh"
#include "utils/http.hh"

namespace tvm {

std::filesystem::path default_cache_file() {
    return std::filesystem::temp_directory_path() / ".tvmCache";
}

std::optional<std::filesystem::path> cache_file_option::resolve() const {
    switch (_mode) {
    case mode::use_default:
        return default_cache_file();
    case mode::disabled:
        return std::nullopt;
    case mode::explicit_path:
        if (_path.empty()) {
            return std::nullopt;
        }
        return _path;
    }
    return std::nullopt;
}

void config::validate() const {
    if (ow.ns.empty()) {
        throw configuration_error("\"ow.namespace\" is required");
    }
    if (ow.ns.find(cache_key_separator) != std::string::npos) {
        throw configuration_error(fmt::format("\"ow.namespace\" must not contain '{}'", cache_key_separator));
    }
    if (ow.auth.empty()) {
        throw configuration_error("\"ow.auth\" is required");
    }
    if (!utils::http::parse_url(api_url)) {
        throw configuration_error(fmt::format("\"api_url\" must be a valid http or https uri, got \"{}\"", api_url));
    }
}

static std::string scalar(const YAML::Node& node, std::string_view name) {
    if (!node.IsScalar()) {
        throw configuration_error(fmt::format("\"{}\" must be a string", name));
    }
    return node.Scalar();
}

static cache_file_option decode_cache_file(const YAML::Node& node) {
    if (node.IsNull()) {
        return cache_file_option::disabled();
    }
    if (!node.IsScalar()) {
        throw configuration_error("\"cache_file\" must be a path or false");
    }
    bool flag;
    if (YAML::convert<bool>::decode(node, flag)) {
        return flag ? cache_file_option() : cache_file_option::disabled();
    }
    return cache_file_option::at(node.Scalar());
}

config config::decode(const YAML::Node& node) {
    if (!node.IsMap()) {
        throw configuration_error("config must be a map");
    }
    config cfg;
    try {
        auto ow = node["ow"];
        if (!ow || !ow.IsMap()) {
            throw configuration_error("\"ow\" is required and must be a map");
        }
        if (auto ns = ow["namespace"]) {
            cfg.ow.ns = scalar(ns, "ow.namespace");
        }
        if (auto auth = ow["auth"]) {
            cfg.ow.auth = scalar(auth, "ow.auth");
        }
        if (auto api_url = node["api_url"]) {
            cfg.api_url = scalar(api_url, "api_url");
        }
        if (auto cache_file = node["cache_file"]) {
            cfg.cache_file = decode_cache_file(cache_file);
        }
    } catch (const YAML::Exception& e) {
        throw configuration_error(fmt::format("Could not decode config: {}", e.what()));
    }
    return cfg;
}

future<config> read_config_file(std::filesystem::path path) {
    sstring data;
    try {
        data = co_await utils::read_entire_file(path);
    } catch (const std::system_error& e) {
        throw configuration_error(fmt::format("Could not read config file {}: {}", path.native(), e.what()));
    }

    YAML::Node doc;
    try {
        doc = YAML::Load(std::string(data));
    } catch (const YAML::Exception& e) {
        throw configuration_error(fmt::format("Could not parse config file {}: {}", path.native(), e.what()));
    }
    co_return config::decode(doc);
}

} // namespace tvm
