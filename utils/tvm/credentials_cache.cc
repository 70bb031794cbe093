/*
 * Copyright (C) 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "credentials_cache.hh"

#include <system_error>
#include <seastar/core/coroutine.hh>
#include <seastar/util/log.hh>

#include "seastarx.hh"
#include "utils/file_io.hh"

namespace tvm {

static seastar::logger cache_logger("tvm_cache");

static bool is_missing_file(std::exception_ptr ex) {
    try {
        std::rethrow_exception(std::move(ex));
    } catch (const std::system_error& e) {
        return e.code() == std::errc::no_such_file_or_directory;
    } catch (const std::exception&) {
        return false;
    }
}

credentials_cache::credentials_cache(std::optional<std::filesystem::path> path)
    : _path(std::move(path))
{}

bool credentials_cache::is_fresh(const credentials& creds, clock_type::time_point now) {
    auto expires_at = creds.expires_at();
    return expires_at && now < *expires_at - freshness_buffer;
}

future<rjson::value> credentials_cache::load() const {
    auto content = co_await utils::read_entire_file(*_path);
    auto all = rjson::parse(std::string_view(content.data(), content.size()));
    if (!all.IsObject()) {
        throw rjson::error("Cache file does not hold a JSON object");
    }
    co_return all;
}

future<cache_lookup> credentials_cache::lookup(std::string key) const {
    if (!_path) {
        co_return cache_lookup::miss();
    }

    rjson::value all;
    std::exception_ptr ex;
    try {
        all = co_await load();
    } catch (...) {
        ex = std::current_exception();
    }
    if (ex) {
        if (is_missing_file(ex)) {
            cache_logger.debug("Cache file {} does not exist", _path->native());
            co_return cache_lookup::miss();
        }
        co_return cache_lookup::degraded(std::move(ex));
    }

    auto* entry = rjson::find(all, key);
    if (!entry || !entry->IsObject()) {
        co_return cache_lookup::miss();
    }
    credentials creds(std::move(*entry));
    if (!is_fresh(creds, clock_type::now())) {
        cache_logger.debug("Cached credentials for {} expire at {}, ignoring them", key, creds.expiration().value_or("<none>"));
        co_return cache_lookup::miss();
    }
    co_return cache_lookup::hit(std::move(creds));
}

future<std::optional<credentials>> credentials_cache::get(std::string key) const {
    auto res = co_await lookup(key);
    switch (res.get_status()) {
    case cache_lookup::status::hit:
        cache_logger.debug("Cache hit for {}", key);
        break;
    case cache_lookup::status::miss:
        cache_logger.debug("Cache miss for {}", key);
        break;
    case cache_lookup::status::degraded:
        cache_logger.debug("Cache file {} is unusable, treating {} as a miss: {}", _path->native(), key, res.cause());
        break;
    }
    co_return std::move(res).release_creds();
}

future<> credentials_cache::set(std::string key, credentials creds) {
    if (!_path) {
        co_return;
    }

    rjson::value all = rjson::empty_object();
    try {
        all = co_await load();
    } catch (const std::exception& e) {
        // missing or corrupt, start over
        cache_logger.debug("Rewriting cache file {} from scratch: {}", _path->native(), e.what());
    }

    rjson::replace_with_string_name(all, key, rjson::copy(creds.blob()));
    auto data = rjson::print(all);
    co_await utils::write_entire_file(*_path, data);
    cache_logger.debug("Stored credentials for {} in {}", key, _path->native());
}

} // namespace tvm
