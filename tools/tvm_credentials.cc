/*
 * Copyright (C) 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <string>

#include <boost/program_options.hpp>
#include <fmt/format.h>
#include <seastar/core/app-template.hh>
#include <seastar/core/coroutine.hh>
#include <seastar/util/log.hh>

#include "seastarx.hh"
#include "utils/tvm/config.hh"
#include "utils/tvm/tvm_client.hh"
#include "utils/tvm/tvm_error.hh"

namespace bpo = boost::program_options;

static seastar::logger cli_logger("tvm_credentials");

static future<tvm::config> make_config(const bpo::variables_map& opts) {
    tvm::config cfg;
    if (opts.contains("config")) {
        cfg = co_await tvm::read_config_file(opts["config"].as<std::string>());
    }
    if (opts.contains("namespace")) {
        cfg.ow.ns = opts["namespace"].as<std::string>();
    }
    if (opts.contains("auth")) {
        cfg.ow.auth = opts["auth"].as<std::string>();
    }
    if (opts.contains("api-url")) {
        cfg.api_url = opts["api-url"].as<std::string>();
    }
    if (opts.contains("no-cache")) {
        cfg.cache_file = tvm::cache_file_option::disabled();
    } else if (opts.contains("cache-file")) {
        cfg.cache_file = tvm::cache_file_option::at(opts["cache-file"].as<std::string>());
    }
    co_return cfg;
}

static future<int> print_credentials(const bpo::variables_map& opts) {
    auto endpoint_name = opts["endpoint"].as<std::string>();
    auto endpoint = tvm::endpoint_from_name(endpoint_name);
    if (!endpoint) {
        cli_logger.error("Unknown endpoint {}, expected aws-s3 or azure-blob", endpoint_name);
        co_return 1;
    }

    auto client = tvm::tvm_client::make(co_await make_config(opts));
    auto creds = co_await client.get_credentials(*endpoint);
    fmt::print("{}\n", creds.to_json());
    co_return 0;
}

int main(int ac, char** av) {
    app_template::config app_cfg;
    app_cfg.name = "tvm-credentials";
    app_cfg.description = "Prints temporary storage credentials issued by the token vending machine.\n"
                          "Credentials are served from the cache file while they are valid for more than a minute.";
    app_template app(std::move(app_cfg));

    app.add_options()
        ("config", bpo::value<std::string>(), "YAML file with the ow namespace and auth, api_url and cache_file")
        ("namespace", bpo::value<std::string>(), "OpenWhisk namespace, overrides the config file")
        ("auth", bpo::value<std::string>(), "OpenWhisk auth key, overrides the config file")
        ("api-url", bpo::value<std::string>(), "TVM api url, overrides the config file")
        ("cache-file", bpo::value<std::string>(), "credentials cache file, overrides the config file")
        ("no-cache", "always fetch from the TVM and do not write the cache")
        ("endpoint", bpo::value<std::string>()->default_value("aws-s3"), "aws-s3 or azure-blob");

    return app.run(ac, av, [&app] () -> future<int> {
        int rc = 1;
        try {
            rc = co_await print_credentials(app.configuration());
        } catch (const tvm::tvm_exception& e) {
            cli_logger.error("Could not get credentials ({}): {}", e.code(), e.what());
        } catch (const std::exception& e) {
            cli_logger.error("Could not get credentials: {}", e.what());
        }
        co_return rc;
    });
}
