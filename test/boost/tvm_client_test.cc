/*
 * Copyright (C) 2024-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include <algorithm>
#include <chrono>
#include <set>
#include <string>
#include <vector>

#include <boost/test/unit_test.hpp>
#include <seastar/core/coroutine.hh>
#include <seastar/core/when_all.hh>
#include <seastar/testing/test_case.hh>
#include <seastar/testing/thread_test_case.hh>

#include "seastarx.hh"
#include "test/lib/tmpdir.hh"
#include "test/lib/tvm_credentials.hh"
#include "utils/file_io.hh"
#include "utils/rjson.hh"
#include "utils/tvm/tvm_client.hh"
#include "utils/tvm/tvm_error.hh"

using namespace std::chrono_literals;

namespace {

class fake_fetcher : public tvm::credentials_fetcher {
    std::vector<tvm::credentials> _responses;
    std::exception_ptr _error;

public:
    std::vector<std::string> urls;
    std::vector<std::string> namespaces;
    std::vector<std::string> auths;

    explicit fake_fetcher(std::vector<tvm::credentials> responses)
        : _responses(std::move(responses)) {
    }

    explicit fake_fetcher(std::exception_ptr error)
        : _error(std::move(error)) {
    }

    future<tvm::credentials> fetch(const std::string& url, const tvm::identity& ow) override {
        urls.push_back(url);
        namespaces.push_back(ow.ns);
        auths.push_back(ow.auth);
        if (_error) {
            return make_exception_future<tvm::credentials>(_error);
        }
        if (_responses.empty()) {
            return make_exception_future<tvm::credentials>(tvm::transport_error("no response configured"));
        }
        // Hand out the responses in order, repeating the last one
        auto idx = std::min(urls.size(), _responses.size()) - 1;
        return make_ready_future<tvm::credentials>(_responses[idx]);
    }

    const char* get_name() const override { return "fake_fetcher"; }

    size_t calls() const { return urls.size(); }
};

tvm::config make_config(std::string ns = "ns1", std::string api_url = "https://tvm.example/apis/tvm") {
    tvm::config cfg;
    cfg.ow = {.ns = std::move(ns), .auth = "secret"};
    cfg.api_url = std::move(api_url);
    return cfg;
}

struct client_with_fake_fetcher {
    fake_fetcher* fetcher;
    tvm::tvm_client client;
};

client_with_fake_fetcher make_client(std::unique_ptr<fake_fetcher> fetcher, std::optional<fs::path> cache_file, tvm::config cfg = make_config()) {
    auto* f = fetcher.get();
    auto cache = std::make_shared<tvm::credentials_cache>(std::move(cache_file));
    return {f, tvm::tvm_client(std::move(cfg), std::move(fetcher), std::move(cache))};
}

rjson::value read_cache_file(const fs::path& path) {
    auto content = utils::read_entire_file(path).get();
    return rjson::parse(std::string_view(content.data(), content.size()));
}

} // namespace

SEASTAR_THREAD_TEST_CASE(test_endpoint_urls) {
    auto [fetcher, client] = make_client(std::make_unique<fake_fetcher>(std::vector<tvm::credentials>{}), std::nullopt);

    BOOST_CHECK_EQUAL(client.endpoint_url(tvm::endpoint_kind::aws_s3), "https://tvm.example/apis/tvm/aws/s3");
    BOOST_CHECK_EQUAL(client.endpoint_url(tvm::endpoint_kind::azure_blob), "https://tvm.example/apis/tvm/azure/blob");
    BOOST_CHECK_EQUAL(client.cache_key(tvm::endpoint_kind::aws_s3), "ns1|https://tvm.example/apis/tvm/aws/s3");

    auto [fetcher2, trailing_slash] = make_client(std::make_unique<fake_fetcher>(std::vector<tvm::credentials>{}), std::nullopt,
            make_config("ns1", "https://tvm.example/apis/tvm/"));
    BOOST_CHECK_EQUAL(trailing_slash.endpoint_url(tvm::endpoint_kind::aws_s3), "https://tvm.example/apis/tvm/aws/s3");
}

SEASTAR_THREAD_TEST_CASE(test_default_api_url) {
    tvm::config cfg;
    cfg.ow = {.ns = "ns1", .auth = "secret"};
    cfg.cache_file = tvm::cache_file_option::disabled();

    auto client = tvm::tvm_client::make(std::move(cfg));

    BOOST_CHECK_EQUAL(client.api_url(), "https://adobeio.adobeioruntime.net/apis/tvm");
    BOOST_CHECK_EQUAL(client.endpoint_url(tvm::endpoint_kind::azure_blob), "https://adobeio.adobeioruntime.net/apis/tvm/azure/blob");
    BOOST_CHECK(!client.cache().enabled());
}

SEASTAR_THREAD_TEST_CASE(test_default_cache_file) {
    auto client = tvm::tvm_client::make(make_config());

    BOOST_REQUIRE(client.cache().path());
    BOOST_CHECK_EQUAL(client.cache().path()->native(), (std::filesystem::temp_directory_path() / ".tvmCache").native());
}

SEASTAR_THREAD_TEST_CASE(test_cache_key_uniqueness) {
    const std::vector<std::string> namespaces = {"ns", "ns1", "ns-1", "n", "s1", "ns@corp", "ns.1"};
    const std::vector<std::string> api_urls = {
        "https://tvm.example/apis/tvm",
        "https://tvm.example/apis/tvm2",
        "http://tvm.example/apis/tvm",
        "https://tvm.example:8443/apis/tvm",
        "https://1-tvm.example/apis/tvm",
    };

    std::set<std::string> keys;
    size_t pairs = 0;
    for (const auto& ns : namespaces) {
        for (const auto& api_url : api_urls) {
            auto [fetcher, client] = make_client(std::make_unique<fake_fetcher>(std::vector<tvm::credentials>{}), std::nullopt, make_config(ns, api_url));
            for (auto endpoint : {tvm::endpoint_kind::aws_s3, tvm::endpoint_kind::azure_blob}) {
                keys.insert(client.cache_key(endpoint));
                ++pairs;
            }
        }
    }
    BOOST_CHECK_EQUAL(keys.size(), pairs);

    // A dash in the namespace cannot be confused with the separator
    BOOST_CHECK_NE(tvm::make_cache_key({.ns = "a-b", .auth = "x"}, "https://c"), tvm::make_cache_key({.ns = "a", .auth = "x"}, "b-https://c"));
}

SEASTAR_TEST_CASE(test_read_through_on_miss) {
    tmpdir dir;
    auto path = dir.path() / "cache.json";
    auto creds = tests::make_s3_credentials("X", 1h);
    auto [fetcher, client] = make_client(std::make_unique<fake_fetcher>(std::vector<tvm::credentials>{creds}), path);

    // Act: request credentials with an empty cache.

    auto res = co_await client.get_aws_s3_credentials();

    // Assert: fetched once, with the identity, and stored unmodified under the key.

    BOOST_CHECK(res == creds);
    BOOST_REQUIRE_EQUAL(fetcher->calls(), 1u);
    BOOST_CHECK_EQUAL(fetcher->urls[0], "https://tvm.example/apis/tvm/aws/s3");
    BOOST_CHECK_EQUAL(fetcher->namespaces[0], "ns1");
    BOOST_CHECK_EQUAL(fetcher->auths[0], "secret");

    auto stored = co_await client.cache().get("ns1|https://tvm.example/apis/tvm/aws/s3");
    BOOST_REQUIRE(stored);
    BOOST_CHECK(*stored == creds);
}

SEASTAR_TEST_CASE(test_read_through_on_hit) {
    tmpdir dir;
    auto path = dir.path() / "cache.json";
    auto cached = tests::make_s3_credentials("CACHED", 1h);
    tvm::credentials_cache seed(path);
    co_await seed.set("ns1|https://tvm.example/apis/tvm/aws/s3", cached);
    auto [fetcher, client] = make_client(std::make_unique<fake_fetcher>(std::vector<tvm::credentials>{tests::make_s3_credentials("FETCHED", 1h)}), path);

    auto res = co_await client.get_aws_s3_credentials();

    BOOST_CHECK(res == cached);
    BOOST_CHECK_EQUAL(fetcher->calls(), 0u);
}

SEASTAR_THREAD_TEST_CASE(test_stale_entry_is_refetched) {
    tmpdir dir;
    auto path = dir.path() / "cache.json";
    tvm::credentials_cache(path).set("ns1|https://tvm.example/apis/tvm/aws/s3", tests::make_s3_credentials("OLD", 30s)).get();
    auto fresh = tests::make_s3_credentials("NEW", 1h);
    auto [fetcher, client] = make_client(std::make_unique<fake_fetcher>(std::vector<tvm::credentials>{fresh}), path);

    auto res = client.get_aws_s3_credentials().get();

    BOOST_CHECK(res == fresh);
    BOOST_CHECK_EQUAL(fetcher->calls(), 1u);
    auto all = read_cache_file(path);
    BOOST_CHECK(rjson::get(all, "ns1|https://tvm.example/apis/tvm/aws/s3") == fresh.blob());
}

SEASTAR_THREAD_TEST_CASE(test_end_to_end_scenario) {
    tmpdir dir;
    auto path = dir.path() / "cache.json";
    auto creds = tvm::credentials::parse(fmt::format(R"({{"accessKeyId":"X","expiration":"{}"}})",
            tvm::format_iso8601(tvm::clock_type::now() + 3600s)));
    auto [fetcher, client] = make_client(std::make_unique<fake_fetcher>(std::vector<tvm::credentials>{creds}), path);

    // First call: one fetch, one cache write.

    auto first = client.get_aws_s3_credentials().get();
    BOOST_CHECK(first == creds);
    BOOST_CHECK_EQUAL(fetcher->calls(), 1u);
    BOOST_REQUIRE(fs::exists(path));
    auto all = read_cache_file(path);
    BOOST_CHECK_EQUAL(all.MemberCount(), 1u);
    BOOST_CHECK(rjson::find(all, "ns1|https://tvm.example/apis/tvm/aws/s3"));

    // Second call: served from the cache.

    auto second = client.get_aws_s3_credentials().get();
    BOOST_CHECK(second == first);
    BOOST_CHECK_EQUAL(fetcher->calls(), 1u);
}

SEASTAR_THREAD_TEST_CASE(test_endpoints_are_cached_separately) {
    tmpdir dir;
    auto path = dir.path() / "cache.json";
    auto s3 = tests::make_s3_credentials("X", 1h);
    auto azure = tests::make_azure_credentials("container", 1h);
    auto [fetcher, client] = make_client(std::make_unique<fake_fetcher>(std::vector<tvm::credentials>{s3, azure}), path);

    BOOST_CHECK(client.get_aws_s3_credentials().get() == s3);
    BOOST_CHECK(client.get_azure_blob_credentials().get() == azure);
    BOOST_CHECK_EQUAL(fetcher->calls(), 2u);
    BOOST_CHECK_EQUAL(fetcher->urls[1], "https://tvm.example/apis/tvm/azure/blob");

    BOOST_CHECK(client.get_aws_s3_credentials().get() == s3);
    BOOST_CHECK(client.get_azure_blob_credentials().get() == azure);
    BOOST_CHECK_EQUAL(fetcher->calls(), 2u);
    BOOST_CHECK_EQUAL(read_cache_file(path).MemberCount(), 2u);
}

SEASTAR_THREAD_TEST_CASE(test_unrelated_entries_survive) {
    tmpdir dir;
    auto path = dir.path() / "cache.json";
    auto other = tests::make_azure_credentials("other", 1h);
    tvm::credentials_cache(path).set("ns2|https://tvm.example/apis/tvm/azure/blob", other).get();
    auto [fetcher, client] = make_client(std::make_unique<fake_fetcher>(std::vector<tvm::credentials>{tests::make_s3_credentials("X", 1h)}), path);

    client.get_aws_s3_credentials().get();

    auto all = read_cache_file(path);
    BOOST_CHECK_EQUAL(all.MemberCount(), 2u);
    BOOST_CHECK(rjson::get(all, "ns2|https://tvm.example/apis/tvm/azure/blob") == other.blob());
}

SEASTAR_THREAD_TEST_CASE(test_namespaces_do_not_share_credentials) {
    tmpdir dir;
    auto path = dir.path() / "cache.json";
    auto cache = std::make_shared<tvm::credentials_cache>(path);
    auto creds1 = tests::make_s3_credentials("ONE", 1h);
    auto creds2 = tests::make_s3_credentials("TWO", 1h);
    auto fetcher1 = std::make_unique<fake_fetcher>(std::vector<tvm::credentials>{creds1});
    auto fetcher2 = std::make_unique<fake_fetcher>(std::vector<tvm::credentials>{creds2});
    auto* f2 = fetcher2.get();
    tvm::tvm_client client1(make_config("ns1"), std::move(fetcher1), cache);
    tvm::tvm_client client2(make_config("ns2"), std::move(fetcher2), cache);

    BOOST_CHECK(client1.get_aws_s3_credentials().get() == creds1);
    BOOST_CHECK(client2.get_aws_s3_credentials().get() == creds2);
    BOOST_CHECK_EQUAL(f2->calls(), 1u);

    BOOST_CHECK(client1.get_aws_s3_credentials().get() == creds1);
    BOOST_CHECK_EQUAL(read_cache_file(path).MemberCount(), 2u);
}

SEASTAR_THREAD_TEST_CASE(test_cache_disabled_always_fetches) {
    tmpdir dir;
    auto creds = tests::make_s3_credentials("X", 1h);
    auto [fetcher, client] = make_client(std::make_unique<fake_fetcher>(std::vector<tvm::credentials>{creds}), std::nullopt);

    for (int i = 0; i < 3; ++i) {
        BOOST_CHECK(client.get_aws_s3_credentials().get() == creds);
    }
    BOOST_CHECK_EQUAL(fetcher->calls(), 3u);
    BOOST_CHECK(fs::is_empty(dir.path()));
}

SEASTAR_THREAD_TEST_CASE(test_corrupt_cache_is_refetched_and_repaired) {
    tmpdir dir;
    auto path = dir.path() / "cache.json";
    utils::write_entire_file(path, "this is not json").get();
    auto creds = tests::make_s3_credentials("X", 1h);
    auto [fetcher, client] = make_client(std::make_unique<fake_fetcher>(std::vector<tvm::credentials>{creds}), path);

    BOOST_CHECK(client.get_aws_s3_credentials().get() == creds);
    BOOST_CHECK_EQUAL(fetcher->calls(), 1u);

    auto all = read_cache_file(path);
    BOOST_CHECK_EQUAL(all.MemberCount(), 1u);
    BOOST_CHECK(client.get_aws_s3_credentials().get() == creds);
    BOOST_CHECK_EQUAL(fetcher->calls(), 1u);
}

SEASTAR_THREAD_TEST_CASE(test_fetch_error_propagates) {
    tmpdir dir;
    auto path = dir.path() / "cache.json";
    auto error = std::make_exception_ptr(tvm::remote_fetch_error(http::reply::status_type::forbidden, R"({"error":"invalid auth"})"));
    auto [fetcher, client] = make_client(std::make_unique<fake_fetcher>(error), path);

    try {
        client.get_aws_s3_credentials().get();
        BOOST_FAIL("expected remote_fetch_error");
    } catch (const tvm::remote_fetch_error& e) {
        BOOST_CHECK_EQUAL(static_cast<int>(e.status()), 403);
        BOOST_CHECK_EQUAL(e.body(), R"({"error":"invalid auth"})");
        BOOST_CHECK(e.code() == tvm::error_code::status_error);
    }

    // Failures are not cached: the next call asks again.

    BOOST_CHECK_THROW(client.get_aws_s3_credentials().get(), tvm::remote_fetch_error);
    BOOST_CHECK_EQUAL(fetcher->calls(), 2u);
    BOOST_CHECK(!fs::exists(path));
}

SEASTAR_THREAD_TEST_CASE(test_transport_error_propagates) {
    auto error = std::make_exception_ptr(tvm::transport_error("connection refused"));
    auto [fetcher, client] = make_client(std::make_unique<fake_fetcher>(error), std::nullopt);

    BOOST_CHECK_THROW(client.get_azure_blob_credentials().get(), tvm::transport_error);
    BOOST_CHECK_EQUAL(fetcher->calls(), 1u);
}

SEASTAR_THREAD_TEST_CASE(test_cache_write_failure_is_not_fatal) {
    tmpdir dir;
    auto creds = tests::make_s3_credentials("X", 1h);
    auto [fetcher, client] = make_client(std::make_unique<fake_fetcher>(std::vector<tvm::credentials>{creds}), dir.path() / "missing" / "cache.json");

    BOOST_CHECK(client.get_aws_s3_credentials().get() == creds);
    BOOST_CHECK(client.get_aws_s3_credentials().get() == creds);
    BOOST_CHECK_EQUAL(fetcher->calls(), 2u);
}

SEASTAR_THREAD_TEST_CASE(test_concurrent_misses_are_not_coalesced) {
    tmpdir dir;
    auto path = dir.path() / "cache.json";
    auto creds = tests::make_s3_credentials("X", 1h);
    auto [fetcher, client] = make_client(std::make_unique<fake_fetcher>(std::vector<tvm::credentials>{creds}), path);

    auto [a, b] = when_all_succeed(client.get_aws_s3_credentials(), client.get_aws_s3_credentials()).get();

    BOOST_CHECK(a == creds);
    BOOST_CHECK(b == creds);
    // Depending on interleaving the second call may already see the first one's write
    BOOST_CHECK_GE(fetcher->calls(), 1u);
    BOOST_CHECK_LE(fetcher->calls(), 2u);
    BOOST_CHECK_EQUAL(read_cache_file(path).MemberCount(), 1u);
}

SEASTAR_THREAD_TEST_CASE(test_invalid_config_is_rejected) {
    auto make = [] (tvm::config cfg) {
        return tvm::tvm_client(std::move(cfg), std::make_unique<fake_fetcher>(std::vector<tvm::credentials>{}),
                std::make_shared<tvm::credentials_cache>(std::nullopt));
    };

    BOOST_CHECK_THROW(make(make_config("")), tvm::configuration_error);
    BOOST_CHECK_THROW(make(make_config("ns|1")), tvm::configuration_error);
    BOOST_CHECK_THROW(make(make_config("ns1", "ftp://tvm.example")), tvm::configuration_error);

    auto no_auth = make_config();
    no_auth.ow.auth.clear();
    BOOST_CHECK_THROW(make(std::move(no_auth)), tvm::configuration_error);

    BOOST_CHECK_THROW(tvm::tvm_client(make_config(), nullptr, std::make_shared<tvm::credentials_cache>(std::nullopt)), tvm::configuration_error);
    BOOST_CHECK_THROW(tvm::tvm_client(make_config(), std::make_unique<fake_fetcher>(std::vector<tvm::credentials>{}), nullptr), tvm::configuration_error);
}
