/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <cstdlib>
#include <cm/config.hpp>
#include <cm/indexer-config.hpp>
#include <cm/test.hpp>

using namespace chain_mirror;

namespace {
    static void my_setenv(const char *name, const char *val)
    {
        if (name == nullptr)
            throw error("my_setenv: name cannot be null!");
        if (val != nullptr)
            setenv(name, val, 1);
        else
            unsetenv(name);
    }
}

suite config_suite = [] {
    "config"_test = [] {
        "required"_test = [] {
            const auto &cfg = configs_dir::get();
            expect(cfg.at("indexer").at("start_block").as_string() == std::string_view { "0x0" });
            expect(cfg.at("indexer").at("contracts").as_object().size() == 6_u);
        };
        "non-standard-location"_test = [] {
            expect(std::getenv("CM_ETC") == nullptr);
            test_same(install_path("etc/default"), configs_dir::default_path());
            my_setenv("CM_ETC", "./etc-missing");
            expect(std::getenv("CM_ETC") != nullptr);
            test_same(std::string { "./etc-missing" }, configs_dir::default_path());
            expect(throws([] { configs_dir cfg { configs_dir::default_path() }; }));
            my_setenv("CM_ETC", nullptr);
            expect(std::getenv("CM_ETC") == nullptr);
        };
        "non-standard-location override"_test = [] {
            test_same(install_path("etc/default"), configs_dir::default_path());
            configs_dir::set_default_path("./new-path");
            expect(configs_dir::default_path() == "./new-path") << configs_dir::default_path();
            expect(throws([] { configs_dir cfg { configs_dir::default_path() }; }));
            configs_dir::set_default_path({});
            test_same(install_path("etc/default"), configs_dir::default_path());
        };
        "mock"_test = [] {
            configs_mock::map_type cfg_data {};
            cfg_data.emplace("indexer", json::object {
                { "rpc_url", std::string_view { "http://node.local:8545/" } },
                { "block_processing_window", 7 }
            });
            configs_mock cfg { std::move(cfg_data) };
            expect(cfg.at("indexer").at("rpc_url").as_string() == std::string_view { "http://node.local:8545/" });
            expect(throws([&] { static_cast<void>(cfg.at("kv")); }));
            const auto icfg = indexer_config::from(cfg);
            test_same(std::string { "http://node.local:8545/" }, icfg.rpc_url);
            test_same(7, icfg.block_processing_window);
        };
        "consider_bin_dir"_test = [] {
            const std::string test_file { "tmp/file.txt" };
            const auto orig_path = install_path(test_file);
            // Ignores an attempt to set install_dir to an improper location
            consider_bin_dir("/unknown/dir");
            test_same(orig_path, install_path(test_file));
        };
    };
    "indexer_config"_test = [] {
        "defaults"_test = [] {
            const auto cfg = indexer_config::from_json(json::object {});
            test_same(std::string { "0x0" }, cfg.start_block);
            test_same(20, cfg.block_processing_window);
            test_same(5, cfg.receipt_workers);
            expect(cfg.rpc_timeout == std::chrono::milliseconds { 10'000 });
            expect(cfg.index_lock_ttl == std::chrono::seconds { 300 });
            expect(cfg.aggregate_lock_ttl == std::chrono::seconds { 1800 });
            expect(cfg.contracts.empty());
        };
        "installed"_test = [] {
            const auto cfg = indexer_config::from(configs_dir::get());
            test_same(6, cfg.contracts.size());
            test_same(std::string { "0x00000000000000000000000000000000000000A5" }, cfg.contracts.at(contract_kind::playlist));
        };
        "overrides"_test = [] {
            const auto cfg = indexer_config::from_json(json::object {
                { "rpc_timeout_ms", 2500 },
                { "receipt_workers", 3 },
                { "index_lock_ttl_sec", 60 },
                { "contracts", json::object { { "track_factory", "0xABC" } } }
            });
            expect(cfg.rpc_timeout == std::chrono::milliseconds { 2500 });
            test_same(3, cfg.receipt_workers);
            expect(cfg.index_lock_ttl == std::chrono::seconds { 60 });
            test_same(1, cfg.contracts.size());
            test_same(std::string { "0xABC" }, cfg.contracts.at(contract_kind::track));
        };
        "invalid"_test = [] {
            expect(throws([] { indexer_config::from_json(json::object { { "block_processing_window", 0 } }); }));
            expect(throws([] { indexer_config::from_json(json::object { { "receipt_workers", 0 } }); }));
            expect(throws([] { indexer_config::from_json(json::object { { "contracts", json::object { { "unknown_factory", "0x1" } } } }); }));
        };
    };
};
