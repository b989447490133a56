/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */
#ifndef CHAIN_MIRROR_INDEXER_CONFIG_HPP
#define CHAIN_MIRROR_INDEXER_CONFIG_HPP

#include <chrono>
#include <cm/config.hpp>
#include <cm/contracts.hpp>

namespace chain_mirror {
    struct indexer_config {
        static constexpr std::string_view config_name { "indexer" };

        std::string db_path { "./data/mirror.sqlite" };
        std::string kv_path { "./data/kv.sqlite" };
        std::string rpc_url { "http://127.0.0.1:8545/" };
        std::chrono::milliseconds rpc_timeout { 10'000 };
        std::string start_block { "0x0" };
        uint64_t block_processing_window = 20;
        size_t receipt_workers = 5;
        std::chrono::seconds index_lock_ttl { 300 };
        std::chrono::seconds aggregate_lock_ttl { 1800 };
        contract_addresses contracts {};

        static indexer_config from_json(const json::object &j);

        static indexer_config from(const configs &cfgs)
        {
            return from_json(cfgs.at(std::string { config_name }).json());
        }
    };
}

#endif // !CHAIN_MIRROR_INDEXER_CONFIG_HPP
