/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <cm/indexer-config.hpp>

namespace chain_mirror {
    indexer_config indexer_config::from_json(const json::object &j)
    {
        indexer_config cfg {};
        cfg.db_path = json::value_or(j, "db_path", cfg.db_path);
        cfg.kv_path = json::value_or(j, "kv_path", cfg.kv_path);
        cfg.rpc_url = json::value_or(j, "rpc_url", cfg.rpc_url);
        cfg.rpc_timeout = std::chrono::milliseconds { json::value_or(j, "rpc_timeout_ms", static_cast<uint64_t>(cfg.rpc_timeout.count())) };
        cfg.start_block = json::value_or(j, "start_block", cfg.start_block);
        cfg.block_processing_window = json::value_or(j, "block_processing_window", cfg.block_processing_window);
        cfg.receipt_workers = json::value_or(j, "receipt_workers", static_cast<uint64_t>(cfg.receipt_workers));
        cfg.index_lock_ttl = std::chrono::seconds { json::value_or(j, "index_lock_ttl_sec", static_cast<uint64_t>(cfg.index_lock_ttl.count())) };
        cfg.aggregate_lock_ttl = std::chrono::seconds { json::value_or(j, "aggregate_lock_ttl_sec", static_cast<uint64_t>(cfg.aggregate_lock_ttl.count())) };
        if (cfg.block_processing_window == 0)
            throw error("block_processing_window must be positive!");
        if (cfg.receipt_workers == 0)
            throw error("receipt_workers must be positive!");
        if (const auto *contracts = json::find(j, "contracts"); contracts) {
            for (const auto &kv: contracts->as_object())
                cfg.contracts.emplace(contract_kind_from_name(kv.key()), std::string { kv.value().as_string() });
        }
        return cfg;
    }
}
