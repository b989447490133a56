/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <algorithm>
#include <cm/block-indexer.hpp>
#include <cm/block-store.hpp>
#include <cm/timer.hpp>

namespace chain_mirror {
    block_indexer::block_indexer(db::database &db, kv_store &kv, const chain::client &chain, const contract_map &contracts,
            applier_set &appliers, const size_t receipt_workers)
        : _db { db }, _kv { kv }, _chain { chain }, _contracts { contracts }, _appliers { appliers }, _sched { receipt_workers }
    {
        _appliers.require_complete();
    }

    chain::receipt_list block_indexer::_fetch_receipts(const chain::block &blk)
    {
        static const std::string task_group { "fetch-receipt" };
        chain::receipt_list receipts {};
        receipts.reserve(blk.transactions.size());
        size_t num_errors = 0;
        _sched.on_result(task_group, [&](auto &&res) {
            if (res.type() == typeid(scheduled_task_error)) {
                ++num_errors;
                return;
            }
            receipts.emplace_back(std::any_cast<chain::receipt>(std::move(res)));
        }, true);
        for (const auto &tx: blk.transactions) {
            _sched.submit(task_group, 100, [this, hash = tx.hash] {
                return _chain.transaction_receipt(hash);
            });
        }
        if (!_sched.process_ok() || num_errors > 0)
            throw chain_error("{}: failed to fetch {} of {} receipts", blk, num_errors, blk.transactions.size());
        if (receipts.size() != blk.transactions.size())
            throw chain_error("{}: fetched {} receipts for {} transactions", blk, receipts.size(), blk.transactions.size());
        return receipts;
    }

    block_index_result block_indexer::index_block(const chain::block &blk)
    {
        timer t { fmt::format("index {}", blk), logger::level::debug };
        auto receipts = _fetch_receipts(blk);
        std::sort(receipts.begin(), receipts.end(), [](const auto &a, const auto &b) {
            return a.tx_hash < b.tx_hash;
        });

        std::map<contract_kind, applier_tx_list> buckets {};
        for (size_t i = 0; i < receipts.size(); ++i) {
            auto &rcpt = receipts[i];
            if (const auto kind = _contracts.classify(rcpt.to); kind)
                buckets[*kind].emplace_back(applier_tx { static_cast<uint32_t>(i), std::move(rcpt) });
            else
                logger::trace("{}: tx {} is not addressed to a known contract", blk, rcpt.tx_hash);
        }

        block_index_result res {};
        res.num_txs = receipts.size();
        {
            db::transaction txn { _db };
            entity_store entities { _db };
            apply_context ctx { entities, blk.number, blk.hash, blk.timestamp };
            for (const auto kind: contract_kinds) {
                auto ar = _appliers.at(kind).apply(ctx, buckets[kind]);
                res.rows_changed += ar.rows_changed;
                res.appliers.emplace(kind, std::move(ar));
            }
            block_store blocks { _db };
            blocks.add_current(block_record { blk.hash, blk.parent_hash, blk.number, true });
            res.block = blocks.require_current();
            txn.commit();
        }

        _kv.publish_dirty(entity_kind::user, res.appliers.at(contract_kind::user).affected_ids);
        _kv.publish_dirty(entity_kind::track, res.appliers.at(contract_kind::track).affected_ids);
        _kv.publish_dirty(entity_kind::playlist, res.appliers.at(contract_kind::playlist).affected_ids);
        publish_most_recent(_kv, res.block);
        logger::info("indexed {}: {} transactions, {} rows changed", res.block, res.num_txs, res.rows_changed);
        return res;
    }

    size_t block_indexer::index(const std::vector<chain::block> &blocks)
    {
        size_t num_indexed = 0;
        for (const auto &blk: blocks) {
            index_block(blk);
            ++num_indexed;
        }
        return num_indexed;
    }
}
