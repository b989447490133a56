/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <cm/block-indexer.hpp>
#include <cm/block-store.hpp>
#include <cm/mocks.hpp>
#include <cm/test.hpp>

using namespace chain_mirror;

namespace {
    struct indexer_env: mocks::deployment {
        const contract_map contracts { mocks::contracts() };

        indexer_env()
        {
            index();
        }
    };
}

suite block_indexer_suite = [] {
    "block_indexer"_test = [] {
        "requires all appliers"_test = [] {
            indexer_env e {};
            applier_set partial {};
            partial.add(contract_kind::user, std::make_unique<mocks::json_applier>());
            expect(throws([&] { block_indexer bi { e.db, e.kv, e.chain, e.contracts, partial, 2 }; }));
        };
        "classification and publication"_test = [] {
            indexer_env e {};
            const auto blk = e.chain.append({
                mocks::receipt(contract_kind::user, { mocks::user(1, "alice") }),
                mocks::receipt(contract_kind::track, { mocks::track(10, 1) }),
                mocks::receipt(contract_kind::social_feature, { mocks::follow(2, 1) }),
                chain::receipt { "", "0x00000000000000000000000000000000000000ff", true, { mocks::user(3, "mallory") } }
            });
            block_indexer bi { e.db, e.kv, e.chain, e.contracts, e.appl, 2 };
            const auto res = bi.index_block(blk);
            test_same(4, res.num_txs);
            test_same(3, res.rows_changed);
            test_same(1, res.appliers.at(contract_kind::user).rows_changed);
            test_same(1, res.appliers.at(contract_kind::track).rows_changed);
            test_same(0, res.appliers.at(contract_kind::playlist).rows_changed);
            expect(res.appliers.at(contract_kind::social_feature).affected_ids == id_set { "2" });
            test_same(blk.hash, res.block.hash);
            expect(res.block.is_current);
            test_same(blk.hash, block_store { e.db }.require_current().hash);

            entity_store entities { e.db };
            expect(!entities.current(entity_kind::user, "3"));
            expect(e.kv.take_dirty(entity_kind::user) == id_set { "1" });
            expect(e.kv.take_dirty(entity_kind::track) == id_set { "10" });
            expect(e.kv.take_dirty(entity_kind::playlist).empty());
            test_same(std::string { "1" }, *e.kv.get(kv_keys::most_recent_indexed_block));
            test_same(blk.hash, *e.kv.get(kv_keys::most_recent_indexed_block_hash));
        };
        "apply order follows transaction hashes"_test = [] {
            indexer_env e {};
            auto r1 = mocks::receipt(contract_kind::user, { mocks::user(1, "second") });
            r1.tx_hash = "0xb0";
            auto r2 = mocks::receipt(contract_kind::user, { mocks::user(1, "first") });
            r2.tx_hash = "0xa0";
            const auto blk = e.chain.append({ std::move(r1), std::move(r2) });
            block_indexer { e.db, e.kv, e.chain, e.contracts, e.appl, 2 }.index_block(blk);
            auto stmt = e.db.prepare("SELECT handle, tx_index FROM users_view WHERE is_current AND user_id = 1");
            expect(stmt.step());
            test_same(std::string { "second" }, stmt.column_text(0));
            test_same(1, stmt.column_uint(1));
        };
        "skipped transactions"_test = [] {
            indexer_env e {};
            const auto blk = e.chain.append({
                mocks::receipt(contract_kind::user, { mocks::malformed(entity_kind::user) }),
                mocks::receipt(contract_kind::user, { mocks::user(2, "reverted") }, false),
                mocks::receipt(contract_kind::user, { mocks::user(1, "alice") })
            });
            const auto res = block_indexer { e.db, e.kv, e.chain, e.contracts, e.appl, 2 }.index_block(blk);
            test_same(3, res.num_txs);
            test_same(1, res.rows_changed);
            test_same(blk.hash, block_store { e.db }.require_current().hash);
        };
        "receipt failure"_test = [] {
            indexer_env e {};
            const auto prev = block_store { e.db }.require_current();
            const auto blk = e.chain.append({
                mocks::receipt(contract_kind::user, { mocks::user(1, "alice") }),
                mocks::receipt(contract_kind::track, { mocks::track(10, 1) })
            });
            static_cast<void>(e.kv.take_dirty(entity_kind::user));
            e.chain.fail_receipt(blk.transactions.at(1).hash);
            block_indexer bi { e.db, e.kv, e.chain, e.contracts, e.appl, 2 };
            expect(throws<chain_error>([&] { bi.index_block(blk); }));
            expect(prev == block_store { e.db }.require_current());
            test_same(0, entity_store { e.db }.count_versions(entity_kind::user));
            expect(e.kv.take_dirty(entity_kind::user).empty());
            test_same(prev.hash, *e.kv.get(kv_keys::most_recent_indexed_block_hash));
            // the indexer stays usable after a failed block
            e.chain.fail_receipt(blk.transactions.at(1).hash, false);
            expect(nothrow([&] { bi.index_block(blk); }));
            test_same(1, entity_store { e.db }.count_versions(entity_kind::user));
        };
        "applier failure"_test = [] {
            indexer_env e {};
            const auto prev = block_store { e.db }.require_current();
            const auto num_blocks = block_store { e.db }.count();
            applier_set failing {};
            for (const auto kind: contract_kinds) {
                if (kind == contract_kind::playlist)
                    failing.add(kind, std::make_unique<mocks::failing_applier>());
                else
                    failing.add(kind, std::make_unique<mocks::json_applier>());
            }
            const auto blk = e.chain.append({ mocks::receipt(contract_kind::user, { mocks::user(1, "alice") }) });
            block_indexer bi { e.db, e.kv, e.chain, e.contracts, failing, 1 };
            expect(throws<chain_mirror::error>([&] { bi.index_block(blk); }));
            expect(prev == block_store { e.db }.require_current());
            test_same(num_blocks, block_store { e.db }.count());
            test_same(0, entity_store { e.db }.count_versions(entity_kind::user));
            expect(e.kv.take_dirty(entity_kind::user).empty());
        };
        "index stops at the first failure"_test = [] {
            indexer_env e {};
            const auto b1 = e.chain.append({ mocks::receipt(contract_kind::user, { mocks::user(1, "alice") }) });
            const auto b2 = e.chain.append({ mocks::receipt(contract_kind::user, { mocks::user(2, "bob") }) });
            const auto b3 = e.chain.append();
            e.chain.fail_receipt(b2.transactions.at(0).hash);
            block_indexer bi { e.db, e.kv, e.chain, e.contracts, e.appl, 2 };
            expect(throws<chain_error>([&] { bi.index({ b1, b2, b3 }); }));
            test_same(b1.hash, block_store { e.db }.require_current().hash);
        };
    };
};
