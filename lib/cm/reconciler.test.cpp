/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <cm/block-store.hpp>
#include <cm/mocks.hpp>
#include <cm/reconciler.hpp>
#include <cm/test.hpp>

using namespace chain_mirror;

namespace {
    std::vector<std::string> hashes(const std::vector<chain::block> &blocks)
    {
        std::vector<std::string> res {};
        for (const auto &b: blocks)
            res.emplace_back(b.hash);
        return res;
    }

    std::vector<std::string> hashes(const block_record_list &blocks)
    {
        std::vector<std::string> res {};
        for (const auto &b: blocks)
            res.emplace_back(b.hash);
        return res;
    }
}

suite reconciler_suite = [] {
    "reconciler"_test = [] {
        "zero window"_test = [] {
            mocks::deployment d {};
            expect(throws([&] { reconciler r { d.db, d.chain, 0 }; }));
        };
        "requires a current block"_test = [] {
            mocks::deployment d {};
            expect(throws<invariant_error>([&] { reconciler { d.db, d.chain, 20 }.plan(); }));
        };
        "starts from the origin"_test = [] {
            mocks::deployment d {};
            index_cycle { indexer_context { d.db, d.kv, d.chain, d.cfg, d.appl } }.init_blocks();
            d.chain.append();
            const auto p = reconciler { d.db, d.chain, 20 }.plan();
            test_same(std::string { origin_hash }, p.intersection);
            test_same(1, p.target);
            expect(hashes(p.index_list) == std::vector<std::string> { d.chain.at(0).hash, d.chain.at(1).hash });
            expect(p.revert_list.empty());
        };
        "chain extension"_test = [] {
            mocks::deployment d {};
            d.index();
            const auto b1 = d.chain.append();
            const auto p = reconciler { d.db, d.chain, 20 }.plan();
            test_same(d.chain.at(0).hash, p.intersection);
            expect(hashes(p.index_list) == std::vector<std::string> { b1.hash });
            expect(p.revert_list.empty());
            expect(!p.empty());
        };
        "window bounds the target"_test = [] {
            mocks::deployment d {};
            d.index();
            for (size_t i = 0; i < 10; ++i)
                d.chain.append();
            const auto p = reconciler { d.db, d.chain, 3 }.plan();
            test_same(3, p.target);
            test_same(3, p.index_list.size());
            test_same(1, p.index_list.front().number);
            test_same(3, p.index_list.back().number);
        };
        "reorganization"_test = [] {
            mocks::deployment d {};
            d.chain.append();
            d.index();
            const auto b1 = d.chain.at(1);
            d.chain.rewind(0);
            const auto b1p = d.chain.append();
            const auto b2p = d.chain.append();
            const auto p = reconciler { d.db, d.chain, 20 }.plan();
            test_same(d.chain.at(0).hash, p.intersection);
            expect(hashes(p.revert_list) == std::vector<std::string> { b1.hash });
            expect(hashes(p.index_list) == std::vector<std::string> { b1p.hash, b2p.hash });
        };
        "planning has no side effects"_test = [] {
            mocks::deployment d {};
            d.chain.append();
            d.index();
            d.chain.rewind(0);
            d.chain.append();
            d.chain.append();
            const auto p1 = reconciler { d.db, d.chain, 20 }.plan();
            const auto p2 = reconciler { d.db, d.chain, 20 }.plan();
            test_same(p1.intersection, p2.intersection);
            expect(hashes(p1.index_list) == hashes(p2.index_list));
            expect(hashes(p1.revert_list) == hashes(p2.revert_list));
            d.index();
            expect(reconciler { d.db, d.chain, 20 }.plan().empty());
        };
        "revert depth is bounded"_test = [] {
            mocks::deployment d {};
            d.index();
            const size_t fork_len = reconciler::max_revert_depth + 10;
            for (size_t i = 0; i < fork_len; ++i)
                d.chain.append();
            block_store blocks { d.db };
            {
                // a local fork of the same height that the chain never had
                db::transaction txn { d.db };
                std::string parent = d.chain.at(0).hash;
                for (size_t i = 1; i <= fork_len; ++i) {
                    const auto hash = fmt::format("0xf{:063x}", i);
                    blocks.add_current(block_record { hash, parent, i, true });
                    parent = hash;
                }
                txn.commit();
            }
            const auto num_blocks = blocks.count();
            const auto cur = blocks.require_current();
            expect(throws<invariant_error>([&] { reconciler { d.db, d.chain, 20 }.plan(); }));
            test_same(num_blocks, blocks.count());
            expect(cur == blocks.require_current());
        };
        "chain failure"_test = [] {
            mocks::deployment d {};
            d.index();
            d.chain.fail_all();
            expect(throws<chain_error>([&] { reconciler { d.db, d.chain, 20 }.plan(); }));
        };
    };
};
