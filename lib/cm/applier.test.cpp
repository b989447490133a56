/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <cm/applier.hpp>
#include <cm/mocks.hpp>
#include <cm/test.hpp>

using namespace chain_mirror;

suite applier_suite = [] {
    "applier"_test = [] {
        "affected_id"_test = [] {
            test_same(std::string { "7" }, affected_id(user_row { {}, 7 }));
            test_same(std::string { "3" }, affected_id(follow_row { {}, 3, 4 }));
            test_same(std::string { "5" }, affected_id(repost_row { {}, 5, 11, item_type::playlist }));
            test_same(std::string { "5" }, affected_id(save_row { {}, 5, 12 }));
            test_same(std::string { "11" }, affected_id(track_row { {}, 11, 5 }));
        };
        "applier_set"_test = [] {
            applier_set s {};
            test_same(contract_kinds.size(), s.missing().size());
            expect(throws([&] { s.require_complete(); }));
            expect(throws([&] { s.add(contract_kind::user, nullptr); }));
            s.add(contract_kind::user, std::make_unique<mocks::json_applier>());
            expect(s.contains(contract_kind::user));
            expect(throws([&] { s.add(contract_kind::user, std::make_unique<mocks::json_applier>()); }));
            expect(throws([&] { s.at(contract_kind::track); }));
            test_same(contract_kinds.size() - 1, s.missing().size());
            const auto full = mocks::appliers();
            expect(full.missing().empty());
            expect(nothrow([&] { full.require_complete(); }));
        };
        "applier_registry"_test = [] {
            const auto reg = applier_registry::reg(contract_kind::user_replica_set, [] { return std::make_unique<mocks::json_applier>(); });
            expect(reg);
            expect(throws([] { applier_registry::reg(contract_kind::user_replica_set, [] { return std::make_unique<mocks::json_applier>(); }); }));
            const auto s = applier_registry::make_set();
            expect(s.contains(contract_kind::user_replica_set));
        };
        "versioned_applier"_test = [] {
            db::database db { std::string { db::database::memory } };
            db::create_schema(db);
            entity_store entities { db };
            apply_context ctx { entities, 5, "0xb5", 1'600'000'025 };
            applier_tx_list txs {};
            auto ok = mocks::receipt(contract_kind::user, { mocks::user(1, "alice"), mocks::user(2, "bob") });
            ok.tx_hash = "0xt1";
            auto reverted = mocks::receipt(contract_kind::user, { mocks::user(3, "carol") }, false);
            reverted.tx_hash = "0xt2";
            auto bad = mocks::receipt(contract_kind::user, { mocks::malformed(entity_kind::user) });
            bad.tx_hash = "0xt3";
            txs.emplace_back(applier_tx { 0, std::move(ok) });
            txs.emplace_back(applier_tx { 1, std::move(reverted) });
            txs.emplace_back(applier_tx { 2, std::move(bad) });
            mocks::json_applier a {};
            const auto res = a.apply(ctx, txs);
            test_same(2, res.rows_changed);
            expect(res.affected_ids == id_set { "1", "2" });
            test_same(2, entities.count_versions(entity_kind::user));
            const auto cur = entities.current(entity_kind::user, "2");
            expect(cur.has_value());
            test_same(5, cur->blocknumber);
            expect(!entities.current(entity_kind::user, "3"));
            test_same(2, entities.versions_in_block(entity_kind::user, "0xb5").size());
        };
    };
};
