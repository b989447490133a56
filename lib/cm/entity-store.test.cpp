/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <cm/db/schema.hpp>
#include <cm/entity-store.hpp>
#include <cm/test.hpp>

using namespace chain_mirror;

namespace {
    version_meta meta(const uint64_t blocknumber, const uint32_t tx_index=0, const bool is_delete=false)
    {
        return version_meta { fmt::format("0x{:064x}", blocknumber), blocknumber, fmt::format("0xtx{}-{}", blocknumber, tx_index), tx_index, 1'600'000'000 + blocknumber, is_delete };
    }

    user_row user(const uint64_t user_id, const version_meta &m, const std::string &handle)
    {
        user_row r { m, user_id, handle, fmt::format("0xwallet{}", user_id) };
        r.secondary_ids = { 2, 3 };
        return r;
    }
}

suite entity_store_suite = [] {
    "entity_store"_test = [] {
        "append makes the version current"_test = [] {
            db::database db { std::string { db::database::memory } };
            db::create_schema(db);
            entity_store es { db };
            const auto v1 = es.append(user(1, meta(10), "alice"));
            const auto v2 = es.append(user(1, meta(11), "alice2"));
            expect(v2 > v1);
            test_same(2, es.count_versions(entity_kind::user));
            const auto cur = es.current(entity_kind::user, "1");
            expect(static_cast<bool>(cur));
            test_same(v2, cur->version_id);
            test_same(11, cur->blocknumber);
            test_same(1, es.current_versions(entity_kind::user).size());
        };
        "keys"_test = [] {
            db::database db { std::string { db::database::memory } };
            db::create_schema(db);
            entity_store es { db };
            es.append(follow_row { meta(5), 1, 2 });
            es.append(repost_row { meta(5), 1, 7, item_type::album });
            es.append(save_row { meta(5), 1, 7, item_type::track });
            expect(static_cast<bool>(es.current(entity_kind::follow, "1:2")));
            expect(static_cast<bool>(es.current(entity_kind::repost, "1:7:album")));
            expect(static_cast<bool>(es.current(entity_kind::save, "1:7:track")));
            expect(!es.current(entity_kind::save, "1:7:album"));
        };
        "a version cannot supersede a newer one"_test = [] {
            db::database db { std::string { db::database::memory } };
            db::create_schema(db);
            entity_store es { db };
            es.append(track_row { meta(20), 5, 1 });
            expect(throws<invariant_error>([&] { es.append(track_row { meta(19), 5, 1 }); }));
            test_same(1, es.count_versions(entity_kind::track));
        };
        "predecessor"_test = [] {
            db::database db { std::string { db::database::memory } };
            db::create_schema(db);
            entity_store es { db };
            const auto v10 = es.append(playlist_row { meta(10), 3, 1 });
            // two versions from one block: the one appended last is current regardless of tx_index
            const auto v12b = es.append(playlist_row { meta(12, 4), 3, 1 });
            const auto v12a = es.append(playlist_row { meta(12, 2), 3, 1 });
            test_same(v12a, es.current(entity_kind::playlist, "3")->version_id);
            const auto v15 = es.append(playlist_row { meta(15), 3, 1 });
            expect(!es.predecessor(entity_kind::playlist, "3", 10));
            test_same(v10, es.predecessor(entity_kind::playlist, "3", 12)->version_id);
            test_same(v12a, es.predecessor(entity_kind::playlist, "3", 15)->version_id);
            test_same(v15, es.predecessor(entity_kind::playlist, "3", 16)->version_id);
            expect(v12a != v12b);
        };
        "versions_in_block and remove_version"_test = [] {
            db::database db { std::string { db::database::memory } };
            db::create_schema(db);
            entity_store es { db };
            const auto v1 = es.append(user(1, meta(10), "a"));
            const auto v2 = es.append(user(1, meta(11), "b"));
            const auto v3 = es.append(user(2, meta(11), "c"));
            const auto in_block = es.versions_in_block(entity_kind::user, meta(11).blockhash);
            test_same(2, in_block.size());
            // the most recent first
            test_same(v3, in_block.at(0).version_id);
            test_same(v2, in_block.at(1).version_id);
            expect(throws<invariant_error>([&] { es.remove_version(entity_kind::user, v2); }));
            es.point_current(entity_kind::user, "1", es.predecessor(entity_kind::user, "1", 11));
            es.remove_version(entity_kind::user, v2);
            test_same(v1, es.current(entity_kind::user, "1")->version_id);
            es.point_current(entity_kind::user, "2", es.predecessor(entity_kind::user, "2", 11));
            es.remove_version(entity_kind::user, v3);
            expect(!es.current(entity_kind::user, "2"));
            expect(throws<invariant_error>([&] { es.remove_version(entity_kind::user, v3); }));
        };
        "views expose is_current"_test = [] {
            db::database db { std::string { db::database::memory } };
            db::create_schema(db);
            entity_store es { db };
            es.append(user(1, meta(10), "a"));
            es.append(user(1, meta(11), "b"));
            auto stmt = db.prepare("SELECT handle, is_current FROM users_view ORDER BY version_id");
            expect(stmt.step());
            test_same(std::string { "a" }, stmt.column_text(0));
            expect(!stmt.column_bool(1));
            expect(stmt.step());
            test_same(std::string { "b" }, stmt.column_text(0));
            expect(stmt.column_bool(1));
            auto ids = db.prepare("SELECT secondary_ids FROM users WHERE handle = 'b'");
            expect(ids.step());
            test_same(std::string { "[2,3]" }, ids.column_text(0));
        };
    };
};
