/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <cm/db/schema.hpp>
#include <cm/model.hpp>

namespace chain_mirror::db {
    namespace {
        // Columns every entity version carries in addition to its own payload.
        constexpr std::string_view version_columns =
            "version_id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "entity_key TEXT NOT NULL,"
            "blockhash TEXT NOT NULL,"
            "blocknumber INTEGER NOT NULL,"
            "txhash TEXT NOT NULL,"
            "tx_index INTEGER NOT NULL,"
            "block_time INTEGER NOT NULL,"
            "is_delete INTEGER NOT NULL DEFAULT 0";

        struct entity_table_def {
            entity_kind kind;
            std::string_view payload;
        };

        const std::array<entity_table_def, 6> &entity_tables()
        {
            static const std::array<entity_table_def, 6> tables {
                entity_table_def { entity_kind::user,
                    "user_id INTEGER NOT NULL, handle TEXT, wallet TEXT NOT NULL, name TEXT,"
                    "is_creator INTEGER NOT NULL, is_verified INTEGER NOT NULL, is_deactivated INTEGER NOT NULL,"
                    "primary_id INTEGER, secondary_ids TEXT NOT NULL" },
                entity_table_def { entity_kind::track,
                    "track_id INTEGER NOT NULL, owner_id INTEGER NOT NULL, title TEXT, route_id TEXT,"
                    "is_unlisted INTEGER NOT NULL, stem_of INTEGER" },
                entity_table_def { entity_kind::playlist,
                    "playlist_id INTEGER NOT NULL, playlist_owner_id INTEGER NOT NULL, playlist_name TEXT,"
                    "is_album INTEGER NOT NULL, is_private INTEGER NOT NULL, playlist_contents TEXT NOT NULL" },
                entity_table_def { entity_kind::follow,
                    "follower_user_id INTEGER NOT NULL, followee_user_id INTEGER NOT NULL" },
                entity_table_def { entity_kind::repost,
                    "user_id INTEGER NOT NULL, repost_item_id INTEGER NOT NULL, repost_type TEXT NOT NULL" },
                entity_table_def { entity_kind::save,
                    "user_id INTEGER NOT NULL, save_item_id INTEGER NOT NULL, save_type TEXT NOT NULL" }
            };
            return tables;
        }
    }

    void create_schema(database &db)
    {
        transaction tx { db };
        db.exec(
            "CREATE TABLE IF NOT EXISTS schema_info (id INTEGER PRIMARY KEY CHECK (id = 1), version INTEGER NOT NULL);"
            "CREATE TABLE IF NOT EXISTS blocks ("
            "  blockhash TEXT PRIMARY KEY,"
            "  parenthash TEXT,"
            "  number INTEGER UNIQUE,"
            "  is_current INTEGER NOT NULL DEFAULT 0"
            ");"
            // at most one current block can exist at the storage level
            "CREATE UNIQUE INDEX IF NOT EXISTS blocks_current_idx ON blocks (is_current) WHERE is_current = 1;"
            "CREATE TABLE IF NOT EXISTS current_versions ("
            "  kind TEXT NOT NULL,"
            "  entity_key TEXT NOT NULL,"
            "  version_id INTEGER NOT NULL,"
            "  blocknumber INTEGER NOT NULL,"
            "  PRIMARY KEY (kind, entity_key)"
            ");"
            "CREATE INDEX IF NOT EXISTS current_versions_version_idx ON current_versions (kind, version_id);"
            "CREATE TABLE IF NOT EXISTS aggregate_user ("
            "  user_id INTEGER PRIMARY KEY,"
            "  track_count INTEGER NOT NULL DEFAULT 0,"
            "  playlist_count INTEGER NOT NULL DEFAULT 0,"
            "  album_count INTEGER NOT NULL DEFAULT 0,"
            "  follower_count INTEGER NOT NULL DEFAULT 0,"
            "  following_count INTEGER NOT NULL DEFAULT 0,"
            "  repost_count INTEGER NOT NULL DEFAULT 0,"
            "  track_save_count INTEGER NOT NULL DEFAULT 0"
            ");"
            "CREATE TABLE IF NOT EXISTS indexing_checkpoints ("
            "  tablename TEXT PRIMARY KEY,"
            "  last_checkpoint INTEGER NOT NULL"
            ");");
        for (const auto &def: entity_tables()) {
            const auto table = entity_table(def.kind);
            db.exec(fmt::format("CREATE TABLE IF NOT EXISTS {} ({}, {});", table, version_columns, def.payload));
            db.exec(fmt::format("CREATE INDEX IF NOT EXISTS {}_block_idx ON {} (blockhash);", table, table));
            db.exec(fmt::format("CREATE INDEX IF NOT EXISTS {}_key_idx ON {} (entity_key, blocknumber);", table, table));
            // the query layer reads versions through the views with a derived is_current flag
            db.exec(fmt::format(
                "CREATE VIEW IF NOT EXISTS {}_view AS"
                " SELECT t.*, (cv.version_id IS NOT NULL) AS is_current FROM {} t"
                " LEFT JOIN current_versions cv ON cv.kind = '{}' AND cv.version_id = t.version_id;",
                table, table, entity_kind_name(def.kind)));
        }
        auto ins = db.prepare("INSERT INTO schema_info (id, version) VALUES (1, ?) ON CONFLICT (id) DO NOTHING");
        ins.bind_all(schema_version).exec();
        if (const auto stored = stored_schema_version(db); stored != schema_version)
            throw error("database {} has schema version {} but {} is required", db.path(), stored, schema_version);
        tx.commit();
    }

    uint64_t stored_schema_version(database &db)
    {
        auto stmt = db.prepare("SELECT version FROM schema_info WHERE id = 1");
        if (!stmt.step())
            throw error("database {} has no schema information", db.path());
        return stmt.column_uint(0);
    }
}
