/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */
#ifndef CHAIN_MIRROR_ENTITY_STORE_HPP
#define CHAIN_MIRROR_ENTITY_STORE_HPP

#include <map>
#include <cm/db/sqlite.hpp>
#include <cm/model.hpp>

namespace chain_mirror {
    /*
     * Entity versions are append-only rows. Which version of a business id is current
     * is recorded separately in the current_versions table, one pointer per id.
     */
    struct entity_store {
        struct version_ref {
            uint64_t version_id = 0;
            std::string entity_key {};
            uint64_t blocknumber = 0;

            bool operator==(const version_ref &o) const =default;
        };
        using version_list = std::vector<version_ref>;
        using current_map = std::map<std::string, uint64_t>;

        explicit entity_store(db::database &db);

        // Appends a version and makes it the current one of its business id; returns its version id.
        uint64_t append(const entity_version &v);
        // Most recent first
        version_list versions_in_block(entity_kind kind, std::string_view blockhash);
        // The latest version of the id from a block strictly below before_number.
        std::optional<version_ref> predecessor(entity_kind kind, std::string_view key, uint64_t before_number);
        std::optional<version_ref> current(entity_kind kind, std::string_view key);
        // Moves the current pointer of the id to the given version or clears it.
        void point_current(entity_kind kind, std::string_view key, const std::optional<version_ref> &ver);
        void remove_version(entity_kind kind, uint64_t version_id);
        size_t count_versions(entity_kind kind);
        current_map current_versions(entity_kind kind);
    private:
        db::database &_db;

        uint64_t _insert(const user_row &row);
        uint64_t _insert(const track_row &row);
        uint64_t _insert(const playlist_row &row);
        uint64_t _insert(const follow_row &row);
        uint64_t _insert(const repost_row &row);
        uint64_t _insert(const save_row &row);
    };
}

#endif // !CHAIN_MIRROR_ENTITY_STORE_HPP
