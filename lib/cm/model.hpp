/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */
#ifndef CHAIN_MIRROR_MODEL_HPP
#define CHAIN_MIRROR_MODEL_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <cm/error.hpp>

namespace chain_mirror {
    // The value stored in place of the chain's all-zero parent hash of the first block.
    static constexpr std::string_view origin_hash { "0x0" };
    static constexpr std::string_view zero_hash { "0x0000000000000000000000000000000000000000000000000000000000000000" };

    inline std::string normalize_parent_hash(const std::string_view hash)
    {
        return std::string { hash == zero_hash ? origin_hash : hash };
    }

    struct block_record {
        std::string hash {};
        std::string parent_hash {};
        std::optional<uint64_t> number {};
        bool is_current = false;

        // the origin row carries no number
        uint64_t height() const
        {
            return number.value_or(0);
        }

        bool operator==(const block_record &o) const =default;
    };

    enum class entity_kind: uint8_t {
        user, track, playlist, follow, repost, save
    };

    // Entities referencing other entities come first so that they are retired before their targets.
    static constexpr std::array<entity_kind, 6> revert_order {
        entity_kind::save, entity_kind::repost, entity_kind::follow,
        entity_kind::playlist, entity_kind::track, entity_kind::user
    };

    extern std::string_view entity_kind_name(entity_kind kind);
    extern std::string_view entity_table(entity_kind kind);

    enum class item_type: uint8_t {
        track, playlist, album
    };

    extern std::string_view item_type_name(item_type type);
    extern item_type item_type_from_name(std::string_view name);

    // Fields shared by every version of every entity kind.
    struct version_meta {
        std::string blockhash {};
        uint64_t blocknumber = 0;
        std::string txhash {};
        uint32_t tx_index = 0;
        uint64_t block_time = 0;
        bool is_delete = false;
    };

    struct user_row {
        static constexpr entity_kind kind = entity_kind::user;
        version_meta meta {};
        uint64_t user_id = 0;
        std::optional<std::string> handle {};
        std::string wallet {};
        std::optional<std::string> name {};
        bool is_creator = false;
        bool is_verified = false;
        bool is_deactivated = false;
        std::optional<uint64_t> primary_id {};
        std::vector<uint64_t> secondary_ids {};

        std::string key() const
        {
            return fmt::format("{}", user_id);
        }
    };

    struct track_row {
        static constexpr entity_kind kind = entity_kind::track;
        version_meta meta {};
        uint64_t track_id = 0;
        uint64_t owner_id = 0;
        std::optional<std::string> title {};
        std::optional<std::string> route_id {};
        bool is_unlisted = false;
        std::optional<uint64_t> stem_of {};

        std::string key() const
        {
            return fmt::format("{}", track_id);
        }
    };

    struct playlist_row {
        static constexpr entity_kind kind = entity_kind::playlist;
        version_meta meta {};
        uint64_t playlist_id = 0;
        uint64_t playlist_owner_id = 0;
        std::optional<std::string> playlist_name {};
        bool is_album = false;
        bool is_private = false;
        std::vector<uint64_t> playlist_contents {};

        std::string key() const
        {
            return fmt::format("{}", playlist_id);
        }
    };

    struct follow_row {
        static constexpr entity_kind kind = entity_kind::follow;
        version_meta meta {};
        uint64_t follower_user_id = 0;
        uint64_t followee_user_id = 0;

        std::string key() const
        {
            return fmt::format("{}:{}", follower_user_id, followee_user_id);
        }
    };

    struct repost_row {
        static constexpr entity_kind kind = entity_kind::repost;
        version_meta meta {};
        uint64_t user_id = 0;
        uint64_t repost_item_id = 0;
        item_type repost_type = item_type::track;

        std::string key() const
        {
            return fmt::format("{}:{}:{}", user_id, repost_item_id, item_type_name(repost_type));
        }
    };

    struct save_row {
        static constexpr entity_kind kind = entity_kind::save;
        version_meta meta {};
        uint64_t user_id = 0;
        uint64_t save_item_id = 0;
        item_type save_type = item_type::track;

        std::string key() const
        {
            return fmt::format("{}:{}:{}", user_id, save_item_id, item_type_name(save_type));
        }
    };

    using entity_version = std::variant<user_row, track_row, playlist_row, follow_row, repost_row, save_row>;
    using entity_version_list = std::vector<entity_version>;

    inline entity_kind kind_of(const entity_version &v)
    {
        return std::visit([](const auto &row) { return row.kind; }, v);
    }

    inline std::string key_of(const entity_version &v)
    {
        return std::visit([](const auto &row) { return row.key(); }, v);
    }

    inline version_meta &meta_of(entity_version &v)
    {
        return std::visit([](auto &row) -> version_meta & { return row.meta; }, v);
    }
}

namespace fmt {
    template<>
    struct formatter<chain_mirror::entity_kind>: formatter<int> {
        template<typename FormatContext>
        auto format(const chain_mirror::entity_kind &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", chain_mirror::entity_kind_name(v));
        }
    };

    template<>
    struct formatter<chain_mirror::block_record>: formatter<int> {
        template<typename FormatContext>
        auto format(const chain_mirror::block_record &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "block #{} {} (parent {}{})", v.number, v.hash, v.parent_hash, v.is_current ? ", current" : "");
        }
    };
}

#endif // !CHAIN_MIRROR_MODEL_HPP
