/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <cm/model.hpp>

namespace chain_mirror {
    std::string_view entity_kind_name(const entity_kind kind)
    {
        switch (kind) {
            case entity_kind::user: return "user";
            case entity_kind::track: return "track";
            case entity_kind::playlist: return "playlist";
            case entity_kind::follow: return "follow";
            case entity_kind::repost: return "repost";
            case entity_kind::save: return "save";
            default: throw error("unsupported entity kind: {}", static_cast<int>(kind));
        }
    }

    std::string_view entity_table(const entity_kind kind)
    {
        switch (kind) {
            case entity_kind::user: return "users";
            case entity_kind::track: return "tracks";
            case entity_kind::playlist: return "playlists";
            case entity_kind::follow: return "follows";
            case entity_kind::repost: return "reposts";
            case entity_kind::save: return "saves";
            default: throw error("unsupported entity kind: {}", static_cast<int>(kind));
        }
    }

    std::string_view item_type_name(const item_type type)
    {
        switch (type) {
            case item_type::track: return "track";
            case item_type::playlist: return "playlist";
            case item_type::album: return "album";
            default: throw error("unsupported item type: {}", static_cast<int>(type));
        }
    }

    item_type item_type_from_name(const std::string_view name)
    {
        if (name == "track")
            return item_type::track;
        if (name == "playlist")
            return item_type::playlist;
        if (name == "album")
            return item_type::album;
        throw error("unsupported item type: {}", name);
    }
}
