/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <algorithm>
#include <cctype>
#include <cm/contracts.hpp>

namespace chain_mirror {
    std::string_view contract_kind_name(const contract_kind kind)
    {
        switch (kind) {
            case contract_kind::user: return "user_factory";
            case contract_kind::track: return "track_factory";
            case contract_kind::social_feature: return "social_feature_factory";
            case contract_kind::user_replica_set: return "user_replica_set_manager";
            case contract_kind::playlist: return "playlist_factory";
            case contract_kind::user_library: return "user_library_factory";
            default: throw error("unsupported contract kind: {}", static_cast<int>(kind));
        }
    }

    contract_kind contract_kind_from_name(const std::string_view name)
    {
        for (const auto kind: contract_kinds) {
            if (contract_kind_name(kind) == name)
                return kind;
        }
        throw error("unknown contract name: {}", name);
    }

    std::string to_lower(const std::string_view s)
    {
        std::string res { s };
        std::transform(res.begin(), res.end(), res.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return res;
    }

    contract_map::contract_map(const contract_addresses &addrs)
    {
        for (const auto &[kind, addr]: addrs) {
            if (addr.empty())
                throw error("address of {} contract must not be empty!", kind);
            if (const auto [it, created] = _by_addr.try_emplace(to_lower(addr), kind); !created)
                throw error("address {} is configured for both {} and {} contracts!", addr, it->second, kind);
        }
    }

    std::optional<contract_kind> contract_map::classify(const std::string_view to_address) const
    {
        if (const auto it = _by_addr.find(to_lower(to_address)); it != _by_addr.end())
            return it->second;
        return {};
    }
}
