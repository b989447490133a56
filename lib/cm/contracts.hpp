/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */
#ifndef CHAIN_MIRROR_CONTRACTS_HPP
#define CHAIN_MIRROR_CONTRACTS_HPP

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <cm/error.hpp>

namespace chain_mirror {
    // The order of the values is the order in which appliers see a block's transactions.
    enum class contract_kind: uint8_t {
        user,
        track,
        social_feature,
        user_replica_set,
        playlist,
        user_library
    };

    static constexpr std::array<contract_kind, 6> contract_kinds {
        contract_kind::user, contract_kind::track, contract_kind::social_feature,
        contract_kind::user_replica_set, contract_kind::playlist, contract_kind::user_library
    };

    extern std::string_view contract_kind_name(contract_kind kind);
    extern contract_kind contract_kind_from_name(std::string_view name);

    using contract_addresses = std::map<contract_kind, std::string>;

    // Resolves a transaction's recipient to the contract that emitted it. Built once per cycle.
    struct contract_map {
        explicit contract_map(const contract_addresses &addrs);
        std::optional<contract_kind> classify(std::string_view to_address) const;

        size_t size() const
        {
            return _by_addr.size();
        }
    private:
        std::map<std::string, contract_kind, std::less<>> _by_addr {};
    };

    extern std::string to_lower(std::string_view s);
}

namespace fmt {
    template<>
    struct formatter<chain_mirror::contract_kind>: formatter<int> {
        template<typename FormatContext>
        auto format(const chain_mirror::contract_kind &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", chain_mirror::contract_kind_name(v));
        }
    };
}

#endif // !CHAIN_MIRROR_CONTRACTS_HPP
