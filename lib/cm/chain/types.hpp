/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */
#ifndef CHAIN_MIRROR_CHAIN_TYPES_HPP
#define CHAIN_MIRROR_CHAIN_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <cm/format.hpp>

namespace chain_mirror::chain {
    struct transaction {
        std::string hash {};
        // empty for contract creations
        std::string to {};
    };
    using transaction_list = std::vector<transaction>;

    struct block {
        std::string hash {};
        std::string parent_hash {};
        uint64_t number = 0;
        uint64_t timestamp = 0;
        transaction_list transactions {};
    };

    struct log_entry {
        std::string address {};
        std::vector<std::string> topics {};
        std::string data {};
    };

    struct receipt {
        std::string tx_hash {};
        std::string to {};
        // false when the transaction was reverted by the chain
        bool status = true;
        std::vector<log_entry> logs {};
    };
    using receipt_list = std::vector<receipt>;
}

namespace fmt {
    template<>
    struct formatter<chain_mirror::chain::block>: formatter<int> {
        template<typename FormatContext>
        auto format(const chain_mirror::chain::block &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "chain block #{} {}", v.number, v.hash);
        }
    };
}

#endif // !CHAIN_MIRROR_CHAIN_TYPES_HPP
