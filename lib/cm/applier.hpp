/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */
#ifndef CHAIN_MIRROR_APPLIER_HPP
#define CHAIN_MIRROR_APPLIER_HPP

#include <functional>
#include <map>
#include <memory>
#include <cm/chain/types.hpp>
#include <cm/contracts.hpp>
#include <cm/entity-store.hpp>
#include <cm/kv-store.hpp>

namespace chain_mirror {
    struct applier_tx {
        // position of the transaction in the block's apply order
        uint32_t apply_pos = 0;
        chain::receipt receipt {};
    };
    using applier_tx_list = std::vector<applier_tx>;

    // Valid only within the transaction of the block being applied.
    struct apply_context {
        entity_store &entities;
        uint64_t block_number = 0;
        std::string block_hash {};
        uint64_t block_time = 0;
    };

    struct applier_result {
        size_t rows_changed = 0;
        id_set affected_ids {};
    };

    // A single transaction cannot be decoded; the transaction is skipped, the block is not failed.
    struct decode_error: error {
        using error::error;
    };

    /*
     * Turns the receipts of one contract kind into entity versions. Appliers run inside
     * the transaction of the block and must not commit or publish anything themselves.
     */
    struct applier {
        virtual ~applier() =default;

        applier_result apply(apply_context &ctx, const applier_tx_list &txs)
        {
            return _apply_impl(ctx, txs);
        }
    private:
        virtual applier_result _apply_impl(apply_context &ctx, const applier_tx_list &txs) =0;
    };

    /*
     * Handles the bookkeeping common to the appliers producing versioned rows:
     * skips reverted transactions, stamps the versions with their block and transaction
     * and appends them through the entity store. A derived class only decodes receipts.
     */
    struct versioned_applier: applier {
    private:
        applier_result _apply_impl(apply_context &ctx, const applier_tx_list &txs) override;
        // throws decode_error for a malformed transaction
        virtual entity_version_list _decode(const apply_context &ctx, const chain::receipt &rcpt) const =0;
    };

    // The id under which the downstream cache stores the entity affected by the version.
    extern std::string affected_id(const entity_version &v);

    struct applier_set {
        void add(contract_kind kind, std::unique_ptr<applier> &&a);
        applier &at(contract_kind kind) const;
        bool contains(contract_kind kind) const;
        std::vector<contract_kind> missing() const;
        // throws error unless every contract kind has an applier
        void require_complete() const;
    private:
        std::map<contract_kind, std::unique_ptr<applier>> _appliers {};
    };

    // Decoders linked into a binary register themselves here through static initialization.
    struct applier_registry {
        using factory = std::function<std::unique_ptr<applier>()>;

        static bool reg(contract_kind kind, const factory &f);
        static applier_set make_set();
    private:
        static std::map<contract_kind, factory> &_factories();
    };
}

#endif // !CHAIN_MIRROR_APPLIER_HPP
