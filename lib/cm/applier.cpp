/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <cm/applier.hpp>

namespace chain_mirror {
    std::string affected_id(const entity_version &v)
    {
        return std::visit([](const auto &row) {
            using T = std::decay_t<decltype(row)>;
            if constexpr (std::is_same_v<T, follow_row>)
                return fmt::format("{}", row.follower_user_id);
            else if constexpr (std::is_same_v<T, repost_row> || std::is_same_v<T, save_row>)
                return fmt::format("{}", row.user_id);
            else
                return row.key();
        }, v);
    }

    applier_result versioned_applier::_apply_impl(apply_context &ctx, const applier_tx_list &txs)
    {
        applier_result res {};
        for (const auto &tx: txs) {
            if (!tx.receipt.status) {
                logger::debug("block {} tx {}: skipping a reverted transaction", ctx.block_number, tx.receipt.tx_hash);
                continue;
            }
            entity_version_list versions {};
            try {
                versions = _decode(ctx, tx.receipt);
            } catch (const decode_error &ex) {
                logger::warn("block {} tx {}: skipping a malformed transaction: {}", ctx.block_number, tx.receipt.tx_hash, ex.what());
                continue;
            }
            for (auto &v: versions) {
                auto &meta = meta_of(v);
                meta.blockhash = ctx.block_hash;
                meta.blocknumber = ctx.block_number;
                meta.txhash = tx.receipt.tx_hash;
                meta.tx_index = tx.apply_pos;
                meta.block_time = ctx.block_time;
                ctx.entities.append(v);
                ++res.rows_changed;
                res.affected_ids.emplace(affected_id(v));
            }
        }
        return res;
    }

    void applier_set::add(const contract_kind kind, std::unique_ptr<applier> &&a)
    {
        if (!a)
            throw error("an empty applier for {}", kind);
        const auto [it, created] = _appliers.try_emplace(kind, std::move(a));
        if (!created)
            throw error("a duplicate applier for {}", kind);
    }

    applier &applier_set::at(const contract_kind kind) const
    {
        const auto it = _appliers.find(kind);
        if (it == _appliers.end())
            throw error("no applier is registered for {}", kind);
        return *it->second;
    }

    bool applier_set::contains(const contract_kind kind) const
    {
        return _appliers.contains(kind);
    }

    std::vector<contract_kind> applier_set::missing() const
    {
        std::vector<contract_kind> res {};
        for (const auto kind: contract_kinds) {
            if (!contains(kind))
                res.emplace_back(kind);
        }
        return res;
    }

    void applier_set::require_complete() const
    {
        if (const auto miss = missing(); !miss.empty())
            throw error("no appliers are registered for: {}", miss);
    }

    std::map<contract_kind, applier_registry::factory> &applier_registry::_factories()
    {
        static std::map<contract_kind, factory> f {};
        return f;
    }

    bool applier_registry::reg(const contract_kind kind, const factory &f)
    {
        const auto [it, created] = _factories().try_emplace(kind, f);
        if (!created)
            throw error("a duplicate applier registration for {}", kind);
        return true;
    }

    applier_set applier_registry::make_set()
    {
        applier_set res {};
        for (const auto &[kind, f]: _factories())
            res.add(kind, f());
        return res;
    }
}
