/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <map>
#include <cm/block-store.hpp>
#include <cm/checkpoint-store.hpp>
#include <cm/entity-store.hpp>
#include <cm/reverter.hpp>
#include <cm/timer.hpp>

namespace chain_mirror {
    reverter::reverter(db::database &db, kv_store &kv)
        : _db { db }, _kv { kv }
    {
    }

    revert_result reverter::revert(const block_record_list &revert_list)
    {
        revert_result res {};
        if (revert_list.empty())
            return res;
        if (revert_list.size() > reconciler::max_revert_depth)
            throw invariant_error("refusing to revert {} blocks: the limit is {}", revert_list.size(), reconciler::max_revert_depth);
        timer t { fmt::format("revert of {} blocks", revert_list.size()), logger::level::info };
        std::map<entity_kind, id_set> dirty {};
        {
            db::transaction txn { _db };
            block_store blocks { _db };
            entity_store entities { _db };
            for (const auto &blk: revert_list) {
                logger::info("reverting {}", blk);
                for (const auto kind: revert_order) {
                    for (const auto &ver: entities.versions_in_block(kind, blk.hash)) {
                        entities.point_current(kind, ver.entity_key, entities.predecessor(kind, ver.entity_key, blk.height()));
                        entities.remove_version(kind, ver.version_id);
                        ++res.num_versions;
                        switch (kind) {
                            case entity_kind::user:
                            case entity_kind::track:
                            case entity_kind::playlist:
                                dirty[kind].emplace(ver.entity_key);
                                break;
                            default:
                                break;
                        }
                    }
                }
                blocks.remove(blk.hash);
                blocks.set_current(blk.parent_hash);
                ++res.num_blocks;
            }
            res.current = blocks.require_current();
            // aggregates counted the retired blocks
            checkpoint_store { _db }.reset_above(res.current->height());
            txn.commit();
        }
        for (const auto &[kind, ids]: dirty)
            _kv.publish_dirty(kind, ids);
        publish_most_recent(_kv, *res.current);
        logger::info("reverted {} blocks and {} entity versions, the current block is {}", res.num_blocks, res.num_versions, *res.current);
        return res;
    }
}
