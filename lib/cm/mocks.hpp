/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */
#ifndef CHAIN_MIRROR_MOCKS_HPP
#define CHAIN_MIRROR_MOCKS_HPP

#include <cm/applier.hpp>
#include <cm/chain/mock.hpp>
#include <cm/db/schema.hpp>
#include <cm/index-cycle.hpp>
#include <cm/json.hpp>
#include <cm/kv-store-mem.hpp>

namespace chain_mirror::mocks {
    /*
     * Test events are logs whose first topic names the entity kind and whose data
     * is a JSON object with the fields of the version.
     */
    inline std::string contract_address(const contract_kind kind)
    {
        return fmt::format("0x{:040x}", static_cast<unsigned>(kind) + 0xA1);
    }

    inline contract_addresses contracts()
    {
        contract_addresses res {};
        for (const auto kind: contract_kinds)
            res.emplace(kind, contract_address(kind));
        return res;
    }

    inline chain::log_entry event(const entity_kind kind, const json::object &fields)
    {
        return chain::log_entry { "", { std::string { entity_kind_name(kind) } }, json::serialize(fields) };
    }

    inline chain::receipt receipt(const contract_kind kind, std::vector<chain::log_entry> &&logs, const bool status=true)
    {
        const auto addr = contract_address(kind);
        for (auto &l: logs)
            l.address = addr;
        return chain::receipt { "", addr, status, std::move(logs) };
    }

    inline chain::log_entry user(const uint64_t user_id, const std::string &handle, const bool is_delete=false)
    {
        return event(entity_kind::user, json::object { { "user_id", user_id }, { "handle", handle }, { "wallet", fmt::format("0xwallet{}", user_id) }, { "is_delete", is_delete } });
    }

    inline chain::log_entry track(const uint64_t track_id, const uint64_t owner_id, const bool is_unlisted=false, const bool is_delete=false)
    {
        return event(entity_kind::track, json::object { { "track_id", track_id }, { "owner_id", owner_id }, { "is_unlisted", is_unlisted }, { "is_delete", is_delete } });
    }

    inline chain::log_entry playlist(const uint64_t playlist_id, const uint64_t owner_id, const bool is_album=false, const bool is_private=false)
    {
        return event(entity_kind::playlist, json::object { { "playlist_id", playlist_id }, { "playlist_owner_id", owner_id }, { "is_album", is_album }, { "is_private", is_private } });
    }

    inline chain::log_entry follow(const uint64_t follower, const uint64_t followee, const bool is_delete=false)
    {
        return event(entity_kind::follow, json::object { { "follower_user_id", follower }, { "followee_user_id", followee }, { "is_delete", is_delete } });
    }

    inline chain::log_entry repost(const uint64_t user_id, const uint64_t item_id, const std::string &type="track")
    {
        return event(entity_kind::repost, json::object { { "user_id", user_id }, { "repost_item_id", item_id }, { "repost_type", type } });
    }

    inline chain::log_entry save(const uint64_t user_id, const uint64_t item_id, const std::string &type="track")
    {
        return event(entity_kind::save, json::object { { "user_id", user_id }, { "save_item_id", item_id }, { "save_type", type } });
    }

    inline chain::log_entry malformed(const entity_kind kind)
    {
        return chain::log_entry { "", { std::string { entity_kind_name(kind) } }, "{ not json" };
    }

    // Decodes the test events of any kind.
    struct json_applier: versioned_applier {
    private:
        static bool _flag(const json::object &o, const std::string_view name)
        {
            const auto *v = json::find(o, name);
            return v && v->as_bool();
        }

        static uint64_t _id(const json::object &o, const std::string_view name)
        {
            const auto *v = json::find(o, name);
            if (!v)
                throw decode_error("the required field {} is missing", name);
            return json::value_to<uint64_t>(*v);
        }

        static entity_version _decode_log(const chain::log_entry &l)
        {
            if (l.topics.empty())
                throw decode_error("a log without topics");
            json::object o {};
            try {
                o = json::parse(l.data).as_object();
            } catch (const std::exception &ex) {
                throw decode_error("invalid event data", ex);
            }
            const auto &kind = l.topics.front();
            version_meta meta {};
            meta.is_delete = _flag(o, "is_delete");
            if (kind == "user")
                return user_row { meta, _id(o, "user_id"), json::value_or(o, "handle", ""), json::value_or(o, "wallet", "") };
            if (kind == "track") {
                track_row r { meta, _id(o, "track_id"), _id(o, "owner_id") };
                r.is_unlisted = _flag(o, "is_unlisted");
                if (json::find(o, "stem_of"))
                    r.stem_of = _id(o, "stem_of");
                return r;
            }
            if (kind == "playlist") {
                playlist_row r { meta, _id(o, "playlist_id"), _id(o, "playlist_owner_id") };
                r.is_album = _flag(o, "is_album");
                r.is_private = _flag(o, "is_private");
                return r;
            }
            if (kind == "follow")
                return follow_row { meta, _id(o, "follower_user_id"), _id(o, "followee_user_id") };
            if (kind == "repost")
                return repost_row { meta, _id(o, "user_id"), _id(o, "repost_item_id"), item_type_from_name(json::value_or(o, "repost_type", "track")) };
            if (kind == "save")
                return save_row { meta, _id(o, "user_id"), _id(o, "save_item_id"), item_type_from_name(json::value_or(o, "save_type", "track")) };
            throw decode_error("unsupported event kind: {}", kind);
        }

        entity_version_list _decode(const apply_context &, const chain::receipt &rcpt) const override
        {
            entity_version_list res {};
            for (const auto &l: rcpt.logs)
                res.emplace_back(_decode_log(l));
            return res;
        }
    };

    // Fails the block after the given number of successful calls.
    struct failing_applier: applier {
        explicit failing_applier(const size_t fail_after=0): _fail_after { fail_after }
        {
        }
    private:
        size_t _fail_after;
        size_t _num_calls = 0;

        applier_result _apply_impl(apply_context &ctx, const applier_tx_list &) override
        {
            if (_num_calls++ >= _fail_after)
                throw error("applier failure injected at block {}", ctx.block_number);
            return {};
        }
    };

    inline applier_set appliers()
    {
        applier_set res {};
        for (const auto kind: contract_kinds)
            res.add(kind, std::make_unique<json_applier>());
        return res;
    }

    inline indexer_config config(const uint64_t window=20)
    {
        indexer_config cfg {};
        cfg.db_path = std::string { db::database::memory };
        cfg.block_processing_window = window;
        cfg.receipt_workers = 2;
        cfg.contracts = contracts();
        return cfg;
    }

    // A complete in-memory deployment: a chain, the stores and a cycle wired to them
    struct deployment {
        chain::mock_chain chain {};
        db::database db { std::string { db::database::memory } };
        kv_store_mem kv {};
        indexer_config cfg;
        applier_set appl = appliers();

        explicit deployment(const uint64_t window=20): cfg { config(window) }
        {
            db::create_schema(db);
        }

        cycle_result index()
        {
            const indexer_context ctx { db, kv, chain, cfg, appl };
            return index_cycle { ctx }.run();
        }
    };
}

#endif // !CHAIN_MIRROR_MOCKS_HPP
