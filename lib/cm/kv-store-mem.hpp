/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */
#ifndef CHAIN_MIRROR_KV_STORE_MEM_HPP
#define CHAIN_MIRROR_KV_STORE_MEM_HPP

#include <map>
#include <cm/kv-store.hpp>
#include <cm/mutex.hpp>

namespace chain_mirror {
    // An in-process store; instances created from the same state behave as separate processes.
    struct kv_store_mem: kv_store {
        struct state {
            using clock = std::chrono::steady_clock;

            // moves the clock forward to simulate lock expiration
            void advance(const std::chrono::seconds d)
            {
                mutex::scoped_lock lk { mtx };
                skew += d;
            }

            clock::time_point now() const
            {
                return clock::now() + skew;
            }

            struct lock_info {
                std::string owner {};
                clock::time_point expires {};
            };

            alignas(mutex::alignment) std::mutex mtx {};
            clock::duration skew {};
            std::map<std::string, lock_info, std::less<>> locks {};
            std::map<std::string, std::string, std::less<>> values {};
            std::map<entity_kind, id_set> dirty {};
        };

        explicit kv_store_mem(std::shared_ptr<state> st=std::make_shared<state>())
            : _state { std::move(st) }, _owner { make_lock_owner() }
        {
        }

        const std::shared_ptr<state> &shared_state() const
        {
            return _state;
        }
    private:
        std::shared_ptr<state> _state;
        const std::string _owner;

        bool _acquire_if_absent_impl(const std::string_view key, const std::chrono::seconds ttl) override
        {
            mutex::scoped_lock lk { _state->mtx };
            const auto now = _state->now();
            if (const auto it = _state->locks.find(key); it != _state->locks.end() && it->second.expires > now)
                return false;
            _state->locks.insert_or_assign(std::string { key }, state::lock_info { _owner, now + ttl });
            return true;
        }

        void _release_impl(const std::string_view key) override
        {
            mutex::scoped_lock lk { _state->mtx };
            if (const auto it = _state->locks.find(key); it != _state->locks.end() && it->second.owner == _owner)
                _state->locks.erase(it);
        }

        void _set_impl(const std::string_view key, const std::string_view value) override
        {
            mutex::scoped_lock lk { _state->mtx };
            _state->values.insert_or_assign(std::string { key }, std::string { value });
        }

        std::optional<std::string> _get_impl(const std::string_view key) const override
        {
            mutex::scoped_lock lk { _state->mtx };
            if (const auto it = _state->values.find(key); it != _state->values.end())
                return it->second;
            return {};
        }

        void _publish_dirty_impl(const entity_kind kind, const id_set &ids) override
        {
            mutex::scoped_lock lk { _state->mtx };
            _state->dirty[kind].insert(ids.begin(), ids.end());
        }

        id_set _take_dirty_impl(const entity_kind kind) override
        {
            mutex::scoped_lock lk { _state->mtx };
            id_set res {};
            if (const auto it = _state->dirty.find(kind); it != _state->dirty.end())
                res = std::move(_state->dirty.extract(it).mapped());
            return res;
        }
    };
}

#endif // !CHAIN_MIRROR_KV_STORE_MEM_HPP
