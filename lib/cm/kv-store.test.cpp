/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <atomic>
#include <thread>
#include <vector>
#include <cm/job-lock.hpp>
#include <cm/kv-store-mem.hpp>
#include <cm/kv-store-sqlite.hpp>
#include <cm/test.hpp>

using namespace std::literals;
using namespace chain_mirror;

namespace {
    // Both stores must observe the same locks as two processes of one deployment would.
    void test_store_pair(kv_store &a, kv_store &b)
    {
        expect(a.acquire_if_absent("job", 60s));
        expect(!b.acquire_if_absent("job", 60s));
        expect(!a.acquire_if_absent("job", 60s));
        // a foreign lock is left intact
        b.release("job");
        expect(!b.acquire_if_absent("job", 60s));
        a.release("job");
        expect(b.acquire_if_absent("job", 60s));
        b.release("job");

        expect(!a.get("missing"));
        a.set(kv_keys::latest_block, "12");
        a.set(kv_keys::latest_block, "13");
        test_same(std::string { "13" }, b.get(kv_keys::latest_block).value());

        a.publish_dirty(entity_kind::user, { "1", "2" });
        a.publish_dirty(entity_kind::user, { "2", "3" });
        a.publish_dirty(entity_kind::track, {});
        const auto users = b.take_dirty(entity_kind::user);
        test_same(3, users.size());
        expect(users.contains("3"));
        expect(b.take_dirty(entity_kind::user).empty());
        expect(b.take_dirty(entity_kind::track).empty());

        publish_most_recent(a, block_record { "0xabc", "0xab", 77, true });
        test_same(std::string { "77" }, b.get(kv_keys::most_recent_indexed_block).value());
        test_same(std::string { "0xabc" }, b.get(kv_keys::most_recent_indexed_block_hash).value());
    }
}

suite kv_store_suite = [] {
    "kv_store"_test = [] {
        "lock owners are unique"_test = [] {
            expect(make_lock_owner() != make_lock_owner());
        };
        "mem"_test = [] {
            kv_store_mem a {};
            kv_store_mem b { a.shared_state() };
            test_store_pair(a, b);
        };
        "mem ttl"_test = [] {
            kv_store_mem a {};
            kv_store_mem b { a.shared_state() };
            expect(a.acquire_if_absent("job", 300s));
            a.shared_state()->advance(299s);
            expect(!b.acquire_if_absent("job", 300s));
            a.shared_state()->advance(2s);
            // the holder crashed: the lock self-heals after its ttl
            expect(b.acquire_if_absent("job", 300s));
            expect(!a.acquire_if_absent("job", 300s));
        };
        "sqlite"_test = [] {
            file::tmp path { "kv-store-test.sqlite" };
            kv_store_sqlite a { path };
            kv_store_sqlite b { path };
            test_store_pair(a, b);
        };
        "sqlite ttl"_test = [] {
            file::tmp path { "kv-store-ttl-test.sqlite" };
            kv_store_sqlite a { path };
            kv_store_sqlite b { path };
            expect(a.acquire_if_absent("job", 1s));
            expect(!b.acquire_if_absent("job", 1s));
            std::this_thread::sleep_for(1100ms);
            expect(b.acquire_if_absent("job", 1s));
        };
    };
    "job_lock"_test = [] {
        "released on every exit path"_test = [] {
            kv_store_mem a {};
            kv_store_mem b { a.shared_state() };
            {
                job_lock lk { a, "disc_prov_lock", 300s };
                expect(static_cast<bool>(lk));
                job_lock lk2 { b, "disc_prov_lock", 300s };
                expect(!lk2);
            }
            expect(throws([&] {
                job_lock lk { a, "disc_prov_lock", 300s };
                expect(static_cast<bool>(lk));
                throw error("cycle failure");
            }));
            job_lock lk3 { b, "disc_prov_lock", 300s };
            expect(static_cast<bool>(lk3));
        };
        "concurrent attempts yield one holder"_test = [] {
            kv_store_mem base {};
            std::atomic_size_t num_acquired { 0 };
            std::vector<std::thread> threads {};
            for (size_t i = 0; i < 8; ++i) {
                threads.emplace_back([&] {
                    kv_store_mem kv { base.shared_state() };
                    if (kv.acquire_if_absent("aggregate", 60s))
                        ++num_acquired;
                });
            }
            for (auto &t: threads)
                t.join();
            test_same(1, num_acquired.load());
        };
    };
};
