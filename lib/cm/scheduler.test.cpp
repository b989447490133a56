/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>
#include <cm/scheduler.hpp>
#include <cm/test.hpp>

using namespace std::literals;
using namespace chain_mirror;

suite scheduler_suite = [] {
    "scheduler"_test = [] {
        "fan-out and fan-in"_test = [] {
            scheduler s { 4 };
            std::vector<size_t> done {};
            s.on_result("square", [&](const std::any &res) {
                done.emplace_back(std::any_cast<size_t>(res));
            });
            for (size_t i = 0; i < 32; ++i) {
                s.submit("square", 100, [i] {
                    std::this_thread::sleep_for(1ms);
                    return i * i;
                });
            }
            s.process();
            test_same(32, done.size());
            std::sort(done.begin(), done.end());
            test_same(31 * 31, done.back());
            test_same(0, s.task_count());
        };
        "chained submission"_test = [] {
            scheduler s { 2 };
            size_t first_calls = 0;
            size_t second_calls = 0;
            s.on_result("first", [&](const std::any &) {
                ++first_calls;
                if (s.task_count("first") == 0)
                    s.submit_void("second", 10, [] {});
            });
            s.on_result("second", [&](const std::any &) {
                ++second_calls;
            });
            for (size_t i = 0; i < 8; ++i)
                s.submit_void("first", 100, [] { std::this_thread::sleep_for(2ms); });
            s.process();
            test_same(8, first_calls);
            test_same(1, second_calls);
        };
        "exceptions"_test = [] {
            scheduler s { 2 };
            size_t num_ok = 0, num_err = 0;
            s.on_result("bad_actor", [&](const std::any &res) {
                if (res.type() == typeid(scheduled_task_error))
                    ++num_err;
                else
                    ++num_ok;
            });
            s.submit("bad_actor", 100, []() { throw error("Ha ha! I told ya!"); return true; });
            s.submit("bad_actor", 100, []() { return true; });
            expect(!s.process_ok());
            test_same(1, num_ok);
            test_same(1, num_err);
        };
        "exceptions_no_observer"_test = [] {
            scheduler s { 2 };
            s.submit("bad_actor", 100, []() { throw error("Ha ha! I told ya!"); return true; });
            expect(throws([&]{ s.process(); }));
        };
        "success is reset after each process call"_test = [] {
            scheduler s { 2 };
            s.submit("bad_actor", 100, []() { throw error("failure"); return true; });
            expect(!s.process_ok());
            s.submit("good_actor", 100, []() { return true; });
            expect(s.process_ok());
        };
        "observers are cleared after each process call"_test = [] {
            scheduler s { 2 };
            size_t ok_cnt = 0;
            s.on_result("ok", [&](const auto &) {
                ok_cnt++;
            });
            s.submit("ok", 100, []() { return true; });
            s.process();
            expect(ok_cnt == 1);
            s.on_result("ok", [&](const auto &) {
                ok_cnt++;
            });
            s.submit("ok", 100, []() { return true; });
            s.process();
            expect(ok_cnt == 2);
        };
        "single worker"_test = [] {
            scheduler s { 1 };
            const auto main_id = std::this_thread::get_id();
            std::atomic_size_t num_in_main { 0 };
            for (size_t i = 0; i < 4; ++i) {
                s.submit_void("inline", 100, [&] {
                    if (std::this_thread::get_id() == main_id)
                        ++num_in_main;
                });
            }
            s.process();
            test_same(4, num_in_main.load());
        };
        "observer registration after submission"_test = [] {
            scheduler s { 2 };
            s.submit_void("late", 100, [] { std::this_thread::sleep_for(50ms); });
            expect(throws([&] { s.on_result("late", [](const std::any &) {}); }));
            s.process();
        };
        "zero workers"_test = [] {
            expect(throws([] { scheduler s { 0 }; }));
        };
    };
};
