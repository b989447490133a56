/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <cm/logger.hpp>
#include <cm/test.hpp>
#include <cm/timer.hpp>

using namespace chain_mirror;

suite logger_suite = [] {
    "logger"_test = [] {
        "api"_test = [] {
            // checks that the code compiles and does not fail
            logger::trace("OK - trace");
            logger::trace("OK - {}", "trace");
            logger::debug("OK - debug");
            logger::debug("OK - {}", "debug");
            logger::info("OK - info");
            logger::info("OK - {}", "info");
            logger::warn("OK - warn");
            logger::warn("OK - {}", "warn");
            logger::error("OK - error");
            logger::error("OK - {}", "error");
            expect(true);
        };
        "run_log_errors"_test = [] {
            const auto ex1 = logger::run_log_errors([] {});
            expect(!ex1);
            const auto ex2 = logger::run_log_errors([] { throw error("Something bad!"); });
            expect(static_cast<bool>(ex2));
        };
        "run_log_errors runs cleanup"_test = [] {
            size_t cleanups = 0;
            const auto ex = logger::run_log_errors([] { throw chain_error("node is down"); }, [&] { ++cleanups; });
            expect(static_cast<bool>(ex));
            test_same(1, cleanups);
        };
        "run_log_errors_rethrow"_test = [] {
            expect(nothrow([] { logger::run_log_errors_rethrow([] {}); }));
            expect(throws<chain_error>([] { logger::run_log_errors_rethrow([] { throw chain_error("Something bad!"); }); }));
        };
        "timer"_test = [] {
            timer t { "logger test timer", logger::level::debug };
            expect(t.duration() >= 0.0);
            const auto d = t.stop(false);
            expect(d == t.duration());
        };
    };
    "error"_test = [] {
        "location"_test = [] {
            const error e { "failure with {}", 42 };
            const std::string msg { e.what() };
            expect(msg.starts_with("failure with 42 at ")) << msg;
            expect(msg.find("logger.test.cpp") != std::string::npos) << msg;
        };
        "string arguments are formatted"_test = [] {
            const std::string table { "blocks" };
            const error e { "table {} is missing", table };
            const std::string msg { e.what() };
            expect(msg.starts_with("table blocks is missing at ")) << msg;
            const chain_error ce { "node {} is unreachable", std::string { "http://127.0.0.1:9/" } };
            expect(std::string_view { ce.what() }.starts_with("node http://127.0.0.1:9/ is unreachable at ")) << ce.what();
            const std::runtime_error cause { "disk full" };
            const error wrapped { std::string { "cannot write" }, cause };
            expect(std::string_view { wrapped.what() }.find("caused by") != std::string_view::npos) << wrapped.what();
        };
        "taxonomy"_test = [] {
            expect(throws<chain_mirror::error>([] { throw chain_error("timeout"); }));
            expect(throws<chain_mirror::error>([] { throw invariant_error("two current blocks"); }));
        };
    };
};
