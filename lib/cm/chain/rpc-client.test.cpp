/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <cm/chain/rpc-client.hpp>
#include <cm/test.hpp>

using namespace chain_mirror;
using namespace chain_mirror::chain;

namespace {
    const char *block_json = R"({
        "hash": "0x2a",
        "parentHash": "0x29",
        "number": "0x1b4",
        "timestamp": "0x5f5e1000",
        "transactions": [
            { "hash": "0xt1", "to": "0xAA" },
            { "hash": "0xt2", "to": null }
        ]
    })";

    const char *receipt_json = R"({
        "transactionHash": "0xt1",
        "to": "0xAA",
        "status": "0x0",
        "logs": [
            { "address": "0xAA", "topics": [ "0xe1", "0xe2" ], "data": "0x01" }
        ]
    })";
}

suite chain_rpc_client_suite = [] {
    "chain::rpc"_test = [] {
        "parse_quantity"_test = [] {
            test_same(0, rpc::parse_quantity("0x0"));
            test_same(436, rpc::parse_quantity("0x1b4"));
            test_same(436, rpc::parse_quantity("0x1B4"));
            expect(throws<chain_error>([] { rpc::parse_quantity("1b4"); }));
            expect(throws<chain_error>([] { rpc::parse_quantity("0x"); }));
            expect(throws<chain_error>([] { rpc::parse_quantity("0xzz"); }));
        };
        "parse_block"_test = [] {
            const auto blk = rpc::parse_block(json::parse(block_json));
            test_same(std::string { "0x2a" }, blk.hash);
            test_same(std::string { "0x29" }, blk.parent_hash);
            test_same(436, blk.number);
            test_same(1600000000, blk.timestamp);
            test_same(2, blk.transactions.size());
            test_same(std::string { "0xAA" }, blk.transactions.at(0).to);
            // contract creation
            expect(blk.transactions.at(1).to.empty());
        };
        "parse_block requires transaction objects"_test = [] {
            expect(throws<chain_error>([] {
                rpc::parse_block(json::parse(R"({ "hash": "0x2a", "parentHash": "0x29", "number": "0x1", "timestamp": "0x1", "transactions": [ "0xt1" ] })"));
            }));
            expect(throws<chain_error>([] { rpc::parse_block(json::parse(R"({ "hash": "0x2a" })")); }));
        };
        "parse_receipt"_test = [] {
            const auto r = rpc::parse_receipt(json::parse(receipt_json));
            test_same(std::string { "0xt1" }, r.tx_hash);
            expect(!r.status);
            test_same(1, r.logs.size());
            test_same(2, r.logs.at(0).topics.size());
            test_same(std::string { "0x01" }, r.logs.at(0).data);
            const auto pre = rpc::parse_receipt(json::parse(R"({ "transactionHash": "0xt3", "root": "0x01", "logs": [] })"));
            expect(pre.status);
        };
        "take_result"_test = [] {
            const auto req = rpc::make_request(7, "eth_getBlockByNumber", json::array { "latest", true });
            test_same(std::string { "eth_getBlockByNumber" }, std::string { req.at("method").as_string() });
            const auto res = rpc::take_result(json::parse(R"({ "jsonrpc": "2.0", "id": 7, "result": { "a": 1 } })"), 7);
            expect(res.is_object());
            expect(throws<chain_error>([] { rpc::take_result(json::parse(R"({ "jsonrpc": "2.0", "id": 8, "result": 1 })"), 7); }));
            expect(throws<chain_error>([] { rpc::take_result(json::parse(R"({ "jsonrpc": "2.0", "id": 7, "result": null })"), 7); }));
            expect(throws<chain_error>([] {
                rpc::take_result(json::parse(R"({ "jsonrpc": "2.0", "id": 7, "error": { "code": -32000, "message": "header not found" } })"), 7);
            }));
        };
        "client construction"_test = [] {
            expect(nothrow([] { rpc_client c { "http://127.0.0.1:8545/" }; }));
            expect(throws([] { rpc_client c { "https://127.0.0.1:8545/" }; }));
        };
        "unreachable node"_test = [] {
            // nothing listens on the discard port of the loopback interface
            const rpc_client c { "http://127.0.0.1:9/", std::chrono::milliseconds { 500 } };
            expect(throws<chain_error>([&] { c.latest(); }));
        };
    };
};
