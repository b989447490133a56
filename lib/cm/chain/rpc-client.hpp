/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */
#ifndef CHAIN_MIRROR_CHAIN_RPC_CLIENT_HPP
#define CHAIN_MIRROR_CHAIN_RPC_CLIENT_HPP

#include <chrono>
#include <memory>
#include <cm/chain/client.hpp>
#include <cm/json.hpp>

namespace chain_mirror::chain {
    namespace rpc {
        // Decoders of Ethereum JSON-RPC results; malformed input is reported as chain_error.
        extern uint64_t parse_quantity(std::string_view hex);
        extern block parse_block(const json::value &res);
        extern receipt parse_receipt(const json::value &res);
        extern json::object make_request(uint64_t id, std::string_view method, json::array params);
        // Returns the result member of a response or throws chain_error with the server's error.
        extern json::value take_result(json::value &&resp, uint64_t expected_id);
    }

    // Ethereum JSON-RPC over HTTP/1.1. Each request uses its own connection.
    struct rpc_client: client {
        explicit rpc_client(const std::string &url, std::chrono::milliseconds timeout=std::chrono::milliseconds { 10'000 });
        ~rpc_client() override;
    private:
        struct impl;
        std::unique_ptr<impl> _impl;

        block _latest_impl() const override;
        block _block_by_number_impl(uint64_t number) const override;
        block _block_by_hash_impl(const std::string &hash) const override;
        receipt _receipt_impl(const std::string &tx_hash) const override;
    };
}

#endif // !CHAIN_MIRROR_CHAIN_RPC_CLIENT_HPP
