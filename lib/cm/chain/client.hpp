/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */
#ifndef CHAIN_MIRROR_CHAIN_CLIENT_HPP
#define CHAIN_MIRROR_CHAIN_CLIENT_HPP

#include <cm/chain/types.hpp>
#include <cm/error.hpp>

namespace chain_mirror::chain {
    /*
     * Read-only access to the chain node. Implementations must be safe to call from
     * multiple threads since receipts of a block are fetched concurrently.
     * All failures are reported as chain_error.
     *
     * A reconciliation walk issues one call per backward step. The walk requires that
     * a block returned once stays retrievable by its hash until the cycle ends; a block
     * vanishing mid-walk fails the cycle with chain_error and it is retried.
     */
    struct client {
        virtual ~client() =default;

        block latest() const
        {
            return _latest_impl();
        }

        block block_by_number(const uint64_t number) const
        {
            return _block_by_number_impl(number);
        }

        block block_by_hash(const std::string &hash) const
        {
            return _block_by_hash_impl(hash);
        }

        receipt transaction_receipt(const std::string &tx_hash) const
        {
            return _receipt_impl(tx_hash);
        }
    private:
        virtual block _latest_impl() const =0;
        virtual block _block_by_number_impl(uint64_t number) const =0;
        virtual block _block_by_hash_impl(const std::string &hash) const =0;
        virtual receipt _receipt_impl(const std::string &tx_hash) const =0;
    };
}

#endif // !CHAIN_MIRROR_CHAIN_CLIENT_HPP
