/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */
#ifndef CHAIN_MIRROR_CHAIN_MOCK_HPP
#define CHAIN_MIRROR_CHAIN_MOCK_HPP

#include <atomic>
#include <map>
#include <set>
#include <cm/chain/client.hpp>
#include <cm/mutex.hpp>

namespace chain_mirror::chain {
    /*
     * An in-memory chain with a genesis block at number 0. Blocks dropped by rewind
     * stay retrievable by hash, as orphaned blocks usually are on a real node.
     */
    struct mock_chain: client {
        mock_chain();

        // Appends a block on top of the canonical tip; transactions are derived from the receipts.
        block append(receipt_list receipts={});
        // Keeps the canonical blocks up to and including the number.
        void rewind(uint64_t number);
        block at(uint64_t number) const;
        // Makes receipt requests for the transaction fail until cleared.
        void fail_receipt(const std::string &tx_hash, bool fail=true);
        // Makes every request fail until cleared.
        void fail_all(bool fail=true);
        size_t num_requests() const;
        std::string make_tx_hash();
    private:
        mutable mutex::unique_lock::mutex_type _mutex alignas(mutex::alignment) {};
        std::vector<block> _canonical {};
        std::map<std::string, block> _by_hash {};
        std::map<std::string, receipt> _receipts {};
        std::set<std::string> _failing_receipts {};
        bool _fail_all = false;
        uint64_t _next_id = 1;
        mutable std::atomic_size_t _num_requests { 0 };

        std::string _next_hash();
        void _check_available() const;
        block _latest_impl() const override;
        block _block_by_number_impl(uint64_t number) const override;
        block _block_by_hash_impl(const std::string &hash) const override;
        receipt _receipt_impl(const std::string &tx_hash) const override;
    };
}

#endif // !CHAIN_MIRROR_CHAIN_MOCK_HPP
