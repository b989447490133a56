/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <cm/chain/mock.hpp>
#include <cm/model.hpp>

namespace chain_mirror::chain {
    mock_chain::mock_chain()
    {
        append();
    }

    std::string mock_chain::_next_hash()
    {
        return fmt::format("0x{:064x}", _next_id++);
    }

    std::string mock_chain::make_tx_hash()
    {
        mutex::scoped_lock lk { _mutex };
        return _next_hash();
    }

    block mock_chain::append(receipt_list receipts)
    {
        mutex::scoped_lock lk { _mutex };
        block blk {};
        blk.number = _canonical.size();
        blk.parent_hash = _canonical.empty() ? std::string { zero_hash } : _canonical.back().hash;
        blk.hash = _next_hash();
        blk.timestamp = 1'600'000'000 + blk.number * 5;
        for (auto &r: receipts) {
            if (r.tx_hash.empty())
                r.tx_hash = _next_hash();
            blk.transactions.emplace_back(transaction { r.tx_hash, r.to });
            _receipts.insert_or_assign(r.tx_hash, std::move(r));
        }
        _canonical.emplace_back(blk);
        _by_hash.emplace(blk.hash, blk);
        return blk;
    }

    void mock_chain::rewind(const uint64_t number)
    {
        mutex::scoped_lock lk { _mutex };
        if (number >= _canonical.size())
            throw error("cannot rewind to block {} the tip is at {}", number, _canonical.size() - 1);
        _canonical.resize(number + 1);
    }

    block mock_chain::at(const uint64_t number) const
    {
        mutex::scoped_lock lk { _mutex };
        if (number >= _canonical.size())
            throw error("block {} is not on the chain", number);
        return _canonical[number];
    }

    void mock_chain::fail_receipt(const std::string &tx_hash, const bool fail)
    {
        mutex::scoped_lock lk { _mutex };
        if (fail)
            _failing_receipts.emplace(tx_hash);
        else
            _failing_receipts.erase(tx_hash);
    }

    void mock_chain::fail_all(const bool fail)
    {
        mutex::scoped_lock lk { _mutex };
        _fail_all = fail;
    }

    size_t mock_chain::num_requests() const
    {
        return _num_requests.load();
    }

    void mock_chain::_check_available() const
    {
        ++_num_requests;
        if (_fail_all)
            throw chain_error("mock chain: the node is not available");
    }

    block mock_chain::_latest_impl() const
    {
        mutex::scoped_lock lk { _mutex };
        _check_available();
        return _canonical.back();
    }

    block mock_chain::_block_by_number_impl(const uint64_t number) const
    {
        mutex::scoped_lock lk { _mutex };
        _check_available();
        if (number >= _canonical.size())
            throw chain_error("mock chain: unknown block number {}", number);
        return _canonical[number];
    }

    block mock_chain::_block_by_hash_impl(const std::string &hash) const
    {
        mutex::scoped_lock lk { _mutex };
        _check_available();
        const auto it = _by_hash.find(hash);
        if (it == _by_hash.end())
            throw chain_error("mock chain: unknown block hash {}", hash);
        return it->second;
    }

    receipt mock_chain::_receipt_impl(const std::string &tx_hash) const
    {
        mutex::scoped_lock lk { _mutex };
        _check_available();
        if (_failing_receipts.contains(tx_hash))
            throw chain_error("mock chain: receipt of {} is not available", tx_hash);
        const auto it = _receipts.find(tx_hash);
        if (it == _receipts.end())
            throw chain_error("mock chain: unknown transaction {}", tx_hash);
        return it->second;
    }
}
