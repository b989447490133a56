/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <atomic>
#include <random>
#include <unistd.h>
#include <cm/kv-store.hpp>

namespace chain_mirror {
    std::string make_lock_owner()
    {
        static std::atomic_uint64_t next_id { 0 };
        std::random_device rd {};
        const uint64_t nonce = (static_cast<uint64_t>(rd()) << 32) | rd();
        return fmt::format("{}-{:016x}-{}", getpid(), nonce, next_id.fetch_add(1));
    }
}
