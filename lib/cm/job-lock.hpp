/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */
#ifndef CHAIN_MIRROR_JOB_LOCK_HPP
#define CHAIN_MIRROR_JOB_LOCK_HPP

#include <cm/kv-store.hpp>

namespace chain_mirror {
    // The outcome of a lock-guarded job
    enum class cycle_status {
        skipped, up_to_date, completed
    };

    // A scoped distributed lock: tries once and releases on every exit path if taken.
    struct job_lock {
        job_lock(kv_store &kv, const std::string_view name, const std::chrono::seconds ttl)
            : _kv { kv }, _name { name }, _acquired { kv.acquire_if_absent(name, ttl) }
        {
            logger::debug("lock {} {}", _name, _acquired ? "acquired" : "is busy");
        }

        ~job_lock()
        {
            if (_acquired) {
                logger::run_log_errors([&] {
                    _kv.release(_name);
                    logger::debug("lock {} released", _name);
                });
            }
        }

        job_lock(const job_lock &) =delete;
        job_lock &operator=(const job_lock &) =delete;

        explicit operator bool() const
        {
            return _acquired;
        }

        const std::string &name() const
        {
            return _name;
        }
    private:
        kv_store &_kv;
        const std::string _name;
        const bool _acquired;
    };
}

namespace fmt {
    template<>
    struct formatter<chain_mirror::cycle_status>: formatter<int> {
        template<typename FormatContext>
        auto format(const chain_mirror::cycle_status &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            switch (v) {
                case chain_mirror::cycle_status::skipped: return fmt::format_to(ctx.out(), "skipped");
                case chain_mirror::cycle_status::up_to_date: return fmt::format_to(ctx.out(), "up_to_date");
                case chain_mirror::cycle_status::completed: return fmt::format_to(ctx.out(), "completed");
                default: throw chain_mirror::error("unsupported cycle_status value: {}", static_cast<int>(v));
            }
        }
    };
}

#endif // !CHAIN_MIRROR_JOB_LOCK_HPP
