/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */
#ifndef CHAIN_MIRROR_SCHEDULER_HPP
#define CHAIN_MIRROR_SCHEDULER_HPP

#include <any>
#include <chrono>
#include <functional>
#include <memory>
#include <thread>
#include <cm/error.hpp>

namespace chain_mirror {
    struct scheduler_error: error {
        using error::error;
    };

    struct scheduled_task {
        int64_t priority;
        std::string task_group;
        std::function<std::any ()> task;

        scheduled_task(const int64_t prio, const std::string &tg, const std::function<std::any ()> &t)
            : priority { prio }, task_group { tg }, task { t }
        {
        }

        bool operator<(const scheduled_task &t) const noexcept
        {
            return priority < t.priority;
        }
    };

    // Delivered to result observers in place of the result of a failed task.
    struct scheduled_task_error: scheduler_error {
        scheduled_task_error(const std::string &msg, const std::string &task_group)
            : scheduler_error { msg }, _task_group { task_group }
        {
        }

        const std::string &task_group() const
        {
            return _task_group;
        }
    private:
        std::string _task_group;
    };

    struct scheduled_result {
        int64_t priority = 0;
        std::string task_group {};
        std::any result {};
        double cpu_time = 0.0;

        bool operator<(const scheduled_result &r) const noexcept
        {
            return priority < r.priority;
        }
    };

    /*
     * A fixed pool of worker threads. Results are handed to the observers of their task group
     * from the thread that calls process, so observers need no locking.
     */
    struct scheduler {
        static constexpr std::chrono::milliseconds default_wait_interval { 10 };

        static size_t default_worker_count()
        {
            return std::thread::hardware_concurrency();
        }

        explicit scheduler(size_t num_workers=scheduler::default_worker_count());
        ~scheduler();
        size_t num_workers() const;
        void submit(const std::string &task_group, int64_t priority, const std::function<std::any ()> &action);
        void submit_void(const std::string &task_group, int64_t priority, const std::function<void ()> &action);
        void on_result(const std::string &task_group, const std::function<void (std::any &&)> &observer, bool replace_if_exists=false);
        size_t task_count(const std::string &task_group);
        size_t task_count();
        // Returns false if any of the tasks has failed.
        [[nodiscard]] bool process_ok(const std::source_location &loc=std::source_location::current());
        void process(const std::source_location &loc=std::source_location::current());
    private:
        struct impl;
        std::unique_ptr<impl> _impl;
    };
}

#endif // !CHAIN_MIRROR_SCHEDULER_HPP
