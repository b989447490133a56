/* This file is part of Chain Mirror project.
 * Copyright (c) 2025 Chain Mirror contributors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <atomic>
#include <condition_variable>
#include <list>
#include <queue>
#include <unordered_map>
#include <vector>
#include <boost/thread.hpp>
#include <cm/logger.hpp>
#include <cm/mutex.hpp>
#include <cm/scheduler.hpp>
#include <cm/timer.hpp>

namespace chain_mirror {
    struct scheduler::impl {
        explicit impl(const size_t num_workers)
            : _num_workers { num_workers }
        {
            if (_num_workers == 0)
                throw scheduler_error("the number of worker threads must be greater than zero!");
            logger::debug("scheduler started, worker count: {}", _num_workers);
            // One worker is a special case handled by the process method itself
            if (_num_workers > 1) {
                for (size_t i = 0; i < _num_workers; ++i)
                    _workers.emplace_back([this, i] { _worker_thread(i); });
            }
        }

        ~impl()
        {
            _destroy = true;
            _tasks_cv.notify_all();
            for (auto &w: _workers)
                w.join();
            _workers.clear();
            for (const auto &[task_group, stats]: _task_stats) {
                logger::trace("task: {} submitted: {} completed: {} cpu_time: {:0.3f} sec",
                    task_group, stats.submitted, stats.completed, stats.cpu_time);
            }
        }

        size_t num_workers() const
        {
            return _num_workers;
        }

        void submit(const std::string &task_group, const int64_t priority, const std::function<std::any ()> &action)
        {
            mutex::unique_lock tasks_lock { _tasks_mutex };
            _tasks.emplace(priority, task_group, action);
            auto &stats = _task_stats[task_group];
            ++stats.submitted;
            ++stats.queued;
            tasks_lock.unlock();
            _tasks_cv.notify_one();
        }

        void on_result(const std::string &task_group, const std::function<void (std::any &&)> &observer, const bool replace_if_exists)
        {
            if (task_count(task_group) != 0)
                throw scheduler_error("observers for task '{}' must be configured before task submission!", task_group);
            mutex::scoped_lock lock { _observers_mutex };
            auto &observers = _observers[task_group];
            if (replace_if_exists)
                observers.clear();
            observers.emplace_back(observer);
        }

        size_t task_count(const std::string &task_group)
        {
            mutex::scoped_lock lock { _tasks_mutex };
            const auto it = _task_stats.find(task_group);
            return it != _task_stats.end() ? it->second.queued : 0;
        }

        size_t task_count()
        {
            mutex::scoped_lock lock { _tasks_mutex };
            return _task_count_unsafe();
        }

        bool process_ok(const std::source_location &loc)
        {
            timer t { fmt::format("scheduler::process_ok call from {}", loc), logger::level::trace };
            bool must_be_false = false;
            if (!_process_running.compare_exchange_strong(must_be_false, true))
                throw scheduler_error("nested calls to scheduler::process are prohibited!");
            const auto finalize = [&] {
                {
                    mutex::scoped_lock observers_lock { _observers_mutex };
                    _observers.clear();
                }
                _process_running = false;
                _success = true;
            };
            try {
                _process();
                const bool res = _success.load();
                finalize();
                return res;
            } catch (const std::exception &ex) {
                logger::warn("scheduler::process failed: {}", ex.what());
                finalize();
                throw;
            }
        }
    private:
        using task_queue = std::priority_queue<scheduled_task>;

        struct task_stat {
            size_t submitted = 0;
            size_t queued = 0;
            size_t completed = 0;
            double cpu_time = 0.0;
        };

        mutable mutex::unique_lock::mutex_type _tasks_mutex alignas(mutex::alignment) {};
        std::condition_variable_any _tasks_cv alignas(mutex::alignment) {};
        task_queue _tasks {};
        std::unordered_map<std::string, task_stat> _task_stats {};

        using observer_list = std::list<std::function<void (std::any &&)>>;
        mutable mutex::unique_lock::mutex_type _observers_mutex alignas(mutex::alignment) {};
        std::unordered_map<std::string, observer_list> _observers {};

        mutex::unique_lock::mutex_type _results_mutex alignas(mutex::alignment) {};
        std::condition_variable_any _results_cv alignas(mutex::alignment) {};
        std::priority_queue<scheduled_result> _results {};

        std::vector<boost::thread> _workers {};
        const size_t _num_workers;
        std::atomic_bool _destroy { false };
        std::atomic_bool _success { true };
        std::atomic_bool _process_running { false };

        size_t _task_count_unsafe() const
        {
            size_t cnt = 0;
            for (const auto &[task_group, stats]: _task_stats)
                cnt += stats.queued;
            return cnt;
        }

        void _process_results(mutex::unique_lock &results_lock)
        {
            while (!_results.empty()) {
                auto res = _results.top();
                _results.pop();
                results_lock.unlock();
                {
                    mutex::scoped_lock tasks_lock { _tasks_mutex };
                    auto &stats = _task_stats.at(res.task_group);
                    --stats.queued;
                    ++stats.completed;
                    stats.cpu_time += res.cpu_time;
                }
                mutex::unique_lock observers_lock { _observers_mutex };
                if (const auto it = _observers.find(res.task_group); it != _observers.end()) {
                    // observers of a task group are configured before task submission
                    const auto &observers = it->second;
                    observers_lock.unlock();
                    for (const auto &observer: observers) {
                        if (logger::run_log_errors([&] { observer(std::move(res.result)); }))
                            _success = false;
                    }
                }
                results_lock.lock();
            }
        }

        void _add_result(const int64_t priority, const std::string &task_group, std::any &&res, const double cpu_time)
        {
            mutex::unique_lock results_lock { _results_mutex };
            _results.push(scheduled_result { priority, task_group, std::move(res), cpu_time });
            results_lock.unlock();
            _results_cv.notify_one();
        }

        bool _worker_try_execute(const size_t worker_idx, const std::chrono::milliseconds wait_interval)
        {
            mutex::unique_lock lock { _tasks_mutex };
            _tasks_cv.wait_for(lock, wait_interval, [&] {
                return !_tasks.empty() || _destroy;
            });
            if (_destroy)
                return false;
            if (!_tasks.empty()) {
                auto task = _tasks.top();
                _tasks.pop();
                lock.unlock();
                std::any task_res {};
                const auto start_time = std::chrono::steady_clock::now();
                try {
                    task_res = task.task();
                } catch (const std::exception &ex) {
                    _success = false;
                    logger::warn("worker-{} task {} failed: {}", worker_idx, task.task_group, ex.what());
                    task_res = std::make_any<scheduled_task_error>(
                        fmt::format("task: '{}' error: '{}' of type: '{}'!", task.task_group, ex.what(), typeid(ex).name()), task.task_group);
                }
                const auto cpu_time = std::chrono::duration<double> { std::chrono::steady_clock::now() - start_time }.count();
                _add_result(task.priority, task.task_group, std::move(task_res), cpu_time);
            }
            return true;
        }

        void _worker_thread(const size_t worker_idx)
        {
            while (_worker_try_execute(worker_idx, default_wait_interval)) {
            }
        }

        void _process()
        {
            for (;;) {
                {
                    mutex::scoped_lock results_lk { _results_mutex };
                    mutex::scoped_lock tasks_lk { _tasks_mutex };
                    if (_task_count_unsafe() == 0 && _results.empty())
                        break;
                }
                // In the single-worker mode, the tasks are executed in the loop
                if (_num_workers == 1)
                    _worker_try_execute(0, default_wait_interval);
                mutex::unique_lock results_lock { _results_mutex };
                if (_results_cv.wait_for(results_lock, default_wait_interval, [&] { return !_results.empty(); }))
                    _process_results(results_lock);
            }
        }
    };

    scheduler::scheduler(const size_t num_workers)
        : _impl { std::make_unique<impl>(num_workers) }
    {
    }

    scheduler::~scheduler() =default;

    size_t scheduler::num_workers() const
    {
        return _impl->num_workers();
    }

    void scheduler::submit(const std::string &task_group, const int64_t priority, const std::function<std::any ()> &action)
    {
        _impl->submit(task_group, priority, action);
    }

    void scheduler::submit_void(const std::string &task_group, const int64_t priority, const std::function<void ()> &action)
    {
        submit(task_group, priority, [action] {
            action();
            return true;
        });
    }

    void scheduler::on_result(const std::string &task_group, const std::function<void (std::any &&)> &observer, const bool replace_if_exists)
    {
        _impl->on_result(task_group, observer, replace_if_exists);
    }

    size_t scheduler::task_count(const std::string &task_group)
    {
        return _impl->task_count(task_group);
    }

    size_t scheduler::task_count()
    {
        return _impl->task_count();
    }

    bool scheduler::process_ok(const std::source_location &loc)
    {
        return _impl->process_ok(loc);
    }

    void scheduler::process(const std::source_location &loc)
    {
        if (!_impl->process_ok(loc))
            throw scheduler_error("some scheduled tasks have failed, please consult logs for more details");
    }
}
