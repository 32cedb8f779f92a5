// ============= include/facewatch/database/thread_pool.hpp =============
/*
 * Writer Thread Pool
 *
 * Runs store write-through and detection logging off the matching path.
 *
 * - Priority queue (identity write-through before detection logs)
 * - Exceptions escaping a task are logged, never rethrown
 * - wait_all() blocks until the queue is drained and no task runs
 */

#pragma once
#include <atomic>
#include <cstdint>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

namespace facewatch {

class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = std::thread::hardware_concurrency());
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Submit task (returns future)
    template<typename F, typename... Args>
    auto submit(F&& f, Args&&... args) -> std::future<decltype(f(args...))>;

    // Fire-and-forget with priority
    void submit_high_priority(std::function<void()> task);
    void submit_low_priority(std::function<void()> task);

    size_t pending_tasks() const;
    size_t active_threads() const { return workers.size(); }

    void wait_all();
    void stop();

private:
    struct Task {
        std::function<void()> func;
        int priority = 0;      // Higher = more urgent
        uint64_t sequence = 0; // FIFO within a priority

        bool operator<(const Task& other) const {
            if (priority != other.priority) return priority < other.priority;
            return sequence > other.sequence;
        }
    };

    std::vector<std::thread> workers;
    std::priority_queue<Task> tasks;
    uint64_t next_sequence = 0;

    mutable std::mutex queue_mutex;
    std::condition_variable condition;
    std::condition_variable idle_condition;
    bool stop_flag = false;
    size_t active_count = 0;

    void enqueue(std::function<void()> func, int priority);
    void worker_thread();
};

// ==================== IMPLEMENTATION ====================

template<typename F, typename... Args>
auto ThreadPool::submit(F&& f, Args&&... args) -> std::future<decltype(f(args...))> {
    using return_type = decltype(f(args...));

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> result = task->get_future();
    enqueue([task]() { (*task)(); }, 0);
    return result;
}

} // namespace facewatch
