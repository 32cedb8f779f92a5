#include "facewatch/database/thread_pool.hpp"
#include <spdlog/spdlog.h>

namespace facewatch {

ThreadPool::ThreadPool(size_t num_threads) {
    if (num_threads == 0) {
        num_threads = 1;
    }
    spdlog::debug("ThreadPool: starting {} threads", num_threads);

    for (size_t i = 0; i < num_threads; ++i) {
        workers.emplace_back(&ThreadPool::worker_thread, this);
    }
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::enqueue(std::function<void()> func, int priority) {
    {
        std::unique_lock<std::mutex> lock(queue_mutex);
        if (stop_flag) {
            throw std::runtime_error("ThreadPool is stopped");
        }
        tasks.push({std::move(func), priority, next_sequence++});
    }
    condition.notify_one();
}

void ThreadPool::worker_thread() {
    while (true) {
        Task task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex);

            condition.wait(lock, [this] {
                return stop_flag || !tasks.empty();
            });

            if (stop_flag && tasks.empty()) {
                return;
            }

            task = tasks.top();
            tasks.pop();
            active_count++;
        }

        try {
            task.func();
        } catch (const std::exception& e) {
            spdlog::error("Task exception: {}", e.what());
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex);
            active_count--;
        }
        idle_condition.notify_all();
    }
}

void ThreadPool::submit_high_priority(std::function<void()> task) {
    enqueue(std::move(task), 10);
}

void ThreadPool::submit_low_priority(std::function<void()> task) {
    enqueue(std::move(task), -10);
}

size_t ThreadPool::pending_tasks() const {
    std::lock_guard<std::mutex> lock(queue_mutex);
    return tasks.size();
}

void ThreadPool::wait_all() {
    std::unique_lock<std::mutex> lock(queue_mutex);
    idle_condition.wait(lock, [this] {
        return tasks.empty() && active_count == 0;
    });
}

void ThreadPool::stop() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex);
        if (stop_flag && workers.empty()) return;
        stop_flag = true;
    }

    condition.notify_all();

    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    workers.clear();
}

} // namespace facewatch
