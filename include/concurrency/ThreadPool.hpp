#pragma once

#include "Task.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace spdlog { class logger; }

namespace fsort::concurrency {

/**
 * Fixed-size worker pool. Each worker runs one task at a time, so at most
 * workerCount() tasks are ever executing.
 */
class ThreadPool {
public:
    explicit ThreadPool(unsigned int nThreads, std::shared_ptr<spdlog::logger> log = nullptr);

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Drops queued tasks that have not started, then joins the workers.
    void stop();

    void submit(std::shared_ptr<Task> task);

    [[nodiscard]] unsigned int workerCount() const;

private:
    void spawnWorker();

    std::vector<std::thread> threads_;

    std::condition_variable cv;
    mutable std::mutex mutex;
    std::queue<std::shared_ptr<Task>> queue;

    std::atomic<bool> stopFlag{false};
    std::shared_ptr<spdlog::logger> log_;
};

} // namespace fsort::concurrency
