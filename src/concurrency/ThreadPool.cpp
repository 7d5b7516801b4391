#include "concurrency/ThreadPool.hpp"
#include "log/Registry.hpp"

#include <stdexcept>
#include <utility>

using namespace fsort::concurrency;

ThreadPool::ThreadPool(const unsigned int nThreads, std::shared_ptr<spdlog::logger> log)
    : stopFlag(false),
      log_(log ? std::move(log) : fsort::log::Registry::sched()) {
    if (nThreads == 0) throw std::invalid_argument("ThreadPool requires at least one worker");

    try {
        for (unsigned int i = 0; i < nThreads; ++i) spawnWorker();
    } catch (...) {
        stop();
        throw;
    }

    log_->debug("[ThreadPool] Started {} workers", nThreads);
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::stop() {
    {
        std::scoped_lock lock(mutex);
        std::queue<std::shared_ptr<Task>> empty;
        std::swap(queue, empty);
        stopFlag.store(true);
    }
    cv.notify_all();

    for (auto& t : threads_)
        if (t.joinable()) t.join();

    threads_.clear();
}

void ThreadPool::submit(std::shared_ptr<Task> task) {
    {
        std::scoped_lock lock(mutex);
        if (stopFlag.load()) throw std::runtime_error("ThreadPool is stopped");
        queue.push(std::move(task));
    }
    cv.notify_one();
}

unsigned int ThreadPool::workerCount() const {
    return static_cast<unsigned int>(threads_.size());
}

void ThreadPool::spawnWorker() {
    threads_.emplace_back([this] {
        while (true) {
            std::shared_ptr<Task> task; {
                std::unique_lock lock(mutex);
                cv.wait(lock, [this] {
                    return stopFlag.load() || !queue.empty();
                });

                if (stopFlag.load() && queue.empty()) break;

                task = std::move(queue.front());
                queue.pop();
            }

            if (task) {
                try {
                    (*task)();
                } catch (const std::exception& e) {
                    log_->error("[ThreadPool] Task threw: {}", e.what());
                } catch (...) {
                    log_->error("[ThreadPool] Task threw a non-standard exception");
                }
            }
        }
    });
}
