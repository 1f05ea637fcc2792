#include "core/pool/WorkerPool.hpp"
#include "logger/Logger.hpp"

namespace core::pool {

    WorkerPool::WorkerPool(std::string name, int workers)
            : name_(std::move(name)), workers_(workers > 0 ? workers : 1) {
    }

    WorkerPool::~WorkerPool() {
        stop();
    }

    bool WorkerPool::start() {
        if (running_) {
            Logger::logWarning("[WorkerPool] " + name_ + " already running");
            return false;
        }

        running_ = true;
        shutdown_ = false;

        try {
            workerThreads_.reserve(workers_);
            for (int i = 0; i < workers_; ++i) {
                workerThreads_.emplace_back(&WorkerPool::workerLoop, this, i);
            }
        } catch (const std::exception &e) {
            Logger::logError("[WorkerPool] Failed to start " + name_ + ": " + e.what());
            stop();
            return false;
        }

        Logger::logInfo("[WorkerPool] " + name_ + " started with " + std::to_string(workers_) + " workers");
        return true;
    }

    void WorkerPool::stop() {
        if (!running_) {
            return;
        }

        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            shutdown_ = true;
            running_ = false;
        }
        taskAvailable_.notify_all();

        for (auto &thread: workerThreads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
        workerThreads_.clear();

        size_t dropped = 0;
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            dropped = tasks_.size();
            std::queue<Task>().swap(tasks_);
        }

        if (dropped > 0) {
            Logger::logWarning("[WorkerPool] " + name_ + " dropped " + std::to_string(dropped) + " queued tasks");
        }
        Logger::logInfo("[WorkerPool] " + name_ + " stopped");
    }

    bool WorkerPool::submit(Task task) {
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (!running_ || shutdown_) {
                Logger::logWarning("[WorkerPool] Cannot submit to stopped pool " + name_);
                return false;
            }
            tasks_.push(std::move(task));
        }
        taskAvailable_.notify_one();
        return true;
    }

    size_t WorkerPool::queueSize() const {
        std::lock_guard<std::mutex> lock(queueMutex_);
        return tasks_.size();
    }

    void WorkerPool::workerLoop(int workerId) {
        const std::string workerName = name_ + "-" + std::to_string(workerId);
        Logger::logDebug("[WorkerPool] " + workerName + " started");

        while (true) {
            Task task;
            {
                std::unique_lock<std::mutex> lock(queueMutex_);
                taskAvailable_.wait(lock, [this] { return !tasks_.empty() || shutdown_; });

                if (shutdown_) {
                    break;
                }

                task = std::move(tasks_.front());
                tasks_.pop();
            }

            active_++;
            try {
                task();
            } catch (const std::exception &e) {
                Logger::logError("[WorkerPool] " + workerName + " task failed: " + e.what());
            }
            active_--;
        }

        Logger::logDebug("[WorkerPool] " + workerName + " stopped");
    }

} // namespace core::pool
