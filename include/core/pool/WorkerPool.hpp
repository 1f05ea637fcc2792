#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace core::pool {

    /**
     * @brief Fixed-size pool of worker threads draining a FIFO of tasks
     */
    class WorkerPool {
    public:
        using Task = std::function<void()>;

        WorkerPool(std::string name, int workers);

        ~WorkerPool();

        WorkerPool(const WorkerPool &) = delete;

        WorkerPool &operator=(const WorkerPool &) = delete;

        bool start();

        /**
         * @brief Let running tasks finish, drop queued ones and join the workers
         */
        void stop();

        /**
         * @return false if the pool is not running
         */
        bool submit(Task task);

        bool isRunning() const { return running_; }

        size_t queueSize() const;

        size_t activeCount() const { return active_; }

        int workerCount() const { return workers_; }

    private:
        std::string name_;
        int workers_;

        std::atomic<bool> running_{false};
        std::atomic<bool> shutdown_{false};
        std::atomic<size_t> active_{0};

        mutable std::mutex queueMutex_;
        std::condition_variable taskAvailable_;
        std::queue<Task> tasks_;

        std::vector<std::thread> workerThreads_;

        void workerLoop(int workerId);
    };

} // namespace core::pool
