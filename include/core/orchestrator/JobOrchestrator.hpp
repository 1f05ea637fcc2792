#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/device/DeviceRegistry.hpp"
#include "core/driver/DriverAdapter.hpp"
#include "core/events/EventSystem.hpp"
#include "core/jobs/JobQueue.hpp"
#include "core/model/ModelFetcher.hpp"
#include "core/pool/WorkerPool.hpp"
#include "core/profile/ProfileRegistry.hpp"
#include "core/slicer/SlicerAdapter.hpp"
#include "core/types/Result.hpp"

namespace core::orchestrator {

    struct OrchestratorConfig {
        int workerThreads = 4;
        std::string workDirectory = "work";
        size_t maxCompletedJobs = 100;
    };

    /**
     * @brief Entry point for every job operation.
     *
     * Client-facing calls only touch the queue and return; slicing and printing run on the
     * worker pool. A device is handed to the head of its wait list once the head is Queued
     * and the device is free and available.
     */
    class JobOrchestrator {
    public:
        JobOrchestrator(OrchestratorConfig config,
                        std::shared_ptr<profile::ProfileRegistry> profiles,
                        std::shared_ptr<slicer::SlicerFactory> slicerFactory,
                        std::shared_ptr<driver::DriverFactory> driverFactory,
                        std::shared_ptr<device::DeviceRegistry> devices,
                        std::shared_ptr<events::EventBus> eventBus,
                        std::shared_ptr<model::ModelFetcher> fetcher = nullptr);

        ~JobOrchestrator();

        JobOrchestrator(const JobOrchestrator &) = delete;

        JobOrchestrator &operator=(const JobOrchestrator &) = delete;

        bool start();

        /**
         * @brief Cancel every unfinished job and stop the worker pool; tasks still queued are discarded
         */
        void stop();

        bool isRunning() const { return running_; }

        /**
         * @brief Validate and enqueue a print request; slicing starts asynchronously
         * @throws core::types::ProfileNotFoundException
         * @throws core::types::UnsupportedModelTypeException
         * @throws core::types::ConveyorException if the orchestrator is not running
         */
        jobs::JobId submit(const std::string &modelRef,
                           const std::string &slicerProfile,
                           const std::string &driverProfile,
                           const std::string &deviceId);

        /**
         * @brief Slice a model to @p outputPath without claiming any device
         * @throws core::types::ProfileNotFoundException
         * @throws core::types::UnsupportedModelTypeException
         * @throws core::types::ConveyorException if the orchestrator is not running or the path is empty
         */
        jobs::JobId slice(const std::string &modelRef,
                          const std::string &slicerProfile,
                          const std::string &outputPath);

        /**
         * @return Success, NotFound or AlreadyTerminal
         */
        types::Result cancel(jobs::JobId id);

        std::optional<jobs::JobSnapshot> status(jobs::JobId id) const;

        std::vector<jobs::JobSnapshot> list(const jobs::JobFilter &filter = {}) const;

        /**
         * @brief Make a device available again and resume its wait list
         */
        types::Result reconnectDevice(const std::string &deviceId);

        std::vector<device::DeviceStatus> devices() const;

        std::vector<jobs::JobId> waitList(const std::string &deviceId) const;

        const profile::ProfileRegistry &profiles() const { return *profiles_; }

        jobs::JobQueue::Statistics getStatistics() const;

        size_t pendingTasks() const;

        size_t activeTasks() const;

    private:
        OrchestratorConfig config_;
        std::shared_ptr<profile::ProfileRegistry> profiles_;
        std::shared_ptr<slicer::SlicerFactory> slicerFactory_;
        std::shared_ptr<driver::DriverFactory> driverFactory_;
        std::shared_ptr<device::DeviceRegistry> devices_;
        std::shared_ptr<events::EventBus> eventBus_;
        std::shared_ptr<model::ModelFetcher> fetcher_;

        std::unique_ptr<jobs::JobQueue> queue_;
        std::unique_ptr<pool::WorkerPool> pool_;

        std::atomic<bool> running_{false};
        std::mutex dispatchMutex_;

        void runSlicing(jobs::JobId id);

        /**
         * @brief Fetch the model if remote, then slice or copy it to @p destination
         * @return false when the job was cancelled on the way
         */
        bool produceToolpath(const jobs::JobContext &ctx, const std::string &destination);

        /**
         * @brief Start the head of the device's wait list if it is ready and the device is free
         */
        void dispatch(const std::string &deviceId);

        void runPrinting(jobs::JobId id, std::shared_ptr<device::DeviceHandle> handle);

        std::string toolpathPathFor(jobs::JobId id) const;
    };

} // namespace core::orchestrator
