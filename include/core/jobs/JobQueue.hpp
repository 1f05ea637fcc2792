#pragma once

#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/events/EventSystem.hpp"
#include "core/jobs/CancellationToken.hpp"
#include "core/jobs/Job.hpp"
#include "core/profile/Profile.hpp"

namespace core::jobs {

    /**
     * @brief Everything a worker needs to run one phase of a job
     */
    struct JobContext {
        JobId id = 0;
        JobKind kind = JobKind::PRINT;
        std::string modelRef;
        std::string deviceId;
        std::shared_ptr<const profile::SlicerProfile> slicerProfile;
        std::shared_ptr<const profile::DriverProfile> driverProfile;
        std::shared_ptr<CancellationToken> cancellation;
        std::optional<std::string> toolpath; // slice jobs: requested output file
    };

    /**
     * @brief Authoritative job table, transition rules and per-device wait lists.
     *
     * All mutations happen under one mutex. Each committed transition is published to the
     * event bus while that mutex is held, so events leave in the order transitions happened.
     */
    class JobQueue {
    public:
        enum class CancelDisposition {
            NOT_FOUND,
            ALREADY_TERMINAL,
            CANCELLED, // was Created/Slicing/Queued, now Cancelled
            FORWARDED // Printing: flag set, the print loop has to confirm the abort
        };

        struct CancelOutcome {
            CancelDisposition disposition;
            std::optional<JobState> previousState;
        };

        struct Statistics {
            size_t totalJobs = 0;
            size_t completedJobs = 0;
            size_t failedJobs = 0;
            size_t cancelledJobs = 0;
            size_t activeJobs = 0;
        };

        explicit JobQueue(std::shared_ptr<events::EventBus> eventBus, size_t maxCompletedJobs = 100);

        /**
         * @brief Create a job in Created and append it to its device's wait list
         */
        JobId create(const std::string &modelRef,
                     std::shared_ptr<const profile::SlicerProfile> slicerProfile,
                     std::shared_ptr<const profile::DriverProfile> driverProfile,
                     const std::string &deviceId);

        /**
         * @brief Create a slice-only job. It goes Created -> Slicing -> Completed and never joins a wait list.
         */
        JobId createSliceJob(const std::string &modelRef,
                             std::shared_ptr<const profile::SlicerProfile> slicerProfile,
                             const std::string &outputPath);

        /**
         * @brief Compare-and-set transition.
         * @return false when the job is unknown or no longer in @p from
         * @throws core::types::IllegalTransitionException when from -> to is not an edge of the state graph
         */
        bool transition(JobId id, JobState from, JobState to, const std::string &message = "");

        /**
         * @brief Move a non-terminal job to Failed with the given detail
         * @return false when the job is unknown or already terminal
         */
        bool fail(JobId id, const std::string &error);

        /**
         * @brief Cancel pre-print jobs immediately; flag printing jobs for the print loop.
         *
         * Jobs already evicted by retention still report ALREADY_TERMINAL.
         */
        CancelOutcome requestCancel(JobId id);

        void setProgress(JobId id, double progress,
                         const std::optional<device::TemperatureReport> &temperature = std::nullopt);

        void setToolpath(JobId id, const std::string &toolpath);

        /**
         * @brief Full snapshot of a retained job, or the final state of an evicted one
         */
        std::optional<JobSnapshot> snapshot(JobId id) const;

        std::vector<JobSnapshot> list(const JobFilter &filter = {}) const;

        std::optional<JobContext> context(JobId id) const;

        /**
         * @brief Head of the device wait list, if it is ready to print
         */
        std::optional<JobId> readyHead(const std::string &deviceId) const;

        std::vector<JobId> waitList(const std::string &deviceId) const;

        std::vector<JobId> nonTerminalJobs() const;

        Statistics getStatistics() const;

    private:
        struct JobRecord {
            JobSnapshot data;
            std::shared_ptr<const profile::SlicerProfile> slicerProfile;
            std::shared_ptr<const profile::DriverProfile> driverProfile;
            std::shared_ptr<CancellationToken> cancellation;
            double lastPublishedProgress = 0.0;
        };

        std::shared_ptr<events::EventBus> eventBus_;
        size_t maxCompletedJobs_;

        mutable std::mutex jobsMutex_;
        std::map<JobId, JobRecord> jobs_;
        std::map<JobId, JobSnapshot> evicted_; // final state only, no history
        std::unordered_map<std::string, std::deque<JobId>> waitLists_;
        JobId nextId_ = 1;
        Statistics stats_;

        JobRecord &insert(JobRecord record);

        void applyTransition(JobRecord &record, JobState to, const std::string &message);

        void removeFromWaitList(const JobRecord &record);

        std::optional<size_t> waitPosition(const JobRecord &record) const;

        JobSnapshot makeSnapshot(const JobRecord &record) const;

        void publish(const JobRecord &record, events::EventType type, std::optional<JobState> oldState,
                     const std::string &message);

        void cleanupCompletedJobs();
    };

} // namespace core::jobs
