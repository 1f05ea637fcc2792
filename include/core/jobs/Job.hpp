#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/device/TemperatureReport.hpp"
#include "core/jobs/JobState.hpp"

namespace core::jobs {

    using JobId = uint64_t;

    struct StateTransition {
        std::optional<JobState> from;
        JobState to;
        std::chrono::system_clock::time_point timestamp;
        std::string message;
    };

    /**
     * @brief Immutable copy of a job handed out by the queue
     */
    struct JobSnapshot {
        JobId id = 0;
        JobKind kind = JobKind::PRINT;
        std::string modelRef;
        std::string slicerProfile;
        std::string driverProfile;
        std::string deviceId;
        JobState state = JobState::CREATED;
        std::vector<StateTransition> history;
        std::optional<std::string> error;
        std::optional<double> progress;
        std::optional<device::TemperatureReport> temperature; // last report seen while printing
        std::optional<std::string> toolpath; // output file for slice jobs
        bool evicted = false; // history dropped by retention, final state kept
        std::optional<size_t> waitPosition; // 1-based, while waiting for the device
        bool cancelRequested = false;
        std::chrono::system_clock::time_point createdAt;
        std::chrono::system_clock::time_point lastUpdate;
    };

    struct JobFilter {
        std::optional<JobState> state;
        std::optional<std::string> deviceId;
        bool activeOnly = false;

        bool matches(const JobSnapshot &job) const {
            if (state && job.state != *state) return false;
            if (deviceId && job.deviceId != *deviceId) return false;
            if (activeOnly && isTerminal(job.state)) return false;
            return true;
        }
    };

} // namespace core::jobs
