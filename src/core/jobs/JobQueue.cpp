#include "core/jobs/JobQueue.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"

#include <algorithm>

namespace core::jobs {

    JobQueue::JobQueue(std::shared_ptr<events::EventBus> eventBus, size_t maxCompletedJobs)
            : eventBus_(std::move(eventBus)), maxCompletedJobs_(std::max<size_t>(maxCompletedJobs, 1)) {
    }

    JobId JobQueue::create(const std::string &modelRef,
                           std::shared_ptr<const profile::SlicerProfile> slicerProfile,
                           std::shared_ptr<const profile::DriverProfile> driverProfile,
                           const std::string &deviceId) {
        std::lock_guard<std::mutex> lock(jobsMutex_);

        JobRecord record;
        record.data.kind = JobKind::PRINT;
        record.data.modelRef = modelRef;
        record.data.deviceId = deviceId;
        record.slicerProfile = std::move(slicerProfile);
        record.driverProfile = std::move(driverProfile);

        auto &stored = insert(std::move(record));
        waitLists_[deviceId].push_back(stored.data.id);

        Logger::logInfo("[JobQueue] Created job " + std::to_string(stored.data.id) + " for device " + deviceId +
                        " (model: " + modelRef + ")");
        publish(stored, events::EventType::JOB_STATE_CHANGED, std::nullopt, "Job created");
        return stored.data.id;
    }

    JobId JobQueue::createSliceJob(const std::string &modelRef,
                                   std::shared_ptr<const profile::SlicerProfile> slicerProfile,
                                   const std::string &outputPath) {
        std::lock_guard<std::mutex> lock(jobsMutex_);

        JobRecord record;
        record.data.kind = JobKind::SLICE;
        record.data.modelRef = modelRef;
        record.data.toolpath = outputPath;
        record.slicerProfile = std::move(slicerProfile);

        auto &stored = insert(std::move(record));

        Logger::logInfo("[JobQueue] Created slice job " + std::to_string(stored.data.id) + " (model: " + modelRef +
                        ", output: " + outputPath + ")");
        publish(stored, events::EventType::JOB_STATE_CHANGED, std::nullopt, "Job created");
        return stored.data.id;
    }

    bool JobQueue::transition(JobId id, JobState from, JobState to, const std::string &message) {
        std::lock_guard<std::mutex> lock(jobsMutex_);

        auto it = jobs_.find(id);
        JobKind kind = (it != jobs_.end()) ? it->second.data.kind : JobKind::PRINT;
        if (!isLegalTransition(from, to, kind)) {
            Logger::logError("[JobQueue] Rejected illegal transition for " + jobKindToString(kind) + " job " +
                             std::to_string(id) + ": " + jobStateToString(from) + " -> " + jobStateToString(to));
            throw types::IllegalTransitionException(std::to_string(id), jobStateToString(from),
                                                    jobStateToString(to));
        }

        if (it == jobs_.end()) {
            Logger::logWarning("[JobQueue] Transition for unknown job " + std::to_string(id));
            return false;
        }

        if (it->second.data.state != from) {
            Logger::logDebug("[JobQueue] Job " + std::to_string(id) + " is " +
                             jobStateToString(it->second.data.state) + ", skipping " + jobStateToString(from) +
                             " -> " + jobStateToString(to));
            return false;
        }

        applyTransition(it->second, to, message);
        if (isTerminal(to)) {
            cleanupCompletedJobs();
        }
        return true;
    }

    bool JobQueue::fail(JobId id, const std::string &error) {
        std::lock_guard<std::mutex> lock(jobsMutex_);

        auto it = jobs_.find(id);
        if (it == jobs_.end() || isTerminal(it->second.data.state)) {
            return false;
        }

        it->second.data.error = error;
        applyTransition(it->second, JobState::FAILED, error);
        cleanupCompletedJobs();
        return true;
    }

    JobQueue::CancelOutcome JobQueue::requestCancel(JobId id) {
        std::shared_ptr<CancellationToken> token;
        CancelOutcome outcome{CancelDisposition::NOT_FOUND, std::nullopt};
        {
            std::lock_guard<std::mutex> lock(jobsMutex_);

            auto it = jobs_.find(id);
            if (it == jobs_.end()) {
                auto gone = evicted_.find(id);
                if (gone != evicted_.end()) {
                    outcome.disposition = CancelDisposition::ALREADY_TERMINAL;
                    outcome.previousState = gone->second.state;
                }
                return outcome;
            }

            auto &record = it->second;
            outcome.previousState = record.data.state;

            if (isTerminal(record.data.state)) {
                outcome.disposition = CancelDisposition::ALREADY_TERMINAL;
                return outcome;
            }

            record.data.cancelRequested = true;
            token = record.cancellation;

            if (record.data.state == JobState::PRINTING) {
                outcome.disposition = CancelDisposition::FORWARDED;
                Logger::logInfo("[JobQueue] Cancel requested for printing job " + std::to_string(id) +
                                ", waiting for abort confirmation");
            } else {
                outcome.disposition = CancelDisposition::CANCELLED;
                applyTransition(record, JobState::CANCELLED, "Cancelled by client");
                cleanupCompletedJobs();
            }
        }

        token->cancel();
        return outcome;
    }

    void JobQueue::setProgress(JobId id, double progress,
                               const std::optional<device::TemperatureReport> &temperature) {
        std::lock_guard<std::mutex> lock(jobsMutex_);

        auto it = jobs_.find(id);
        if (it == jobs_.end() || it->second.data.state != JobState::PRINTING) {
            return;
        }

        auto &record = it->second;
        progress = std::clamp(progress, 0.0, 1.0);
        record.data.progress = progress;
        if (temperature) {
            record.data.temperature = temperature;
        }
        record.data.lastUpdate = std::chrono::system_clock::now();

        if (progress - record.lastPublishedProgress >= 0.01) {
            record.lastPublishedProgress = progress;
            publish(record, events::EventType::JOB_PROGRESS, record.data.state, "");
        }
    }

    void JobQueue::setToolpath(JobId id, const std::string &toolpath) {
        std::lock_guard<std::mutex> lock(jobsMutex_);
        auto it = jobs_.find(id);
        if (it != jobs_.end()) {
            it->second.data.toolpath = toolpath;
        }
    }

    std::optional<JobSnapshot> JobQueue::snapshot(JobId id) const {
        std::lock_guard<std::mutex> lock(jobsMutex_);
        auto it = jobs_.find(id);
        if (it != jobs_.end()) {
            return makeSnapshot(it->second);
        }
        auto gone = evicted_.find(id);
        if (gone != evicted_.end()) {
            return gone->second;
        }
        return std::nullopt;
    }

    std::vector<JobSnapshot> JobQueue::list(const JobFilter &filter) const {
        std::lock_guard<std::mutex> lock(jobsMutex_);
        std::vector<JobSnapshot> result;

        for (const auto &[id, record]: jobs_) {
            if (filter.matches(record.data)) {
                result.push_back(makeSnapshot(record));
            }
        }
        return result;
    }

    std::optional<JobContext> JobQueue::context(JobId id) const {
        std::lock_guard<std::mutex> lock(jobsMutex_);
        auto it = jobs_.find(id);
        if (it == jobs_.end()) {
            return std::nullopt;
        }

        const auto &record = it->second;
        JobContext ctx;
        ctx.id = id;
        ctx.kind = record.data.kind;
        ctx.modelRef = record.data.modelRef;
        ctx.deviceId = record.data.deviceId;
        ctx.slicerProfile = record.slicerProfile;
        ctx.driverProfile = record.driverProfile;
        ctx.cancellation = record.cancellation;
        ctx.toolpath = record.data.toolpath;
        return ctx;
    }

    std::optional<JobId> JobQueue::readyHead(const std::string &deviceId) const {
        std::lock_guard<std::mutex> lock(jobsMutex_);

        auto listIt = waitLists_.find(deviceId);
        if (listIt == waitLists_.end() || listIt->second.empty()) {
            return std::nullopt;
        }

        JobId head = listIt->second.front();
        auto jobIt = jobs_.find(head);
        if (jobIt == jobs_.end() || jobIt->second.data.state != JobState::QUEUED) {
            return std::nullopt;
        }
        return head;
    }

    std::vector<JobId> JobQueue::waitList(const std::string &deviceId) const {
        std::lock_guard<std::mutex> lock(jobsMutex_);
        auto it = waitLists_.find(deviceId);
        if (it == waitLists_.end()) {
            return {};
        }
        return {it->second.begin(), it->second.end()};
    }

    std::vector<JobId> JobQueue::nonTerminalJobs() const {
        std::lock_guard<std::mutex> lock(jobsMutex_);
        std::vector<JobId> active;
        for (const auto &[id, record]: jobs_) {
            if (!isTerminal(record.data.state)) {
                active.push_back(id);
            }
        }
        return active;
    }

    JobQueue::Statistics JobQueue::getStatistics() const {
        std::lock_guard<std::mutex> lock(jobsMutex_);
        Statistics stats = stats_;
        stats.activeJobs = 0;
        for (const auto &entry: jobs_) {
            if (!isTerminal(entry.second.data.state)) {
                stats.activeJobs++;
            }
        }
        return stats;
    }

    JobQueue::JobRecord &JobQueue::insert(JobRecord record) {
        JobId id = nextId_++;
        auto now = std::chrono::system_clock::now();

        record.data.id = id;
        record.data.slicerProfile = record.slicerProfile ? record.slicerProfile->name : "";
        record.data.driverProfile = record.driverProfile ? record.driverProfile->name : "";
        record.data.state = JobState::CREATED;
        record.data.createdAt = now;
        record.data.lastUpdate = now;
        record.data.history.push_back({std::nullopt, JobState::CREATED, now, "Job created"});
        record.cancellation = std::make_shared<CancellationToken>();

        stats_.totalJobs++;
        return jobs_.emplace(id, std::move(record)).first->second;
    }

    void JobQueue::applyTransition(JobRecord &record, JobState to, const std::string &message) {
        JobState from = record.data.state;
        auto now = std::chrono::system_clock::now();

        record.data.state = to;
        record.data.lastUpdate = now;
        record.data.history.push_back({from, to, now, message});

        if (to == JobState::PRINTING || isTerminal(to)) {
            removeFromWaitList(record);
        }

        switch (to) {
            case JobState::COMPLETED:
                record.data.progress = 1.0;
                stats_.completedJobs++;
                break;
            case JobState::FAILED:
                stats_.failedJobs++;
                break;
            case JobState::CANCELLED:
                stats_.cancelledJobs++;
                break;
            default:
                break;
        }

        std::string logLine = "[JobQueue] Job " + std::to_string(record.data.id) + ": " + jobStateToString(from) +
                              " -> " + jobStateToString(to) + (message.empty() ? "" : " (" + message + ")");
        if (to == JobState::FAILED) {
            Logger::logError(logLine);
        } else {
            Logger::logInfo(logLine);
        }

        publish(record, events::EventType::JOB_STATE_CHANGED, from, message);
    }

    void JobQueue::removeFromWaitList(const JobRecord &record) {
        auto it = waitLists_.find(record.data.deviceId);
        if (it == waitLists_.end()) return;

        auto &waiting = it->second;
        waiting.erase(std::remove(waiting.begin(), waiting.end(), record.data.id), waiting.end());
        if (waiting.empty()) {
            waitLists_.erase(it);
        }
    }

    std::optional<size_t> JobQueue::waitPosition(const JobRecord &record) const {
        auto it = waitLists_.find(record.data.deviceId);
        if (it == waitLists_.end()) return std::nullopt;

        const auto &waiting = it->second;
        auto pos = std::find(waiting.begin(), waiting.end(), record.data.id);
        if (pos == waiting.end()) return std::nullopt;
        return static_cast<size_t>(pos - waiting.begin()) + 1;
    }

    JobSnapshot JobQueue::makeSnapshot(const JobRecord &record) const {
        JobSnapshot snapshot = record.data;
        snapshot.waitPosition = waitPosition(record);
        return snapshot;
    }

    void JobQueue::publish(const JobRecord &record, events::EventType type, std::optional<JobState> oldState,
                           const std::string &message) {
        if (!eventBus_) return;

        events::Event event;
        event.type = type;
        event.jobId = record.data.id;
        event.deviceId = record.data.deviceId;
        event.oldState = oldState;
        event.newState = record.data.state;
        event.progress = record.data.progress;
        event.temperature = record.data.temperature;
        event.message = message;
        event.timestamp = record.data.lastUpdate;
        eventBus_->publish(std::move(event));
    }

    void JobQueue::cleanupCompletedJobs() {
        std::vector<std::pair<JobId, std::chrono::system_clock::time_point>> completed;
        for (const auto &[id, record]: jobs_) {
            if (isTerminal(record.data.state)) {
                completed.emplace_back(id, record.data.lastUpdate);
            }
        }

        if (completed.size() > maxCompletedJobs_) {
            std::sort(completed.begin(), completed.end(),
                      [](const auto &a, const auto &b) {
                          return a.second < b.second || (a.second == b.second && a.first < b.first);
                      });

            size_t toRemove = completed.size() - maxCompletedJobs_;
            for (size_t i = 0; i < toRemove; ++i) {
                auto it = jobs_.find(completed[i].first);
                JobSnapshot retained = it->second.data;
                retained.history.clear();
                retained.temperature.reset();
                retained.evicted = true;
                evicted_[retained.id] = std::move(retained);
                jobs_.erase(it);
            }
            Logger::logDebug("[JobQueue] Evicted " + std::to_string(toRemove) + " finished jobs");
        }
    }

} // namespace core::jobs
