#include "core/orchestrator/JobOrchestrator.hpp"
#include "core/model/ModelReference.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace core::orchestrator {

    namespace {
        /**
         * @brief File removed on scope exit unless released
         */
        class ScopedFile {
        public:
            ScopedFile() = default;

            ~ScopedFile() {
                if (!path_.empty()) {
                    std::error_code ec;
                    fs::remove(path_, ec);
                }
            }

            ScopedFile(const ScopedFile &) = delete;

            ScopedFile &operator=(const ScopedFile &) = delete;

            void reset(const std::string &path) { path_ = path; }

            void release() { path_.clear(); }

        private:
            std::string path_;
        };

        std::string describeSliceFailure(const types::SliceFailedException &e) {
            std::string detail = std::string(e.what()) + " (exit code " + std::to_string(e.exitCode()) + ")";
            if (!e.diagnostics().empty()) {
                detail += "\n" + e.diagnostics();
            }
            return detail;
        }
    }

    JobOrchestrator::JobOrchestrator(OrchestratorConfig config,
                                     std::shared_ptr<profile::ProfileRegistry> profiles,
                                     std::shared_ptr<slicer::SlicerFactory> slicerFactory,
                                     std::shared_ptr<driver::DriverFactory> driverFactory,
                                     std::shared_ptr<device::DeviceRegistry> devices,
                                     std::shared_ptr<events::EventBus> eventBus,
                                     std::shared_ptr<model::ModelFetcher> fetcher)
            : config_(std::move(config)),
              profiles_(std::move(profiles)),
              slicerFactory_(std::move(slicerFactory)),
              driverFactory_(std::move(driverFactory)),
              devices_(std::move(devices)),
              eventBus_(std::move(eventBus)),
              fetcher_(std::move(fetcher)) {
        if (!profiles_ || !slicerFactory_ || !driverFactory_ || !devices_) {
            throw std::invalid_argument("JobOrchestrator dependencies cannot be null");
        }
        if (!fetcher_) {
            fetcher_ = std::make_shared<model::ModelFetcher>();
        }
        queue_ = std::make_unique<jobs::JobQueue>(eventBus_, config_.maxCompletedJobs);
        pool_ = std::make_unique<pool::WorkerPool>("JobWorkers", config_.workerThreads);
    }

    JobOrchestrator::~JobOrchestrator() {
        stop();
    }

    bool JobOrchestrator::start() {
        if (running_) {
            Logger::logWarning("[JobOrchestrator] Already running");
            return false;
        }

        std::error_code ec;
        fs::create_directories(config_.workDirectory, ec);
        if (ec) {
            Logger::logError("[JobOrchestrator] Cannot create work directory " + config_.workDirectory + ": " +
                             ec.message());
            return false;
        }

        if (!pool_->start()) {
            return false;
        }

        running_ = true;
        Logger::logInfo("[JobOrchestrator] Started (work directory: " + config_.workDirectory + ")");
        return true;
    }

    void JobOrchestrator::stop() {
        if (!running_.exchange(false)) {
            return;
        }

        Logger::logInfo("[JobOrchestrator] Stopping, cancelling unfinished jobs...");
        for (auto id: queue_->nonTerminalJobs()) {
            queue_->requestCancel(id);
        }

        pool_->stop();

        // Printing jobs whose loop never got to confirm the abort
        for (auto id: queue_->nonTerminalJobs()) {
            queue_->fail(id, "Daemon shutting down");
        }
        Logger::logInfo("[JobOrchestrator] Stopped");
    }

    jobs::JobId JobOrchestrator::submit(const std::string &modelRef,
                                        const std::string &slicerProfile,
                                        const std::string &driverProfile,
                                        const std::string &deviceId) {
        auto slicer = profiles_->resolveSlicer(slicerProfile);
        auto driver = profiles_->resolveDriver(driverProfile);

        if (model::ModelReference::classify(modelRef) == model::ModelType::UNSUPPORTED) {
            Logger::logWarning("[JobOrchestrator] Rejected unsupported model " + modelRef);
            throw types::UnsupportedModelTypeException(modelRef);
        }

        if (!running_) {
            throw types::ConveyorException("Job orchestrator is not running");
        }

        devices_->registerDevice({deviceId, "", 0});
        jobs::JobId id = queue_->create(modelRef, std::move(slicer), std::move(driver), deviceId);

        if (!pool_->submit([this, id]() { runSlicing(id); })) {
            queue_->fail(id, "Worker pool is not running");
        }
        return id;
    }

    jobs::JobId JobOrchestrator::slice(const std::string &modelRef,
                                       const std::string &slicerProfile,
                                       const std::string &outputPath) {
        auto slicer = profiles_->resolveSlicer(slicerProfile);

        if (model::ModelReference::classify(modelRef) == model::ModelType::UNSUPPORTED) {
            Logger::logWarning("[JobOrchestrator] Rejected unsupported model " + modelRef);
            throw types::UnsupportedModelTypeException(modelRef);
        }
        if (outputPath.empty()) {
            throw types::ConveyorException("Output path must not be empty");
        }
        if (!running_) {
            throw types::ConveyorException("Job orchestrator is not running");
        }

        std::error_code ec;
        fs::path absolute = fs::absolute(outputPath, ec);
        if (ec) {
            throw types::ConveyorException("Cannot resolve output path " + outputPath + ": " + ec.message());
        }
        std::string output = absolute.lexically_normal().string();
        jobs::JobId id = queue_->createSliceJob(modelRef, std::move(slicer), output);

        if (!pool_->submit([this, id]() { runSlicing(id); })) {
            queue_->fail(id, "Worker pool is not running");
        }
        return id;
    }

    types::Result JobOrchestrator::cancel(jobs::JobId id) {
        auto before = queue_->snapshot(id);
        auto outcome = queue_->requestCancel(id);

        switch (outcome.disposition) {
            case jobs::JobQueue::CancelDisposition::NOT_FOUND:
                return types::Result::notFound("Job " + std::to_string(id) + " not found");
            case jobs::JobQueue::CancelDisposition::ALREADY_TERMINAL:
                return types::Result::alreadyTerminal("Job " + std::to_string(id) + " is already " +
                                                      jobs::jobStateToString(*outcome.previousState));
            case jobs::JobQueue::CancelDisposition::FORWARDED:
                return types::Result::success("Cancellation forwarded to the driver");
            case jobs::JobQueue::CancelDisposition::CANCELLED:
                break;
        }

        // The cancelled job may have been holding up its wait list
        if (before && !before->deviceId.empty()) {
            dispatch(before->deviceId);
        }
        return types::Result::success("Job cancelled");
    }

    std::optional<jobs::JobSnapshot> JobOrchestrator::status(jobs::JobId id) const {
        return queue_->snapshot(id);
    }

    std::vector<jobs::JobSnapshot> JobOrchestrator::list(const jobs::JobFilter &filter) const {
        return queue_->list(filter);
    }

    types::Result JobOrchestrator::reconnectDevice(const std::string &deviceId) {
        if (!devices_->markAvailable(deviceId)) {
            return types::Result::notFound("Device " + deviceId + " not found");
        }
        Logger::logInfo("[JobOrchestrator] Device " + deviceId + " reconnected");
        dispatch(deviceId);
        return types::Result::success("Device " + deviceId + " available");
    }

    std::vector<device::DeviceStatus> JobOrchestrator::devices() const {
        return devices_->list();
    }

    std::vector<jobs::JobId> JobOrchestrator::waitList(const std::string &deviceId) const {
        return queue_->waitList(deviceId);
    }

    jobs::JobQueue::Statistics JobOrchestrator::getStatistics() const {
        return queue_->getStatistics();
    }

    size_t JobOrchestrator::pendingTasks() const {
        return pool_->queueSize();
    }

    size_t JobOrchestrator::activeTasks() const {
        return pool_->activeCount();
    }

    void JobOrchestrator::runSlicing(jobs::JobId id) {
        auto ctx = queue_->context(id);
        if (!ctx || ctx->cancellation->isCancelled()) {
            return;
        }

        if (!queue_->transition(id, jobs::JobState::CREATED, jobs::JobState::SLICING, "Slicing started")) {
            return;
        }

        const bool sliceOnly = ctx->kind == jobs::JobKind::SLICE;
        const std::string toolpath = sliceOnly ? ctx->toolpath.value_or("") : toolpathPathFor(id);
        ScopedFile partial;

        try {
            if (sliceOnly) {
                std::error_code ec;
                fs::create_directories(fs::path(toolpath).parent_path(), ec);
                if (ec) {
                    throw types::ConveyorException("Cannot create output directory for " + toolpath + ": " +
                                                   ec.message());
                }
                partial.reset(toolpath);
            }

            if (!produceToolpath(*ctx, toolpath)) {
                return;
            }
        } catch (const types::SliceFailedException &e) {
            queue_->fail(id, describeSliceFailure(e));
            return;
        } catch (const types::ConveyorException &e) {
            queue_->fail(id, e.what());
            return;
        } catch (const std::exception &e) {
            Logger::logError("[JobOrchestrator] Unexpected error slicing job " + std::to_string(id) + ": " +
                             e.what());
            queue_->fail(id, std::string("Unexpected error: ") + e.what());
            return;
        }

        if (sliceOnly) {
            if (queue_->transition(id, jobs::JobState::SLICING, jobs::JobState::COMPLETED,
                                   "Toolpath written to " + toolpath)) {
                partial.release();
            }
            return;
        }

        queue_->setToolpath(id, toolpath);
        if (!queue_->transition(id, jobs::JobState::SLICING, jobs::JobState::QUEUED, "Toolpath ready")) {
            // Cancelled while the slicer was finishing
            return;
        }

        dispatch(ctx->deviceId);
    }

    bool JobOrchestrator::produceToolpath(const jobs::JobContext &ctx, const std::string &destination) {
        std::string modelPath = ctx.modelRef;
        ScopedFile downloaded;

        if (model::ModelReference::isRemote(ctx.modelRef)) {
            modelPath = (fs::path(config_.workDirectory) /
                         ("job-" + std::to_string(ctx.id) + "-" + model::ModelReference::fileName(ctx.modelRef)))
                    .string();
            downloaded.reset(modelPath);
            if (!fetcher_->fetch(ctx.modelRef, modelPath, *ctx.cancellation)) {
                Logger::logInfo("[JobOrchestrator] Job " + std::to_string(ctx.id) + " cancelled during download");
                return false;
            }
        }

        if (model::ModelReference::classify(ctx.modelRef) == model::ModelType::GCODE) {
            std::error_code ec;
            fs::copy_file(modelPath, destination, fs::copy_options::overwrite_existing, ec);
            if (ec) {
                throw types::ConveyorException("Cannot copy " + modelPath + ": " + ec.message());
            }
            return true;
        }

        auto slicer = slicerFactory_->create(ctx.slicerProfile->backend);
        Logger::logInfo("[JobOrchestrator] Job " + std::to_string(ctx.id) + " slicing with " +
                        slicer->getSlicerName() + " to " + destination);
        if (slicer->slice(modelPath, *ctx.slicerProfile, destination, *ctx.cancellation) ==
            slicer::SliceOutcome::CANCELLED) {
            Logger::logInfo("[JobOrchestrator] Job " + std::to_string(ctx.id) + " cancelled during slicing");
            return false;
        }
        return true;
    }

    void JobOrchestrator::dispatch(const std::string &deviceId) {
        std::lock_guard<std::mutex> lock(dispatchMutex_);

        while (true) {
            auto head = queue_->readyHead(deviceId);
            if (!head) {
                return;
            }

            auto handle = devices_->tryAcquire(deviceId, *head);
            if (!handle) {
                Logger::logDebug("[JobOrchestrator] Device " + deviceId + " busy or unavailable, job " +
                                 std::to_string(*head) + " keeps waiting");
                return;
            }

            auto granted = std::make_shared<device::DeviceHandle>(std::move(*handle));
            if (!queue_->transition(*head, jobs::JobState::QUEUED, jobs::JobState::PRINTING,
                                    "Printing on " + deviceId)) {
                // Cancelled in between; the handle goes back with this iteration
                continue;
            }

            jobs::JobId id = *head;
            if (!pool_->submit([this, id, granted]() { runPrinting(id, granted); })) {
                queue_->fail(id, "Worker pool is not running");
            }
            return;
        }
    }

    void JobOrchestrator::runPrinting(jobs::JobId id, std::shared_ptr<device::DeviceHandle> handle) {
        const std::string deviceId = handle->deviceId();
        auto ctx = queue_->context(id);

        if (!ctx || !ctx->toolpath) {
            queue_->fail(id, "No toolpath available");
        } else {
            try {
                auto driver = driverFactory_->create(ctx->driverProfile->backend);
                Logger::logInfo("[JobOrchestrator] Job " + std::to_string(id) + " printing with " +
                                driver->getDriverName() + " on " + deviceId);

                auto stream = driver->print(*ctx->toolpath, *ctx->driverProfile, *handle);
                while (true) {
                    if (ctx->cancellation->isCancelled()) {
                        if (stream->abort()) {
                            queue_->transition(id, jobs::JobState::PRINTING, jobs::JobState::CANCELLED,
                                               "Cancelled by client, abort sequence confirmed");
                        } else {
                            queue_->fail(id, "Abort sequence was not confirmed by the device");
                            devices_->markUnavailable(deviceId, "abort sequence not confirmed");
                        }
                        break;
                    }

                    auto progress = stream->next();
                    if (!progress) {
                        queue_->transition(id, jobs::JobState::PRINTING, jobs::JobState::COMPLETED,
                                           "Print finished");
                        break;
                    }
                    queue_->setProgress(id, progress->fraction(), progress->temperature);
                }
            } catch (const types::DeviceDisconnectedException &e) {
                queue_->fail(id, e.what());
                devices_->markUnavailable(deviceId, e.what());
            } catch (const types::ConveyorException &e) {
                queue_->fail(id, e.what());
            } catch (const std::exception &e) {
                Logger::logError("[JobOrchestrator] Unexpected error printing job " + std::to_string(id) + ": " +
                                 e.what());
                queue_->fail(id, std::string("Unexpected error: ") + e.what());
            }
        }

        handle->release();
        dispatch(deviceId);
    }

    std::string JobOrchestrator::toolpathPathFor(jobs::JobId id) const {
        return (fs::path(config_.workDirectory) / ("job-" + std::to_string(id) + ".gcode")).string();
    }

} // namespace core::orchestrator
