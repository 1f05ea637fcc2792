#include "application/controllers/ApplicationController.hpp"
#include "core/driver/BackendDriverFactory.hpp"
#include "core/slicer/BackendSlicerFactory.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"

ApplicationController::ApplicationController(core::config::ConveyorConfig config,
                                             std::shared_ptr<core::slicer::SlicerFactory> slicerFactory,
                                             std::shared_ptr<core::driver::DriverFactory> driverFactory)
        : config_(std::move(config)),
          slicerFactory_(std::move(slicerFactory)),
          driverFactory_(std::move(driverFactory)) {
}

ApplicationController::~ApplicationController() {
    shutdown();
}

bool ApplicationController::initialize() {
    Logger::logInfo("===============================================");
    Logger::logInfo("[ApplicationController] STARTING CONVEYOR DAEMON");
    Logger::logInfo("===============================================");
    Logger::logInfo("[ApplicationController] Build Date: " + std::string(__DATE__) + " " + std::string(__TIME__));

    initializationStarted_ = true;

    Logger::logInfo("[ApplicationController] [1/5] Loading profiles and devices...");
    if (!initializeRegistries()) {
        Logger::logError("[ApplicationController] ✗ Profile registry initialization FAILED");
        return false;
    }
    Logger::logInfo("[ApplicationController] ✓ Profiles and devices loaded");

    Logger::logInfo("[ApplicationController] [2/5] Starting Job Orchestrator...");
    if (!initializeOrchestrator()) {
        Logger::logError("[ApplicationController] ✗ Job Orchestrator initialization FAILED");
        return false;
    }
    Logger::logInfo("[ApplicationController] ✓ Job Orchestrator RUNNING");

    Logger::logInfo("[ApplicationController] [3/5] Initializing Kafka Event Sink...");
    if (!initializeKafkaSink()) {
        Logger::logWarning("[ApplicationController] ⚠ Kafka sink not active - job events stay local");
    } else {
        Logger::logInfo("[ApplicationController] ✓ Kafka Event Sink initialized");
    }

    Logger::logInfo("[ApplicationController] [4/5] Starting RPC Gateway...");
    if (!initializeGateway()) {
        Logger::logError("[ApplicationController] ✗ RPC Gateway initialization FAILED");
        return false;
    }
    Logger::logInfo("[ApplicationController] ✓ RPC Gateway listening");

    Logger::logInfo("[ApplicationController] [5/5] Starting System Monitor...");
    monitor_ = std::make_unique<SystemMonitor>(orchestrator_, gateway_, kafkaSink_);
    monitor_->start();
    Logger::logInfo("[ApplicationController] ✓ System Monitor ACTIVE");

    printInitializationSummary();
    isRunning_ = true;

    Logger::logInfo("===============================================");
    Logger::logInfo("[ApplicationController] SYSTEM READY - WAITING FOR JOBS");
    Logger::logInfo("===============================================");
    return true;
}

bool ApplicationController::initializeRegistries() {
    try {
        profiles_ = std::make_shared<core::profile::ProfileRegistry>(config_.slicerProfiles, config_.driverProfiles);
        devices_ = std::make_shared<core::device::DeviceRegistry>(config_.devices);
    } catch (const core::types::ConveyorException &e) {
        Logger::logError("[ApplicationController] " + std::string(e.what()));
        return false;
    }

    Logger::logInfo("[ApplicationController] " + std::to_string(config_.slicerProfiles.size()) +
                    " slicer profiles, " + std::to_string(config_.driverProfiles.size()) + " driver profiles, " +
                    std::to_string(config_.devices.size()) + " configured devices");
    return true;
}

bool ApplicationController::initializeOrchestrator() {
    if (!slicerFactory_) {
        slicerFactory_ = std::make_shared<core::slicer::BackendSlicerFactory>(config_.slicers);
    }
    if (!driverFactory_) {
        driverFactory_ = std::make_shared<core::driver::BackendDriverFactory>();
    }

    eventBus_ = std::make_shared<core::events::EventBus>();
    eventBus_->start();

    core::orchestrator::OrchestratorConfig orchestratorConfig;
    orchestratorConfig.workerThreads = config_.server.eventThreads;
    orchestratorConfig.workDirectory = config_.workDirectory;
    orchestratorConfig.maxCompletedJobs = config_.server.maxCompletedJobs;

    try {
        orchestrator_ = std::make_shared<core::orchestrator::JobOrchestrator>(
                orchestratorConfig, profiles_, slicerFactory_, driverFactory_, devices_, eventBus_);
    } catch (const std::exception &e) {
        Logger::logError("[ApplicationController] Cannot create orchestrator: " + std::string(e.what()));
        return false;
    }
    return orchestrator_->start();
}

bool ApplicationController::initializeKafkaSink() {
    if (!config_.kafka.enabled) {
        Logger::logInfo("[ApplicationController] Kafka disabled by configuration");
        return false;
    }

    config_.kafka.resolveFromEnvironment();
    config_.kafka.printConfig();

    kafkaSender_ = std::make_shared<connector::events::job::JobEventSender>(config_.kafka);
    if (!kafkaSender_->isReady()) {
        kafkaSender_.reset();
        return false;
    }

    kafkaSink_ = std::make_shared<connector::events::job::KafkaEventSink>(kafkaSender_);
    eventBus_->subscribe(kafkaSink_);
    return true;
}

bool ApplicationController::initializeGateway() {
    dispatcher_ = std::make_shared<connector::RpcDispatcher>();
    jobController_ = std::make_unique<connector::controllers::JobController>(orchestrator_);
    jobController_->registerMethods(*dispatcher_);

    try {
        gateway_ = std::make_shared<connector::rpc::RpcGateway>(config_.address, dispatcher_, eventBus_,
                                                                config_.server.rpcThreads);
        gateway_->start();
    } catch (const core::types::ConveyorException &e) {
        Logger::logError("[ApplicationController] " + std::string(e.what()));
        gateway_.reset();
        return false;
    }
    return true;
}

void ApplicationController::shutdown() {
    if (!initializationStarted_.exchange(false)) {
        return;
    }

    Logger::logInfo("===============================================");
    Logger::logInfo("[ApplicationController] SHUTTING DOWN CONVEYOR");
    Logger::logInfo("===============================================");

    isRunning_ = false;

    if (monitor_) {
        monitor_->stop();
        monitor_.reset();
        Logger::logInfo("[ApplicationController] ✓ System Monitor stopped");
    }

    if (gateway_) {
        gateway_->stop();
        Logger::logInfo("[ApplicationController] ✓ RPC Gateway stopped");
    }

    if (orchestrator_) {
        orchestrator_->stop();
        Logger::logInfo("[ApplicationController] ✓ Job Orchestrator stopped");
    }

    if (eventBus_) {
        eventBus_->stop();
        Logger::logInfo("[ApplicationController] ✓ Event Bus drained");
    }

    if (kafkaSink_) {
        eventBus_->unsubscribe(kafkaSink_);
        kafkaSink_.reset();
        kafkaSender_.reset();
        Logger::logInfo("[ApplicationController] ✓ Kafka producer flushed");
    }

    Logger::logInfo("[ApplicationController] Shutdown complete");
}

void ApplicationController::printInitializationSummary() const {
    Logger::logInfo("[ApplicationController] ========== INITIALIZATION SUMMARY ==========");
    Logger::logInfo("  Address: " + config_.address.toString());
    Logger::logInfo("  Work Directory: " + config_.workDirectory);
    Logger::logInfo("  Worker Threads: " + std::to_string(config_.server.eventThreads));
    Logger::logInfo("  RPC Threads: " + std::to_string(config_.server.rpcThreads));

    std::string slicers;
    for (const auto &profile: profiles_->slicerProfiles()) {
        slicers += (slicers.empty() ? "" : ", ") + profile->name + " (" +
                   core::profile::slicerBackendToString(profile->backend) + ")";
    }
    std::string drivers;
    for (const auto &profile: profiles_->driverProfiles()) {
        drivers += (drivers.empty() ? "" : ", ") + profile->name + " (" +
                   core::profile::driverBackendToString(profile->backend) + ")";
    }
    Logger::logInfo("  Slicer Profiles: " + slicers);
    Logger::logInfo("  Driver Profiles: " + drivers);
    Logger::logInfo("  Kafka Sink: " + std::string(kafkaSink_ ? "ACTIVE on " + kafkaSender_->getTopicName()
                                                              : "DISABLED"));
    Logger::logInfo("[ApplicationController] ============================================");
}
