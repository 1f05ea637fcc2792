#pragma once

#include <atomic>
#include <memory>

#include "application/config/ConveyorConfig.hpp"
#include "application/monitor/SystemMonitor.hpp"
#include "connector/controllers/JobController.hpp"
#include "connector/events/job/JobEventSender.hpp"
#include "connector/events/job/KafkaEventSink.hpp"
#include "connector/registry/RpcDispatcher.hpp"
#include "connector/rpc/RpcGateway.hpp"
#include "core/device/DeviceRegistry.hpp"
#include "core/driver/DriverAdapter.hpp"
#include "core/events/EventSystem.hpp"
#include "core/orchestrator/JobOrchestrator.hpp"
#include "core/profile/ProfileRegistry.hpp"
#include "core/slicer/SlicerAdapter.hpp"

/**
 * @class ApplicationController
 * @brief Wires the conveyor daemon together and owns every long-lived component
 *
 * Initialization sequence:
 * 1. Profile and device registries
 * 2. Event bus and job orchestrator (worker pool)
 * 3. Kafka event sink (optional - the daemon works without Kafka)
 * 4. JSON-RPC gateway
 * 5. System monitor
 *
 * Shutdown runs in reverse order.
 */
class ApplicationController {
public:
    explicit ApplicationController(core::config::ConveyorConfig config,
                                   std::shared_ptr<core::slicer::SlicerFactory> slicerFactory = nullptr,
                                   std::shared_ptr<core::driver::DriverFactory> driverFactory = nullptr);

    ~ApplicationController();

    ApplicationController(const ApplicationController &) = delete;

    ApplicationController &operator=(const ApplicationController &) = delete;

    /**
     * @return true if every mandatory component started
     */
    bool initialize();

    void shutdown();

    bool isRunning() const { return isRunning_; }

    std::shared_ptr<core::orchestrator::JobOrchestrator> orchestrator() const { return orchestrator_; }

    std::shared_ptr<connector::rpc::RpcGateway> gateway() const { return gateway_; }

private:
    core::config::ConveyorConfig config_;

    // ========== Core ==========
    std::shared_ptr<core::profile::ProfileRegistry> profiles_;
    std::shared_ptr<core::device::DeviceRegistry> devices_;
    std::shared_ptr<core::slicer::SlicerFactory> slicerFactory_;
    std::shared_ptr<core::driver::DriverFactory> driverFactory_;
    std::shared_ptr<core::events::EventBus> eventBus_;
    std::shared_ptr<core::orchestrator::JobOrchestrator> orchestrator_;

    // ========== Connector ==========
    std::shared_ptr<connector::RpcDispatcher> dispatcher_;
    std::unique_ptr<connector::controllers::JobController> jobController_;
    std::shared_ptr<connector::rpc::RpcGateway> gateway_;
    std::shared_ptr<connector::events::job::JobEventSender> kafkaSender_;
    std::shared_ptr<connector::events::job::KafkaEventSink> kafkaSink_;

    // ========== Monitoring ==========
    std::unique_ptr<SystemMonitor> monitor_;

    std::atomic<bool> isRunning_{false};
    std::atomic<bool> initializationStarted_{false};

    bool initializeRegistries();

    bool initializeOrchestrator();

    bool initializeKafkaSink();

    bool initializeGateway();

    void printInitializationSummary() const;
};
