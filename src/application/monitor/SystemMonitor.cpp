#include "application/monitor/SystemMonitor.hpp"
#include "logger/Logger.hpp"
#include <utility>

SystemMonitor::SystemMonitor(std::shared_ptr<core::orchestrator::JobOrchestrator> orchestrator,
                             std::shared_ptr<connector::rpc::RpcGateway> gateway,
                             std::shared_ptr<connector::events::job::KafkaEventSink> kafkaSink,
                             std::chrono::seconds reportInterval)
        : orchestrator_(std::move(orchestrator)),
          gateway_(std::move(gateway)),
          kafkaSink_(std::move(kafkaSink)),
          reportInterval_(reportInterval) {
}

SystemMonitor::~SystemMonitor() {
    stop();
}

void SystemMonitor::start() {
    if (running_) {
        Logger::logWarning("[SystemMonitor] Already running");
        return;
    }

    running_ = true;
    monitorThread_ = std::thread([this]() {
        try {
            monitorLoop();
        } catch (const std::exception &e) {
            Logger::logError("[SystemMonitor] Monitor thread crashed: " + std::string(e.what()));
        }
    });

    Logger::logInfo("[SystemMonitor] Started");
}

void SystemMonitor::stop() {
    {
        std::lock_guard<std::mutex> lock(stopMutex_);
        if (!running_) return;
        running_ = false;
    }
    stopCondition_.notify_all();

    if (monitorThread_.joinable()) {
        monitorThread_.join();
    }

    Logger::logInfo("[SystemMonitor] Stopped");
}

bool SystemMonitor::isRunning() const {
    return running_;
}

void SystemMonitor::monitorLoop() {
    Logger::logInfo("[SystemMonitor] Monitor loop started");

    std::unique_lock<std::mutex> lock(stopMutex_);
    while (running_) {
        if (stopCondition_.wait_for(lock, reportInterval_, [this] { return !running_.load(); })) {
            break;
        }
        lock.unlock();
        try {
            reportStatus();
        } catch (const std::exception &e) {
            Logger::logError("[SystemMonitor] Loop error: " + std::string(e.what()));
        }
        lock.lock();
    }
}

void SystemMonitor::reportStatus() const {
    Logger::logInfo("[SystemMonitor] ===== System Status Report =====");

    if (orchestrator_) {
        auto stats = orchestrator_->getStatistics();
        Logger::logInfo("[SystemMonitor] Job Orchestrator:");
        Logger::logInfo("  Running: " + std::string(orchestrator_->isRunning() ? "TRUE" : "FALSE"));
        Logger::logInfo("  Total Jobs: " + std::to_string(stats.totalJobs));
        Logger::logInfo("  Active Jobs: " + std::to_string(stats.activeJobs));
        Logger::logInfo("  Completed: " + std::to_string(stats.completedJobs));
        Logger::logInfo("  Failed: " + std::to_string(stats.failedJobs));
        Logger::logInfo("  Cancelled: " + std::to_string(stats.cancelledJobs));
        Logger::logInfo("  Worker Tasks: " + std::to_string(orchestrator_->activeTasks()) + " active, " +
                        std::to_string(orchestrator_->pendingTasks()) + " pending");

        for (const auto &device: orchestrator_->devices()) {
            std::string state = !device.available ? "UNAVAILABLE (" + device.lastError + ")"
                                                  : device.activeJob ? "PRINTING job " +
                                                                       std::to_string(*device.activeJob)
                                                                     : "IDLE";
            Logger::logInfo("  Device " + device.config.id + ": " + state + ", " +
                            std::to_string(orchestrator_->waitList(device.config.id).size()) + " waiting");
            if (!device.available && !orchestrator_->waitList(device.config.id).empty()) {
                Logger::logWarning("[SystemMonitor] WARNING: Jobs waiting on unavailable device " +
                                   device.config.id);
            }
        }
    } else {
        Logger::logError("[SystemMonitor] Job Orchestrator: NOT AVAILABLE");
    }

    if (gateway_) {
        Logger::logInfo("[SystemMonitor] RPC Gateway:");
        Logger::logInfo("  Running: " + std::string(gateway_->isRunning() ? "true" : "false"));
        Logger::logInfo("  Address: " + gateway_->address().toString());
        Logger::logInfo("  Connections: " + std::to_string(gateway_->connectionCount()));
    }

    if (kafkaSink_) {
        auto stats = kafkaSink_->getStatistics();
        Logger::logInfo("[SystemMonitor] Kafka Event Sink:");
        Logger::logInfo("  Events TX: " + std::to_string(stats.eventsSent));
        Logger::logInfo("  Failures: " + std::to_string(stats.sendFailures));
    } else {
        Logger::logInfo("[SystemMonitor] Kafka Event Sink: DISABLED");
    }

    Logger::logInfo("[SystemMonitor] =======================================");
}
