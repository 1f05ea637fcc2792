#pragma once

#include "connector/events/job/KafkaEventSink.hpp"
#include "connector/rpc/RpcGateway.hpp"
#include "core/orchestrator/JobOrchestrator.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

/**
 * @brief Periodic status report of the queue, the worker pool, the devices and the gateway
 */
class SystemMonitor {
public:
    SystemMonitor(std::shared_ptr<core::orchestrator::JobOrchestrator> orchestrator,
                  std::shared_ptr<connector::rpc::RpcGateway> gateway,
                  std::shared_ptr<connector::events::job::KafkaEventSink> kafkaSink,
                  std::chrono::seconds reportInterval = std::chrono::seconds(30));

    ~SystemMonitor();

    void start();

    void stop();

    bool isRunning() const;

    void reportStatus() const;

private:
    std::atomic<bool> running_{false};
    std::thread monitorThread_;
    std::mutex stopMutex_;
    std::condition_variable stopCondition_;

    std::shared_ptr<core::orchestrator::JobOrchestrator> orchestrator_;
    std::shared_ptr<connector::rpc::RpcGateway> gateway_;
    std::shared_ptr<connector::events::job::KafkaEventSink> kafkaSink_;
    std::chrono::seconds reportInterval_;

    void monitorLoop();
};
