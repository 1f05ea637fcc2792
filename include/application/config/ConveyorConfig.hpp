#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "connector/address/Address.hpp"
#include "connector/kafka/KafkaConfig.hpp"
#include "core/device/DeviceRegistry.hpp"
#include "core/profile/Profile.hpp"
#include "core/slicer/BackendSlicerFactory.hpp"
#include "logger/Logger.hpp"

namespace core::config {

    struct ServerConfig {
        int eventThreads = 4;
        int rpcThreads = 2;
        bool chdir = false;
        size_t maxCompletedJobs = 100;
        std::chrono::milliseconds cancelGracePeriod{5000};
        LoggingSettings logging;
    };

    struct ClientConfig {
        int eventThreads = 1;
        std::string slicer = "MiracleGrue";
        std::string driver = "MakerBotDriver";
        std::string device = "/dev/ttyACM0";
        profile::SlicingSettings slicing;
        LoggingSettings logging;
    };

    /**
     * @brief Typed daemon and client configuration, built once by ConfigManager
     */
    struct ConveyorConfig {
        connector::address::Address address = connector::address::Address::pipe("/tmp/conveyord.socket");
        std::string pidFile = "/tmp/conveyord.pid";
        std::string workDirectory = "/tmp/conveyor";

        slicer::SlicerBackendsConfig slicers;
        ServerConfig server;
        ClientConfig client;

        std::vector<profile::SlicerProfile> slicerProfiles;
        std::vector<profile::DriverProfile> driverProfiles;
        std::vector<device::DeviceConfig> devices;

        connector::kafka::KafkaConfig kafka;
    };

} // namespace core::config
