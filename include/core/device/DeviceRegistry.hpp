#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/jobs/Job.hpp"

namespace core::device {

    struct DeviceConfig {
        std::string id;
        std::string port;
        uint32_t baudrate = 0; // 0: use the driver profile's rate
    };

    struct DeviceStatus {
        DeviceConfig config;
        bool available = true;
        std::optional<jobs::JobId> activeJob;
        std::string lastError;
    };

    class DeviceRegistry;

    /**
     * @brief Exclusive access to one device for one job. Releases the device on destruction.
     */
    class DeviceHandle {
    public:
        DeviceHandle(DeviceRegistry *registry, DeviceConfig config, jobs::JobId jobId);

        ~DeviceHandle();

        DeviceHandle(const DeviceHandle &) = delete;

        DeviceHandle &operator=(const DeviceHandle &) = delete;

        DeviceHandle(DeviceHandle &&other) noexcept;

        DeviceHandle &operator=(DeviceHandle &&other) noexcept;

        const std::string &deviceId() const { return config_.id; }

        const std::string &port() const { return config_.port; }

        uint32_t baudrate() const { return config_.baudrate; }

        jobs::JobId jobId() const { return jobId_; }

        bool isValid() const { return registry_ != nullptr; }

        void release();

    private:
        DeviceRegistry *registry_;
        DeviceConfig config_;
        jobs::JobId jobId_;
    };

    /**
     * @brief Known devices, which job holds each one and whether it may be used.
     *
     * Acquisition never blocks: a busy or unavailable device simply yields no handle.
     * The registry must outlive every handle it gives out.
     */
    class DeviceRegistry {
    public:
        explicit DeviceRegistry(const std::vector<DeviceConfig> &devices = {});

        DeviceRegistry(const DeviceRegistry &) = delete;

        DeviceRegistry &operator=(const DeviceRegistry &) = delete;

        /**
         * @brief Add a device unless it is already known; the ID doubles as the port when none is given
         */
        void registerDevice(const DeviceConfig &config);

        std::optional<DeviceHandle> tryAcquire(const std::string &deviceId, jobs::JobId jobId);

        void markUnavailable(const std::string &deviceId, const std::string &reason);

        /**
         * @return false if the device is unknown
         */
        bool markAvailable(const std::string &deviceId);

        bool contains(const std::string &deviceId) const;

        bool isBusy(const std::string &deviceId) const;

        bool isAvailable(const std::string &deviceId) const;

        std::optional<DeviceStatus> status(const std::string &deviceId) const;

        std::vector<DeviceStatus> list() const;

    private:
        friend class DeviceHandle;

        mutable std::mutex devicesMutex_;
        std::map<std::string, DeviceStatus> devices_;

        void release(const std::string &deviceId, jobs::JobId jobId);

        void registerLocked(const DeviceConfig &config);
    };

} // namespace core::device
