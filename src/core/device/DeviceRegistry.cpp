#include "core/device/DeviceRegistry.hpp"
#include "logger/Logger.hpp"

namespace core::device {

    DeviceHandle::DeviceHandle(DeviceRegistry *registry, DeviceConfig config, jobs::JobId jobId)
            : registry_(registry), config_(std::move(config)), jobId_(jobId) {
    }

    DeviceHandle::~DeviceHandle() {
        release();
    }

    DeviceHandle::DeviceHandle(DeviceHandle &&other) noexcept
            : registry_(other.registry_), config_(std::move(other.config_)), jobId_(other.jobId_) {
        other.registry_ = nullptr;
    }

    DeviceHandle &DeviceHandle::operator=(DeviceHandle &&other) noexcept {
        if (this != &other) {
            release();
            registry_ = other.registry_;
            config_ = std::move(other.config_);
            jobId_ = other.jobId_;
            other.registry_ = nullptr;
        }
        return *this;
    }

    void DeviceHandle::release() {
        if (registry_) {
            registry_->release(config_.id, jobId_);
            registry_ = nullptr;
        }
    }

    DeviceRegistry::DeviceRegistry(const std::vector<DeviceConfig> &devices) {
        for (const auto &device: devices) {
            registerLocked(device);
        }
    }

    void DeviceRegistry::registerDevice(const DeviceConfig &config) {
        std::lock_guard<std::mutex> lock(devicesMutex_);
        registerLocked(config);
    }

    void DeviceRegistry::registerLocked(const DeviceConfig &config) {
        if (devices_.count(config.id)) {
            return;
        }
        DeviceStatus status;
        status.config = config;
        if (status.config.port.empty()) {
            status.config.port = config.id;
        }
        devices_.emplace(config.id, status);
        Logger::logInfo("[DeviceRegistry] Registered device " + config.id + " on " + status.config.port);
    }

    std::optional<DeviceHandle> DeviceRegistry::tryAcquire(const std::string &deviceId, jobs::JobId jobId) {
        std::lock_guard<std::mutex> lock(devicesMutex_);

        auto it = devices_.find(deviceId);
        if (it == devices_.end()) {
            registerLocked({deviceId, deviceId, 0});
            it = devices_.find(deviceId);
        }

        auto &device = it->second;
        if (!device.available || device.activeJob) {
            return std::nullopt;
        }

        device.activeJob = jobId;
        Logger::logInfo("[DeviceRegistry] Device " + deviceId + " acquired by job " + std::to_string(jobId));
        return std::optional<DeviceHandle>(std::in_place, this, device.config, jobId);
    }

    void DeviceRegistry::release(const std::string &deviceId, jobs::JobId jobId) {
        std::lock_guard<std::mutex> lock(devicesMutex_);
        auto it = devices_.find(deviceId);
        if (it == devices_.end() || it->second.activeJob != jobId) {
            Logger::logWarning("[DeviceRegistry] Release of " + deviceId + " by job " + std::to_string(jobId) +
                               " which does not hold it");
            return;
        }
        it->second.activeJob.reset();
        Logger::logInfo("[DeviceRegistry] Device " + deviceId + " released by job " + std::to_string(jobId));
    }

    void DeviceRegistry::markUnavailable(const std::string &deviceId, const std::string &reason) {
        std::lock_guard<std::mutex> lock(devicesMutex_);
        auto it = devices_.find(deviceId);
        if (it == devices_.end()) {
            registerLocked({deviceId, deviceId, 0});
            it = devices_.find(deviceId);
        }
        it->second.available = false;
        it->second.lastError = reason;
        Logger::logWarning("[DeviceRegistry] Device " + deviceId + " unavailable: " + reason);
    }

    bool DeviceRegistry::markAvailable(const std::string &deviceId) {
        std::lock_guard<std::mutex> lock(devicesMutex_);
        auto it = devices_.find(deviceId);
        if (it == devices_.end()) {
            return false;
        }
        it->second.available = true;
        it->second.lastError.clear();
        Logger::logInfo("[DeviceRegistry] Device " + deviceId + " available");
        return true;
    }

    bool DeviceRegistry::contains(const std::string &deviceId) const {
        std::lock_guard<std::mutex> lock(devicesMutex_);
        return devices_.count(deviceId) > 0;
    }

    bool DeviceRegistry::isBusy(const std::string &deviceId) const {
        std::lock_guard<std::mutex> lock(devicesMutex_);
        auto it = devices_.find(deviceId);
        return it != devices_.end() && it->second.activeJob.has_value();
    }

    bool DeviceRegistry::isAvailable(const std::string &deviceId) const {
        std::lock_guard<std::mutex> lock(devicesMutex_);
        auto it = devices_.find(deviceId);
        return it == devices_.end() || it->second.available;
    }

    std::optional<DeviceStatus> DeviceRegistry::status(const std::string &deviceId) const {
        std::lock_guard<std::mutex> lock(devicesMutex_);
        auto it = devices_.find(deviceId);
        if (it == devices_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<DeviceStatus> DeviceRegistry::list() const {
        std::lock_guard<std::mutex> lock(devicesMutex_);
        std::vector<DeviceStatus> result;
        result.reserve(devices_.size());
        for (const auto &[id, status]: devices_) {
            result.push_back(status);
        }
        return result;
    }

} // namespace core::device
