#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace core::types {

class ConveyorException : public std::runtime_error {
public:
    explicit ConveyorException(const std::string& msg)
        : std::runtime_error(msg) {}
};

/**
 * @brief Requested slicer or driver profile name is not registered
 */
class ProfileNotFoundException : public ConveyorException {
public:
    ProfileNotFoundException(const std::string& kind, const std::string& name)
        : ConveyorException(kind + " profile not found: " + name), kind_(kind), name_(name) {}

    const std::string& kind() const { return kind_; }
    const std::string& name() const { return name_; }

private:
    std::string kind_;
    std::string name_;
};

class UnsupportedModelTypeException : public ConveyorException {
public:
    explicit UnsupportedModelTypeException(const std::string& modelRef)
        : ConveyorException("Unsupported model type: " + modelRef), modelRef_(modelRef) {}

    const std::string& modelRef() const { return modelRef_; }

private:
    std::string modelRef_;
};

/**
 * @brief External slicer exited with an error or produced no toolpath
 */
class SliceFailedException : public ConveyorException {
public:
    SliceFailedException(const std::string& msg, int exitCode, std::string diagnostics)
        : ConveyorException(msg), exitCode_(exitCode), diagnostics_(std::move(diagnostics)) {}

    int exitCode() const { return exitCode_; }
    const std::string& diagnostics() const { return diagnostics_; }

private:
    int exitCode_;
    std::string diagnostics_;
};

class ModelFetchException : public ConveyorException {
public:
    explicit ModelFetchException(const std::string& msg)
        : ConveyorException(msg) {}
};

/**
 * @brief The device went away mid-print; fatal for the job, never retried
 */
class DeviceDisconnectedException : public ConveyorException {
public:
    DeviceDisconnectedException(const std::string& deviceId, const std::string& reason)
        : ConveyorException("Device " + deviceId + " disconnected: " + reason), deviceId_(deviceId) {}

    const std::string& deviceId() const { return deviceId_; }

private:
    std::string deviceId_;
};

class IllegalTransitionException : public ConveyorException {
public:
    IllegalTransitionException(const std::string& jobId, const std::string& from, const std::string& to)
        : ConveyorException("Illegal transition for job " + jobId + ": " + from + " -> " + to) {}
};

class JobNotFoundException : public ConveyorException {
public:
    explicit JobNotFoundException(const std::string& jobId)
        : ConveyorException("Job not found: " + jobId) {}
};

class InvalidAddressException : public ConveyorException {
public:
    explicit InvalidAddressException(const std::string& msg)
        : ConveyorException(msg) {}
};

class ConfigurationException : public ConveyorException {
public:
    explicit ConfigurationException(const std::string& msg)
        : ConveyorException(msg) {}
};

}
