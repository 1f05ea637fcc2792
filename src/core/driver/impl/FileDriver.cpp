#include "core/driver/impl/FileDriver.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"

#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace core::driver {

    FilePrintStream::FilePrintStream(const std::string &toolpathPath, const profile::DriverProfile &profile,
                                     const std::string &outputPath, const std::string &deviceId)
            : LineStream(toolpathPath, profile),
              outputPath_(outputPath),
              deviceId_(deviceId),
              abortSequence_(profile.abortSequence),
              out_(outputPath, std::ios::out | std::ios::trunc) {
        if (!out_.is_open()) {
            throw types::DeviceDisconnectedException(deviceId, "cannot open " + outputPath);
        }
    }

    void FilePrintStream::emit(const std::string &command) {
        out_ << command << '\n';
        if (!out_) {
            throw types::DeviceDisconnectedException(deviceId_, "write to " + outputPath_ + " failed");
        }
    }

    bool FilePrintStream::abort() {
        if (!out_.is_open()) {
            return false;
        }
        for (const auto &command: abortSequence_) {
            out_ << command << '\n';
        }
        out_.close();
        if (out_.fail()) {
            Logger::logError("[FileDriver] Abort sequence could not be written to " + outputPath_);
            return false;
        }
        Logger::logInfo("[FileDriver] Abort sequence appended to " + outputPath_);
        return true;
    }

    std::unique_ptr<PrintStream> FileDriver::print(const std::string &toolpathPath,
                                                   const profile::DriverProfile &profile,
                                                   device::DeviceHandle &device) {
        std::error_code ec;
        fs::create_directories(profile.outputDirectory, ec);
        if (ec) {
            throw types::DeviceDisconnectedException(device.deviceId(),
                                                     "cannot create " + profile.outputDirectory + ": " +
                                                     ec.message());
        }

        std::string outputPath = outputPathFor(profile, device.deviceId(), device.jobId());
        Logger::logInfo("[FileDriver] Printing job " + std::to_string(device.jobId()) + " to " + outputPath);
        return std::make_unique<FilePrintStream>(toolpathPath, profile, outputPath, device.deviceId());
    }

    std::string FileDriver::outputPathFor(const profile::DriverProfile &profile, const std::string &deviceId,
                                          jobs::JobId jobId) {
        std::string name = deviceId;
        std::replace(name.begin(), name.end(), '/', '_');
        return (fs::path(profile.outputDirectory) / (name + "-" + std::to_string(jobId) + ".gcode")).string();
    }

} // namespace core::driver
