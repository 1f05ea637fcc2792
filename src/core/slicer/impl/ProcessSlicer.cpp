#include "core/slicer/impl/ProcessSlicer.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"

#include <filesystem>

namespace core::slicer {

    ProcessSlicer::ProcessSlicer(std::chrono::milliseconds gracePeriod)
            : gracePeriod_(gracePeriod) {
    }

    process::ProcessResult ProcessSlicer::runBackend(const std::string &executable,
                                                     const std::vector<std::string> &arguments,
                                                     jobs::CancellationToken &cancellation) const {
        process::ChildProcess child(executable, arguments, gracePeriod_);
        Logger::logDebug("[" + getSlicerName() + "] arguments: " + child.commandLine());

        try {
            child.start();
        } catch (const types::ConveyorException &e) {
            Logger::logError("[" + getSlicerName() + "] " + e.what());
            throw types::SliceFailedException(getSlicerName() + " could not be started", -1, e.what());
        }

        auto registration = cancellation.subscribe([&child]() { child.terminate(); });

        const std::string prefix = "[" + getSlicerName() + "] ";
        auto result = child.wait([&prefix](const std::string &line) {
            Logger::logDebug(prefix + line);
        });

        Logger::logDebug(prefix + "terminated with status code " + std::to_string(result.exitCode));
        return result;
    }

    void ProcessSlicer::checkResult(const process::ProcessResult &result, const std::string &toolpathPath) const {
        if (result.exitCode != 0) {
            Logger::logError("[" + getSlicerName() + "] Failed with status code " + std::to_string(result.exitCode));
            throw types::SliceFailedException(
                    getSlicerName() + " exited with status code " + std::to_string(result.exitCode),
                    result.exitCode, result.output);
        }

        std::error_code ec;
        if (!std::filesystem::exists(toolpathPath, ec) || std::filesystem::file_size(toolpathPath, ec) == 0) {
            Logger::logError("[" + getSlicerName() + "] No toolpath written to " + toolpathPath);
            throw types::SliceFailedException(getSlicerName() + " produced no toolpath", result.exitCode,
                                              result.output);
        }
    }

} // namespace core::slicer
