#include "core/slicer/impl/MiracleGrueSlicer.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace core::slicer {

    namespace {
        /**
         * @brief Start/end G-code file removed when it goes out of scope
         */
        class SequenceFile {
        public:
            SequenceFile(fs::path path, const std::vector<std::string> &lines, bool write)
                    : path_(std::move(path)) {
                std::ofstream out(path_, std::ios::out | std::ios::trunc);
                if (!out.is_open()) {
                    throw types::SliceFailedException("Cannot create " + path_.string(), -1, "");
                }
                if (write) {
                    for (const auto &line: lines) {
                        out << line << '\n';
                    }
                }
            }

            ~SequenceFile() {
                std::error_code ec;
                fs::remove(path_, ec);
            }

            SequenceFile(const SequenceFile &) = delete;

            SequenceFile &operator=(const SequenceFile &) = delete;

            std::string path() const { return path_.string(); }

        private:
            fs::path path_;
        };
    }

    MiracleGrueSlicer::MiracleGrueSlicer(MiracleGrueSettings settings, std::chrono::milliseconds gracePeriod)
            : ProcessSlicer(gracePeriod), settings_(std::move(settings)) {
    }

    SliceOutcome MiracleGrueSlicer::slice(const std::string &modelPath,
                                          const profile::SlicerProfile &profile,
                                          const std::string &toolpathPath,
                                          jobs::CancellationToken &cancellation) {
        Logger::logInfo("[MiracleGrue] Slicing " + modelPath + " with profile " + profile.name);

        if (cancellation.isCancelled()) {
            return SliceOutcome::CANCELLED;
        }

        fs::path toolpath(toolpathPath);
        fs::path base = toolpath.parent_path() / toolpath.stem();
        SequenceFile start(base.string() + ".start.gcode", profile.startSequence, profile.withStartEnd);
        SequenceFile end(base.string() + ".end.gcode", profile.endSequence, profile.withStartEnd);

        auto result = runBackend(settings_.executable,
                                 buildArguments(modelPath, toolpathPath, start.path(), end.path()),
                                 cancellation);

        if (result.terminated || cancellation.isCancelled()) {
            Logger::logInfo("[MiracleGrue] Slicing cancelled for " + modelPath);
            return SliceOutcome::CANCELLED;
        }

        checkResult(result, toolpathPath);
        Logger::logInfo("[MiracleGrue] Toolpath written to " + toolpathPath);
        return SliceOutcome::COMPLETED;
    }

    std::vector<std::string> MiracleGrueSlicer::buildArguments(const std::string &modelPath,
                                                               const std::string &toolpathPath,
                                                               const std::string &startPath,
                                                               const std::string &endPath) const {
        return {
                "-c", settings_.configPath,
                "-o", toolpathPath,
                "-s", startPath,
                "-e", endPath,
                modelPath
        };
    }

} // namespace core::slicer
