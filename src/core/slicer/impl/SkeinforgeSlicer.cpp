#include "core/slicer/impl/SkeinforgeSlicer.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"

#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

namespace core::slicer {

    namespace {
        std::string option(const std::string &csv, const std::string &key, const std::string &value) {
            return csv + ":" + key + ":" + value;
        }

        std::string formatNumber(double value) {
            std::ostringstream oss;
            oss << value;
            return oss.str();
        }

        std::string formatBool(bool value) {
            return value ? "True" : "False";
        }
    }

    SkeinforgeSlicer::SkeinforgeSlicer(SkeinforgeSettings settings, std::chrono::milliseconds gracePeriod)
            : ProcessSlicer(gracePeriod), settings_(std::move(settings)) {
    }

    SliceOutcome SkeinforgeSlicer::slice(const std::string &modelPath,
                                         const profile::SlicerProfile &profile,
                                         const std::string &toolpathPath,
                                         jobs::CancellationToken &cancellation) {
        Logger::logInfo("[Skeinforge] Slicing " + modelPath + " with profile " + profile.name);

        if (cancellation.isCancelled()) {
            return SliceOutcome::CANCELLED;
        }

        fs::path toolpath(toolpathPath);
        fs::path staged = toolpath.parent_path() / (toolpath.stem().string() + ".stl");
        fs::path exported = toolpath.parent_path() / (toolpath.stem().string() + "_export.gcode");

        std::error_code ec;
        fs::copy_file(modelPath, staged, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            throw types::SliceFailedException("Cannot stage model for Skeinforge: " + ec.message(), -1, "");
        }

        auto result = runBackend(settings_.python, buildArguments(staged.string(), profile.settings), cancellation);
        fs::remove(staged, ec);

        if (result.terminated || cancellation.isCancelled()) {
            fs::remove(exported, ec);
            Logger::logInfo("[Skeinforge] Slicing cancelled for " + modelPath);
            return SliceOutcome::CANCELLED;
        }

        if (result.exitCode == 0 && fs::exists(exported)) {
            fs::rename(exported, toolpath, ec);
            if (ec) {
                throw types::SliceFailedException("Cannot move Skeinforge export: " + ec.message(), 0,
                                                  result.output);
            }
        }

        checkResult(result, toolpathPath);
        Logger::logInfo("[Skeinforge] Toolpath written to " + toolpathPath);
        return SliceOutcome::COMPLETED;
    }

    std::vector<std::string> SkeinforgeSlicer::buildArguments(const std::string &modelPath,
                                                              const profile::SlicingSettings &settings) const {
        std::vector<std::string> arguments = {settings_.craftScript, "-p", settings_.profileDirectory};

        auto add = [&arguments](const std::string &value) {
            arguments.emplace_back("--option");
            arguments.push_back(value);
        };

        add(option("raft.csv", "Add Raft, Elevate Nozzle, Orbit", formatBool(settings.raft)));
        add(option("raft.csv", "None", formatBool(!settings.support)));
        add(option("raft.csv", "Everywhere", formatBool(settings.support)));
        add(option("fill.csv", "Infill Solidity (ratio)", formatNumber(settings.infill)));
        add(option("carve.csv", "Layer Height (mm)", formatNumber(settings.layerHeight)));
        add(option("fill.csv", "Extra Shells on Alternating Solid Layer (layers)",
                   std::to_string(settings.shells)));
        add(option("fill.csv", "Extra Shells on Base (layers)", std::to_string(settings.shells)));
        add(option("fill.csv", "Extra Shells on Sparse Layer (layers)", std::to_string(settings.shells)));
        add(option("speed.csv", "Feed Rate (mm/s)", formatNumber(settings.printSpeed)));
        add(option("speed.csv", "Travel Feed Rate (mm/s)", formatNumber(settings.travelSpeed)));
        add(option("temperature.csv", "Base Temperature (Celcius)", std::to_string(settings.extruderTemperature)));
        add(option("temperature.csv", "Object First Layer Infill Temperature (Celcius)",
                   std::to_string(settings.extruderTemperature)));
        add(option("temperature.csv", "Object First Layer Perimeter Temperature (Celcius)",
                   std::to_string(settings.extruderTemperature)));
        add(option("temperature.csv", "Object Next Layers Temperature (Celcius)",
                   std::to_string(settings.extruderTemperature)));
        add(option("raft.csv", "Platform Temperature (Celcius)", std::to_string(settings.platformTemperature)));

        arguments.push_back(modelPath);
        return arguments;
    }

} // namespace core::slicer
