#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace core::profile {

    enum class ProfileKind {
        SLICER,
        DRIVER
    };

    enum class SlicerBackend {
        MIRACLE_GRUE,
        SKEINFORGE
    };

    enum class DriverBackend {
        MAKERBOT,
        PRINT_TO_FILE
    };

    /**
     * @brief Settings handed to the slicing backend
     */
    struct SlicingSettings {
        bool raft = false;
        bool support = false;
        double infill = 0.1;
        double layerHeight = 0.27;
        int shells = 2;
        int extruderTemperature = 230;
        int platformTemperature = 110;
        double printSpeed = 80.0;
        double travelSpeed = 100.0;
    };

    struct SlicerProfile {
        std::string name;
        SlicerBackend backend = SlicerBackend::MIRACLE_GRUE;
        SlicingSettings settings;
        bool withStartEnd = false;
        std::vector<std::string> startSequence;
        std::vector<std::string> endSequence;
    };

    struct DriverProfile {
        std::string name;
        DriverBackend backend = DriverBackend::MAKERBOT;
        uint32_t baudrate = 115200;
        int ackTimeoutMs = 30000;
        int temperaturePollMs = 5000; // M105 interval while printing, 0 disables
        bool withStartEnd = true;
        std::vector<std::string> startSequence;
        std::vector<std::string> endSequence;
        std::vector<std::string> abortSequence = {"M104 S0", "M140 S0", "M107", "G91", "G1 Z10 F600", "G90", "M84"};
        std::string outputDirectory = "output";
    };

    inline std::string profileKindToString(ProfileKind kind) {
        switch (kind) {
            case ProfileKind::SLICER: return "Slicer";
            case ProfileKind::DRIVER: return "Driver";
            default: return "Unknown";
        }
    }

    inline std::string slicerBackendToString(SlicerBackend backend) {
        switch (backend) {
            case SlicerBackend::MIRACLE_GRUE: return "MiracleGrue";
            case SlicerBackend::SKEINFORGE: return "Skeinforge";
            default: return "Unknown";
        }
    }

    inline std::string driverBackendToString(DriverBackend backend) {
        switch (backend) {
            case DriverBackend::MAKERBOT: return "MakerBot";
            case DriverBackend::PRINT_TO_FILE: return "File";
            default: return "Unknown";
        }
    }

    inline std::optional<SlicerBackend> slicerBackendFromString(const std::string &name) {
        if (name == "MiracleGrue") return SlicerBackend::MIRACLE_GRUE;
        if (name == "Skeinforge") return SlicerBackend::SKEINFORGE;
        return std::nullopt;
    }

    inline std::optional<DriverBackend> driverBackendFromString(const std::string &name) {
        if (name == "MakerBot") return DriverBackend::MAKERBOT;
        if (name == "File") return DriverBackend::PRINT_TO_FILE;
        return std::nullopt;
    }

} // namespace core::profile
