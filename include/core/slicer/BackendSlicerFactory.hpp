#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "core/slicer/SlicerAdapter.hpp"

namespace core::slicer {

    struct MiracleGrueSettings {
        std::string executable = "miracle_grue";
        std::string configPath = "miracle.config";
    };

    struct SkeinforgeSettings {
        std::string python = "python";
        std::string craftScript = "skeinforge/skeinforge_application/skeinforge_utilities/skeinforge_craft.py";
        std::string profileDirectory = "skeinforge/profiles/Replicator";
    };

    struct SlicerBackendsConfig {
        MiracleGrueSettings miracleGrue;
        SkeinforgeSettings skeinforge;
        std::chrono::milliseconds cancelGracePeriod{5000};
    };

    class BackendSlicerFactory : public SlicerFactory {
    public:
        explicit BackendSlicerFactory(SlicerBackendsConfig config);

        std::shared_ptr<SlicerAdapter> create(profile::SlicerBackend backend) override;

    private:
        SlicerBackendsConfig config_;
    };

} // namespace core::slicer
