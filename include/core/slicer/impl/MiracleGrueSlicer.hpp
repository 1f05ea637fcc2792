#pragma once

#include "core/slicer/BackendSlicerFactory.hpp"
#include "core/slicer/impl/ProcessSlicer.hpp"

namespace core::slicer {

    /**
     * @brief Miracle Grue: <exe> -c <config> -o <toolpath> -s <start> -e <end> <model>
     */
    class MiracleGrueSlicer : public ProcessSlicer {
    public:
        MiracleGrueSlicer(MiracleGrueSettings settings, std::chrono::milliseconds gracePeriod);

        SliceOutcome slice(const std::string &modelPath,
                           const profile::SlicerProfile &profile,
                           const std::string &toolpathPath,
                           jobs::CancellationToken &cancellation) override;

        std::string getSlicerName() const override { return "MiracleGrue"; }

        std::vector<std::string> buildArguments(const std::string &modelPath, const std::string &toolpathPath,
                                                const std::string &startPath, const std::string &endPath) const;

    private:
        MiracleGrueSettings settings_;
    };

} // namespace core::slicer
