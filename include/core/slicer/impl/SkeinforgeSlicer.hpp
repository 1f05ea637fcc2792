#pragma once

#include "core/slicer/BackendSlicerFactory.hpp"
#include "core/slicer/impl/ProcessSlicer.hpp"

namespace core::slicer {

    /**
     * @brief Skeinforge craft run through the Python interpreter.
     *
     * Skeinforge writes <model stem>_export.gcode next to its input, so the model is
     * staged beside the toolpath first and the export is moved into place afterwards.
     */
    class SkeinforgeSlicer : public ProcessSlicer {
    public:
        SkeinforgeSlicer(SkeinforgeSettings settings, std::chrono::milliseconds gracePeriod);

        SliceOutcome slice(const std::string &modelPath,
                           const profile::SlicerProfile &profile,
                           const std::string &toolpathPath,
                           jobs::CancellationToken &cancellation) override;

        std::string getSlicerName() const override { return "Skeinforge"; }

        std::vector<std::string> buildArguments(const std::string &modelPath,
                                                const profile::SlicingSettings &settings) const;

    private:
        SkeinforgeSettings settings_;
    };

} // namespace core::slicer
