#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "core/process/ChildProcess.hpp"
#include "core/slicer/SlicerAdapter.hpp"

namespace core::slicer {

    /**
     * @brief Shared plumbing for slicers that run as a child process
     */
    class ProcessSlicer : public SlicerAdapter {
    public:
        explicit ProcessSlicer(std::chrono::milliseconds gracePeriod);

    protected:
        /**
         * @brief Run the backend, wiring the cancellation token to process termination
         * @throws core::types::SliceFailedException if the backend cannot be launched
         */
        process::ProcessResult runBackend(const std::string &executable,
                                          const std::vector<std::string> &arguments,
                                          jobs::CancellationToken &cancellation) const;

        /**
         * @throws core::types::SliceFailedException on non-zero exit or a missing/empty toolpath
         */
        void checkResult(const process::ProcessResult &result, const std::string &toolpathPath) const;

    private:
        std::chrono::milliseconds gracePeriod_;
    };

} // namespace core::slicer
