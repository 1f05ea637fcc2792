#pragma once

#include <memory>
#include <string>

#include "core/jobs/CancellationToken.hpp"
#include "core/profile/Profile.hpp"

namespace core::slicer {

    enum class SliceOutcome {
        COMPLETED,
        CANCELLED
    };

    /**
     * @brief Contract for one external slicing backend.
     */
    class SlicerAdapter {
    public:
        virtual ~SlicerAdapter() = default;

        /**
         * @brief Convert a model into a toolpath, blocking for the duration of the backend run.
         *
         * Cancellation terminates the backend and yields CANCELLED, never an error.
         * @param modelPath Local path of the model (.stl)
         * @param profile Slicer profile resolved for the job
         * @param toolpathPath Where the G-code has to be written
         * @param cancellation Job cancellation token
         * @throws core::types::SliceFailedException on non-zero exit or missing output
         */
        virtual SliceOutcome slice(const std::string &modelPath,
                                   const profile::SlicerProfile &profile,
                                   const std::string &toolpathPath,
                                   jobs::CancellationToken &cancellation) = 0;

        virtual std::string getSlicerName() const = 0;
    };

    /**
     * @brief Maps a profile's backend tag to an adapter instance
     */
    class SlicerFactory {
    public:
        virtual ~SlicerFactory() = default;

        virtual std::shared_ptr<SlicerAdapter> create(profile::SlicerBackend backend) = 0;
    };

} // namespace core::slicer
