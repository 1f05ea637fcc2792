#pragma once

#include <fstream>
#include <string>
#include <vector>

#include "core/driver/DriverAdapter.hpp"

namespace core::driver {

    /**
     * @brief Walks start sequence, toolpath and end sequence one command at a time.
     *
     * Comments and blank lines are skipped but still count towards line and byte progress.
     * Subclasses decide where each command goes.
     */
    class LineStream : public PrintStream {
    public:
        LineStream(const std::string &toolpathPath, const profile::DriverProfile &profile);

        std::optional<PrintProgress> next() override;

        const PrintProgress &progress() const { return progress_; }

    protected:
        virtual void emit(const std::string &command) = 0;

        /**
         * @brief Latest temperature the device reported, copied into each progress step
         */
        virtual std::optional<device::TemperatureReport> temperature() const { return std::nullopt; }

    private:
        enum class Phase {
            START,
            BODY,
            END,
            DONE
        };

        std::string toolpathPath_;
        std::vector<std::string> startSequence_;
        std::vector<std::string> endSequence_;
        std::ifstream toolpath_;
        Phase phase_ = Phase::START;
        size_t sequenceIndex_ = 0;
        PrintProgress progress_;

        /**
         * @brief Next raw line of the whole stream, advancing phases as they run out
         */
        bool nextRawLine(std::string &line);
    };

} // namespace core::driver
