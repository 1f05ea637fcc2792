#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "core/device/DeviceRegistry.hpp"
#include "core/device/TemperatureReport.hpp"
#include "core/profile/Profile.hpp"

namespace core::driver {

    struct PrintProgress {
        uint64_t currentLine = 0;
        uint64_t totalLines = 0;
        uint64_t currentByte = 0;
        uint64_t totalBytes = 0;
        std::optional<device::TemperatureReport> temperature; // latest report from the device, if any

        double fraction() const {
            if (totalBytes > 0) return static_cast<double>(currentByte) / static_cast<double>(totalBytes);
            if (totalLines > 0) return static_cast<double>(currentLine) / static_cast<double>(totalLines);
            return 1.0;
        }
    };

    /**
     * @brief Lazy progress stream of one print.
     *
     * Destroying the stream closes whatever connection it holds.
     */
    class PrintStream {
    public:
        virtual ~PrintStream() = default;

        /**
         * @brief Advance the print by one step
         * @return Progress after the step, std::nullopt once everything was sent
         * @throws core::types::DeviceDisconnectedException when the device goes away
         */
        virtual std::optional<PrintProgress> next() = 0;

        /**
         * @brief Stop the print and run the profile's abort sequence
         * @return true if the device confirmed the abort sequence
         */
        virtual bool abort() = 0;
    };

    /**
     * @brief Contract for one printer driver backend.
     */
    class DriverAdapter {
    public:
        virtual ~DriverAdapter() = default;

        /**
         * @brief Open the device and prepare to stream @p toolpathPath
         * @throws core::types::DeviceDisconnectedException if the device cannot be reached
         */
        virtual std::unique_ptr<PrintStream> print(const std::string &toolpathPath,
                                                   const profile::DriverProfile &profile,
                                                   device::DeviceHandle &device) = 0;

        virtual std::string getDriverName() const = 0;
    };

    class DriverFactory {
    public:
        virtual ~DriverFactory() = default;

        virtual std::shared_ptr<DriverAdapter> create(profile::DriverBackend backend) = 0;
    };

} // namespace core::driver
