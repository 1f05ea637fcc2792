#pragma once

#include <chrono>
#include <functional>
#include <memory>

#include "core/driver/DriverAdapter.hpp"
#include "core/driver/impl/LineStream.hpp"
#include "core/serial/SerialPort.hpp"
#include "core/serial/handler/GCodeStreamer.hpp"

namespace core::driver {

    using SerialPortFactory = std::function<std::shared_ptr<serial::SerialPort>(const std::string &port,
                                                                                uint32_t baudrate)>;

    /**
     * @brief Streams a toolpath over a serial link, one acknowledged line at a time
     */
    class MakerBotPrintStream : public LineStream {
    public:
        MakerBotPrintStream(const std::string &toolpathPath, const profile::DriverProfile &profile,
                            std::shared_ptr<serial::SerialPort> port, const std::string &deviceId);

        ~MakerBotPrintStream() override;

        /**
         * @brief Put the firmware line counter in sync before the first command
         */
        void begin();

        bool abort() override;

    protected:
        void emit(const std::string &command) override;

        std::optional<device::TemperatureReport> temperature() const override;

    private:
        std::shared_ptr<serial::SerialPort> port_;
        serial::GCodeStreamer streamer_;
        std::vector<std::string> abortSequence_;
        std::string deviceId_;
        std::chrono::milliseconds pollInterval_;
        std::chrono::steady_clock::time_point nextPoll_;
    };

    class MakerBotDriver : public DriverAdapter {
    public:
        explicit MakerBotDriver(SerialPortFactory serialPortFactory);

        std::unique_ptr<PrintStream> print(const std::string &toolpathPath,
                                           const profile::DriverProfile &profile,
                                           device::DeviceHandle &device) override;

        std::string getDriverName() const override { return "MakerBot"; }

    private:
        SerialPortFactory serialPortFactory_;
    };

} // namespace core::driver
