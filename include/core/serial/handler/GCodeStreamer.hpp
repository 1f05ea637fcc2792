#pragma once

#include "core/device/TemperatureReport.hpp"
#include "core/serial/SerialPort.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace core::serial {

    /**
     * @brief Sends line-numbered G-code and waits for the firmware to acknowledge each line.
     *
     * Lines go out as "N<n> <command>*<checksum>". The streamer blocks until "ok" arrives,
     * replays history on "Resend: <n>", and treats any silence longer than the ack timeout
     * as a lost device. Only one line is in flight at a time.
     */
    class GCodeStreamer {
    public:
        GCodeStreamer(std::shared_ptr<SerialPort> port, std::string deviceId, std::chrono::milliseconds ackTimeout);

        /**
         * @brief Restart line numbering on the firmware (M110)
         * @throws core::types::DeviceDisconnectedException
         */
        void resetLineNumber();

        /**
         * @brief Send one command and wait for its acknowledgement
         * @throws core::types::DeviceDisconnectedException on timeout, link failure or halted firmware
         */
        void send(const std::string &command);

        /**
         * @brief Ask the firmware for its heater readings (M105); the reply lands in lastTemperature()
         * @throws core::types::DeviceDisconnectedException
         */
        void requestTemperature();

        /**
         * @brief Most recent temperature report seen in any reply
         */
        const std::optional<device::TemperatureReport> &lastTemperature() const { return lastTemperature_; }

        uint32_t lastLineNumber() const { return currentNumber_ - 1; }

        static std::string buildLine(uint32_t number, const std::string &command);

        static uint8_t computeChecksum(const std::string &data);

        /**
         * @brief Drop a trailing ';' comment and surrounding whitespace
         */
        static std::string stripComment(const std::string &line);

    private:
        enum class ReplyKind {
            OK,
            RESEND
        };

        struct Reply {
            ReplyKind kind;
            uint32_t resendFrom = 0;
        };

        std::shared_ptr<SerialPort> port_;
        std::string deviceId_;
        std::chrono::milliseconds ackTimeout_;
        uint32_t currentNumber_ = 1;
        std::map<uint32_t, std::string> history_;
        std::optional<device::TemperatureReport> lastTemperature_;

        void storeLine(uint32_t number, const std::string &line);

        void write(const std::string &line);

        /**
         * @brief Transmit lines from @p first up to the newest numbered line until each one is acknowledged
         */
        void transmitFrom(uint32_t first);

        Reply awaitReply();

        static std::optional<uint32_t> parseResend(const std::string &line);
    };

} // namespace core::serial
