#pragma once

#include "core/serial/SerialPort.hpp"
#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace core::serial {

/**
 * @brief SerialPort over Boost.Asio
 */
    class RealSerialPort : public SerialPort {
    public:
        RealSerialPort(const std::string &portName, uint32_t baudrate,
                       std::chrono::milliseconds readTimeout = std::chrono::milliseconds(500));

        ~RealSerialPort() override;

        void send(const std::string &data) override;

        std::string receiveLine() override;

        bool isOpen() const override;

        void close() override;

    private:
        std::string portName_;
        std::chrono::milliseconds readTimeout_;
        boost::asio::io_context io_context_;
        std::unique_ptr<boost::asio::serial_port> serial_port_;
        std::string buffer_;
        int timeoutCount_ = 0;

        void configurePort(uint32_t baudrate);

        /**
         * @brief Pulse DTR so boards with an auto-reset circuit reboot into a known state
         */
        void triggerDeviceReset();

        uint32_t getAvailableBytes();

        void clearBuffer();
    };

} // namespace core::serial
