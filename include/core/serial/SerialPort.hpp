#pragma once

#include <string>

namespace core::serial {

    /**
     * @brief Line-oriented link to a printer.
     */
    class SerialPort {
    public:
        virtual ~SerialPort() = default;

        /**
         * @brief Write one line; the terminating newline is added by the port.
         * @throws core::types::ConveyorException when the write fails
         */
        virtual void send(const std::string &data) = 0;

        /**
         * @brief Read one line without its terminator.
         * @return Empty string on read timeout, "CONN_LOST" or "SERIAL_ERROR" when the link broke
         */
        virtual std::string receiveLine() = 0;

        virtual bool isOpen() const = 0;

        virtual void close() = 0;
    };

} // namespace core::serial
