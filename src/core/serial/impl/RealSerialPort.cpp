#include "core/serial/impl/RealSerialPort.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"
#include <boost/system/error_code.hpp>
#include <sys/ioctl.h>
#include <termios.h>
#include <thread>

namespace core::serial {
    RealSerialPort::RealSerialPort(const std::string &portName, uint32_t baudrate,
                                   std::chrono::milliseconds readTimeout)
            : portName_(portName), readTimeout_(readTimeout), io_context_(), serial_port_(nullptr) {
        try {
            serial_port_ = std::make_unique<boost::asio::serial_port>(io_context_, portName);

            if (!serial_port_->is_open()) {
                Logger::logError("[SerialPort] Failed to open " + portName);
                serial_port_.reset();
                return;
            }

            // Configure port before touching DTR
            configurePort(baudrate);
            triggerDeviceReset();

            Logger::logInfo("[SerialPort] Opened " + portName + " at " + std::to_string(baudrate) + " baud");

        } catch (const boost::system::system_error &e) {
            Logger::logError("[SerialPort] Failed to open " + portName + ": " + e.what());
            serial_port_.reset();
        }
    }

    RealSerialPort::~RealSerialPort() {
        close();
    }

    void RealSerialPort::close() {
        if (serial_port_ && serial_port_->is_open()) {
            boost::system::error_code ec;
            serial_port_->close(ec);
            if (ec) {
                Logger::logError("[SerialPort] Error closing " + portName_ + ": " + ec.message());
            } else {
                Logger::logInfo("[SerialPort] Closed " + portName_);
            }
        }
    }

    void RealSerialPort::configurePort(uint32_t baudrate) {
        if (!serial_port_ || !serial_port_->is_open()) return;

        boost::system::error_code ec;

        serial_port_->set_option(boost::asio::serial_port_base::baud_rate(baudrate), ec);
        if (ec) {
            Logger::logWarning("[SerialPort] Failed to set baud rate: " + ec.message());
        }

        serial_port_->set_option(boost::asio::serial_port_base::character_size(8), ec);
        if (ec) {
            Logger::logWarning("[SerialPort] Character size setting failed (non-critical): " + ec.message());
        }

        serial_port_->set_option(boost::asio::serial_port_base::parity(
                boost::asio::serial_port_base::parity::none), ec);
        if (ec) {
            Logger::logWarning("[SerialPort] Failed to set parity: " + ec.message());
        }

        serial_port_->set_option(boost::asio::serial_port_base::stop_bits(
                boost::asio::serial_port_base::stop_bits::one), ec);
        if (ec) {
            Logger::logWarning("[SerialPort] Failed to set stop bits: " + ec.message());
        }

        serial_port_->set_option(boost::asio::serial_port_base::flow_control(
                boost::asio::serial_port_base::flow_control::none), ec);
        if (ec) {
            Logger::logWarning("[SerialPort] Failed to set flow control: " + ec.message());
        }
    }

    void RealSerialPort::triggerDeviceReset() {
        if (!serial_port_ || !serial_port_->is_open()) return;

        Logger::logInfo("[SerialPort] Triggering device reset via DTR...");

        int fd = serial_port_->native_handle();
        int status = 0;

        if (ioctl(fd, TIOCMGET, &status) == -1) {
            Logger::logWarning("[SerialPort] Cannot read modem lines on " + portName_ + ", skipping reset");
            return;
        }

        status |= TIOCM_DTR;
        ioctl(fd, TIOCMSET, &status);
        std::this_thread::sleep_for(std::chrono::milliseconds(50));

        status &= ~TIOCM_DTR;
        ioctl(fd, TIOCMSET, &status);
        std::this_thread::sleep_for(std::chrono::milliseconds(50));

        status |= TIOCM_DTR;
        ioctl(fd, TIOCMSET, &status);

        tcflush(fd, TCIOFLUSH);

        // Bootloader needs about two seconds before the firmware answers
        Logger::logInfo("[SerialPort] Waiting for device bootloader...");
        std::this_thread::sleep_for(std::chrono::milliseconds(2000));

        clearBuffer();
    }

    uint32_t RealSerialPort::getAvailableBytes() {
        if (!serial_port_ || !serial_port_->is_open()) return 0;

        int fd = serial_port_->native_handle();
        int bytes = 0;
        if (ioctl(fd, FIONREAD, &bytes) == -1) {
            return 0;
        }
        return static_cast<uint32_t>(bytes);
    }

    void RealSerialPort::clearBuffer() {
        if (!serial_port_ || !serial_port_->is_open()) return;

        boost::system::error_code ec;
        char temp[256];

        while (getAvailableBytes() > 0) {
            serial_port_->read_some(boost::asio::buffer(temp, sizeof(temp)), ec);
            if (ec) break;
        }

        buffer_.clear();
    }

    void RealSerialPort::send(const std::string &data) {
        if (!serial_port_ || !serial_port_->is_open()) {
            Logger::logError("[SerialPort] Port " + portName_ + " not open when trying to send");
            throw types::ConveyorException("Serial port " + portName_ + " is not open");
        }

        std::string message = data + "\n";
        boost::system::error_code ec;

        size_t bytes_written = boost::asio::write(*serial_port_, boost::asio::buffer(message), ec);

        if (ec) {
            Logger::logError("[SerialPort] Write error: " + ec.message());
            throw types::ConveyorException("Serial write failed on " + portName_ + ": " + ec.message());
        }

        if (bytes_written != message.length()) {
            Logger::logWarning("[SerialPort] Not all bytes written: " +
                               std::to_string(bytes_written) + "/" + std::to_string(message.length()));
        }

        Logger::logDebug("[TX] " + data);
    }

    std::string RealSerialPort::receiveLine() {
        if (!serial_port_ || !serial_port_->is_open()) {
            return "CONN_LOST";
        }

        std::string line;

        try {
            boost::system::error_code readError;
            bool completed = false;

            boost::asio::async_read_until(*serial_port_, boost::asio::dynamic_buffer(buffer_), '\n',
                                          [&](const boost::system::error_code &ec, std::size_t) {
                                              readError = ec;
                                              completed = true;
                                          });

            io_context_.restart();
            io_context_.run_for(readTimeout_);

            if (!completed) {
                // Let the aborted handler run before the locals above go away
                serial_port_->cancel();
                io_context_.restart();
                io_context_.run();

                if (++timeoutCount_ % 100 == 0) {
                    Logger::logWarning("[SerialPort] " + std::to_string(timeoutCount_) + " timeouts occurred");
                }
                return "";
            }

            timeoutCount_ = 0;

            if (readError) {
                if (readError == boost::asio::error::operation_aborted) {
                    return "";
                }
                Logger::logError("[SerialPort] Read error: " + readError.message());
                return "CONN_LOST";
            }

            auto pos = buffer_.find('\n');
            if (pos != std::string::npos) {
                line = buffer_.substr(0, pos);
                buffer_.erase(0, pos + 1);

                if (!line.empty() && line.back() == '\r') {
                    line.pop_back();
                }

                if (!line.empty()) {
                    Logger::logDebug("[RX] " + line);
                }
            }

        } catch (const std::exception &e) {
            Logger::logError("[SerialPort] Exception: " + std::string(e.what()));
            return "SERIAL_ERROR";
        }

        return line;
    }

    bool RealSerialPort::isOpen() const {
        return serial_port_ && serial_port_->is_open();
    }
} // namespace core::serial
