#include "core/serial/handler/GCodeStreamer.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace core::serial {

    namespace {
        constexpr size_t HISTORY_SIZE = 100;
        constexpr int MAX_RESENDS_PER_LINE = 10;

        bool startsWith(const std::string &value, const std::string &prefix) {
            return value.compare(0, prefix.size(), prefix) == 0;
        }

        std::string toLower(std::string value) {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return value;
        }

        std::string trim(const std::string &value) {
            auto begin = value.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos) return "";
            auto end = value.find_last_not_of(" \t\r\n");
            return value.substr(begin, end - begin + 1);
        }
    }

    GCodeStreamer::GCodeStreamer(std::shared_ptr<SerialPort> port, std::string deviceId,
                                 std::chrono::milliseconds ackTimeout)
            : port_(std::move(port)), deviceId_(std::move(deviceId)), ackTimeout_(ackTimeout) {
        if (!port_) {
            throw std::invalid_argument("SerialPort cannot be null");
        }
    }

    void GCodeStreamer::resetLineNumber() {
        history_.clear();
        storeLine(0, buildLine(0, "M110 N0"));
        currentNumber_ = 1;
        transmitFrom(0);
        Logger::logInfo("[GCodeStreamer] Line numbering reset on " + deviceId_);
    }

    void GCodeStreamer::send(const std::string &command) {
        uint32_t number = currentNumber_++;
        storeLine(number, buildLine(number, command));
        transmitFrom(number);
    }

    void GCodeStreamer::requestTemperature() {
        send("M105");
    }

    std::string GCodeStreamer::buildLine(uint32_t number, const std::string &command) {
        std::ostringstream oss;
        oss << "N" << number << " " << command;

        std::string rawLine = oss.str();
        oss << "*" << static_cast<int>(computeChecksum(rawLine));
        return oss.str();
    }

    uint8_t GCodeStreamer::computeChecksum(const std::string &data) {
        uint8_t checksum = 0;
        for (char c: data) {
            checksum ^= static_cast<uint8_t>(c);
        }
        return checksum;
    }

    std::string GCodeStreamer::stripComment(const std::string &line) {
        auto pos = line.find(';');
        return trim(pos == std::string::npos ? line : line.substr(0, pos));
    }

    void GCodeStreamer::storeLine(uint32_t number, const std::string &line) {
        if (history_.size() >= HISTORY_SIZE) {
            history_.erase(history_.begin());
        }
        history_[number] = line;
    }

    void GCodeStreamer::write(const std::string &line) {
        if (!port_->isOpen()) {
            throw types::DeviceDisconnectedException(deviceId_, "serial port closed");
        }
        try {
            port_->send(line);
        } catch (const types::ConveyorException &e) {
            Logger::logError("[GCodeStreamer] Write to " + deviceId_ + " failed: " + e.what());
            throw types::DeviceDisconnectedException(deviceId_, e.what());
        }
    }

    void GCodeStreamer::transmitFrom(uint32_t first) {
        const uint32_t last = currentNumber_ - 1;
        uint32_t next = first;
        int resends = 0;

        while (next <= last) {
            auto it = history_.find(next);
            if (it == history_.end()) {
                Logger::logError("[GCodeStreamer] RESEND FAILED - N" + std::to_string(next) +
                                 " not found in history");
                throw types::DeviceDisconnectedException(
                        deviceId_, "firmware requested line " + std::to_string(next) + " which is no longer buffered");
            }

            write(it->second);
            Reply reply = awaitReply();

            if (reply.kind == ReplyKind::OK) {
                ++next;
                continue;
            }

            if (++resends > MAX_RESENDS_PER_LINE) {
                throw types::DeviceDisconnectedException(deviceId_, "too many resend requests");
            }
            if (reply.resendFrom > last) {
                throw types::DeviceDisconnectedException(
                        deviceId_, "firmware expects line " + std::to_string(reply.resendFrom) +
                                   " but only " + std::to_string(last) + " were sent");
            }
            Logger::logWarning("[GCodeStreamer] Resending from N" + std::to_string(reply.resendFrom));
            next = reply.resendFrom;
        }
    }

    GCodeStreamer::Reply GCodeStreamer::awaitReply() {
        auto lastActivity = std::chrono::steady_clock::now();
        std::optional<uint32_t> pendingResend;

        while (true) {
            std::string line = port_->receiveLine();

            if (line == "CONN_LOST" || line == "SERIAL_ERROR") {
                throw types::DeviceDisconnectedException(deviceId_, "serial link lost");
            }

            if (line.empty()) {
                if (!port_->isOpen()) {
                    throw types::DeviceDisconnectedException(deviceId_, "serial port closed");
                }
                if (std::chrono::steady_clock::now() - lastActivity > ackTimeout_) {
                    Logger::logError("[GCodeStreamer] No response from " + deviceId_ + " for " +
                                     std::to_string(ackTimeout_.count()) + "ms");
                    throw types::DeviceDisconnectedException(
                            deviceId_, "no response within " + std::to_string(ackTimeout_.count()) + "ms");
                }
                continue;
            }

            // Anything the firmware says proves it is alive
            lastActivity = std::chrono::steady_clock::now();
            std::string lower = toLower(line);

            if (auto report = device::TemperatureReport::parse(line)) {
                lastTemperature_ = std::move(report);
            }

            if (startsWith(lower, "ok")) {
                if (pendingResend) {
                    return {ReplyKind::RESEND, *pendingResend};
                }
                return {ReplyKind::OK};
            }

            if (auto resend = parseResend(line)) {
                Logger::logWarning("[GCodeStreamer] RESEND request for N" + std::to_string(*resend));
                pendingResend = resend;
                continue;
            }

            if (startsWith(lower, "error:") || startsWith(lower, "!!")) {
                if (lower.find("halted") != std::string::npos || lower.find("kill") != std::string::npos ||
                    startsWith(lower, "!!")) {
                    throw types::DeviceDisconnectedException(deviceId_, "firmware halted: " + line);
                }
                Logger::logWarning("[GCodeStreamer] " + deviceId_ + ": " + line);
                continue;
            }

            if (lower.find("busy") != std::string::npos) {
                Logger::logDebug("[GCodeStreamer] " + deviceId_ + " busy");
                continue;
            }

            Logger::logDebug("[GCodeStreamer] " + deviceId_ + ": " + line);
        }
    }

    std::optional<uint32_t> GCodeStreamer::parseResend(const std::string &line) {
        std::string rest;
        std::string lower = toLower(line);
        if (startsWith(lower, "resend:")) {
            rest = line.substr(7);
        } else if (startsWith(lower, "rs ")) {
            rest = line.substr(3);
        } else {
            return std::nullopt;
        }

        rest = trim(rest);
        if (!rest.empty() && (rest[0] == 'N' || rest[0] == 'n')) {
            rest.erase(0, 1);
        }
        if (rest.empty() || !std::isdigit(static_cast<unsigned char>(rest[0]))) {
            Logger::logError("[GCodeStreamer] Failed to parse resend line: " + line);
            return std::nullopt;
        }
        try {
            return static_cast<uint32_t>(std::stoul(rest));
        } catch (const std::exception &e) {
            Logger::logError("[GCodeStreamer] Failed to parse resend line: " + line);
            return std::nullopt;
        }
    }

} // namespace core::serial
