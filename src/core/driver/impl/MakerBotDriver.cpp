#include "core/driver/impl/MakerBotDriver.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"

namespace core::driver {

    MakerBotPrintStream::MakerBotPrintStream(const std::string &toolpathPath, const profile::DriverProfile &profile,
                                             std::shared_ptr<serial::SerialPort> port, const std::string &deviceId)
            : LineStream(toolpathPath, profile),
              port_(port),
              streamer_(std::move(port), deviceId, std::chrono::milliseconds(profile.ackTimeoutMs)),
              abortSequence_(profile.abortSequence),
              deviceId_(deviceId),
              pollInterval_(profile.temperaturePollMs),
              nextPoll_(std::chrono::steady_clock::now() + pollInterval_) {
    }

    MakerBotPrintStream::~MakerBotPrintStream() {
        port_->close();
    }

    void MakerBotPrintStream::begin() {
        streamer_.resetLineNumber();
    }

    void MakerBotPrintStream::emit(const std::string &command) {
        streamer_.send(command);

        if (pollInterval_.count() > 0 && std::chrono::steady_clock::now() >= nextPoll_) {
            streamer_.requestTemperature();
            nextPoll_ = std::chrono::steady_clock::now() + pollInterval_;
        }
    }

    std::optional<device::TemperatureReport> MakerBotPrintStream::temperature() const {
        return streamer_.lastTemperature();
    }

    bool MakerBotPrintStream::abort() {
        Logger::logInfo("[MakerBotDriver] Running abort sequence on " + deviceId_);
        try {
            for (const auto &command: abortSequence_) {
                streamer_.send(command);
            }
        } catch (const types::DeviceDisconnectedException &e) {
            Logger::logError("[MakerBotDriver] Abort sequence not confirmed on " + deviceId_ + ": " + e.what());
            return false;
        }
        Logger::logInfo("[MakerBotDriver] Abort sequence confirmed on " + deviceId_);
        return true;
    }

    MakerBotDriver::MakerBotDriver(SerialPortFactory serialPortFactory)
            : serialPortFactory_(std::move(serialPortFactory)) {
    }

    std::unique_ptr<PrintStream> MakerBotDriver::print(const std::string &toolpathPath,
                                                       const profile::DriverProfile &profile,
                                                       device::DeviceHandle &device) {
        uint32_t baudrate = device.baudrate() != 0 ? device.baudrate() : profile.baudrate;
        Logger::logInfo("[MakerBotDriver] Connecting to " + device.deviceId() + " on " + device.port() +
                        " at " + std::to_string(baudrate) + " baud");

        auto port = serialPortFactory_(device.port(), baudrate);
        if (!port || !port->isOpen()) {
            throw types::DeviceDisconnectedException(device.deviceId(), "cannot open " + device.port());
        }

        auto stream = std::make_unique<MakerBotPrintStream>(toolpathPath, profile, port, device.deviceId());
        stream->begin();
        return stream;
    }

} // namespace core::driver
