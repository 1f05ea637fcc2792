#include "core/driver/BackendDriverFactory.hpp"
#include "core/driver/impl/FileDriver.hpp"
#include "core/serial/impl/RealSerialPort.hpp"
#include "core/types/Error.hpp"

namespace core::driver {

    BackendDriverFactory::BackendDriverFactory(SerialPortFactory serialPortFactory)
            : serialPortFactory_(std::move(serialPortFactory)) {
        if (!serialPortFactory_) {
            serialPortFactory_ = [](const std::string &port, uint32_t baudrate) {
                return std::make_shared<serial::RealSerialPort>(port, baudrate);
            };
        }
    }

    std::shared_ptr<DriverAdapter> BackendDriverFactory::create(profile::DriverBackend backend) {
        switch (backend) {
            case profile::DriverBackend::MAKERBOT:
                return std::make_shared<MakerBotDriver>(serialPortFactory_);
            case profile::DriverBackend::PRINT_TO_FILE:
                return std::make_shared<FileDriver>();
        }
        throw types::ConveyorException("Unsupported driver backend: " + profile::driverBackendToString(backend));
    }

} // namespace core::driver
