#pragma once

#include "core/driver/DriverAdapter.hpp"
#include "core/driver/impl/MakerBotDriver.hpp"

namespace core::driver {

    class BackendDriverFactory : public DriverFactory {
    public:
        /**
         * @param serialPortFactory Opens serial ports for the MakerBot backend; defaults to RealSerialPort
         */
        explicit BackendDriverFactory(SerialPortFactory serialPortFactory = nullptr);

        std::shared_ptr<DriverAdapter> create(profile::DriverBackend backend) override;

    private:
        SerialPortFactory serialPortFactory_;
    };

} // namespace core::driver
