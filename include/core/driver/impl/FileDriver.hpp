#pragma once

#include <fstream>

#include "core/driver/DriverAdapter.hpp"
#include "core/driver/impl/LineStream.hpp"

namespace core::driver {

    /**
     * @brief "Print to file": the command stream ends up in <outputDirectory>/<device>-<job>.gcode
     */
    class FilePrintStream : public LineStream {
    public:
        FilePrintStream(const std::string &toolpathPath, const profile::DriverProfile &profile,
                        const std::string &outputPath, const std::string &deviceId);

        bool abort() override;

        const std::string &outputPath() const { return outputPath_; }

    protected:
        void emit(const std::string &command) override;

    private:
        std::string outputPath_;
        std::string deviceId_;
        std::vector<std::string> abortSequence_;
        std::ofstream out_;
    };

    class FileDriver : public DriverAdapter {
    public:
        std::unique_ptr<PrintStream> print(const std::string &toolpathPath,
                                           const profile::DriverProfile &profile,
                                           device::DeviceHandle &device) override;

        std::string getDriverName() const override { return "File"; }

        static std::string outputPathFor(const profile::DriverProfile &profile, const std::string &deviceId,
                                         jobs::JobId jobId);
    };

} // namespace core::driver
