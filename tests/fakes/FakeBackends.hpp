#pragma once

#include "TestSupport.hpp"
#include "core/driver/DriverAdapter.hpp"
#include "core/slicer/SlicerAdapter.hpp"
#include "core/types/Error.hpp"

#include <atomic>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fakes {

    /**
     * @brief Writes a fixed toolpath; can be told to fail or to wait for a gate
     */
    class FakeSlicer : public core::slicer::SlicerAdapter {
    public:
        core::slicer::SliceOutcome slice(const std::string &modelPath,
                                         const core::profile::SlicerProfile &profile,
                                         const std::string &toolpathPath,
                                         core::jobs::CancellationToken &cancellation) override {
            calls++;
            if (gate) {
                auto registration = cancellation.subscribe([this]() { gate->open(); });
                gate->wait();
            }
            if (cancellation.isCancelled()) {
                return core::slicer::SliceOutcome::CANCELLED;
            }
            if (failWith) {
                throw core::types::SliceFailedException(*failWith, 3, "backend diagnostics");
            }

            std::ofstream out(toolpathPath, std::ios::out | std::ios::trunc);
            for (const auto &line: toolpath) {
                out << line << '\n';
            }
            return core::slicer::SliceOutcome::COMPLETED;
        }

        std::string getSlicerName() const override { return "FakeSlicer"; }

        std::vector<std::string> toolpath = {"G1 X1", "G1 X2", "G1 X3"};
        std::optional<std::string> failWith;
        std::shared_ptr<testing_support::Gate> gate;
        std::atomic<int> calls{0};
    };

    class FakeSlicerFactory : public core::slicer::SlicerFactory {
    public:
        explicit FakeSlicerFactory(std::shared_ptr<FakeSlicer> slicer) : slicer_(std::move(slicer)) {}

        std::shared_ptr<core::slicer::SlicerAdapter> create(core::profile::SlicerBackend) override {
            return slicer_;
        }

    private:
        std::shared_ptr<FakeSlicer> slicer_;
    };

    class FakeDriver;

    /**
     * @brief A print of a fixed number of steps, each of which may wait on the driver's gate
     */
    class FakePrintStream : public core::driver::PrintStream {
    public:
        explicit FakePrintStream(FakeDriver &driver);

        std::optional<core::driver::PrintProgress> next() override;

        bool abort() override;

    private:
        FakeDriver &driver_;
        uint64_t step_ = 0;
    };

    class FakeDriver : public core::driver::DriverAdapter {
    public:
        std::unique_ptr<core::driver::PrintStream> print(const std::string &toolpathPath,
                                                         const core::profile::DriverProfile &profile,
                                                         core::device::DeviceHandle &device) override {
            {
                std::lock_guard<std::mutex> lock(mutex);
                printed.push_back(device.jobId());
                printedOn.push_back(device.deviceId());
            }
            if (failToOpen) {
                throw core::types::DeviceDisconnectedException(device.deviceId(), "cannot open port");
            }
            return std::make_unique<FakePrintStream>(*this);
        }

        std::string getDriverName() const override { return "FakeDriver"; }

        std::vector<core::jobs::JobId> printedJobs() {
            std::lock_guard<std::mutex> lock(mutex);
            return printed;
        }

        uint64_t steps = 3;
        std::optional<uint64_t> disconnectAtStep;
        bool failToOpen = false;
        bool abortConfirmed = true;
        std::optional<core::device::TemperatureReport> temperature;
        std::shared_ptr<testing_support::Gate> gate;
        std::atomic<int> aborts{0};

        std::mutex mutex;
        std::vector<core::jobs::JobId> printed;
        std::vector<std::string> printedOn;
    };

    inline FakePrintStream::FakePrintStream(FakeDriver &driver)
            : driver_(driver) {
    }

    inline std::optional<core::driver::PrintProgress> FakePrintStream::next() {
        if (driver_.gate) {
            driver_.gate->wait();
        }
        if (step_ >= driver_.steps) {
            return std::nullopt;
        }
        ++step_;
        if (driver_.disconnectAtStep && step_ == *driver_.disconnectAtStep) {
            throw core::types::DeviceDisconnectedException("fake", "link lost at step " + std::to_string(step_));
        }

        core::driver::PrintProgress progress;
        progress.currentLine = step_;
        progress.totalLines = driver_.steps;
        progress.temperature = driver_.temperature;
        return progress;
    }

    inline bool FakePrintStream::abort() {
        driver_.aborts++;
        return driver_.abortConfirmed;
    }

    class FakeDriverFactory : public core::driver::DriverFactory {
    public:
        explicit FakeDriverFactory(std::shared_ptr<FakeDriver> driver) : driver_(std::move(driver)) {}

        std::shared_ptr<core::driver::DriverAdapter> create(core::profile::DriverBackend) override {
            return driver_;
        }

    private:
        std::shared_ptr<FakeDriver> driver_;
    };

} // namespace fakes
