#include "core/process/ChildProcess.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"

#include <csignal>
#include <istream>
#include <sstream>
#include <sys/types.h>

namespace bp = boost::process;

namespace core::process {

    ChildProcess::ChildProcess(std::string executable, std::vector<std::string> arguments,
                               std::chrono::milliseconds gracePeriod)
            : executable_(std::move(executable)), arguments_(std::move(arguments)), gracePeriod_(gracePeriod) {
    }

    ChildProcess::~ChildProcess() {
        bool running = false;
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            running = child_ && !exited_;
            if (running) {
                signalGroup(SIGKILL);
            }
        }

        if (running) {
            std::error_code ec;
            child_->wait(ec);
            markExited();
            Logger::logWarning("[ChildProcess] Killed " + executable_ + " (pid " + std::to_string(pid()) + ")");
        }

        if (killerThread_.joinable()) {
            killerThread_.join();
        }
    }

    void ChildProcess::start() {
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            if (child_) {
                throw types::ConveyorException("Process already started: " + executable_);
            }

            boost::filesystem::path program = executable_;
            if (executable_.find('/') == std::string::npos) {
                program = bp::search_path(executable_);
                if (program.empty()) {
                    throw types::ConveyorException("Executable not found in PATH: " + executable_);
                }
            }

            try {
                child_ = std::make_unique<bp::child>(bp::exe = program.string(), bp::args = arguments_,
                                                     (bp::std_out & bp::std_err) > output_,
                                                     bp::std_in < bp::null, group_);
            } catch (const bp::process_error &e) {
                throw types::ConveyorException("Failed to launch " + executable_ + ": " + e.what());
            }
        }

        Logger::logDebug("[ChildProcess] Started pid " + std::to_string(pid()) + ": " + commandLine());

        if (terminateRequested_) {
            terminate();
        }
    }

    ProcessResult ChildProcess::wait(const LineCallback &onLine) {
        ProcessResult result;
        if (!child_) {
            return result;
        }

        std::ostringstream captured;
        std::string line;
        while (std::getline(output_, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            captured << line << '\n';
            if (onLine) {
                onLine(line);
            }
        }

        std::error_code ec;
        child_->wait(ec);
        if (ec) {
            Logger::logWarning("[ChildProcess] Wait failed for pid " + std::to_string(pid()) + ": " + ec.message());
        }
        markExited();

        if (killerThread_.joinable()) {
            killerThread_.join();
        }

        result.exitCode = child_->exit_code();
        result.terminated = terminateRequested_;
        result.output = captured.str();
        return result;
    }

    void ChildProcess::terminate() {
        terminateRequested_ = true;

        std::lock_guard<std::mutex> lock(stateMutex_);
        if (!child_ || exited_ || killerThread_.joinable()) {
            return;
        }

        Logger::logInfo("[ChildProcess] Terminating pid " + std::to_string(child_->id()) + " (" + executable_ + ")");
        signalGroup(SIGTERM);

        killerThread_ = std::thread([this]() {
            std::unique_lock<std::mutex> lock(stateMutex_);
            if (!exitedCondition_.wait_for(lock, gracePeriod_, [this] { return exited_; })) {
                Logger::logWarning("[ChildProcess] pid " + std::to_string(child_->id()) +
                                   " ignored SIGTERM, sending SIGKILL");
                signalGroup(SIGKILL);
            }
        });
    }

    bool ChildProcess::isRunning() {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (!child_ || exited_) {
            return false;
        }
        std::error_code ec;
        return child_->running(ec);
    }

    int ChildProcess::pid() const {
        return child_ ? child_->id() : -1;
    }

    std::string ChildProcess::commandLine() const {
        std::string line = executable_;
        for (const auto &arg: arguments_) {
            line += " " + arg;
        }
        return line;
    }

    void ChildProcess::signalGroup(int signal) {
        pid_t groupId = group_.native_handle();
        if (groupId > 0) {
            ::kill(-groupId, signal);
        } else if (child_) {
            ::kill(child_->id(), signal);
        }
    }

    void ChildProcess::markExited() {
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            exited_ = true;
        }
        exitedCondition_.notify_all();
    }

} // namespace core::process
