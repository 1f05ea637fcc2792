#pragma once

#include <boost/process.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace core::process {

    struct ProcessResult {
        int exitCode = -1;
        bool terminated = false;
        std::string output;
    };

    /**
     * @brief External program with merged stdout/stderr, run in its own process group.
     *
     * The destructor kills and reaps a child that is still running.
     */
    class ChildProcess {
    public:
        using LineCallback = std::function<void(const std::string &)>;

        ChildProcess(std::string executable, std::vector<std::string> arguments,
                     std::chrono::milliseconds gracePeriod = std::chrono::seconds(5));

        ~ChildProcess();

        ChildProcess(const ChildProcess &) = delete;

        ChildProcess &operator=(const ChildProcess &) = delete;

        /**
         * @throws core::types::ConveyorException if the program cannot be launched
         */
        void start();

        /**
         * @brief Read output until the child closes it, then reap the child
         */
        ProcessResult wait(const LineCallback &onLine = nullptr);

        /**
         * @brief SIGTERM to the process group, SIGKILL once the grace period runs out.
         *
         * Never blocks; safe to call from any thread and more than once.
         */
        void terminate();

        bool isRunning();

        int pid() const;

        std::string commandLine() const;

    private:
        std::string executable_;
        std::vector<std::string> arguments_;
        std::chrono::milliseconds gracePeriod_;

        boost::process::ipstream output_;
        boost::process::group group_;
        std::unique_ptr<boost::process::child> child_;

        std::mutex stateMutex_;
        std::condition_variable exitedCondition_;
        bool exited_ = false; // reaped
        std::atomic<bool> terminateRequested_{false};
        std::thread killerThread_;

        void signalGroup(int signal);

        void markExited();
    };

} // namespace core::process
