#include "application/config/ConfigManager.hpp"
#include "application/controllers/ApplicationController.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"

#include <boost/program_options.hpp>
#include <unistd.h>

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>

namespace po = boost::program_options;

// Global shutdown mechanism
std::atomic<bool> running{true};
std::condition_variable shutdownCondition;
std::mutex shutdownMutex;

void handleSignal(int signal) {
    (void) signal;
    running = false;
}

void waitForShutdownSignal() {
    std::unique_lock<std::mutex> lock(shutdownMutex);
    // The signal handler may only touch the atomic flag
    while (running.load()) {
        shutdownCondition.wait_for(lock, std::chrono::milliseconds(500));
    }
}

/**
 * @brief Writes the daemon's PID on construction and removes the file on destruction
 */
class PidFile {
public:
    explicit PidFile(std::string path) : path_(std::move(path)) {
        std::ofstream out(path_, std::ios::trunc);
        if (!out.is_open()) {
            throw core::types::ConveyorException("Cannot write PID file " + path_);
        }
        out << ::getpid() << '\n';
        Logger::logInfo("[conveyord] PID " + std::to_string(::getpid()) + " written to " + path_);
    }

    ~PidFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    PidFile(const PidFile &) = delete;

    PidFile &operator=(const PidFile &) = delete;

private:
    std::string path_;
};

int main(int argc, char **argv) {
    std::string configPath;

    po::options_description options("conveyord options");
    options.add_options()
            ("help,h", "Show this help message")
            ("config,c", po::value<std::string>(&configPath)->default_value("conveyor.json"),
             "Configuration file");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, options), vm);
        po::notify(vm);
    } catch (const po::error &e) {
        std::cerr << "conveyord: " << e.what() << "\n" << options << std::endl;
        return 2;
    }
    if (vm.count("help")) {
        std::cout << options << std::endl;
        return 0;
    }

    try {
        core::config::ConfigManager configManager;
        configManager.loadFromFile(configPath);
        configManager.loadFromEnv();
        core::config::ConveyorConfig config = configManager.build();

        Logger::init(config.server.logging);
        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);
        std::signal(SIGPIPE, SIG_IGN);

        PidFile pidFile(std::filesystem::absolute(config.pidFile).string());

        if (config.server.chdir) {
            // Relative paths in the config keep meaning relative to the launch directory
            config.workDirectory = std::filesystem::absolute(config.workDirectory).string();
            config.slicers.miracleGrue.configPath = std::filesystem::absolute(
                    config.slicers.miracleGrue.configPath).string();
            config.slicers.skeinforge.craftScript = std::filesystem::absolute(
                    config.slicers.skeinforge.craftScript).string();
            config.slicers.skeinforge.profileDirectory = std::filesystem::absolute(
                    config.slicers.skeinforge.profileDirectory).string();
            for (auto &profile: config.driverProfiles) {
                profile.outputDirectory = std::filesystem::absolute(profile.outputDirectory).string();
            }
            if (::chdir("/") != 0) {
                Logger::logWarning("[conveyord] Cannot change directory to /");
            }
        }

        {
            ApplicationController app(config);
            if (!app.initialize()) {
                Logger::logError("Application initialization failed");
                app.shutdown();
                Logger::shutdown();
                return 1;
            }

            waitForShutdownSignal();
            Logger::logInfo("[conveyord] Shutdown signal received");
            app.shutdown();
        }
        Logger::shutdown();
    } catch (const core::types::ConfigurationException &ex) {
        std::cerr << "conveyord: " << ex.what() << std::endl;
        return 1;
    } catch (const std::exception &ex) {
        Logger::logError("Fatal error: " + std::string(ex.what()));
        Logger::shutdown();
        return 1;
    }

    return 0;
}
