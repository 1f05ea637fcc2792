#include "application/config/ConfigManager.hpp"
#include "connector/registry/RpcDispatcher.hpp"
#include "connector/rpc/RpcClient.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"

#include <boost/program_options.hpp>

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace po = boost::program_options;

namespace {

    constexpr int EXIT_RPC_ERROR = 1;
    constexpr int EXIT_USAGE = 2;

    std::string text(const nlohmann::json &value) {
        return value.is_string() ? value.get<std::string>() : value.dump();
    }

    /**
     * @brief " T0 205/210 B0 60/60" from a temperature object, empty when there is none
     */
    std::string temperatureText(const nlohmann::json &temperature) {
        if (!temperature.is_object()) return "";

        std::ostringstream out;
        out << std::fixed << std::setprecision(0);
        auto heaters = [&](const char *key, const char *label) {
            if (!temperature.contains(key)) return;
            for (const auto &heater: temperature[key].items()) {
                const auto &reading = heater.value();
                out << " " << label << heater.key() << " " << reading.value("current", 0.0);
                if (reading.contains("target") && reading["target"].is_number()) {
                    out << "/" << reading["target"].get<double>();
                }
            }
        };
        heaters("tools", "T");
        heaters("heatedPlatforms", "B");
        return out.str();
    }

    void printJob(const nlohmann::json &job) {
        std::ostringstream line;
        line << "job " << job.value("id", 0ULL) << " [" << text(job["state"]) << "] " << text(job["model"]);
        if (job.value("kind", "print") == "slice") {
            line << " => " << text(job["toolpath"]) << " (slicer " << text(job["slicerProfile"]) << ")";
        } else {
            line << " -> " << text(job["device"]) << " (slicer " << text(job["slicerProfile"]) << ", driver "
                 << text(job["driverProfile"]) << ")";
        }
        if (job.contains("progress") && job["progress"].is_number()) {
            line << " " << std::fixed << std::setprecision(0) << job["progress"].get<double>() * 100.0 << "%";
        }
        if (job.contains("temperature")) {
            line << temperatureText(job["temperature"]);
        }
        if (job.contains("waitPosition") && job["waitPosition"].is_number()) {
            line << " waiting #" << job["waitPosition"].get<size_t>();
        }
        if (job.contains("error") && job["error"].is_string()) {
            line << "\n    error: " << job["error"].get<std::string>();
        }
        std::cout << line.str() << std::endl;
    }

    void printEvent(const nlohmann::json &event) {
        std::ostringstream line;
        line << "#" << event.value("sequence", 0ULL) << " job " << event.value("jobId", 0ULL) << " ";
        if (event.value("type", "") == "progress") {
            line << "progress " << std::fixed << std::setprecision(0)
                 << event.value("progress", 0.0) * 100.0 << "%";
            if (event.contains("temperature")) {
                line << temperatureText(event["temperature"]);
            }
        } else {
            line << (event["oldState"].is_string() ? event["oldState"].get<std::string>() : std::string("-"))
                 << " -> " << text(event["newState"]);
        }
        std::string message = event.value("message", "");
        if (!message.empty()) {
            line << " (" << message << ")";
        }
        std::cout << line.str() << std::endl;
    }

    int usage(const po::options_description &options) {
        std::cerr << "usage: conveyor [-c config] <command> [args]\n\n"
                  << "commands:\n"
                  << "  submit <model> [--slicer S] [--driver D] [--device DEV]\n"
                  << "  slice <model> <output> [--slicer S]\n"
                  << "  cancel <id>\n"
                  << "  status <id>\n"
                  << "  list [--state S] [--device DEV] [--active]\n"
                  << "  profiles\n"
                  << "  devices\n"
                  << "  reconnect <device>\n"
                  << "  watch\n\n"
                  << options << std::endl;
        return EXIT_USAGE;
    }

    bool parseJobId(const std::string &value, unsigned long long &id) {
        if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
            return false;
        }
        try {
            id = std::stoull(value);
        } catch (const std::out_of_range &) {
            return false;
        }
        return true;
    }

    int runCommand(const std::string &command, const std::vector<std::string> &args, const po::variables_map &vm,
                   const po::options_description &options, const core::config::ConveyorConfig &config) {
        const bool rawJson = vm.count("json") > 0;

        try {
            connector::rpc::RpcClient client(config.address);
            client.connect();
            client.call("hello");

            if (command == "submit") {
                if (args.size() != 1) return usage(options);
                nlohmann::json params = {
                        {"model",  args[0]},
                        {"slicer", vm.count("slicer") ? vm["slicer"].as<std::string>() : config.client.slicer},
                        {"driver", vm.count("driver") ? vm["driver"].as<std::string>() : config.client.driver},
                        {"device", vm.count("device") ? vm["device"].as<std::string>() : config.client.device}
                };
                auto job = client.call("submit", params);
                if (rawJson) {
                    std::cout << job.dump(2) << std::endl;
                } else {
                    printJob(job);
                }
            } else if (command == "slice") {
                if (args.size() != 2) return usage(options);
                // The daemon resolves relative paths against its own working directory
                std::error_code ec;
                auto output = std::filesystem::absolute(args[1], ec);
                nlohmann::json params = {
                        {"model",  args[0]},
                        {"slicer", vm.count("slicer") ? vm["slicer"].as<std::string>() : config.client.slicer},
                        {"output", ec ? args[1] : output.lexically_normal().string()}
                };
                auto job = client.call("slice", params);
                if (rawJson) {
                    std::cout << job.dump(2) << std::endl;
                } else {
                    printJob(job);
                }
            } else if (command == "cancel" || command == "status") {
                unsigned long long id = 0;
                if (args.size() != 1 || !parseJobId(args[0], id)) return usage(options);
                auto result = client.call(command, {{"id", id}});
                if (rawJson) {
                    std::cout << result.dump(2) << std::endl;
                } else if (command == "status") {
                    printJob(result);
                } else {
                    std::cout << "job " << id << ": " << result.value("message", "") << std::endl;
                }
            } else if (command == "list") {
                nlohmann::json params = nlohmann::json::object();
                if (vm.count("state")) params["state"] = vm["state"].as<std::string>();
                if (vm.count("device")) params["device"] = vm["device"].as<std::string>();
                if (vm.count("active")) params["active"] = true;
                auto jobs = client.call("list", params);
                if (rawJson) {
                    std::cout << jobs.dump(2) << std::endl;
                } else {
                    for (const auto &job: jobs) printJob(job);
                }
            } else if (command == "profiles") {
                auto profiles = client.call("listProfiles");
                if (rawJson) {
                    std::cout << profiles.dump(2) << std::endl;
                } else {
                    for (const auto &p: profiles["slicers"]) {
                        std::cout << "slicer " << text(p["name"]) << " (" << text(p["backend"]) << ")" << std::endl;
                    }
                    for (const auto &p: profiles["drivers"]) {
                        std::cout << "driver " << text(p["name"]) << " (" << text(p["backend"]) << ")" << std::endl;
                    }
                }
            } else if (command == "devices") {
                auto devices = client.call("devices");
                if (rawJson) {
                    std::cout << devices.dump(2) << std::endl;
                } else {
                    for (const auto &d: devices) {
                        std::cout << text(d["id"]) << " on " << text(d["port"]) << ": "
                                  << (d.value("available", false) ? "available" : "UNAVAILABLE")
                                  << (d["activeJob"].is_number() ? ", printing job " + d["activeJob"].dump() : "")
                                  << ", " << d.value("waiting", 0) << " waiting";
                        std::string lastError = d.value("lastError", "");
                        if (!lastError.empty()) std::cout << " (" << lastError << ")";
                        std::cout << std::endl;
                    }
                }
            } else if (command == "reconnect") {
                if (args.size() != 1) return usage(options);
                auto result = client.call("reconnect", {{"device", args[0]}});
                std::cout << (rawJson ? result.dump(2) : args[0] + ": " + result.value("message", "")) << std::endl;
            } else if (command == "watch") {
                client.call("subscribe");
                while (auto notification = client.readNotification()) {
                    if (notification->value("method", "") != "jobchanged") continue;
                    if (rawJson) {
                        std::cout << (*notification)["params"].dump() << std::endl;
                    } else {
                        printEvent((*notification)["params"]);
                    }
                }
                std::cerr << "conveyor: daemon closed the connection" << std::endl;
            } else {
                std::cerr << "conveyor: unknown command '" << command << "'" << std::endl;
                return usage(options);
            }
        } catch (const connector::RpcException &e) {
            std::cerr << "conveyor: " << e.what() << " (code " << e.code() << ")" << std::endl;
            return EXIT_RPC_ERROR;
        } catch (const core::types::ConveyorException &e) {
            std::cerr << "conveyor: " << e.what() << std::endl;
            return EXIT_RPC_ERROR;
        }
        return 0;
    }
}

int main(int argc, char **argv) {
    std::string configPath;
    std::string command;
    std::vector<std::string> args;

    po::options_description options("options");
    options.add_options()
            ("help,h", "Show this help message")
            ("config,c", po::value<std::string>(&configPath)->default_value("conveyor.json"), "Configuration file")
            ("slicer", po::value<std::string>(), "Slicer profile (submit, slice)")
            ("driver", po::value<std::string>(), "Driver profile (submit)")
            ("device", po::value<std::string>(), "Target device (submit, list)")
            ("state", po::value<std::string>(), "Job state filter (list)")
            ("active", "Only unfinished jobs (list)")
            ("json", "Print raw JSON results");

    po::options_description hidden;
    hidden.add_options()
            ("command", po::value<std::string>(&command))
            ("args", po::value<std::vector<std::string>>(&args));

    po::options_description all;
    all.add(options).add(hidden);

    po::positional_options_description positional;
    positional.add("command", 1).add("args", -1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);
        po::notify(vm);
    } catch (const po::error &e) {
        std::cerr << "conveyor: " << e.what() << std::endl;
        return usage(options);
    }
    if (vm.count("help") || command.empty()) {
        return usage(options);
    }

    core::config::ConveyorConfig config;
    try {
        core::config::ConfigManager configManager;
        configManager.loadFromFile(configPath);
        configManager.loadFromEnv();
        config = configManager.build();
    } catch (const core::types::ConfigurationException &e) {
        std::cerr << "conveyor: " << e.what() << std::endl;
        return EXIT_USAGE;
    }

    LoggingSettings logging = config.client.logging;
    Logger::init(logging);

    int exitCode = runCommand(command, args, vm, options, config);

    Logger::shutdown();
    return exitCode;
}
