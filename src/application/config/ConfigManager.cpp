#include "application/config/ConfigManager.hpp"
#include "connector/models/profile/ProfileModel.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <set>

extern char **environ;

namespace core::config {

    namespace {
        constexpr const char *ENV_PREFIX = "CONVEYOR_";

        std::string toLower(std::string value) {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return value;
        }

        bool isInteger(const std::string &value) {
            if (value.empty()) return false;
            size_t start = (value[0] == '-' || value[0] == '+') ? 1 : 0;
            return start < value.size() &&
                   std::all_of(value.begin() + static_cast<std::ptrdiff_t>(start), value.end(),
                               [](unsigned char c) { return std::isdigit(c) != 0; });
        }
    }

    ConfigManager::ConfigManager() {
        setDefaults();
    }

    bool ConfigManager::loadFromFile(const std::string &configPath) {
        configPath_ = configPath;

        if (!std::filesystem::exists(configPath)) {
            Logger::logWarning("[ConfigManager] Config file not found: " + configPath + ", using defaults");
            return false;
        }

        std::ifstream file(configPath);
        if (!file.is_open()) {
            throw types::ConfigurationException("Cannot open config file " + configPath);
        }

        nlohmann::json json;
        try {
            file >> json;
        } catch (const nlohmann::json::parse_error &e) {
            throw types::ConfigurationException("Invalid JSON in " + configPath + ": " + e.what());
        }
        if (!json.is_object()) {
            throw types::ConfigurationException("Config file " + configPath + " must contain a JSON object");
        }

        loadFromJson(json);
        Logger::logInfo("[ConfigManager] Loaded " + std::to_string(config_.size()) + " settings from " + configPath);
        return true;
    }

    void ConfigManager::loadFromJson(const nlohmann::json &json) {
        std::lock_guard<std::mutex> lock(configMutex_);
        for (auto it = json.begin(); it != json.end(); ++it) {
            if (it.key() == "slicerProfiles") {
                slicerProfiles_ = it.value();
            } else if (it.key() == "driverProfiles") {
                driverProfiles_ = it.value();
            } else if (it.key() == "devices") {
                devices_ = it.value();
            } else if (it.value().is_object()) {
                flatten(it.value(), it.key());
            } else {
                config_[it.key()] = it.value().is_string() ? it.value().get<std::string>() : it.value().dump();
            }
        }
    }

    void ConfigManager::flatten(const nlohmann::json &object, const std::string &prefix) {
        for (auto it = object.begin(); it != object.end(); ++it) {
            std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();
            if (it.value().is_object()) {
                flatten(it.value(), key);
            } else if (it.value().is_string()) {
                config_[key] = it.value().get<std::string>();
            } else {
                config_[key] = it.value().dump();
            }
        }
    }

    int ConfigManager::loadFromEnv() {
        std::lock_guard<std::mutex> lock(configMutex_);

        std::unordered_map<std::string, std::string> knownKeys;
        for (const auto &entry: config_) {
            std::string flat = toLower(entry.first);
            std::replace(flat.begin(), flat.end(), '.', '_');
            knownKeys[flat] = entry.first;
        }

        const std::string prefix = ENV_PREFIX;
        int loaded = 0;
        for (char **env = environ; env && *env; ++env) {
            std::string variable = *env;
            if (variable.compare(0, prefix.size(), prefix) != 0) continue;

            auto separator = variable.find('=');
            if (separator == std::string::npos) continue;

            std::string name = toLower(variable.substr(prefix.size(), separator - prefix.size()));
            auto it = knownKeys.find(name);
            if (it == knownKeys.end()) {
                Logger::logWarning("[ConfigManager] Ignoring unknown setting " + variable.substr(0, separator));
                continue;
            }

            config_[it->second] = variable.substr(separator + 1);
            loaded++;
        }

        Logger::logInfo("[ConfigManager] Loaded " + std::to_string(loaded) + " settings from environment");
        return loaded;
    }

    void ConfigManager::set(const std::string &key, const std::string &value) {
        std::lock_guard<std::mutex> lock(configMutex_);
        config_[key] = value;
    }

    bool ConfigManager::contains(const std::string &key) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        return config_.count(key) > 0;
    }

    std::string ConfigManager::lookup(const std::string &key, bool &found) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        found = it != config_.end();
        return found ? it->second : std::string();
    }

    void ConfigManager::setDefaults() {
        config_.clear();
        slicerProfiles_ = nullptr;
        driverProfiles_ = nullptr;
        devices_ = nullptr;

        config_["common.address"] = "pipe:/tmp/conveyord.socket";
        config_["common.pidFile"] = "/tmp/conveyord.pid";
        config_["common.workDirectory"] = "/tmp/conveyor";

        config_["miracleGrue.executable"] = "miracle_grue";
        config_["miracleGrue.configPath"] = "miracle.config";
        config_["miracleGrue.defaultProfile"] = "MiracleGrue";

        config_["skeinforge.python"] = "python";
        config_["skeinforge.craftScript"] = "skeinforge/skeinforge_application/skeinforge_utilities/skeinforge_craft.py";
        config_["skeinforge.profileDirectory"] = "skeinforge/profiles/Replicator";
        config_["skeinforge.defaultProfile"] = "Skeinforge";

        config_["makerbot.baudrate"] = "115200";
        config_["makerbot.ackTimeoutMs"] = "30000";
        config_["makerbot.temperaturePollMs"] = "5000";
        config_["makerbot.defaultProfile"] = "MakerBotDriver";

        config_["file.outputDirectory"] = "output";
        config_["file.defaultProfile"] = "File";

        config_["server.eventThreads"] = "4";
        config_["server.rpcThreads"] = "2";
        config_["server.chdir"] = "false";
        config_["server.maxCompletedJobs"] = "100";
        config_["server.cancelGracePeriodMs"] = "5000";
        config_["server.logging.enabled"] = "true";
        config_["server.logging.level"] = "INFO";
        config_["server.logging.directory"] = "logs";

        profile::SlicingSettings slicing;
        config_["client.eventThreads"] = "1";
        config_["client.slicer"] = "MiracleGrue";
        config_["client.driver"] = "MakerBotDriver";
        config_["client.device"] = "/dev/ttyACM0";
        config_["client.logging.enabled"] = "false";
        config_["client.logging.level"] = "WARNING";
        config_["client.logging.directory"] = "logs";
        config_["client.slicing.raft"] = slicing.raft ? "true" : "false";
        config_["client.slicing.support"] = slicing.support ? "true" : "false";
        config_["client.slicing.infill"] = std::to_string(slicing.infill);
        config_["client.slicing.layerHeight"] = std::to_string(slicing.layerHeight);
        config_["client.slicing.shells"] = std::to_string(slicing.shells);
        config_["client.slicing.extruderTemperature"] = std::to_string(slicing.extruderTemperature);
        config_["client.slicing.platformTemperature"] = std::to_string(slicing.platformTemperature);
        config_["client.slicing.printSpeed"] = std::to_string(slicing.printSpeed);
        config_["client.slicing.travelSpeed"] = std::to_string(slicing.travelSpeed);

        connector::kafka::KafkaConfig kafka;
        config_["kafka.enabled"] = "false";
        config_["kafka.brokers"] = kafka.brokers;
        config_["kafka.clientId"] = kafka.clientId;
        config_["kafka.topic"] = kafka.topic;
        config_["kafka.compressionType"] = kafka.compressionType;
        config_["kafka.enableSsl"] = "false";
        config_["kafka.sslCaLocation"] = kafka.sslCaLocation;
        config_["kafka.sslCertLocation"] = kafka.sslCertLocation;
        config_["kafka.sslKeyLocation"] = kafka.sslKeyLocation;
        config_["kafka.saslMechanism"] = kafka.saslMechanism;
        config_["kafka.saslUsername"] = kafka.saslUsername;
        config_["kafka.saslPassword"] = kafka.saslPassword;
    }

    ConfigManager::ValidationResult ConfigManager::validate() const {
        ValidationResult result;
        assemble(result.errors);
        result.isValid = result.errors.empty();
        return result;
    }

    ConveyorConfig ConfigManager::build() const {
        std::vector<std::string> errors;
        ConveyorConfig config = assemble(errors);

        if (!errors.empty()) {
            std::string message = "Invalid configuration:";
            for (const auto &error: errors) {
                Logger::logError("[ConfigManager] " + error);
                message += "\n  " + error;
            }
            throw types::ConfigurationException(message);
        }
        return config;
    }

    ConveyorConfig ConfigManager::assemble(std::vector<std::string> &errors) const {
        ConveyorConfig config;

        auto requireInt = [&](const std::string &key, int minimum) -> int {
            std::string value = get<std::string>(key, "");
            if (!isInteger(value)) {
                errors.push_back(key + " must be an integer (got '" + value + "')");
                return minimum;
            }
            int parsed = get<int>(key, minimum);
            if (parsed < minimum) {
                errors.push_back(key + " must be >= " + std::to_string(minimum));
                return minimum;
            }
            return parsed;
        };

        try {
            config.address = connector::address::Address::parse(get<std::string>("common.address", ""));
        } catch (const types::InvalidAddressException &e) {
            errors.push_back("common.address: " + std::string(e.what()));
        }
        config.pidFile = get<std::string>("common.pidFile", config.pidFile);
        config.workDirectory = get<std::string>("common.workDirectory", config.workDirectory);
        if (config.workDirectory.empty()) {
            errors.push_back("common.workDirectory must not be empty");
        }

        config.slicers.miracleGrue.executable = get<std::string>("miracleGrue.executable", "");
        config.slicers.miracleGrue.configPath = get<std::string>("miracleGrue.configPath", "");
        config.slicers.skeinforge.python = get<std::string>("skeinforge.python", "");
        config.slicers.skeinforge.craftScript = get<std::string>("skeinforge.craftScript", "");
        config.slicers.skeinforge.profileDirectory = get<std::string>("skeinforge.profileDirectory", "");

        config.server.eventThreads = requireInt("server.eventThreads", 1);
        config.server.rpcThreads = requireInt("server.rpcThreads", 1);
        config.server.chdir = get<bool>("server.chdir", false);
        config.server.maxCompletedJobs = static_cast<size_t>(requireInt("server.maxCompletedJobs", 1));
        config.server.cancelGracePeriod = std::chrono::milliseconds(requireInt("server.cancelGracePeriodMs", 0));
        config.slicers.cancelGracePeriod = config.server.cancelGracePeriod;
        config.server.logging = buildLogging("server.logging", "conveyord", errors);

        config.client.eventThreads = requireInt("client.eventThreads", 1);
        config.client.slicer = get<std::string>("client.slicer", config.client.slicer);
        config.client.driver = get<std::string>("client.driver", config.client.driver);
        config.client.device = get<std::string>("client.device", config.client.device);
        config.client.slicing = buildSlicingDefaults();
        config.client.logging = buildLogging("client.logging", "conveyor", errors);

        requireInt("makerbot.baudrate", 1);
        requireInt("makerbot.ackTimeoutMs", 1);
        requireInt("makerbot.temperaturePollMs", 0);

        config.slicerProfiles = buildSlicerProfiles(errors);
        config.driverProfiles = buildDriverProfiles(errors);
        config.devices = buildDevices(errors);

        config.kafka.enabled = get<bool>("kafka.enabled", false);
        config.kafka.brokers = get<std::string>("kafka.brokers", config.kafka.brokers);
        config.kafka.clientId = get<std::string>("kafka.clientId", config.kafka.clientId);
        config.kafka.topic = get<std::string>("kafka.topic", config.kafka.topic);
        config.kafka.compressionType = get<std::string>("kafka.compressionType", config.kafka.compressionType);
        config.kafka.enableSsl = get<bool>("kafka.enableSsl", false);
        config.kafka.sslCaLocation = get<std::string>("kafka.sslCaLocation", config.kafka.sslCaLocation);
        config.kafka.sslCertLocation = get<std::string>("kafka.sslCertLocation", config.kafka.sslCertLocation);
        config.kafka.sslKeyLocation = get<std::string>("kafka.sslKeyLocation", config.kafka.sslKeyLocation);
        config.kafka.saslMechanism = get<std::string>("kafka.saslMechanism", config.kafka.saslMechanism);
        config.kafka.saslUsername = get<std::string>("kafka.saslUsername", config.kafka.saslUsername);
        config.kafka.saslPassword = get<std::string>("kafka.saslPassword", config.kafka.saslPassword);

        return config;
    }

    LoggingSettings ConfigManager::buildLogging(const std::string &prefix, const std::string &filePrefix,
                                                std::vector<std::string> &errors) const {
        LoggingSettings settings;
        settings.enabled = get<bool>(prefix + ".enabled", true);
        settings.directory = get<std::string>(prefix + ".directory", settings.directory);
        settings.filePrefix = filePrefix;

        std::string level = get<std::string>(prefix + ".level", "INFO");
        if (!Logger::parseLevel(level, settings.level)) {
            errors.push_back(prefix + ".level: unknown log level '" + level + "'");
        }
        return settings;
    }

    profile::SlicingSettings ConfigManager::buildSlicingDefaults() const {
        profile::SlicingSettings s;
        s.raft = get<bool>("client.slicing.raft", s.raft);
        s.support = get<bool>("client.slicing.support", s.support);
        s.infill = get<double>("client.slicing.infill", s.infill);
        s.layerHeight = get<double>("client.slicing.layerHeight", s.layerHeight);
        s.shells = get<int>("client.slicing.shells", s.shells);
        s.extruderTemperature = get<int>("client.slicing.extruderTemperature", s.extruderTemperature);
        s.platformTemperature = get<int>("client.slicing.platformTemperature", s.platformTemperature);
        s.printSpeed = get<double>("client.slicing.printSpeed", s.printSpeed);
        s.travelSpeed = get<double>("client.slicing.travelSpeed", s.travelSpeed);
        return s;
    }

    std::vector<profile::SlicerProfile> ConfigManager::buildSlicerProfiles(std::vector<std::string> &errors) const {
        nlohmann::json profiles;
        {
            std::lock_guard<std::mutex> lock(configMutex_);
            profiles = slicerProfiles_;
        }

        std::vector<profile::SlicerProfile> result;
        if (profiles.is_null()) {
            profile::SlicingSettings defaults = buildSlicingDefaults();

            profile::SlicerProfile miracleGrue;
            miracleGrue.name = get<std::string>("miracleGrue.defaultProfile", "MiracleGrue");
            miracleGrue.backend = profile::SlicerBackend::MIRACLE_GRUE;
            miracleGrue.settings = defaults;
            result.push_back(miracleGrue);

            profile::SlicerProfile skeinforge;
            skeinforge.name = get<std::string>("skeinforge.defaultProfile", "Skeinforge");
            skeinforge.backend = profile::SlicerBackend::SKEINFORGE;
            skeinforge.settings = defaults;
            result.push_back(skeinforge);
        } else if (!profiles.is_array()) {
            errors.push_back("slicerProfiles must be an array");
        } else {
            for (size_t i = 0; i < profiles.size(); ++i) {
                try {
                    connector::models::profile::SlicerProfileModel model(profiles[i]);
                    if (!model.isValid()) {
                        errors.push_back("slicerProfiles[" + std::to_string(i) + "] has invalid settings");
                        continue;
                    }
                    result.push_back(model.profile);
                } catch (const types::ConfigurationException &e) {
                    errors.push_back("slicerProfiles[" + std::to_string(i) + "]: " + e.what());
                } catch (const nlohmann::json::exception &e) {
                    errors.push_back("slicerProfiles[" + std::to_string(i) + "]: " + e.what());
                }
            }
        }

        std::set<std::string> names;
        for (const auto &p: result) {
            if (!names.insert(p.name).second) {
                errors.push_back("duplicate slicer profile name: " + p.name);
            }
        }
        return result;
    }

    std::vector<profile::DriverProfile> ConfigManager::buildDriverProfiles(std::vector<std::string> &errors) const {
        nlohmann::json profiles;
        {
            std::lock_guard<std::mutex> lock(configMutex_);
            profiles = driverProfiles_;
        }

        std::vector<profile::DriverProfile> result;
        if (profiles.is_null()) {
            profile::DriverProfile makerbot;
            makerbot.name = get<std::string>("makerbot.defaultProfile", "MakerBotDriver");
            makerbot.backend = profile::DriverBackend::MAKERBOT;
            makerbot.baudrate = static_cast<uint32_t>(std::max(1, get<int>("makerbot.baudrate", 115200)));
            makerbot.ackTimeoutMs = std::max(1, get<int>("makerbot.ackTimeoutMs", 30000));
            makerbot.temperaturePollMs = std::max(0, get<int>("makerbot.temperaturePollMs", 5000));
            result.push_back(makerbot);

            profile::DriverProfile file;
            file.name = get<std::string>("file.defaultProfile", "File");
            file.backend = profile::DriverBackend::PRINT_TO_FILE;
            file.outputDirectory = get<std::string>("file.outputDirectory", file.outputDirectory);
            result.push_back(file);
        } else if (!profiles.is_array()) {
            errors.push_back("driverProfiles must be an array");
        } else {
            for (size_t i = 0; i < profiles.size(); ++i) {
                try {
                    connector::models::profile::DriverProfileModel model(profiles[i]);
                    if (!model.isValid()) {
                        errors.push_back("driverProfiles[" + std::to_string(i) + "] has invalid settings");
                        continue;
                    }
                    result.push_back(model.profile);
                } catch (const types::ConfigurationException &e) {
                    errors.push_back("driverProfiles[" + std::to_string(i) + "]: " + e.what());
                } catch (const nlohmann::json::exception &e) {
                    errors.push_back("driverProfiles[" + std::to_string(i) + "]: " + e.what());
                }
            }
        }

        std::set<std::string> names;
        for (const auto &p: result) {
            if (!names.insert(p.name).second) {
                errors.push_back("duplicate driver profile name: " + p.name);
            }
        }
        return result;
    }

    std::vector<device::DeviceConfig> ConfigManager::buildDevices(std::vector<std::string> &errors) const {
        nlohmann::json devices;
        {
            std::lock_guard<std::mutex> lock(configMutex_);
            devices = devices_;
        }

        std::vector<device::DeviceConfig> result;
        if (devices.is_null()) {
            return result;
        }
        if (!devices.is_array()) {
            errors.push_back("devices must be an array");
            return result;
        }

        std::set<std::string> ids;
        for (size_t i = 0; i < devices.size(); ++i) {
            const auto &entry = devices[i];
            try {
                device::DeviceConfig config;
                config.id = entry.at("id").get<std::string>();
                config.port = entry.value("port", config.id);
                config.baudrate = entry.value("baudrate", 0u);
                if (config.id.empty()) {
                    errors.push_back("devices[" + std::to_string(i) + "] has an empty id");
                    continue;
                }
                if (!ids.insert(config.id).second) {
                    errors.push_back("duplicate device id: " + config.id);
                    continue;
                }
                result.push_back(config);
            } catch (const nlohmann::json::exception &e) {
                errors.push_back("devices[" + std::to_string(i) + "]: " + e.what());
            }
        }
        return result;
    }

} // namespace core::config
