#pragma once

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "application/config/ConveyorConfig.hpp"

namespace core::config {

    /**
     * @brief Loads conveyor.json, applies CONVEYOR_* overrides and builds a ConveyorConfig.
     *
     * Scalar settings are flattened into dotted keys ("server.eventThreads"); the profile and
     * device arrays are kept as JSON and parsed by build().
     */
    class ConfigManager {
    public:
        ConfigManager();

        /**
         * @return false if the file does not exist (defaults stay in place)
         * @throws core::types::ConfigurationException if the file is not valid JSON
         */
        bool loadFromFile(const std::string &configPath = "conveyor.json");

        void loadFromJson(const nlohmann::json &json);

        /**
         * @brief Apply CONVEYOR_<SECTION>_<KEY> variables to known keys, matched case-insensitively
         * @return Number of settings overridden
         */
        int loadFromEnv();

        void set(const std::string &key, const std::string &value);

        bool contains(const std::string &key) const;

        template<typename T>
        T get(const std::string &key, const T &defaultValue) const;

        const std::string &configPath() const { return configPath_; }

        struct ValidationResult {
            bool isValid = true;
            std::vector<std::string> errors;
        };

        ValidationResult validate() const;

        /**
         * @throws core::types::ConfigurationException listing every validation error
         */
        ConveyorConfig build() const;

    private:
        mutable std::mutex configMutex_;
        std::unordered_map<std::string, std::string> config_;
        nlohmann::json slicerProfiles_;
        nlohmann::json driverProfiles_;
        nlohmann::json devices_;
        std::string configPath_;

        void setDefaults();

        void flatten(const nlohmann::json &object, const std::string &prefix);

        std::vector<profile::SlicerProfile> buildSlicerProfiles(std::vector<std::string> &errors) const;

        std::vector<profile::DriverProfile> buildDriverProfiles(std::vector<std::string> &errors) const;

        std::vector<device::DeviceConfig> buildDevices(std::vector<std::string> &errors) const;

        LoggingSettings buildLogging(const std::string &prefix, const std::string &filePrefix,
                                     std::vector<std::string> &errors) const;

        profile::SlicingSettings buildSlicingDefaults() const;

        ConveyorConfig assemble(std::vector<std::string> &errors) const;

        std::string lookup(const std::string &key, bool &found) const;
    };

    template<>
    inline std::string ConfigManager::get<std::string>(const std::string &key, const std::string &defaultValue) const {
        bool found = false;
        std::string value = lookup(key, found);
        return found ? value : defaultValue;
    }

    template<>
    inline int ConfigManager::get<int>(const std::string &key, const int &defaultValue) const {
        bool found = false;
        std::string value = lookup(key, found);
        if (!found) return defaultValue;
        try {
            size_t consumed = 0;
            int parsed = std::stoi(value, &consumed);
            return consumed == value.size() ? parsed : defaultValue;
        } catch (const std::exception &) {
            return defaultValue;
        }
    }

    template<>
    inline double ConfigManager::get<double>(const std::string &key, const double &defaultValue) const {
        bool found = false;
        std::string value = lookup(key, found);
        if (!found) return defaultValue;
        try {
            size_t consumed = 0;
            double parsed = std::stod(value, &consumed);
            return consumed == value.size() ? parsed : defaultValue;
        } catch (const std::exception &) {
            return defaultValue;
        }
    }

    template<>
    inline bool ConfigManager::get<bool>(const std::string &key, const bool &defaultValue) const {
        bool found = false;
        std::string value = lookup(key, found);
        if (!found) return defaultValue;
        if (value == "true" || value == "1") return true;
        if (value == "false" || value == "0") return false;
        return defaultValue;
    }

} // namespace core::config
