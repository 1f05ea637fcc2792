#pragma once

#include "../BaseModel.hpp"
#include "core/profile/Profile.hpp"
#include "core/types/Error.hpp"
#include <string>
#include <vector>

namespace connector::models::profile {

    namespace detail {
        inline std::vector<std::string> readSequence(const nlohmann::json &json, const char *key,
                                                     std::vector<std::string> fallback = {}) {
            if (!json.contains(key)) {
                return fallback;
            }
            return json.at(key).get<std::vector<std::string>>();
        }
    }

    /**
     * @brief Slicer profile as it appears in the config file and in "listProfiles"
     */
    class SlicerProfileModel : public BaseModel {
    public:
        core::profile::SlicerProfile profile;

        SlicerProfileModel() = default;

        explicit SlicerProfileModel(core::profile::SlicerProfile profile) : profile(std::move(profile)) {}

        explicit SlicerProfileModel(const nlohmann::json &json) { fromJson(json); }

        nlohmann::json toJson() const override {
            const auto &s = profile.settings;
            return nlohmann::json{
                    {"name",          profile.name},
                    {"backend",       core::profile::slicerBackendToString(profile.backend)},
                    {"settings",      {
                                              {"raft", s.raft},
                                              {"support", s.support},
                                              {"infill", s.infill},
                                              {"layerHeight", s.layerHeight},
                                              {"shells", s.shells},
                                              {"extruderTemperature", s.extruderTemperature},
                                              {"platformTemperature", s.platformTemperature},
                                              {"printSpeed", s.printSpeed},
                                              {"travelSpeed", s.travelSpeed}
                                      }},
                    {"withStartEnd",  profile.withStartEnd},
                    {"startSequence", profile.startSequence},
                    {"endSequence",   profile.endSequence}
            };
        }

        /**
         * @throws core::types::ConfigurationException on an unknown backend
         * @throws nlohmann::json::exception on missing or mistyped fields
         */
        void fromJson(const nlohmann::json &json) override {
            profile = {};
            profile.name = json.at("name").get<std::string>();

            std::string backend = json.at("backend").get<std::string>();
            auto parsed = core::profile::slicerBackendFromString(backend);
            if (!parsed) {
                throw core::types::ConfigurationException(
                        "Slicer profile '" + profile.name + "' has unknown backend: " + backend);
            }
            profile.backend = *parsed;

            if (json.contains("settings")) {
                const auto &settings = json.at("settings");
                auto &s = profile.settings;
                s.raft = settings.value("raft", s.raft);
                s.support = settings.value("support", s.support);
                s.infill = settings.value("infill", s.infill);
                s.layerHeight = settings.value("layerHeight", s.layerHeight);
                s.shells = settings.value("shells", s.shells);
                s.extruderTemperature = settings.value("extruderTemperature", s.extruderTemperature);
                s.platformTemperature = settings.value("platformTemperature", s.platformTemperature);
                s.printSpeed = settings.value("printSpeed", s.printSpeed);
                s.travelSpeed = settings.value("travelSpeed", s.travelSpeed);
            }

            profile.withStartEnd = json.value("withStartEnd", false);
            profile.startSequence = detail::readSequence(json, "startSequence");
            profile.endSequence = detail::readSequence(json, "endSequence");
        }

        bool isValid() const override {
            const auto &s = profile.settings;
            return !profile.name.empty() && s.infill >= 0.0 && s.infill <= 1.0 && s.layerHeight > 0.0 &&
                   s.shells >= 0 && s.printSpeed > 0.0 && s.travelSpeed > 0.0;
        }

        std::string getTypeName() const override {
            return "SlicerProfileModel";
        }
    };

    /**
     * @brief Driver profile as it appears in the config file and in "listProfiles"
     */
    class DriverProfileModel : public BaseModel {
    public:
        core::profile::DriverProfile profile;

        DriverProfileModel() = default;

        explicit DriverProfileModel(core::profile::DriverProfile profile) : profile(std::move(profile)) {}

        explicit DriverProfileModel(const nlohmann::json &json) { fromJson(json); }

        nlohmann::json toJson() const override {
            return nlohmann::json{
                    {"name",            profile.name},
                    {"backend",         core::profile::driverBackendToString(profile.backend)},
                    {"baudrate",        profile.baudrate},
                    {"ackTimeoutMs",    profile.ackTimeoutMs},
                    {"temperaturePollMs", profile.temperaturePollMs},
                    {"withStartEnd",    profile.withStartEnd},
                    {"startSequence",   profile.startSequence},
                    {"endSequence",     profile.endSequence},
                    {"abortSequence",   profile.abortSequence},
                    {"outputDirectory", profile.outputDirectory}
            };
        }

        /**
         * @throws core::types::ConfigurationException on an unknown backend
         * @throws nlohmann::json::exception on missing or mistyped fields
         */
        void fromJson(const nlohmann::json &json) override {
            profile = {};
            profile.name = json.at("name").get<std::string>();

            std::string backend = json.at("backend").get<std::string>();
            auto parsed = core::profile::driverBackendFromString(backend);
            if (!parsed) {
                throw core::types::ConfigurationException(
                        "Driver profile '" + profile.name + "' has unknown backend: " + backend);
            }
            profile.backend = *parsed;

            profile.baudrate = json.value("baudrate", profile.baudrate);
            profile.ackTimeoutMs = json.value("ackTimeoutMs", profile.ackTimeoutMs);
            profile.temperaturePollMs = json.value("temperaturePollMs", profile.temperaturePollMs);
            profile.withStartEnd = json.value("withStartEnd", profile.withStartEnd);
            profile.startSequence = detail::readSequence(json, "startSequence");
            profile.endSequence = detail::readSequence(json, "endSequence");
            profile.abortSequence = detail::readSequence(json, "abortSequence", profile.abortSequence);
            profile.outputDirectory = json.value("outputDirectory", profile.outputDirectory);
        }

        bool isValid() const override {
            return !profile.name.empty() && profile.baudrate > 0 && profile.ackTimeoutMs > 0 &&
                   profile.temperaturePollMs >= 0;
        }

        std::string getTypeName() const override {
            return "DriverProfileModel";
        }
    };

}
