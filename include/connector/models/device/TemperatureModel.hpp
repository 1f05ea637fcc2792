#pragma once

#include "../BaseModel.hpp"
#include "core/device/TemperatureReport.hpp"
#include <string>

namespace connector::models::device {

    /**
     * @brief Wire form of a temperature report:
     * {"tools": {"0": {"current": 210.0, "target": 210.0}}, "heatedPlatforms": {"0": {...}}}
     */
    class TemperatureModel : public BaseModel {
    public:
        core::device::TemperatureReport report;

        TemperatureModel() = default;

        explicit TemperatureModel(core::device::TemperatureReport report) : report(std::move(report)) {}

        explicit TemperatureModel(const nlohmann::json &json) { fromJson(json); }

        nlohmann::json toJson() const override {
            return nlohmann::json{
                    {"tools",           heatersToJson(report.tools)},
                    {"heatedPlatforms", heatersToJson(report.heatedPlatforms)}
            };
        }

        void fromJson(const nlohmann::json &json) override {
            report = {};
            heatersFromJson(json.value("tools", nlohmann::json::object()), report.tools);
            heatersFromJson(json.value("heatedPlatforms", nlohmann::json::object()), report.heatedPlatforms);
        }

        bool isValid() const override {
            return !report.empty();
        }

        std::string getTypeName() const override {
            return "TemperatureModel";
        }

    private:
        static nlohmann::json heatersToJson(const std::map<int, core::device::HeaterReading> &heaters) {
            nlohmann::json json = nlohmann::json::object();
            for (const auto &[index, reading]: heaters) {
                json[std::to_string(index)] = {
                        {"current", reading.current},
                        {"target",  reading.target ? nlohmann::json(*reading.target) : nlohmann::json()}
                };
            }
            return json;
        }

        static void heatersFromJson(const nlohmann::json &json, std::map<int, core::device::HeaterReading> &heaters) {
            for (const auto &heater: json.items()) {
                const auto &value = heater.value();
                core::device::HeaterReading reading;
                reading.current = value.at("current").get<double>();
                if (value.contains("target") && value["target"].is_number()) {
                    reading.target = value["target"].get<double>();
                }
                heaters[std::stoi(heater.key())] = reading;
            }
        }
    };

}
