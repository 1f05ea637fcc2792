#pragma once

#include "../BaseModel.hpp"
#include "connector/models/device/TemperatureModel.hpp"
#include "connector/utils/Time.hpp"
#include "core/events/EventSystem.hpp"
#include <string>

namespace connector::models::job {

    /**
     * @brief Payload of "jobchanged" notifications and Kafka job events
     */
    class JobEventModel : public BaseModel {
    public:
        core::events::Event event;

        JobEventModel() = default;

        explicit JobEventModel(core::events::Event event) : event(std::move(event)) {}

        explicit JobEventModel(const nlohmann::json &json) { fromJson(json); }

        nlohmann::json toJson() const override {
            nlohmann::json json = {
                    {"sequence",  event.sequence},
                    {"type",      core::events::eventTypeToString(event.type)},
                    {"jobId",     event.jobId},
                    {"device",    event.deviceId},
                    {"newState",  core::jobs::jobStateToString(event.newState)},
                    {"message",   event.message},
                    {"timestamp", utils::toMillis(event.timestamp)}
            };
            json["oldState"] = event.oldState ? nlohmann::json(core::jobs::jobStateToString(*event.oldState))
                                              : nlohmann::json();
            json["progress"] = event.progress ? nlohmann::json(*event.progress) : nlohmann::json();
            if (event.temperature) {
                json["temperature"] = device::TemperatureModel(*event.temperature).toJson();
            }
            return json;
        }

        void fromJson(const nlohmann::json &json) override {
            event = {};
            event.sequence = json.at("sequence").get<uint64_t>();
            event.type = json.at("type").get<std::string>() == "progress" ? core::events::EventType::JOB_PROGRESS
                                                                          : core::events::EventType::JOB_STATE_CHANGED;
            event.jobId = json.at("jobId").get<core::jobs::JobId>();
            event.deviceId = json.value("device", "");
            event.newState = core::jobs::jobStateFromString(json.at("newState").get<std::string>())
                    .value_or(core::jobs::JobState::CREATED);
            if (json.contains("oldState") && json["oldState"].is_string()) {
                event.oldState = core::jobs::jobStateFromString(json["oldState"].get<std::string>());
            }
            if (json.contains("progress") && json["progress"].is_number()) {
                event.progress = json["progress"].get<double>();
            }
            if (json.contains("temperature") && json["temperature"].is_object()) {
                event.temperature = device::TemperatureModel(json["temperature"]).report;
            }
            event.message = json.value("message", "");
            event.timestamp = utils::fromMillis(json.value("timestamp", 0LL));
        }

        bool isValid() const override {
            return event.sequence != 0 && event.jobId != 0;
        }

        std::string getTypeName() const override {
            return "JobEventModel";
        }
    };

}
