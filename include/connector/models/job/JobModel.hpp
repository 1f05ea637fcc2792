#pragma once

#include "../BaseModel.hpp"
#include "connector/models/device/TemperatureModel.hpp"
#include "connector/utils/Time.hpp"
#include "core/jobs/Job.hpp"
#include <string>

namespace connector::models::job {

    /**
     * @brief Wire form of a job snapshot
     */
    class JobModel : public BaseModel {
    public:
        core::jobs::JobSnapshot job;

        JobModel() = default;

        explicit JobModel(core::jobs::JobSnapshot snapshot) : job(std::move(snapshot)) {}

        explicit JobModel(const nlohmann::json &json) { fromJson(json); }

        nlohmann::json toJson() const override {
            nlohmann::json history = nlohmann::json::array();
            for (const auto &transition: job.history) {
                history.push_back({
                                          {"from",      transition.from
                                                        ? nlohmann::json(core::jobs::jobStateToString(*transition.from))
                                                        : nlohmann::json()},
                                          {"to",        core::jobs::jobStateToString(transition.to)},
                                          {"timestamp", utils::toMillis(transition.timestamp)},
                                          {"message",   transition.message}
                                  });
            }

            nlohmann::json json = {
                    {"id",              job.id},
                    {"kind",            core::jobs::jobKindToString(job.kind)},
                    {"model",           job.modelRef},
                    {"slicerProfile",   job.slicerProfile},
                    {"driverProfile",   job.driverProfile},
                    {"device",          job.deviceId},
                    {"state",           core::jobs::jobStateToString(job.state)},
                    {"stateCode",       core::jobs::jobStateToCode(job.state)},
                    {"cancelRequested", job.cancelRequested},
                    {"evicted",         job.evicted},
                    {"createdAt",       utils::toMillis(job.createdAt)},
                    {"lastUpdate",      utils::toMillis(job.lastUpdate)},
                    {"history",         history}
            };
            json["progress"] = job.progress ? nlohmann::json(*job.progress) : nlohmann::json();
            json["error"] = job.error ? nlohmann::json(*job.error) : nlohmann::json();
            json["toolpath"] = job.toolpath ? nlohmann::json(*job.toolpath) : nlohmann::json();
            json["waitPosition"] = job.waitPosition ? nlohmann::json(*job.waitPosition) : nlohmann::json();
            json["temperature"] = job.temperature ? device::TemperatureModel(*job.temperature).toJson()
                                                  : nlohmann::json();
            return json;
        }

        void fromJson(const nlohmann::json &json) override {
            job = {};
            job.id = json.at("id").get<core::jobs::JobId>();
            job.kind = json.value("kind", "print") == "slice" ? core::jobs::JobKind::SLICE
                                                              : core::jobs::JobKind::PRINT;
            job.modelRef = json.at("model").get<std::string>();
            job.slicerProfile = json.value("slicerProfile", "");
            job.driverProfile = json.value("driverProfile", "");
            job.deviceId = json.at("device").get<std::string>();
            job.state = core::jobs::jobStateFromString(json.at("state").get<std::string>())
                    .value_or(core::jobs::JobState::CREATED);
            job.cancelRequested = json.value("cancelRequested", false);
            job.evicted = json.value("evicted", false);
            job.createdAt = utils::fromMillis(json.value("createdAt", 0LL));
            job.lastUpdate = utils::fromMillis(json.value("lastUpdate", 0LL));

            if (json.contains("progress") && json["progress"].is_number()) {
                job.progress = json["progress"].get<double>();
            }
            if (json.contains("error") && json["error"].is_string()) {
                job.error = json["error"].get<std::string>();
            }
            if (json.contains("toolpath") && json["toolpath"].is_string()) {
                job.toolpath = json["toolpath"].get<std::string>();
            }
            if (json.contains("waitPosition") && json["waitPosition"].is_number_unsigned()) {
                job.waitPosition = json["waitPosition"].get<size_t>();
            }
            if (json.contains("temperature") && json["temperature"].is_object()) {
                job.temperature = device::TemperatureModel(json["temperature"]).report;
            }

            if (json.contains("history") && json["history"].is_array()) {
                for (const auto &entry: json["history"]) {
                    core::jobs::StateTransition transition;
                    if (entry.contains("from") && entry["from"].is_string()) {
                        transition.from = core::jobs::jobStateFromString(entry["from"].get<std::string>());
                    }
                    transition.to = core::jobs::jobStateFromString(entry.at("to").get<std::string>())
                            .value_or(core::jobs::JobState::CREATED);
                    transition.timestamp = utils::fromMillis(entry.value("timestamp", 0LL));
                    transition.message = entry.value("message", "");
                    job.history.push_back(transition);
                }
            }
        }

        bool isValid() const override {
            bool placed = job.kind == core::jobs::JobKind::SLICE || !job.deviceId.empty();
            return job.id != 0 && !job.modelRef.empty() && placed;
        }

        std::string getTypeName() const override {
            return "JobModel";
        }
    };

}
