#pragma once

#include "../BaseModel.hpp"
#include "core/device/DeviceRegistry.hpp"
#include <string>

namespace connector::models::device {

    class DeviceModel : public BaseModel {
    public:
        core::device::DeviceStatus status;
        size_t waiting = 0;

        DeviceModel() = default;

        DeviceModel(core::device::DeviceStatus status, size_t waiting)
                : status(std::move(status)), waiting(waiting) {}

        explicit DeviceModel(const nlohmann::json &json) { fromJson(json); }

        nlohmann::json toJson() const override {
            nlohmann::json json = {
                    {"id",        status.config.id},
                    {"port",      status.config.port},
                    {"baudrate",  status.config.baudrate},
                    {"available", status.available},
                    {"waiting",   waiting},
                    {"lastError", status.lastError}
            };
            json["activeJob"] = status.activeJob ? nlohmann::json(*status.activeJob) : nlohmann::json();
            return json;
        }

        void fromJson(const nlohmann::json &json) override {
            status = {};
            status.config.id = json.at("id").get<std::string>();
            status.config.port = json.value("port", status.config.id);
            status.config.baudrate = json.value("baudrate", 0u);
            status.available = json.value("available", true);
            status.lastError = json.value("lastError", "");
            waiting = json.value("waiting", static_cast<size_t>(0));
            if (json.contains("activeJob") && json["activeJob"].is_number_unsigned()) {
                status.activeJob = json["activeJob"].get<core::jobs::JobId>();
            }
        }

        bool isValid() const override {
            return !status.config.id.empty();
        }

        std::string getTypeName() const override {
            return "DeviceModel";
        }
    };

}
