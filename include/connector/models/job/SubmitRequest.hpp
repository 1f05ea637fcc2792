#pragma once

#include "../BaseModel.hpp"
#include <string>

namespace connector::models::job {

    /**
     * @brief Parameters of the "submit" method
     */
    class SubmitRequest : public BaseModel {
    public:
        std::string model;
        std::string slicer;
        std::string driver;
        std::string device;

        SubmitRequest() = default;

        SubmitRequest(std::string model, std::string slicer, std::string driver, std::string device)
                : model(std::move(model)), slicer(std::move(slicer)), driver(std::move(driver)),
                  device(std::move(device)) {}

        explicit SubmitRequest(const nlohmann::json &json) { fromJson(json); }

        nlohmann::json toJson() const override {
            return nlohmann::json{
                    {"model",  model},
                    {"slicer", slicer},
                    {"driver", driver},
                    {"device", device}
            };
        }

        void fromJson(const nlohmann::json &json) override {
            model = json.at("model").get<std::string>();
            slicer = json.at("slicer").get<std::string>();
            driver = json.at("driver").get<std::string>();
            device = json.at("device").get<std::string>();
        }

        bool isValid() const override {
            return !model.empty() && !slicer.empty() && !driver.empty() && !device.empty();
        }

        std::string getTypeName() const override {
            return "SubmitRequest";
        }
    };

}
