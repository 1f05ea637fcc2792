#pragma once

#include "../BaseModel.hpp"
#include <string>

namespace connector::models::job {

    /**
     * @brief Parameters of the "slice" method
     */
    class SliceRequest : public BaseModel {
    public:
        std::string model;
        std::string slicer;
        std::string output;

        SliceRequest() = default;

        SliceRequest(std::string model, std::string slicer, std::string output)
                : model(std::move(model)), slicer(std::move(slicer)), output(std::move(output)) {}

        explicit SliceRequest(const nlohmann::json &json) { fromJson(json); }

        nlohmann::json toJson() const override {
            return nlohmann::json{
                    {"model",  model},
                    {"slicer", slicer},
                    {"output", output}
            };
        }

        void fromJson(const nlohmann::json &json) override {
            model = json.at("model").get<std::string>();
            slicer = json.at("slicer").get<std::string>();
            output = json.at("output").get<std::string>();
        }

        bool isValid() const override {
            return !model.empty() && !slicer.empty() && !output.empty();
        }

        std::string getTypeName() const override {
            return "SliceRequest";
        }
    };

}
