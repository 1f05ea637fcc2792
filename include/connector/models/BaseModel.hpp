#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace connector::models {

    /**
     * @brief JSON view of a conveyor value (RPC payloads, config entries, Kafka events)
     */
    class BaseModel {
    public:
        virtual ~BaseModel() = default;

        virtual nlohmann::json toJson() const = 0;

        /**
         * @throws nlohmann::json::exception on missing or mistyped fields
         */
        virtual void fromJson(const nlohmann::json &json) = 0;

        virtual bool isValid() const = 0;

        virtual std::string getTypeName() const = 0;

        /**
         * @brief Compact single-line JSON, as written to the wire and to Kafka
         */
        std::string serialize() const {
            return toJson().dump();
        }
    };

} // namespace connector::models
