#pragma once

#include "../BaseModel.hpp"
#include <string>

namespace connector::models::rpc {

    namespace ErrorCode {
        constexpr int PARSE_ERROR = -32700;
        constexpr int INVALID_REQUEST = -32600;
        constexpr int METHOD_NOT_FOUND = -32601;
        constexpr int INVALID_PARAMS = -32602;
        constexpr int INTERNAL_ERROR = -32603;

        constexpr int JOB_NOT_FOUND = -32001;
        constexpr int ALREADY_TERMINAL = -32002;
        constexpr int PROFILE_NOT_FOUND = -32003;
        constexpr int UNSUPPORTED_MODEL_TYPE = -32004;
        constexpr int DEVICE_NOT_FOUND = -32005;
    }

    /**
     * @brief JSON-RPC 2.0 request; a request without "id" is a notification
     */
    class RpcRequest : public BaseModel {
    public:
        nlohmann::json id;
        std::string method;
        nlohmann::json params = nlohmann::json::object();

        RpcRequest() = default;

        RpcRequest(nlohmann::json id, std::string method, nlohmann::json params)
                : id(std::move(id)), method(std::move(method)), params(std::move(params)) {}

        explicit RpcRequest(const nlohmann::json &json) { fromJson(json); }

        nlohmann::json toJson() const override {
            nlohmann::json json = {
                    {"jsonrpc", "2.0"},
                    {"method",  method},
                    {"params",  params}
            };
            if (!id.is_null()) {
                json["id"] = id;
            }
            return json;
        }

        void fromJson(const nlohmann::json &json) override {
            id = json.contains("id") ? json.at("id") : nlohmann::json();
            method = json.at("method").get<std::string>();
            params = json.contains("params") ? json.at("params") : nlohmann::json::object();
        }

        bool isValid() const override {
            return !method.empty() && (params.is_object() || params.is_array()) &&
                   (id.is_null() || id.is_number_integer() || id.is_string());
        }

        bool isNotification() const {
            return id.is_null();
        }

        std::string getTypeName() const override {
            return "RpcRequest";
        }
    };

    inline nlohmann::json makeResult(const nlohmann::json &id, const nlohmann::json &result) {
        return {{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
    }

    inline nlohmann::json makeError(const nlohmann::json &id, int code, const std::string &message,
                                    const nlohmann::json &data = nullptr) {
        nlohmann::json error = {{"code", code}, {"message", message}};
        if (!data.is_null()) {
            error["data"] = data;
        }
        return {{"jsonrpc", "2.0"}, {"id", id}, {"error", error}};
    }

    inline nlohmann::json makeNotification(const std::string &method, const nlohmann::json &params) {
        return {{"jsonrpc", "2.0"}, {"method", method}, {"params", params}};
    }

}
