#pragma once

#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace connector {

    /**
     * @brief Thrown by a method handler; becomes a JSON-RPC error object
     */
    class RpcException : public std::runtime_error {
    public:
        RpcException(int code, const std::string &message, nlohmann::json data = nullptr)
                : std::runtime_error(message), code_(code), data_(std::move(data)) {}

        int code() const { return code_; }

        const nlohmann::json &data() const { return data_; }

    private:
        int code_;
        nlohmann::json data_;
    };

    /**
     * @brief Per-connection state visible to method handlers
     */
    class RpcSession {
    public:
        virtual ~RpcSession() = default;

        virtual void setSubscribed(bool subscribed) = 0;

        virtual bool isSubscribed() const = 0;

        virtual std::string peer() const = 0;
    };

    using RpcHandler = std::function<nlohmann::json(const nlohmann::json &params, RpcSession &session)>;

    /**
     * @brief Method name to handler table for the JSON-RPC gateway
     */
    class RpcDispatcher {
    public:
        void registerHandler(const std::string &method, RpcHandler handler);

        bool hasMethod(const std::string &method) const;

        std::vector<std::string> methods() const;

        /**
         * @brief Handle one request line
         * @return The response, or null when the request was a notification
         */
        nlohmann::json handle(const std::string &line, RpcSession &session) const;

        nlohmann::json handle(const nlohmann::json &request, RpcSession &session) const;

    private:
        mutable std::mutex handlersMutex_;
        std::unordered_map<std::string, RpcHandler> handlers_;

        RpcHandler find(const std::string &method) const;
    };
}
