#include "connector/registry/RpcDispatcher.hpp"
#include "connector/models/rpc/RpcMessage.hpp"
#include "logger/Logger.hpp"
#include <algorithm>

namespace connector {

    using models::rpc::ErrorCode::INTERNAL_ERROR;
    using models::rpc::ErrorCode::INVALID_PARAMS;
    using models::rpc::ErrorCode::INVALID_REQUEST;
    using models::rpc::ErrorCode::METHOD_NOT_FOUND;
    using models::rpc::ErrorCode::PARSE_ERROR;

    void RpcDispatcher::registerHandler(const std::string &method, RpcHandler handler) {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        handlers_[method] = std::move(handler);
    }

    bool RpcDispatcher::hasMethod(const std::string &method) const {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        return handlers_.count(method) > 0;
    }

    std::vector<std::string> RpcDispatcher::methods() const {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        std::vector<std::string> names;
        names.reserve(handlers_.size());
        for (const auto &entry: handlers_) {
            names.push_back(entry.first);
        }
        std::sort(names.begin(), names.end());
        return names;
    }

    RpcHandler RpcDispatcher::find(const std::string &method) const {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        auto it = handlers_.find(method);
        return it != handlers_.end() ? it->second : RpcHandler();
    }

    nlohmann::json RpcDispatcher::handle(const std::string &line, RpcSession &session) const {
        nlohmann::json request;
        try {
            request = nlohmann::json::parse(line);
        } catch (const nlohmann::json::parse_error &e) {
            Logger::logWarning("[RpcDispatcher] Parse error from " + session.peer() + ": " + e.what());
            return models::rpc::makeError(nullptr, PARSE_ERROR, "Parse error");
        }
        return handle(request, session);
    }

    nlohmann::json RpcDispatcher::handle(const nlohmann::json &request, RpcSession &session) const {
        if (!request.is_object() || !request.contains("method") || !request["method"].is_string()) {
            nlohmann::json id = request.is_object() && request.contains("id") ? request["id"] : nlohmann::json();
            return models::rpc::makeError(id, INVALID_REQUEST, "Invalid request");
        }

        models::rpc::RpcRequest rpcRequest(request);
        if (!rpcRequest.isValid()) {
            return models::rpc::makeError(rpcRequest.id, INVALID_REQUEST, "Invalid request");
        }

        RpcHandler handler = find(rpcRequest.method);
        if (!handler) {
            Logger::logWarning("[RpcDispatcher] Unknown method: " + rpcRequest.method);
            if (rpcRequest.isNotification()) {
                return nullptr;
            }
            return models::rpc::makeError(rpcRequest.id, METHOD_NOT_FOUND, "Method not found: " + rpcRequest.method);
        }

        nlohmann::json result;
        try {
            result = handler(rpcRequest.params, session);
        } catch (const RpcException &e) {
            Logger::logDebug("[RpcDispatcher] " + rpcRequest.method + " failed: " + e.what());
            return rpcRequest.isNotification() ? nlohmann::json()
                                               : models::rpc::makeError(rpcRequest.id, e.code(), e.what(), e.data());
        } catch (const nlohmann::json::exception &e) {
            Logger::logWarning("[RpcDispatcher] Bad params for " + rpcRequest.method + ": " + e.what());
            return rpcRequest.isNotification() ? nlohmann::json()
                                               : models::rpc::makeError(rpcRequest.id, INVALID_PARAMS,
                                                                        "Invalid params: " + std::string(e.what()));
        } catch (const std::exception &e) {
            Logger::logError("[RpcDispatcher] " + rpcRequest.method + " raised: " + std::string(e.what()));
            return rpcRequest.isNotification() ? nlohmann::json()
                                               : models::rpc::makeError(rpcRequest.id, INTERNAL_ERROR, e.what());
        }

        if (rpcRequest.isNotification()) {
            return nullptr;
        }
        return models::rpc::makeResult(rpcRequest.id, result);
    }
}
