#pragma once

#include "connector/registry/RpcDispatcher.hpp"
#include "core/orchestrator/JobOrchestrator.hpp"
#include <memory>

namespace connector::controllers {

    /**
     * @brief Binds the job RPC methods to the orchestrator
     */
    class JobController {
    public:
        explicit JobController(std::shared_ptr<core::orchestrator::JobOrchestrator> orchestrator);

        void registerMethods(RpcDispatcher &dispatcher);

        nlohmann::json hello(const nlohmann::json &params, RpcSession &session) const;

        nlohmann::json submit(const nlohmann::json &params) const;

        /**
         * @brief Slice a model to an output file on the daemon host; no device is involved
         */
        nlohmann::json slice(const nlohmann::json &params) const;

        nlohmann::json cancel(const nlohmann::json &params) const;

        nlohmann::json status(const nlohmann::json &params) const;

        nlohmann::json list(const nlohmann::json &params) const;

        nlohmann::json listProfiles() const;

        nlohmann::json devices() const;

        nlohmann::json reconnect(const nlohmann::json &params) const;

    private:
        std::shared_ptr<core::orchestrator::JobOrchestrator> orchestrator_;

        static core::jobs::JobId jobIdParam(const nlohmann::json &params);
    };

} // namespace connector::controllers
