#include "connector/controllers/JobController.hpp"
#include "connector/models/device/DeviceModel.hpp"
#include "connector/models/job/JobModel.hpp"
#include "connector/models/job/SliceRequest.hpp"
#include "connector/models/job/SubmitRequest.hpp"
#include "connector/models/profile/ProfileModel.hpp"
#include "connector/models/rpc/RpcMessage.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"
#include <stdexcept>

namespace connector::controllers {

    namespace ErrorCode = models::rpc::ErrorCode;

    namespace {
        constexpr const char *SERVER_NAME = "conveyord";
        constexpr const char *SERVER_VERSION = "1.0.0";

        /**
         * @brief Named parameter, or positional one when params is an array
         */
        const nlohmann::json &param(const nlohmann::json &params, const char *name, size_t index) {
            if (params.is_array()) {
                if (index < params.size()) {
                    return params[index];
                }
            } else if (params.contains(name)) {
                return params[name];
            }
            throw RpcException(ErrorCode::INVALID_PARAMS, std::string("Missing parameter: ") + name);
        }
    }

    JobController::JobController(std::shared_ptr<core::orchestrator::JobOrchestrator> orchestrator)
            : orchestrator_(std::move(orchestrator)) {
        if (!orchestrator_) {
            throw std::invalid_argument("JobOrchestrator cannot be null");
        }
    }

    void JobController::registerMethods(RpcDispatcher &dispatcher) {
        dispatcher.registerHandler("hello", [this](const nlohmann::json &params, RpcSession &session) {
            return hello(params, session);
        });
        dispatcher.registerHandler("submit", [this](const nlohmann::json &params, RpcSession &) {
            return submit(params);
        });
        dispatcher.registerHandler("slice", [this](const nlohmann::json &params, RpcSession &) {
            return slice(params);
        });
        dispatcher.registerHandler("cancel", [this](const nlohmann::json &params, RpcSession &) {
            return cancel(params);
        });
        dispatcher.registerHandler("status", [this](const nlohmann::json &params, RpcSession &) {
            return status(params);
        });
        dispatcher.registerHandler("list", [this](const nlohmann::json &params, RpcSession &) {
            return list(params);
        });
        dispatcher.registerHandler("listProfiles", [this](const nlohmann::json &, RpcSession &) {
            return listProfiles();
        });
        dispatcher.registerHandler("devices", [this](const nlohmann::json &, RpcSession &) {
            return devices();
        });
        dispatcher.registerHandler("reconnect", [this](const nlohmann::json &params, RpcSession &) {
            return reconnect(params);
        });
        dispatcher.registerHandler("subscribe", [](const nlohmann::json &, RpcSession &session) {
            session.setSubscribed(true);
            Logger::logDebug("[JobController] " + session.peer() + " subscribed");
            return nlohmann::json{{"subscribed", true}};
        });
        dispatcher.registerHandler("unsubscribe", [](const nlohmann::json &, RpcSession &session) {
            session.setSubscribed(false);
            Logger::logDebug("[JobController] " + session.peer() + " unsubscribed");
            return nlohmann::json{{"subscribed", false}};
        });

        Logger::logInfo("[JobController] Registered " + std::to_string(dispatcher.methods().size()) + " methods");
    }

    nlohmann::json JobController::hello(const nlohmann::json &params, RpcSession &session) const {
        (void) params;
        Logger::logInfo("[JobController] Hello from " + session.peer());
        return {
                {"server",  SERVER_NAME},
                {"version", SERVER_VERSION}
        };
    }

    nlohmann::json JobController::submit(const nlohmann::json &params) const {
        models::job::SubmitRequest request;
        if (params.is_array()) {
            request = models::job::SubmitRequest(param(params, "model", 0).get<std::string>(),
                                                 param(params, "slicer", 1).get<std::string>(),
                                                 param(params, "driver", 2).get<std::string>(),
                                                 param(params, "device", 3).get<std::string>());
        } else {
            request.fromJson(params);
        }
        if (!request.isValid()) {
            throw RpcException(ErrorCode::INVALID_PARAMS, "model, slicer, driver and device must not be empty");
        }

        core::jobs::JobId id;
        try {
            id = orchestrator_->submit(request.model, request.slicer, request.driver, request.device);
        } catch (const core::types::ProfileNotFoundException &e) {
            throw RpcException(ErrorCode::PROFILE_NOT_FOUND, e.what(), {{"kind", e.kind()}, {"name", e.name()}});
        } catch (const core::types::UnsupportedModelTypeException &e) {
            throw RpcException(ErrorCode::UNSUPPORTED_MODEL_TYPE, e.what(), {{"model", e.modelRef()}});
        }

        auto snapshot = orchestrator_->status(id);
        if (!snapshot) {
            return {{"id", id}};
        }
        return models::job::JobModel(*snapshot).toJson();
    }

    nlohmann::json JobController::slice(const nlohmann::json &params) const {
        models::job::SliceRequest request;
        if (params.is_array()) {
            request = models::job::SliceRequest(param(params, "model", 0).get<std::string>(),
                                                param(params, "slicer", 1).get<std::string>(),
                                                param(params, "output", 2).get<std::string>());
        } else {
            request.fromJson(params);
        }
        if (!request.isValid()) {
            throw RpcException(ErrorCode::INVALID_PARAMS, "model, slicer and output must not be empty");
        }

        core::jobs::JobId id;
        try {
            id = orchestrator_->slice(request.model, request.slicer, request.output);
        } catch (const core::types::ProfileNotFoundException &e) {
            throw RpcException(ErrorCode::PROFILE_NOT_FOUND, e.what(), {{"kind", e.kind()}, {"name", e.name()}});
        } catch (const core::types::UnsupportedModelTypeException &e) {
            throw RpcException(ErrorCode::UNSUPPORTED_MODEL_TYPE, e.what(), {{"model", e.modelRef()}});
        }

        auto snapshot = orchestrator_->status(id);
        if (!snapshot) {
            return {{"id", id}};
        }
        return models::job::JobModel(*snapshot).toJson();
    }

    nlohmann::json JobController::cancel(const nlohmann::json &params) const {
        core::jobs::JobId id = jobIdParam(params);
        core::types::Result result = orchestrator_->cancel(id);

        if (result.isNotFound()) {
            throw RpcException(ErrorCode::JOB_NOT_FOUND, result.message, {{"id", id}});
        }
        if (result.isAlreadyTerminal()) {
            throw RpcException(ErrorCode::ALREADY_TERMINAL, result.message, {{"id", id}});
        }
        if (result.isError()) {
            throw RpcException(ErrorCode::INTERNAL_ERROR, result.message, {{"id", id}});
        }
        return {{"id", id}, {"message", result.message}};
    }

    nlohmann::json JobController::status(const nlohmann::json &params) const {
        core::jobs::JobId id = jobIdParam(params);
        auto snapshot = orchestrator_->status(id);
        if (!snapshot) {
            throw RpcException(ErrorCode::JOB_NOT_FOUND, "Job not found: " + std::to_string(id), {{"id", id}});
        }
        return models::job::JobModel(*snapshot).toJson();
    }

    nlohmann::json JobController::list(const nlohmann::json &params) const {
        core::jobs::JobFilter filter;
        if (params.is_object()) {
            if (params.contains("state") && !params["state"].is_null()) {
                auto state = core::jobs::jobStateFromString(params["state"].get<std::string>());
                if (!state) {
                    throw RpcException(ErrorCode::INVALID_PARAMS,
                                       "Unknown state: " + params["state"].get<std::string>());
                }
                filter.state = state;
            }
            if (params.contains("device") && !params["device"].is_null()) {
                filter.deviceId = params["device"].get<std::string>();
            }
            filter.activeOnly = params.value("active", false);
        }

        nlohmann::json jobs = nlohmann::json::array();
        for (const auto &snapshot: orchestrator_->list(filter)) {
            jobs.push_back(models::job::JobModel(snapshot).toJson());
        }
        return jobs;
    }

    nlohmann::json JobController::listProfiles() const {
        nlohmann::json slicers = nlohmann::json::array();
        for (const auto &profile: orchestrator_->profiles().slicerProfiles()) {
            slicers.push_back(models::profile::SlicerProfileModel(*profile).toJson());
        }
        nlohmann::json drivers = nlohmann::json::array();
        for (const auto &profile: orchestrator_->profiles().driverProfiles()) {
            drivers.push_back(models::profile::DriverProfileModel(*profile).toJson());
        }
        return {{"slicers", slicers}, {"drivers", drivers}};
    }

    nlohmann::json JobController::devices() const {
        nlohmann::json devices = nlohmann::json::array();
        for (const auto &device: orchestrator_->devices()) {
            size_t waiting = orchestrator_->waitList(device.config.id).size();
            devices.push_back(models::device::DeviceModel(device, waiting).toJson());
        }
        return devices;
    }

    nlohmann::json JobController::reconnect(const nlohmann::json &params) const {
        std::string deviceId = param(params, "device", 0).get<std::string>();
        core::types::Result result = orchestrator_->reconnectDevice(deviceId);
        if (result.isNotFound()) {
            throw RpcException(ErrorCode::DEVICE_NOT_FOUND, result.message, {{"device", deviceId}});
        }
        if (!result.isSuccess()) {
            throw RpcException(ErrorCode::INTERNAL_ERROR, result.message, {{"device", deviceId}});
        }
        return {{"device", deviceId}, {"message", result.message}};
    }

    core::jobs::JobId JobController::jobIdParam(const nlohmann::json &params) {
        const auto &id = param(params, "id", 0);
        if (!id.is_number_unsigned() && !(id.is_number_integer() && id.get<long long>() >= 0)) {
            throw RpcException(ErrorCode::INVALID_PARAMS, "id must be a non-negative integer");
        }
        return id.get<core::jobs::JobId>();
    }

} // namespace connector::controllers
