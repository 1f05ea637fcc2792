#pragma once

#include <string>

namespace core::types {

    enum class ResultCode {
        Success,
        Error,
        NotFound,
        AlreadyTerminal
    };

    /**
     * @brief Outcome of a control operation (cancel, reconnect)
     */
    struct Result {
        ResultCode code;
        std::string message;

        inline bool isSuccess() const {
            return code == ResultCode::Success;
        }

        inline bool isError() const {
            return code == ResultCode::Error;
        }

        inline bool isNotFound() const {
            return code == ResultCode::NotFound;
        }

        inline bool isAlreadyTerminal() const {
            return code == ResultCode::AlreadyTerminal;
        }

        static inline Result success(const std::string &msg = "Success") {
            return {ResultCode::Success, msg};
        }

        static inline Result error(const std::string &msg = "Error") {
            return {ResultCode::Error, msg};
        }

        static inline Result notFound(const std::string &msg = "Not found") {
            return {ResultCode::NotFound, msg};
        }

        static inline Result alreadyTerminal(const std::string &msg = "Already terminal") {
            return {ResultCode::AlreadyTerminal, msg};
        }
    };

    inline std::string resultCodeToString(ResultCode code) {
        switch (code) {
            case ResultCode::Success: return "Success";
            case ResultCode::Error: return "Error";
            case ResultCode::NotFound: return "NotFound";
            case ResultCode::AlreadyTerminal: return "AlreadyTerminal";
            default: return "Unknown";
        }
    }

}
