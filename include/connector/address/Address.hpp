#pragma once

#include "core/types/Error.hpp"
#include <cstdint>
#include <string>

namespace connector::address {

    enum class AddressKind {
        TCP,
        PIPE
    };

    enum class AddressError {
        UNKNOWN_PROTOCOL,
        MISSING_HOST,
        MISSING_PORT,
        INVALID_PORT,
        MISSING_PATH
    };

    class AddressException : public core::types::InvalidAddressException {
    public:
        AddressException(AddressError error, const std::string &msg)
                : InvalidAddressException(msg), error_(error) {}

        AddressError error() const { return error_; }

    private:
        AddressError error_;
    };

    /**
     * @brief Where the daemon listens: "tcp:<host>:<port>" or "pipe:<path>" (UNIX-domain socket)
     */
    struct Address {
        AddressKind kind = AddressKind::PIPE;
        std::string host;
        uint16_t port = 0;
        std::string path;

        /**
         * @throws AddressException
         */
        static Address parse(const std::string &value);

        std::string toString() const;

        static Address tcp(const std::string &host, uint16_t port) {
            return {AddressKind::TCP, host, port, ""};
        }

        static Address pipe(const std::string &path) {
            return {AddressKind::PIPE, "", 0, path};
        }
    };

} // namespace connector::address
