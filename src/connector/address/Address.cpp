#include "connector/address/Address.hpp"

#include <algorithm>
#include <cctype>

namespace connector::address {

    Address Address::parse(const std::string &value) {
        auto colon = value.find(':');
        std::string protocol = colon == std::string::npos ? value : value.substr(0, colon);
        std::string rest = colon == std::string::npos ? "" : value.substr(colon + 1);

        if (protocol == "pipe") {
            if (rest.empty()) {
                throw AddressException(AddressError::MISSING_PATH, "Missing pipe path in address: " + value);
            }
            return pipe(rest);
        }

        if (protocol != "tcp") {
            throw AddressException(AddressError::UNKNOWN_PROTOCOL, "Unknown protocol in address: " + value);
        }

        // Host may not contain ':', the port is everything after the last one
        auto portSeparator = rest.rfind(':');
        std::string host = portSeparator == std::string::npos ? rest : rest.substr(0, portSeparator);
        std::string port = portSeparator == std::string::npos ? "" : rest.substr(portSeparator + 1);

        if (host.empty()) {
            throw AddressException(AddressError::MISSING_HOST, "Missing host in address: " + value);
        }
        if (port.empty()) {
            throw AddressException(AddressError::MISSING_PORT, "Missing port in address: " + value);
        }

        bool numeric = port.size() <= 5 && std::all_of(port.begin(), port.end(), [](unsigned char c) {
            return std::isdigit(c) != 0;
        });
        if (!numeric || std::stoul(port) > 65535) {
            throw AddressException(AddressError::INVALID_PORT, "Invalid port in address: " + value);
        }

        return tcp(host, static_cast<uint16_t>(std::stoul(port)));
    }

    std::string Address::toString() const {
        if (kind == AddressKind::TCP) {
            return "tcp:" + host + ":" + std::to_string(port);
        }
        return "pipe:" + path;
    }

} // namespace connector::address
