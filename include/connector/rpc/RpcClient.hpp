#pragma once

#include <cstdint>
#include <deque>
#include <optional>
#include <string>

#include <boost/asio.hpp>
#include <nlohmann/json.hpp>

#include "connector/address/Address.hpp"

namespace connector::rpc {

    /**
     * @brief Blocking JSON-RPC client used by the command line tool and the tests
     */
    class RpcClient {
    public:
        explicit RpcClient(address::Address address);

        ~RpcClient();

        RpcClient(const RpcClient &) = delete;

        RpcClient &operator=(const RpcClient &) = delete;

        /**
         * @throws core::types::ConveyorException if the daemon cannot be reached
         */
        void connect();

        void close();

        bool isConnected() const;

        /**
         * @brief Send a request and wait for its response; notifications read meanwhile are kept
         * @throws connector::RpcException when the daemon answers with an error
         * @throws core::types::ConveyorException on connection failure
         */
        nlohmann::json call(const std::string &method, const nlohmann::json &params = nlohmann::json::object());

        /**
         * @brief Next notification, blocking; nullopt once the daemon closes the connection
         */
        std::optional<nlohmann::json> readNotification();

    private:
        address::Address address_;
        boost::asio::io_context ioContext_;
        boost::asio::generic::stream_protocol::socket socket_;
        boost::asio::streambuf buffer_;
        std::deque<nlohmann::json> notifications_;
        int64_t nextId_ = 1;

        std::optional<nlohmann::json> readMessage();
    };

} // namespace connector::rpc
