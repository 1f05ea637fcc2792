#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

#include <boost/asio.hpp>

#include "connector/address/Address.hpp"
#include "connector/registry/RpcDispatcher.hpp"
#include "connector/rpc/RpcConnection.hpp"
#include "core/events/EventSystem.hpp"

namespace connector::rpc {

    /**
     * @brief Listens on a TCP or UNIX-domain address and serves JSON-RPC connections
     */
    class RpcGateway {
    public:
        RpcGateway(address::Address address,
                   std::shared_ptr<RpcDispatcher> dispatcher,
                   std::shared_ptr<core::events::EventBus> eventBus,
                   int threads = 2);

        ~RpcGateway();

        RpcGateway(const RpcGateway &) = delete;

        RpcGateway &operator=(const RpcGateway &) = delete;

        /**
         * @throws core::types::ConveyorException if the address cannot be bound
         */
        void start();

        void stop();

        bool isRunning() const { return running_; }

        const address::Address &address() const { return address_; }

        /**
         * @brief Port actually bound, useful when listening on port 0; 0 for pipes
         */
        uint16_t boundPort() const;

        size_t connectionCount() const;

    private:
        using Protocol = boost::asio::generic::stream_protocol;

        address::Address address_;
        std::shared_ptr<RpcDispatcher> dispatcher_;
        std::shared_ptr<core::events::EventBus> eventBus_;
        int threadCount_;

        boost::asio::io_context ioContext_;
        std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> workGuard_;
        boost::asio::basic_socket_acceptor<Protocol> acceptor_;
        std::vector<std::thread> threads_;

        mutable std::mutex connectionsMutex_;
        std::set<std::shared_ptr<RpcConnection>> connections_;
        uint64_t nextConnectionId_ = 1;

        std::atomic<bool> running_{false};

        Protocol::endpoint resolveEndpoint();

        void doAccept();

        void onConnectionClosed(const std::shared_ptr<RpcConnection> &connection);
    };

} // namespace connector::rpc
