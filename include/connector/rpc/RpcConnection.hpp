#pragma once

#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <string>

#include <boost/asio.hpp>
#include <nlohmann/json.hpp>

#include "connector/registry/RpcDispatcher.hpp"
#include "core/events/EventSystem.hpp"

namespace connector::rpc {

    /**
     * @brief One client connection: newline-delimited JSON-RPC in, responses and notifications out.
     *
     * Every handler runs on the socket's strand, so reads, writes and the outbox never race.
     * Events arrive on the event bus thread and are posted onto the strand.
     */
    class RpcConnection : public RpcSession,
                          public core::events::IEventObserver,
                          public std::enable_shared_from_this<RpcConnection> {
    public:
        using Socket = boost::asio::generic::stream_protocol::socket;
        using CloseCallback = std::function<void(const std::shared_ptr<RpcConnection> &)>;

        static constexpr size_t MAX_LINE_LENGTH = 1024 * 1024;

        RpcConnection(Socket socket, std::string peer, const RpcDispatcher &dispatcher, CloseCallback onClosed);

        void start();

        /**
         * @brief Close the socket; the close callback fires once
         */
        void close();

        void send(const nlohmann::json &message);

        void setSubscribed(bool subscribed) override;

        bool isSubscribed() const override;

        std::string peer() const override;

        void onEvent(const core::events::Event &event) override;

    private:
        Socket socket_;
        std::string peer_;
        const RpcDispatcher &dispatcher_;
        CloseCallback onClosed_;

        boost::asio::streambuf buffer_;
        std::deque<std::string> outbox_;
        std::atomic<bool> subscribed_{false};
        std::atomic<bool> closed_{false};

        void doRead();

        void doWrite();

        void handleLine(const std::string &line);

        void closeOnStrand();
    };

} // namespace connector::rpc
