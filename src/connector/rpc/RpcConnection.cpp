#include "connector/rpc/RpcConnection.hpp"
#include "connector/models/job/JobEventModel.hpp"
#include "connector/models/rpc/RpcMessage.hpp"
#include "logger/Logger.hpp"

namespace connector::rpc {

    RpcConnection::RpcConnection(Socket socket, std::string peer, const RpcDispatcher &dispatcher,
                                 CloseCallback onClosed)
            : socket_(std::move(socket)),
              peer_(std::move(peer)),
              dispatcher_(dispatcher),
              onClosed_(std::move(onClosed)),
              buffer_(MAX_LINE_LENGTH) {
    }

    void RpcConnection::start() {
        Logger::logInfo("[RpcConnection] Client connected: " + peer_);
        auto self = shared_from_this();
        boost::asio::post(socket_.get_executor(), [self]() { self->doRead(); });
    }

    void RpcConnection::doRead() {
        auto self = shared_from_this();
        boost::asio::async_read_until(
                socket_, buffer_, '\n',
                [self](const boost::system::error_code &ec, std::size_t bytes) {
                    if (ec) {
                        if (ec == boost::asio::error::not_found) {
                            Logger::logWarning("[RpcConnection] Request line from " + self->peer_ + " exceeds " +
                                               std::to_string(MAX_LINE_LENGTH) + " bytes");
                            self->send(models::rpc::makeError(nullptr, models::rpc::ErrorCode::INVALID_REQUEST,
                                                              "Request too large"));
                        } else if (ec != boost::asio::error::eof && ec != boost::asio::error::operation_aborted) {
                            Logger::logWarning("[RpcConnection] Read from " + self->peer_ + " failed: " +
                                               ec.message());
                        }
                        self->closeOnStrand();
                        return;
                    }

                    std::string line(boost::asio::buffers_begin(self->buffer_.data()),
                                     boost::asio::buffers_begin(self->buffer_.data()) +
                                     static_cast<std::ptrdiff_t>(bytes));
                    self->buffer_.consume(bytes);

                    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
                        line.pop_back();
                    }
                    if (!line.empty()) {
                        self->handleLine(line);
                    }
                    if (!self->closed_) {
                        self->doRead();
                    }
                });
    }

    void RpcConnection::handleLine(const std::string &line) {
        Logger::logDebug("[RpcConnection] " + peer_ + " -> " + line);
        nlohmann::json response = dispatcher_.handle(line, *this);
        if (!response.is_null()) {
            send(response);
        }
    }

    void RpcConnection::send(const nlohmann::json &message) {
        if (closed_) {
            return;
        }
        auto self = shared_from_this();
        std::string data = message.dump() + "\n";
        boost::asio::post(socket_.get_executor(), [self, data = std::move(data)]() mutable {
            if (self->closed_) {
                return;
            }
            bool idle = self->outbox_.empty();
            self->outbox_.push_back(std::move(data));
            if (idle) {
                self->doWrite();
            }
        });
    }

    void RpcConnection::doWrite() {
        auto self = shared_from_this();
        boost::asio::async_write(
                socket_, boost::asio::buffer(outbox_.front()),
                [self](const boost::system::error_code &ec, std::size_t) {
                    if (ec) {
                        if (ec != boost::asio::error::operation_aborted) {
                            Logger::logWarning("[RpcConnection] Write to " + self->peer_ + " failed: " +
                                               ec.message());
                        }
                        self->closeOnStrand();
                        return;
                    }
                    self->outbox_.pop_front();
                    if (!self->outbox_.empty()) {
                        self->doWrite();
                    }
                });
    }

    void RpcConnection::close() {
        auto self = shared_from_this();
        boost::asio::post(socket_.get_executor(), [self]() { self->closeOnStrand(); });
    }

    void RpcConnection::closeOnStrand() {
        if (closed_.exchange(true)) {
            return;
        }
        subscribed_ = false;
        outbox_.clear();

        boost::system::error_code ec;
        socket_.shutdown(Socket::shutdown_both, ec);
        socket_.close(ec);

        Logger::logInfo("[RpcConnection] Client disconnected: " + peer_);
        if (onClosed_) {
            onClosed_(shared_from_this());
        }
    }

    void RpcConnection::setSubscribed(bool subscribed) {
        subscribed_ = subscribed;
    }

    bool RpcConnection::isSubscribed() const {
        return subscribed_;
    }

    std::string RpcConnection::peer() const {
        return peer_;
    }

    void RpcConnection::onEvent(const core::events::Event &event) {
        if (!subscribed_ || closed_) {
            return;
        }
        send(models::rpc::makeNotification("jobchanged", models::job::JobEventModel(event).toJson()));
    }

} // namespace connector::rpc
