#include "connector/rpc/RpcGateway.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

namespace connector::rpc {

    RpcGateway::RpcGateway(address::Address address,
                           std::shared_ptr<RpcDispatcher> dispatcher,
                           std::shared_ptr<core::events::EventBus> eventBus,
                           int threads)
            : address_(std::move(address)),
              dispatcher_(std::move(dispatcher)),
              eventBus_(std::move(eventBus)),
              threadCount_(threads),
              acceptor_(ioContext_) {
        if (!dispatcher_) {
            throw std::invalid_argument("RpcDispatcher cannot be null");
        }
        if (!eventBus_) {
            throw std::invalid_argument("EventBus cannot be null");
        }
        if (threadCount_ <= 0) {
            throw std::invalid_argument("RpcGateway needs at least one thread");
        }
    }

    RpcGateway::~RpcGateway() {
        stop();
    }

    RpcGateway::Protocol::endpoint RpcGateway::resolveEndpoint() {
        if (address_.kind == address::AddressKind::PIPE) {
            std::error_code ec;
            if (fs::exists(address_.path, ec)) {
                Logger::logWarning("[RpcGateway] Removing stale socket " + address_.path);
                fs::remove(address_.path, ec);
                if (ec) {
                    throw core::types::ConveyorException("Cannot remove stale socket " + address_.path + ": " +
                                                         ec.message());
                }
            }
            return boost::asio::local::stream_protocol::endpoint(address_.path);
        }

        boost::asio::ip::tcp::resolver resolver(ioContext_);
        boost::system::error_code ec;
        auto results = resolver.resolve(address_.host, std::to_string(address_.port),
                                        boost::asio::ip::tcp::resolver::passive, ec);
        if (ec || results.empty()) {
            throw core::types::ConveyorException("Cannot resolve " + address_.toString() + ": " +
                                                 (ec ? ec.message() : std::string("no addresses")));
        }
        return results.begin()->endpoint();
    }

    void RpcGateway::start() {
        if (running_) {
            Logger::logWarning("[RpcGateway] Already running");
            return;
        }

        Protocol::endpoint endpoint = resolveEndpoint();

        boost::system::error_code ec;
        acceptor_.open(endpoint.protocol(), ec);
        if (!ec && address_.kind == address::AddressKind::TCP) {
            acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
        }
        if (!ec) acceptor_.bind(endpoint, ec);
        if (!ec) acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
        if (ec) {
            boost::system::error_code ignored;
            acceptor_.close(ignored);
            Logger::logError("[RpcGateway] Cannot listen on " + address_.toString() + ": " + ec.message());
            throw core::types::ConveyorException("Cannot listen on " + address_.toString() + ": " + ec.message());
        }

        if (address_.kind == address::AddressKind::PIPE) {
            std::error_code permissionsError;
            fs::permissions(address_.path,
                            fs::perms::owner_read | fs::perms::owner_write |
                            fs::perms::group_read | fs::perms::group_write |
                            fs::perms::others_read | fs::perms::others_write,
                            permissionsError);
            if (permissionsError) {
                Logger::logWarning("[RpcGateway] Cannot chmod " + address_.path + ": " +
                                   permissionsError.message());
            }
        }

        ioContext_.restart();
        workGuard_ = std::make_unique<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
                ioContext_.get_executor());
        running_ = true;

        doAccept();

        for (int i = 0; i < threadCount_; ++i) {
            threads_.emplace_back([this]() { ioContext_.run(); });
        }

        Logger::logInfo("[RpcGateway] Listening on " + address_.toString() +
                        (address_.kind == address::AddressKind::TCP ? " (port " + std::to_string(boundPort()) + ")"
                                                                    : std::string()) +
                        " with " + std::to_string(threadCount_) + " threads");
    }

    void RpcGateway::stop() {
        if (!running_.exchange(false)) {
            return;
        }

        Logger::logInfo("[RpcGateway] Stopping...");

        boost::asio::post(ioContext_, [this]() {
            boost::system::error_code ec;
            acceptor_.close(ec);
        });

        std::set<std::shared_ptr<RpcConnection>> connections;
        {
            std::lock_guard<std::mutex> lock(connectionsMutex_);
            connections = connections_;
        }
        for (const auto &connection: connections) {
            connection->close();
        }

        workGuard_.reset();
        for (auto &thread: threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
        threads_.clear();
        ioContext_.stop();

        {
            std::lock_guard<std::mutex> lock(connectionsMutex_);
            for (const auto &connection: connections_) {
                eventBus_->unsubscribe(connection);
            }
            connections_.clear();
        }

        if (address_.kind == address::AddressKind::PIPE) {
            std::error_code ec;
            fs::remove(address_.path, ec);
        }

        Logger::logInfo("[RpcGateway] Stopped");
    }

    uint16_t RpcGateway::boundPort() const {
        if (address_.kind != address::AddressKind::TCP || !acceptor_.is_open()) {
            return 0;
        }
        boost::system::error_code ec;
        Protocol::endpoint endpoint = acceptor_.local_endpoint(ec);
        if (ec) {
            return 0;
        }
        const sockaddr *raw = endpoint.data();
        if (raw->sa_family == AF_INET) {
            return ntohs(reinterpret_cast<const sockaddr_in *>(raw)->sin_port);
        }
        if (raw->sa_family == AF_INET6) {
            return ntohs(reinterpret_cast<const sockaddr_in6 *>(raw)->sin6_port);
        }
        return 0;
    }

    size_t RpcGateway::connectionCount() const {
        std::lock_guard<std::mutex> lock(connectionsMutex_);
        return connections_.size();
    }

    void RpcGateway::doAccept() {
        acceptor_.async_accept(
                boost::asio::make_strand(ioContext_),
                [this](const boost::system::error_code &ec, Protocol::socket socket) {
                    if (ec) {
                        if (ec != boost::asio::error::operation_aborted) {
                            Logger::logError("[RpcGateway] Accept failed: " + ec.message());
                        }
                        if (running_ && acceptor_.is_open()) {
                            doAccept();
                        }
                        return;
                    }

                    std::shared_ptr<RpcConnection> connection;
                    {
                        std::lock_guard<std::mutex> lock(connectionsMutex_);
                        if (!running_) {
                            boost::system::error_code ignored;
                            socket.close(ignored);
                            return;
                        }
                        std::string peer = "client#" + std::to_string(nextConnectionId_++);
                        connection = std::make_shared<RpcConnection>(
                                std::move(socket), peer, *dispatcher_,
                                [this](const std::shared_ptr<RpcConnection> &closed) {
                                    onConnectionClosed(closed);
                                });
                        connections_.insert(connection);
                    }

                    eventBus_->subscribe(connection);
                    connection->start();

                    if (running_) {
                        doAccept();
                    }
                });
    }

    void RpcGateway::onConnectionClosed(const std::shared_ptr<RpcConnection> &connection) {
        eventBus_->unsubscribe(connection);
        std::lock_guard<std::mutex> lock(connectionsMutex_);
        connections_.erase(connection);
    }

} // namespace connector::rpc
