#include "connector/rpc/RpcClient.hpp"
#include "connector/models/rpc/RpcMessage.hpp"
#include "connector/registry/RpcDispatcher.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"

namespace connector::rpc {

    RpcClient::RpcClient(address::Address address)
            : address_(std::move(address)), socket_(ioContext_) {
    }

    RpcClient::~RpcClient() {
        close();
    }

    void RpcClient::connect() {
        boost::system::error_code ec;

        if (address_.kind == address::AddressKind::PIPE) {
            boost::asio::local::stream_protocol::endpoint endpoint(address_.path);
            socket_.connect(endpoint, ec);
        } else {
            boost::asio::ip::tcp::resolver resolver(ioContext_);
            auto results = resolver.resolve(address_.host, std::to_string(address_.port), ec);
            if (!ec) {
                ec = boost::asio::error::host_not_found;
                for (const auto &entry: results) {
                    boost::system::error_code attempt;
                    if (socket_.is_open()) {
                        socket_.close(attempt);
                    }
                    socket_.connect(entry.endpoint(), attempt);
                    if (!attempt) {
                        ec = attempt;
                        break;
                    }
                    ec = attempt;
                }
            }
        }

        if (ec) {
            throw core::types::ConveyorException("Cannot connect to " + address_.toString() + ": " + ec.message());
        }
        Logger::logDebug("[RpcClient] Connected to " + address_.toString());
    }

    void RpcClient::close() {
        if (!socket_.is_open()) {
            return;
        }
        boost::system::error_code ec;
        socket_.shutdown(boost::asio::generic::stream_protocol::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    bool RpcClient::isConnected() const {
        return socket_.is_open();
    }

    nlohmann::json RpcClient::call(const std::string &method, const nlohmann::json &params) {
        if (!socket_.is_open()) {
            throw core::types::ConveyorException("Not connected to " + address_.toString());
        }

        int64_t id = nextId_++;
        models::rpc::RpcRequest request(id, method, params);
        std::string line = request.serialize() + "\n";

        boost::system::error_code ec;
        boost::asio::write(socket_, boost::asio::buffer(line), ec);
        if (ec) {
            throw core::types::ConveyorException("Cannot send " + method + ": " + ec.message());
        }

        while (true) {
            auto message = readMessage();
            if (!message) {
                throw core::types::ConveyorException("Connection closed while waiting for " + method);
            }
            if (!message->contains("id")) {
                notifications_.push_back(std::move(*message));
                continue;
            }
            if ((*message)["id"] != id) {
                Logger::logWarning("[RpcClient] Ignoring response with unexpected id: " + (*message)["id"].dump());
                continue;
            }
            if (message->contains("error")) {
                const auto &error = (*message)["error"];
                throw RpcException(error.value("code", models::rpc::ErrorCode::INTERNAL_ERROR),
                                   error.value("message", std::string("Unknown error")),
                                   error.contains("data") ? error["data"] : nlohmann::json());
            }
            return message->value("result", nlohmann::json());
        }
    }

    std::optional<nlohmann::json> RpcClient::readNotification() {
        while (notifications_.empty()) {
            auto message = readMessage();
            if (!message) {
                return std::nullopt;
            }
            if (!message->contains("id")) {
                notifications_.push_back(std::move(*message));
            }
        }
        nlohmann::json notification = std::move(notifications_.front());
        notifications_.pop_front();
        return notification;
    }

    std::optional<nlohmann::json> RpcClient::readMessage() {
        while (true) {
            boost::system::error_code ec;
            std::size_t bytes = boost::asio::read_until(socket_, buffer_, '\n', ec);
            if (ec) {
                if (ec != boost::asio::error::eof) {
                    Logger::logWarning("[RpcClient] Read failed: " + ec.message());
                }
                return std::nullopt;
            }

            std::string line(boost::asio::buffers_begin(buffer_.data()),
                             boost::asio::buffers_begin(buffer_.data()) + static_cast<std::ptrdiff_t>(bytes));
            buffer_.consume(bytes);

            try {
                return nlohmann::json::parse(line);
            } catch (const nlohmann::json::parse_error &e) {
                Logger::logWarning("[RpcClient] Discarding malformed message: " + std::string(e.what()));
            }
        }
    }

} // namespace connector::rpc
