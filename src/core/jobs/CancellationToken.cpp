#include "core/jobs/CancellationToken.hpp"
#include "logger/Logger.hpp"

#include <utility>

namespace core::jobs {

    CancellationToken::Registration::Registration(Registration &&other) noexcept
            : token_(other.token_), id_(other.id_) {
        other.token_ = nullptr;
        other.id_ = 0;
    }

    CancellationToken::Registration &CancellationToken::Registration::operator=(Registration &&other) noexcept {
        if (this != &other) {
            if (token_) {
                token_->unsubscribe(id_);
            }
            token_ = other.token_;
            id_ = other.id_;
            other.token_ = nullptr;
            other.id_ = 0;
        }
        return *this;
    }

    CancellationToken::Registration::~Registration() {
        if (token_) {
            token_->unsubscribe(id_);
        }
    }

    void CancellationToken::cancel() {
        std::lock_guard<std::mutex> lock(callbacksMutex_);
        if (cancelled_.exchange(true)) {
            return;
        }

        for (auto &[id, callback]: callbacks_) {
            try {
                callback();
            } catch (const std::exception &e) {
                Logger::logError("[CancellationToken] Callback " + std::to_string(id) + " failed: " + e.what());
            }
        }
        callbacks_.clear();
    }

    CancellationToken::Registration CancellationToken::subscribe(Callback callback) {
        std::unique_lock<std::mutex> lock(callbacksMutex_);
        if (cancelled_) {
            lock.unlock();
            callback();
            return {};
        }

        uint64_t id = nextId_++;
        callbacks_.emplace(id, std::move(callback));
        return {this, id};
    }

    void CancellationToken::unsubscribe(uint64_t id) {
        std::lock_guard<std::mutex> lock(callbacksMutex_);
        callbacks_.erase(id);
    }

} // namespace core::jobs
