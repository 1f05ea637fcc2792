#include "core/events/EventSystem.hpp"
#include "logger/Logger.hpp"

#include <algorithm>

namespace core::events {

    EventBus::EventBus() = default;

    EventBus::~EventBus() {
        stop();
    }

    void EventBus::start() {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (running_) {
            Logger::logWarning("[EventBus] Already running");
            return;
        }

        running_ = true;
        dispatchThread_ = std::thread([this]() { dispatchLoop(); });
        Logger::logInfo("[EventBus] Dispatcher started");
    }

    void EventBus::stop() {
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (!running_) return;
            running_ = false;
        }
        queueCondition_.notify_all();

        if (dispatchThread_.joinable()) {
            dispatchThread_.join();
        }
        Logger::logInfo("[EventBus] Dispatcher stopped");
    }

    bool EventBus::isRunning() const {
        return running_;
    }

    void EventBus::subscribe(const std::shared_ptr<IEventObserver> &observer) {
        if (!observer) return;
        std::lock_guard<std::mutex> lock(observersMutex_);
        observers_.push_back(observer);
    }

    void EventBus::unsubscribe(const std::shared_ptr<IEventObserver> &observer) {
        std::lock_guard<std::mutex> lock(observersMutex_);
        observers_.erase(std::remove_if(observers_.begin(), observers_.end(),
                                        [&observer](const std::weak_ptr<IEventObserver> &candidate) {
                                            auto locked = candidate.lock();
                                            return !locked || locked == observer;
                                        }),
                         observers_.end());
    }

    uint64_t EventBus::publish(Event event) {
        uint64_t sequence;
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (!running_) {
                Logger::logDebug("[EventBus] Dispatcher not running, dropped event for job " +
                                 std::to_string(event.jobId));
                return 0;
            }
            sequence = nextSequence_++;
            event.sequence = sequence;
            pending_.push_back(std::move(event));
        }
        queueCondition_.notify_one();
        return sequence;
    }

    size_t EventBus::observerCount() const {
        std::lock_guard<std::mutex> lock(observersMutex_);
        return observers_.size();
    }

    size_t EventBus::pendingCount() const {
        std::lock_guard<std::mutex> lock(queueMutex_);
        return pending_.size();
    }

    void EventBus::dispatchLoop() {
        while (true) {
            Event event;
            {
                std::unique_lock<std::mutex> lock(queueMutex_);
                queueCondition_.wait(lock, [this] { return !pending_.empty() || !running_; });

                if (pending_.empty()) {
                    break;
                }
                event = std::move(pending_.front());
                pending_.pop_front();
            }

            deliver(event);
        }
    }

    void EventBus::deliver(const Event &event) {
        std::vector<std::shared_ptr<IEventObserver>> active;
        {
            std::lock_guard<std::mutex> lock(observersMutex_);
            auto it = observers_.begin();
            while (it != observers_.end()) {
                if (auto observer = it->lock()) {
                    active.push_back(std::move(observer));
                    ++it;
                } else {
                    it = observers_.erase(it);
                }
            }
        }

        for (const auto &observer: active) {
            try {
                observer->onEvent(event);
            } catch (const std::exception &e) {
                Logger::logError("[EventBus] Observer failed on event #" + std::to_string(event.sequence) + ": " +
                                 e.what());
            }
        }
    }

} // namespace core::events
