#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "core/jobs/Job.hpp"

namespace core::events {

    enum class EventType {
        JOB_STATE_CHANGED,
        JOB_PROGRESS
    };

    inline std::string eventTypeToString(EventType type) {
        switch (type) {
            case EventType::JOB_STATE_CHANGED: return "stateChanged";
            case EventType::JOB_PROGRESS: return "progress";
            default: return "unknown";
        }
    }

    struct Event {
        uint64_t sequence = 0;
        EventType type = EventType::JOB_STATE_CHANGED;
        jobs::JobId jobId = 0;
        std::string deviceId;
        std::optional<jobs::JobState> oldState; // absent on creation
        jobs::JobState newState = jobs::JobState::CREATED;
        std::optional<double> progress;
        std::optional<device::TemperatureReport> temperature;
        std::string message;
        std::chrono::system_clock::time_point timestamp;
    };

    class IEventObserver {
    public:
        virtual ~IEventObserver() = default;

        virtual void onEvent(const Event &event) = 0;
    };

    /**
     * @brief Ordered fan-out of job events.
     *
     * publish() only enqueues; a single dispatcher thread delivers, so every observer
     * sees events in the order they were published. Observers are held weakly.
     */
    class EventBus {
    public:
        EventBus();

        ~EventBus();

        EventBus(const EventBus &) = delete;

        EventBus &operator=(const EventBus &) = delete;

        void start();

        /**
         * @brief Deliver what is already queued, then stop the dispatcher
         */
        void stop();

        bool isRunning() const;

        void subscribe(const std::shared_ptr<IEventObserver> &observer);

        void unsubscribe(const std::shared_ptr<IEventObserver> &observer);

        /**
         * @brief Stamp the event with the next sequence number and queue it for delivery
         * @return The assigned sequence number, or 0 when the bus is not running and the event was dropped
         */
        uint64_t publish(Event event);

        size_t observerCount() const;

        size_t pendingCount() const;

    private:
        mutable std::mutex observersMutex_;
        std::vector<std::weak_ptr<IEventObserver>> observers_;

        mutable std::mutex queueMutex_;
        std::condition_variable queueCondition_;
        std::deque<Event> pending_;
        uint64_t nextSequence_ = 1;

        std::atomic<bool> running_{false};
        std::thread dispatchThread_;

        void dispatchLoop();

        void deliver(const Event &event);
    };

} // namespace core::events
