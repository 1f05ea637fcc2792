#pragma once

#include "core/events/EventSystem.hpp"
#include "connector/events/BaseSender.hpp"
#include "connector/models/job/JobEventModel.hpp"
#include <atomic>
#include <memory>

namespace connector::events::job {

    /**
     * @brief Event bus observer forwarding every job event to Kafka
     */
    class KafkaEventSink : public core::events::IEventObserver {
    public:
        explicit KafkaEventSink(std::shared_ptr<BaseSender> sender);

        void onEvent(const core::events::Event &event) override;

        struct Statistics {
            size_t eventsSent = 0;
            size_t sendFailures = 0;
        };

        Statistics getStatistics() const;

    private:
        std::shared_ptr<BaseSender> sender_;
        std::atomic<size_t> eventsSent_{0};
        std::atomic<size_t> sendFailures_{0};
    };

}
