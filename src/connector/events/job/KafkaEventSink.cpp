#include "connector/events/job/KafkaEventSink.hpp"
#include "logger/Logger.hpp"
#include <stdexcept>

namespace connector::events::job {

    KafkaEventSink::KafkaEventSink(std::shared_ptr<BaseSender> sender)
            : sender_(std::move(sender)) {
        if (!sender_) {
            throw std::invalid_argument("BaseSender cannot be null");
        }
    }

    void KafkaEventSink::onEvent(const core::events::Event &event) {
        models::job::JobEventModel model(event);
        if (sender_->sendMessage(model.serialize(), std::to_string(event.jobId))) {
            ++eventsSent_;
            return;
        }
        if (++sendFailures_ == 1) {
            Logger::logWarning("[KafkaEventSink] Could not forward event to " + sender_->getTopicName() +
                               "; further failures are logged at debug level");
        } else {
            Logger::logDebug("[KafkaEventSink] Dropped event " + std::to_string(event.sequence));
        }
    }

    KafkaEventSink::Statistics KafkaEventSink::getStatistics() const {
        return {eventsSent_.load(), sendFailures_.load()};
    }

}
