#include "connector/events/job/JobEventSender.hpp"
#include "logger/Logger.hpp"

namespace connector::events::job {

    JobEventSender::JobEventSender(const kafka::KafkaConfig &config)
            : KafkaProducerBase(config, config.topic) {
        Logger::logInfo("[JobEventSender] Initialized for topic: " + config.topic);
    }

    std::string JobEventSender::getSenderName() const {
        return "JobEventSender";
    }

}
