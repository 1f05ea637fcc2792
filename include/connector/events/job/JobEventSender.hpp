#pragma once

#include "../../kafka/KafkaProducerBase.hpp"

namespace connector::events::job {

    /**
     * @brief Producer for the job events topic
     */
    class JobEventSender : public kafka::KafkaProducerBase {
    public:
        explicit JobEventSender(const kafka::KafkaConfig &config);

    protected:
        std::string getSenderName() const override;
    };

}
