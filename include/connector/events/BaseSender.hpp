#pragma once

#include <string>

namespace connector::events {

    /**
     * @brief Outbound channel for serialized job events
     */
    class BaseSender {
    public:
        virtual ~BaseSender() = default;

        /**
         * @param message Serialized event
         * @param key Partitioning key; the job id keeps one job's events in order
         * @return false if the message was not accepted for delivery
         */
        virtual bool sendMessage(const std::string &message, const std::string &key = "") = 0;

        virtual bool isReady() const = 0;

        virtual std::string getTopicName() const = 0;

        virtual std::string getSenderName() const = 0;
    };

}
