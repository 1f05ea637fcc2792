#pragma once

#include <string>

namespace connector::kafka {
    struct KafkaConfig {
        bool enabled = false;

        // Connection - with Spring Boot style placeholders
        std::string brokers = "${KAFKA_BROKERS:localhost:9092}";
        std::string clientId = "${KAFKA_CLIENT_ID:conveyord}";
        std::string topic = "${KAFKA_JOB_EVENTS_TOPIC:conveyor-job-events}";

        // Producer settings
        int deliveryTimeoutMs = 30000;
        int requestTimeoutMs = 5000;
        std::string compressionType = "${KAFKA_COMPRESSION_TYPE:snappy}";
        int batchSize = 16384;
        int lingerMs = 5;

        // Security (optional)
        bool enableSsl = false;
        std::string sslCaLocation = "${KAFKA_SSL_CA_LOCATION:}";
        std::string sslCertLocation = "${KAFKA_SSL_CERT_LOCATION:}";
        std::string sslKeyLocation = "${KAFKA_SSL_KEY_LOCATION:}";
        std::string saslMechanism = "${KAFKA_SASL_MECHANISM:}";
        std::string saslUsername = "${KAFKA_SASL_USERNAME:}";
        std::string saslPassword = "${KAFKA_SASL_PASSWORD:}";

        /**
         * @brief Load .env, then resolve all placeholders with environment variables
         */
        void resolveFromEnvironment(const std::string &envFilePath = ".env");

        /**
         * @brief Print current configuration (for debugging)
         */
        void printConfig() const;

        /**
         * @brief Resolve every ${VAR:default} placeholder in a string
         */
        static std::string resolvePlaceholder(const std::string &value);

        /**
         * @brief Load environment variables from a .env file; variables already set win
         * @return Number of variables loaded
         */
        static int loadEnvFile(const std::string &envFilePath = ".env");
    };
}
