#include "connector/kafka/KafkaProducerBase.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"

namespace connector::kafka {

    KafkaProducerBase::KafkaProducerBase(const KafkaConfig &config, const std::string &topicName)
            : config_(config), topicName_(topicName), producer_(nullptr), ready_(false) {

        Logger::logInfo("[KafkaProducerBase] Initializing producer for topic: " + topicName);

        try {
            createProducer();
        } catch (const core::types::ConveyorException &e) {
            // Left not-ready: job execution never depends on Kafka
            Logger::logError("[KafkaProducerBase] Failed to initialize producer: " + std::string(e.what()));
            ready_ = false;
        }
    }

    KafkaProducerBase::~KafkaProducerBase() {
        destroyProducer();
    }

    bool KafkaProducerBase::sendMessage(const std::string &message, const std::string &key) {
        if (!ready_ || !producer_) {
            Logger::logDebug("[" + getSenderName() + "] Producer not ready");
            return false;
        }

        const char *keyPtr = key.empty() ? nullptr : key.c_str();
        size_t keyLen = key.empty() ? 0 : key.length();

        rd_kafka_resp_err_t result = rd_kafka_producev(
                producer_,
                RD_KAFKA_V_TOPIC(topicName_.c_str()),
                RD_KAFKA_V_MSGFLAGS(RD_KAFKA_MSG_F_COPY),
                RD_KAFKA_V_VALUE(const_cast<char *>(message.c_str()), message.length()),
                RD_KAFKA_V_KEY(const_cast<char *>(keyPtr), keyLen),
                RD_KAFKA_V_OPAQUE(nullptr),
                RD_KAFKA_V_END
        );

        if (result != RD_KAFKA_RESP_ERR_NO_ERROR) {
            Logger::logError("[" + getSenderName() + "] Failed to produce message: " +
                             std::string(rd_kafka_err2str(result)));
            return false;
        }

        rd_kafka_poll(producer_, 0);
        Logger::logDebug("[" + getSenderName() + "] Message sent to topic: " + topicName_ + ", key: " + key);
        return true;
    }

    bool KafkaProducerBase::isReady() const {
        return ready_;
    }

    std::string KafkaProducerBase::getTopicName() const {
        return topicName_;
    }

    void KafkaProducerBase::poll() {
        if (producer_) {
            rd_kafka_poll(producer_, 0);
        }
    }

    void KafkaProducerBase::setOption(rd_kafka_conf_t *conf, const std::string &name, const std::string &value) {
        char errstr[512];
        errstr[0] = '\0';
        if (rd_kafka_conf_set(conf, name.c_str(), value.c_str(), errstr, sizeof(errstr)) != RD_KAFKA_CONF_OK) {
            throw core::types::ConveyorException("Failed to set " + name + ": " + std::string(errstr));
        }
    }

    void KafkaProducerBase::createProducer() {
        char errstr[512];
        errstr[0] = '\0';

        Logger::logInfo("[KafkaProducerBase] Creating librdkafka producer configuration...");
        rd_kafka_conf_t *conf = rd_kafka_conf_new();
        if (!conf) {
            throw core::types::ConveyorException("Failed to create Kafka producer configuration object");
        }

        try {
            Logger::logInfo("[KafkaProducerBase] Setting brokers: " + config_.brokers);
            setOption(conf, "bootstrap.servers", config_.brokers);
            setOption(conf, "client.id", config_.clientId);

            setOption(conf, "delivery.timeout.ms", std::to_string(config_.deliveryTimeoutMs));
            setOption(conf, "request.timeout.ms", std::to_string(config_.requestTimeoutMs));
            setOption(conf, "compression.type", config_.compressionType);
            setOption(conf, "batch.size", std::to_string(config_.batchSize));
            setOption(conf, "linger.ms", std::to_string(config_.lingerMs));
            setOption(conf, "socket.timeout.ms", "10000");
            setOption(conf, "socket.keepalive.enable", "true");

            if (config_.enableSsl) {
                setOption(conf, "security.protocol", config_.saslMechanism.empty() ? "ssl" : "sasl_ssl");
                if (!config_.sslCaLocation.empty()) setOption(conf, "ssl.ca.location", config_.sslCaLocation);
                if (!config_.sslCertLocation.empty()) {
                    setOption(conf, "ssl.certificate.location", config_.sslCertLocation);
                }
                if (!config_.sslKeyLocation.empty()) setOption(conf, "ssl.key.location", config_.sslKeyLocation);
            } else if (!config_.saslMechanism.empty()) {
                setOption(conf, "security.protocol", "sasl_plaintext");
            }
            if (!config_.saslMechanism.empty()) {
                setOption(conf, "sasl.mechanisms", config_.saslMechanism);
                setOption(conf, "sasl.username", config_.saslUsername);
                setOption(conf, "sasl.password", config_.saslPassword);
            }
        } catch (const core::types::ConveyorException &) {
            rd_kafka_conf_destroy(conf);
            throw;
        }

        rd_kafka_conf_set_dr_msg_cb(conf, deliveryReportCallback);
        rd_kafka_conf_set_error_cb(conf, errorCallback);

        Logger::logInfo("[KafkaProducerBase] Creating Kafka producer instance...");
        // rd_kafka_new takes ownership of conf only on success
        producer_ = rd_kafka_new(RD_KAFKA_PRODUCER, conf, errstr, sizeof(errstr));
        if (!producer_) {
            rd_kafka_conf_destroy(conf);
            throw core::types::ConveyorException("Failed to create Kafka producer: " + std::string(errstr));
        }

        ready_ = true;
        Logger::logInfo("[KafkaProducerBase] Producer created and ready");
    }

    void KafkaProducerBase::destroyProducer() {
        if (!producer_) {
            return;
        }
        ready_ = false;
        Logger::logInfo("[KafkaProducerBase] Flushing producer...");
        rd_kafka_resp_err_t err = rd_kafka_flush(producer_, 5000);
        if (err != RD_KAFKA_RESP_ERR_NO_ERROR) {
            Logger::logWarning("[KafkaProducerBase] Flush incomplete: " + std::string(rd_kafka_err2str(err)));
        }
        rd_kafka_destroy(producer_);
        producer_ = nullptr;
        Logger::logInfo("[KafkaProducerBase] Producer destroyed");
    }

    void KafkaProducerBase::deliveryReportCallback(rd_kafka_t *rk, const rd_kafka_message_t *rkmessage, void *opaque) {
        (void) rk;
        (void) opaque;

        if (rkmessage->err != RD_KAFKA_RESP_ERR_NO_ERROR) {
            Logger::logError("[KafkaProducer] Delivery failed: " + std::string(rd_kafka_err2str(rkmessage->err)));
        } else {
            Logger::logDebug("[KafkaProducer] Message delivered successfully");
        }
    }

    void KafkaProducerBase::errorCallback(rd_kafka_t *rk, int err, const char *reason, void *opaque) {
        (void) rk;
        (void) opaque;
        Logger::logError(
                "[KafkaProducer] Error: " + std::string(rd_kafka_err2str(static_cast<rd_kafka_resp_err_t>(err))) +
                " - " + reason);
    }

}
