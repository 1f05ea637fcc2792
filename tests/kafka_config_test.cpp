#include "connector/kafka/KafkaConfig.hpp"
#include "TestSupport.hpp"

#include <cstdlib>
#include <fstream>
#include <gtest/gtest.h>

using connector::kafka::KafkaConfig;

class KafkaConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        unsetenv("CONVEYOR_TEST_BROKERS");
        unsetenv("CONVEYOR_TEST_TOPIC");
        unsetenv("CONVEYOR_TEST_PRESET");
        unsetenv("CONVEYOR_TEST_QUOTED");
    }

    testing_support::TempDirectory dir_;
};

TEST_F(KafkaConfigTest, PlaceholderFallsBackToDefault) {
    EXPECT_EQ(KafkaConfig::resolvePlaceholder("${CONVEYOR_TEST_BROKERS:localhost:9092}"), "localhost:9092");
    EXPECT_EQ(KafkaConfig::resolvePlaceholder("${CONVEYOR_TEST_TOPIC:}"), "");
    EXPECT_EQ(KafkaConfig::resolvePlaceholder("plain-value"), "plain-value");
}

TEST_F(KafkaConfigTest, PlaceholderPrefersEnvironment) {
    setenv("CONVEYOR_TEST_BROKERS", "kafka-1:9093", 1);
    setenv("CONVEYOR_TEST_TOPIC", "jobs", 1);

    EXPECT_EQ(KafkaConfig::resolvePlaceholder("${CONVEYOR_TEST_BROKERS:localhost:9092}"), "kafka-1:9093");
    EXPECT_EQ(KafkaConfig::resolvePlaceholder("prefix-${CONVEYOR_TEST_TOPIC:x}-${CONVEYOR_TEST_TOPIC:y}"),
              "prefix-jobs-jobs");
}

TEST_F(KafkaConfigTest, EnvFileDoesNotOverrideExistingVariables) {
    setenv("CONVEYOR_TEST_PRESET", "kept", 1);

    std::string path = dir_.file(".env");
    {
        std::ofstream out(path);
        out << "# comment\n"
            << "\n"
            << "CONVEYOR_TEST_BROKERS = broker:1234\n"
            << "CONVEYOR_TEST_QUOTED=\"with spaces\"\n"
            << "CONVEYOR_TEST_PRESET=replaced\n"
            << "not a setting\n";
    }

    EXPECT_EQ(KafkaConfig::loadEnvFile(path), 2);
    EXPECT_STREQ(std::getenv("CONVEYOR_TEST_BROKERS"), "broker:1234");
    EXPECT_STREQ(std::getenv("CONVEYOR_TEST_QUOTED"), "with spaces");
    EXPECT_STREQ(std::getenv("CONVEYOR_TEST_PRESET"), "kept");
}

TEST_F(KafkaConfigTest, MissingEnvFileLoadsNothing) {
    EXPECT_EQ(KafkaConfig::loadEnvFile(dir_.file("absent.env")), 0);
}

TEST_F(KafkaConfigTest, ResolveFromEnvironmentExpandsEveryField) {
    setenv("CONVEYOR_TEST_BROKERS", "kafka-2:9092", 1);

    KafkaConfig config;
    config.brokers = "${CONVEYOR_TEST_BROKERS:localhost:9092}";
    config.topic = "${CONVEYOR_TEST_TOPIC:conveyor-job-events}";
    config.resolveFromEnvironment(dir_.file("absent.env"));

    EXPECT_EQ(config.brokers, "kafka-2:9092");
    EXPECT_EQ(config.topic, "conveyor-job-events");
    EXPECT_EQ(config.sslCaLocation.find("${"), std::string::npos);
}
