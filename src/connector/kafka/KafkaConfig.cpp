#include "connector/kafka/KafkaConfig.hpp"
#include "logger/Logger.hpp"
#include <cstdlib>
#include <fstream>
#include <regex>
#include <string>

namespace connector::kafka {

    namespace {
        void trim(std::string &value) {
            value.erase(0, value.find_first_not_of(" \t\r"));
            value.erase(value.find_last_not_of(" \t\r") + 1);
        }
    }

    std::string KafkaConfig::resolvePlaceholder(const std::string &value) {
        // ${VAR_NAME:default_value}
        static const std::regex placeholderRegex(R"(\$\{([^}:]+):([^}]*)\})");
        std::string result = value;

        std::smatch matches;
        while (std::regex_search(result, matches, placeholderRegex)) {
            std::string varName = matches[1].str();
            std::string defaultValue = matches[2].str();

            const char *envValue = std::getenv(varName.c_str());
            std::string replacement = envValue ? envValue : defaultValue;

            if (envValue) {
                Logger::logDebug("[KafkaConfig] Resolved " + varName + " from environment");
            } else {
                Logger::logDebug("[KafkaConfig] Using default for " + varName + " = " + replacement);
            }

            result.replace(static_cast<size_t>(matches.position(0)), static_cast<size_t>(matches.length(0)),
                           replacement);
        }

        return result;
    }

    int KafkaConfig::loadEnvFile(const std::string &envFilePath) {
        std::ifstream envFile(envFilePath);
        if (!envFile.is_open()) {
            Logger::logDebug("[KafkaConfig] No .env file found at: " + envFilePath +
                             " (using system environment only)");
            return 0;
        }

        Logger::logInfo("[KafkaConfig] Loading .env file: " + envFilePath);

        std::string line;
        int loadedVars = 0;

        while (std::getline(envFile, line)) {
            trim(line);
            if (line.empty() || line[0] == '#') continue;

            size_t pos = line.find('=');
            if (pos == std::string::npos) continue;

            std::string key = line.substr(0, pos);
            std::string value = line.substr(pos + 1);
            trim(key);
            trim(value);
            if (key.empty()) continue;

            if (value.size() >= 2 &&
                ((value.front() == '"' && value.back() == '"') ||
                 (value.front() == '\'' && value.back() == '\''))) {
                value = value.substr(1, value.size() - 2);
            }

            if (std::getenv(key.c_str()) == nullptr) {
                setenv(key.c_str(), value.c_str(), 0);
                Logger::logDebug("[KafkaConfig] Loaded from .env: " + key);
                loadedVars++;
            } else {
                Logger::logDebug("[KafkaConfig] Skipped (already set): " + key);
            }
        }

        Logger::logInfo("[KafkaConfig] Loaded " + std::to_string(loadedVars) + " variables from .env file");
        return loadedVars;
    }

    void KafkaConfig::resolveFromEnvironment(const std::string &envFilePath) {
        loadEnvFile(envFilePath);

        brokers = resolvePlaceholder(brokers);
        clientId = resolvePlaceholder(clientId);
        topic = resolvePlaceholder(topic);
        compressionType = resolvePlaceholder(compressionType);
        sslCaLocation = resolvePlaceholder(sslCaLocation);
        sslCertLocation = resolvePlaceholder(sslCertLocation);
        sslKeyLocation = resolvePlaceholder(sslKeyLocation);
        saslMechanism = resolvePlaceholder(saslMechanism);
        saslUsername = resolvePlaceholder(saslUsername);
        saslPassword = resolvePlaceholder(saslPassword);

        Logger::logInfo("[KafkaConfig] All placeholders resolved");
    }

    void KafkaConfig::printConfig() const {
        Logger::logInfo("[KafkaConfig] Final configuration:");
        Logger::logInfo("  Enabled: " + std::string(enabled ? "true" : "false"));
        Logger::logInfo("  Brokers: " + brokers);
        Logger::logInfo("  Client ID: " + clientId);
        Logger::logInfo("  Topic: " + topic);
        Logger::logInfo("  Compression: " + compressionType);
        Logger::logInfo("  SSL Enabled: " + std::string(enableSsl ? "true" : "false"));

        if (!saslMechanism.empty()) {
            Logger::logInfo("  SASL Mechanism: " + saslMechanism);
        }
    }

}
