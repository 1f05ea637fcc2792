#include "core/device/TemperatureReport.hpp"

#include <cctype>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace core::device {

    namespace {
        std::optional<double> parseNumber(const std::string &text) {
            if (text.empty()) return std::nullopt;
            try {
                size_t used = 0;
                double value = std::stod(text, &used);
                if (used != text.size()) return std::nullopt;
                return value;
            } catch (const std::invalid_argument &) {
                return std::nullopt;
            } catch (const std::out_of_range &) {
                return std::nullopt;
            }
        }

        /**
         * @brief Split "T12:" / "B:" style labels into heater kind and index
         */
        bool parseLabel(const std::string &label, char &kind, int &index, bool &explicitIndex) {
            if (label.empty() || (label[0] != 'T' && label[0] != 'B')) return false;
            kind = label[0];

            std::string digits = label.substr(1);
            if (digits.empty()) {
                index = 0;
                explicitIndex = false;
                return true;
            }
            if (digits.size() > 3) return false;
            for (char c: digits) {
                if (!std::isdigit(static_cast<unsigned char>(c))) return false;
            }
            index = std::stoi(digits);
            explicitIndex = true;
            return true;
        }
    }

    std::optional<TemperatureReport> TemperatureReport::parse(const std::string &line) {
        std::istringstream stream(line);
        std::vector<std::string> tokens;
        std::string token;
        while (stream >> token) {
            tokens.push_back(token);
        }

        TemperatureReport report;
        bool explicitTool0 = false;

        for (size_t i = 0; i < tokens.size(); ++i) {
            auto colon = tokens[i].find(':');
            if (colon == std::string::npos || colon == 0) continue;

            char kind = 0;
            int index = 0;
            bool explicitIndex = false;
            if (!parseLabel(tokens[i].substr(0, colon), kind, index, explicitIndex)) continue;

            auto current = parseNumber(tokens[i].substr(colon + 1));
            if (!current) continue;

            HeaterReading reading;
            reading.current = *current;
            if (i + 1 < tokens.size() && tokens[i + 1].size() > 1 && tokens[i + 1][0] == '/') {
                reading.target = parseNumber(tokens[i + 1].substr(1));
                ++i;
            }

            if (kind == 'B') {
                report.heatedPlatforms[index] = reading;
            } else if (explicitIndex) {
                report.tools[index] = reading;
                if (index == 0) explicitTool0 = true;
            } else if (!explicitTool0) {
                report.tools[0] = reading;
            }
        }

        if (report.empty()) {
            return std::nullopt;
        }
        return report;
    }

} // namespace core::device
