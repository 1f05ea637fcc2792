#pragma once

#include <map>
#include <optional>
#include <string>

namespace core::device {

    struct HeaterReading {
        double current = 0.0;
        std::optional<double> target;
    };

    /**
     * @brief Heater readings reported by a device, keyed by tool / platform index
     */
    struct TemperatureReport {
        std::map<int, HeaterReading> tools;
        std::map<int, HeaterReading> heatedPlatforms;

        bool empty() const { return tools.empty() && heatedPlatforms.empty(); }

        /**
         * @brief Parse a firmware temperature line such as "ok T:210.0 /210.0 B:60.0 /60.0 @:0".
         *
         * "T:" is the active tool and maps to index 0 unless an explicit "T0:" follows.
         * "B:" is the heated platform. Power readings ("@:", "B@:") are ignored.
         * @return std::nullopt when the line carries no reading
         */
        static std::optional<TemperatureReport> parse(const std::string &line);
    };

} // namespace core::device
