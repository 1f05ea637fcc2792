#pragma once

#include <chrono>

namespace utils {

    inline long long currentTimeMillis() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch()).count();
    }

    inline long long toMillis(std::chrono::system_clock::time_point time) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
    }

    inline std::chrono::system_clock::time_point fromMillis(long long millis) {
        return std::chrono::system_clock::time_point(std::chrono::milliseconds(millis));
    }

}
