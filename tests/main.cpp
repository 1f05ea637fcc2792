#include "logger/Logger.hpp"

#include <gtest/gtest.h>

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    Logger::setLevel(LogLevel::Error);
    int result = RUN_ALL_TESTS();
    Logger::shutdown();
    return result;
}
