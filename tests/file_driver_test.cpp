#include "TestSupport.hpp"
#include "core/driver/impl/FileDriver.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <sstream>

using namespace core::driver;
using core::device::DeviceRegistry;

namespace {
    std::string readFile(const std::string &path) {
        std::ifstream in(path);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }
}

class FileDriverTest : public ::testing::Test {
protected:
    void SetUp() override {
        toolpath = dir.file("job-3.gcode");
        std::ofstream out(toolpath);
        out << "G28 ; home\nG1 X5\n";

        profile.name = "File";
        profile.backend = core::profile::DriverBackend::PRINT_TO_FILE;
        profile.withStartEnd = true;
        profile.startSequence = {"M104 S200"};
        profile.endSequence = {"M84"};
        profile.abortSequence = {"M104 S0"};
        profile.outputDirectory = dir.file("out");
    }

    testing_support::TempDirectory dir;
    std::string toolpath;
    core::profile::DriverProfile profile;
    DeviceRegistry registry;
};

TEST_F(FileDriverTest, WritesCommandStream) {
    auto handle = registry.tryAcquire("bot/1", 3);
    ASSERT_TRUE(handle.has_value());

    FileDriver driver;
    auto stream = driver.print(toolpath, profile, *handle);
    while (stream->next()) {
    }
    stream.reset();

    std::string expectedPath = FileDriver::outputPathFor(profile, "bot/1", 3);
    EXPECT_NE(expectedPath.find("bot_1-3.gcode"), std::string::npos);
    EXPECT_EQ(readFile(expectedPath), "M104 S200\nG28\nG1 X5\nM84\n");
}

TEST_F(FileDriverTest, AbortAppendsAbortSequence) {
    auto handle = registry.tryAcquire("bot-1", 4);
    FileDriver driver;
    auto stream = driver.print(toolpath, profile, *handle);

    ASSERT_TRUE(stream->next().has_value());
    EXPECT_TRUE(stream->abort());
    EXPECT_FALSE(stream->abort());

    EXPECT_EQ(readFile(FileDriver::outputPathFor(profile, "bot-1", 4)), "M104 S200\nM104 S0\n");
}
