#include "TestSupport.hpp"
#include "core/orchestrator/JobOrchestrator.hpp"
#include "core/types/Error.hpp"
#include "fakes/FakeBackends.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <set>
#include <thread>

using namespace core::jobs;
using core::orchestrator::JobOrchestrator;
using core::orchestrator::OrchestratorConfig;
using testing_support::Gate;
using testing_support::waitUntil;

class JobOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        core::profile::SlicerProfile slicerProfile;
        slicerProfile.name = "MiracleGrue";
        core::profile::DriverProfile driverProfile;
        driverProfile.name = "MakerBotDriver";

        profiles = std::make_shared<core::profile::ProfileRegistry>(
                std::vector<core::profile::SlicerProfile>{slicerProfile},
                std::vector<core::profile::DriverProfile>{driverProfile});
        slicer = std::make_shared<fakes::FakeSlicer>();
        driver = std::make_shared<fakes::FakeDriver>();
        devices = std::make_shared<core::device::DeviceRegistry>();
        eventBus = std::make_shared<core::events::EventBus>();
        eventBus->start();

        OrchestratorConfig config;
        config.workerThreads = 4;
        config.workDirectory = dir.file("work");
        orchestrator = std::make_unique<JobOrchestrator>(config, profiles,
                                                         std::make_shared<fakes::FakeSlicerFactory>(slicer),
                                                         std::make_shared<fakes::FakeDriverFactory>(driver),
                                                         devices, eventBus);
        ASSERT_TRUE(orchestrator->start());
    }

    void TearDown() override {
        if (driver->gate) {
            driver->gate->open();
        }
        if (slicer->gate) {
            slicer->gate->open();
        }
        orchestrator->stop();
        eventBus->stop();
    }

    JobId submit(const std::string &device = "bot-1", const std::string &model = "part.stl") {
        return orchestrator->submit(model, "MiracleGrue", "MakerBotDriver", device);
    }

    bool waitForState(JobId id, JobState state) {
        return waitUntil([&] {
            auto snapshot = orchestrator->status(id);
            return snapshot && snapshot->state == state;
        });
    }

    JobState stateOf(JobId id) {
        return orchestrator->status(id)->state;
    }

    testing_support::TempDirectory dir;
    std::shared_ptr<core::profile::ProfileRegistry> profiles;
    std::shared_ptr<fakes::FakeSlicer> slicer;
    std::shared_ptr<fakes::FakeDriver> driver;
    std::shared_ptr<core::device::DeviceRegistry> devices;
    std::shared_ptr<core::events::EventBus> eventBus;
    std::unique_ptr<JobOrchestrator> orchestrator;
};

TEST_F(JobOrchestratorTest, JobRunsToCompletion) {
    auto id = submit();
    ASSERT_TRUE(waitForState(id, JobState::COMPLETED));

    auto snapshot = orchestrator->status(id);
    EXPECT_DOUBLE_EQ(*snapshot->progress, 1.0);
    EXPECT_FALSE(snapshot->waitPosition.has_value());
    ASSERT_TRUE(snapshot->toolpath.has_value());

    std::vector<JobState> states;
    for (const auto &step: snapshot->history) {
        states.push_back(step.to);
    }
    std::vector<JobState> expected = {JobState::CREATED, JobState::SLICING, JobState::QUEUED,
                                      JobState::PRINTING, JobState::COMPLETED};
    EXPECT_EQ(states, expected);
    EXPECT_EQ(slicer->calls, 1);
    EXPECT_TRUE(waitUntil([&] { return !devices->isBusy("bot-1"); }));
}

TEST_F(JobOrchestratorTest, UnknownProfileCreatesNoJob) {
    try {
        orchestrator->submit("part.stl", "Cura", "MakerBotDriver", "bot-1");
        FAIL() << "expected ProfileNotFoundException";
    } catch (const core::types::ProfileNotFoundException &e) {
        EXPECT_EQ(e.kind(), "Slicer");
        EXPECT_EQ(e.name(), "Cura");
    }
    EXPECT_THROW(orchestrator->submit("part.stl", "MiracleGrue", "Replicator", "bot-1"),
                 core::types::ProfileNotFoundException);
    EXPECT_TRUE(orchestrator->list().empty());
}

TEST_F(JobOrchestratorTest, UnsupportedModelIsRejected) {
    EXPECT_THROW(submit("bot-1", "part.obj"), core::types::UnsupportedModelTypeException);
    EXPECT_TRUE(orchestrator->list().empty());
}

TEST_F(JobOrchestratorTest, GCodeModelSkipsSlicer) {
    std::string model = dir.file("ready.gcode");
    std::ofstream(model) << "G28\nG1 X1\n";

    auto id = submit("bot-1", model);
    ASSERT_TRUE(waitForState(id, JobState::COMPLETED));
    EXPECT_EQ(slicer->calls, 0);
}

TEST_F(JobOrchestratorTest, DeviceServesJobsInSubmissionOrder) {
    driver->gate = std::make_shared<Gate>();

    auto first = submit();
    auto second = submit();
    auto third = submit();

    ASSERT_TRUE(waitForState(first, JobState::PRINTING));
    ASSERT_TRUE(waitForState(second, JobState::QUEUED));
    ASSERT_TRUE(waitForState(third, JobState::QUEUED));

    EXPECT_EQ(orchestrator->status(second)->waitPosition, 1u);
    EXPECT_EQ(orchestrator->status(third)->waitPosition, 2u);
    EXPECT_EQ(orchestrator->waitList("bot-1"), (std::vector<JobId>{second, third}));

    driver->gate->open();
    ASSERT_TRUE(waitForState(third, JobState::COMPLETED));
    EXPECT_EQ(stateOf(first), JobState::COMPLETED);
    EXPECT_EQ(stateOf(second), JobState::COMPLETED);
    EXPECT_EQ(driver->printedJobs(), (std::vector<JobId>{first, second, third}));
}

TEST_F(JobOrchestratorTest, DevicesPrintIndependently) {
    driver->gate = std::make_shared<Gate>();

    auto onFirst = submit("bot-1");
    auto onSecond = submit("bot-2");

    EXPECT_TRUE(waitForState(onFirst, JobState::PRINTING));
    EXPECT_TRUE(waitForState(onSecond, JobState::PRINTING));
    EXPECT_EQ(orchestrator->devices().size(), 2u);
}

TEST_F(JobOrchestratorTest, CancelWaitingJobLetsNextMoveUp) {
    driver->gate = std::make_shared<Gate>();

    auto first = submit();
    auto second = submit();
    auto third = submit();
    ASSERT_TRUE(waitForState(first, JobState::PRINTING));
    ASSERT_TRUE(waitForState(third, JobState::QUEUED));

    EXPECT_TRUE(orchestrator->cancel(second).isSuccess());
    EXPECT_EQ(stateOf(second), JobState::CANCELLED);
    EXPECT_EQ(orchestrator->status(third)->waitPosition, 1u);

    EXPECT_TRUE(orchestrator->cancel(second).isAlreadyTerminal());
    EXPECT_TRUE(orchestrator->cancel(999).isNotFound());

    driver->gate->open();
    ASSERT_TRUE(waitForState(third, JobState::COMPLETED));
    EXPECT_EQ(driver->printedJobs(), (std::vector<JobId>{first, third}));
}

TEST_F(JobOrchestratorTest, CancelDuringSlicing) {
    slicer->gate = std::make_shared<Gate>();

    auto id = submit();
    ASSERT_TRUE(waitForState(id, JobState::SLICING));

    EXPECT_TRUE(orchestrator->cancel(id).isSuccess());
    EXPECT_EQ(stateOf(id), JobState::CANCELLED);

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(stateOf(id), JobState::CANCELLED);
    EXPECT_TRUE(driver->printedJobs().empty());
}

TEST_F(JobOrchestratorTest, CancelWhilePrintingRunsAbort) {
    driver->gate = std::make_shared<Gate>();

    auto id = submit();
    ASSERT_TRUE(waitForState(id, JobState::PRINTING));

    auto result = orchestrator->cancel(id);
    EXPECT_TRUE(result.isSuccess());
    EXPECT_TRUE(orchestrator->status(id)->cancelRequested);

    driver->gate->open();
    ASSERT_TRUE(waitForState(id, JobState::CANCELLED));
    EXPECT_EQ(driver->aborts, 1);
    EXPECT_TRUE(devices->isAvailable("bot-1"));
    EXPECT_TRUE(waitUntil([&] { return !devices->isBusy("bot-1"); }));
}

TEST_F(JobOrchestratorTest, UnconfirmedAbortFailsJobAndParksDevice) {
    driver->gate = std::make_shared<Gate>();
    driver->abortConfirmed = false;

    auto id = submit();
    ASSERT_TRUE(waitForState(id, JobState::PRINTING));
    orchestrator->cancel(id);
    driver->gate->open();

    ASSERT_TRUE(waitForState(id, JobState::FAILED));
    EXPECT_TRUE(waitUntil([&] { return !devices->isAvailable("bot-1"); }));
}

TEST_F(JobOrchestratorTest, DisconnectFailsJobAndHoldsWaitList) {
    driver->disconnectAtStep = 2;

    auto first = submit();
    ASSERT_TRUE(waitForState(first, JobState::FAILED));
    EXPECT_NE(orchestrator->status(first)->error->find("link lost"), std::string::npos);
    ASSERT_TRUE(waitUntil([&] { return !devices->isAvailable("bot-1"); }));

    driver->disconnectAtStep.reset();
    auto second = submit();
    ASSERT_TRUE(waitForState(second, JobState::QUEUED));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(stateOf(second), JobState::QUEUED);

    EXPECT_TRUE(orchestrator->reconnectDevice("bot-1").isSuccess());
    ASSERT_TRUE(waitForState(second, JobState::COMPLETED));
    EXPECT_TRUE(orchestrator->reconnectDevice("no-such-device").isNotFound());
}

TEST_F(JobOrchestratorTest, UnreachableDeviceFailsJob) {
    driver->failToOpen = true;

    auto id = submit();
    ASSERT_TRUE(waitForState(id, JobState::FAILED));
    EXPECT_TRUE(waitUntil([&] { return !devices->isAvailable("bot-1"); }));
}

TEST_F(JobOrchestratorTest, SliceFailureFailsJobWithDiagnostics) {
    slicer->failWith = "MiracleGrue exited with status code 3";

    auto id = submit();
    ASSERT_TRUE(waitForState(id, JobState::FAILED));

    auto error = orchestrator->status(id)->error;
    ASSERT_TRUE(error.has_value());
    EXPECT_NE(error->find("status code 3"), std::string::npos);
    EXPECT_NE(error->find("backend diagnostics"), std::string::npos);
    EXPECT_TRUE(driver->printedJobs().empty());
}

TEST_F(JobOrchestratorTest, ListFiltersByDeviceAndActivity) {
    driver->gate = std::make_shared<Gate>();
    auto first = submit("bot-1");
    submit("bot-2");
    ASSERT_TRUE(waitForState(first, JobState::PRINTING));

    JobFilter onFirst;
    onFirst.deviceId = "bot-1";
    EXPECT_EQ(orchestrator->list(onFirst).size(), 1u);

    JobFilter active;
    active.activeOnly = true;
    EXPECT_EQ(orchestrator->list(active).size(), 2u);

    driver->gate->open();
    ASSERT_TRUE(waitForState(first, JobState::COMPLETED));
}

TEST_F(JobOrchestratorTest, StopCancelsUnfinishedJobs) {
    slicer->gate = std::make_shared<Gate>();
    auto id = submit();
    ASSERT_TRUE(waitForState(id, JobState::SLICING));

    orchestrator->stop();
    EXPECT_TRUE(isTerminal(stateOf(id)));
    EXPECT_THROW(submit(), core::types::ConveyorException);
}

TEST_F(JobOrchestratorTest, ConcurrentSubmissionsShareOneDeviceInOrder) {
    constexpr size_t SUBMITTERS = 8;

    std::vector<JobId> ids(SUBMITTERS);
    std::vector<std::thread> submitters;
    for (size_t i = 0; i < SUBMITTERS; ++i) {
        submitters.emplace_back([this, &ids, i]() { ids[i] = submit("bot-1"); });
    }
    for (auto &thread: submitters) {
        thread.join();
    }

    EXPECT_EQ(std::set<JobId>(ids.begin(), ids.end()).size(), SUBMITTERS);
    std::vector<JobId> ordered = ids;
    std::sort(ordered.begin(), ordered.end());

    for (auto id: ordered) {
        ASSERT_TRUE(waitForState(id, JobState::COMPLETED)) << "job " << id;
    }
    EXPECT_EQ(driver->printedJobs(), ordered);

    std::vector<std::pair<std::chrono::system_clock::time_point, std::chrono::system_clock::time_point>> printing;
    for (auto id: ordered) {
        auto snapshot = orchestrator->status(id);
        std::optional<std::chrono::system_clock::time_point> began;
        std::optional<std::chrono::system_clock::time_point> ended;
        for (const auto &step: snapshot->history) {
            if (step.to == JobState::PRINTING) began = step.timestamp;
            if (step.from == JobState::PRINTING) ended = step.timestamp;
        }
        ASSERT_TRUE(began && ended) << "job " << id;
        printing.emplace_back(*began, *ended);
    }
    for (size_t i = 1; i < printing.size(); ++i) {
        EXPECT_GE(printing[i].first, printing[i - 1].second) << "job " << ordered[i] << " overlapped its predecessor";
    }
}

TEST_F(JobOrchestratorTest, ProgressCarriesDriverTemperature) {
    core::device::TemperatureReport report;
    report.tools[0] = {215.0, 215.0};
    driver->temperature = report;

    auto id = submit();
    ASSERT_TRUE(waitForState(id, JobState::COMPLETED));

    auto snapshot = orchestrator->status(id);
    ASSERT_TRUE(snapshot->temperature.has_value());
    EXPECT_DOUBLE_EQ(snapshot->temperature->tools.at(0).current, 215.0);
}

TEST_F(JobOrchestratorTest, SliceJobWritesOutputWithoutDevice) {
    std::string output = dir.file("out/part.gcode");
    auto id = orchestrator->slice("part.stl", "MiracleGrue", output);
    ASSERT_TRUE(waitForState(id, JobState::COMPLETED));

    auto snapshot = orchestrator->status(id);
    EXPECT_EQ(snapshot->kind, JobKind::SLICE);
    EXPECT_EQ(snapshot->toolpath, output);
    EXPECT_TRUE(snapshot->deviceId.empty());

    std::vector<JobState> states;
    for (const auto &step: snapshot->history) {
        states.push_back(step.to);
    }
    EXPECT_EQ(states, (std::vector<JobState>{JobState::CREATED, JobState::SLICING, JobState::COMPLETED}));

    std::ifstream in(output);
    std::string first;
    ASSERT_TRUE(std::getline(in, first));
    EXPECT_EQ(first, "G1 X1");

    EXPECT_TRUE(driver->printedJobs().empty());
    EXPECT_TRUE(orchestrator->devices().empty());
}

TEST_F(JobOrchestratorTest, SliceJobDoesNotWaitForBusyDevice) {
    driver->gate = std::make_shared<Gate>();
    auto printing = submit();
    ASSERT_TRUE(waitForState(printing, JobState::PRINTING));

    auto id = orchestrator->slice("part.stl", "MiracleGrue", dir.file("side.gcode"));
    ASSERT_TRUE(waitForState(id, JobState::COMPLETED));
    EXPECT_EQ(stateOf(printing), JobState::PRINTING);
    EXPECT_TRUE(orchestrator->waitList("bot-1").empty());
}

TEST_F(JobOrchestratorTest, CancelledSliceJobLeavesNoOutput) {
    slicer->gate = std::make_shared<Gate>();
    std::string output = dir.file("cancelled.gcode");
    auto id = orchestrator->slice("part.stl", "MiracleGrue", output);
    ASSERT_TRUE(waitForState(id, JobState::SLICING));

    EXPECT_TRUE(orchestrator->cancel(id).isSuccess());
    ASSERT_TRUE(waitForState(id, JobState::CANCELLED));
    EXPECT_TRUE(waitUntil([&] { return orchestrator->activeTasks() == 0; }));
    EXPECT_FALSE(std::filesystem::exists(output));
}

TEST_F(JobOrchestratorTest, SliceValidatesRequest) {
    EXPECT_THROW(orchestrator->slice("part.stl", "Cura", dir.file("x.gcode")),
                 core::types::ProfileNotFoundException);
    EXPECT_THROW(orchestrator->slice("part.obj", "MiracleGrue", dir.file("x.gcode")),
                 core::types::UnsupportedModelTypeException);
    EXPECT_THROW(orchestrator->slice("part.stl", "MiracleGrue", ""), core::types::ConveyorException);
    EXPECT_TRUE(orchestrator->list().empty());
}

TEST_F(JobOrchestratorTest, CancelAfterRetentionEvictionIsAlreadyTerminal) {
    OrchestratorConfig config;
    config.workerThreads = 2;
    config.workDirectory = dir.file("work-small");
    config.maxCompletedJobs = 1;
    JobOrchestrator small(config, profiles, std::make_shared<fakes::FakeSlicerFactory>(slicer),
                          std::make_shared<fakes::FakeDriverFactory>(driver), devices, eventBus);
    ASSERT_TRUE(small.start());

    auto first = small.submit("part.stl", "MiracleGrue", "MakerBotDriver", "bot-9");
    ASSERT_TRUE(waitUntil([&] { return small.status(first)->state == JobState::COMPLETED; }));
    auto second = small.submit("part.stl", "MiracleGrue", "MakerBotDriver", "bot-9");
    ASSERT_TRUE(waitUntil([&] { return small.status(second)->state == JobState::COMPLETED; }));

    auto evicted = small.status(first);
    ASSERT_TRUE(evicted.has_value());
    EXPECT_TRUE(evicted->evicted);
    EXPECT_EQ(evicted->state, JobState::COMPLETED);
    EXPECT_TRUE(small.cancel(first).isAlreadyTerminal());
    EXPECT_TRUE(small.cancel(99).isNotFound());
    small.stop();
}
