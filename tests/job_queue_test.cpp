#include "TestSupport.hpp"
#include "core/jobs/JobQueue.hpp"
#include "core/types/Error.hpp"

#include <gtest/gtest.h>

using namespace core::jobs;
using core::events::Event;
using core::events::EventBus;
using core::events::EventType;
using testing_support::waitUntil;

namespace {
    class RecordingObserver : public core::events::IEventObserver {
    public:
        void onEvent(const Event &event) override {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(event);
        }

        std::vector<Event> events() {
            std::lock_guard<std::mutex> lock(mutex_);
            return events_;
        }

    private:
        std::mutex mutex_;
        std::vector<Event> events_;
    };
}

class JobQueueTest : public ::testing::Test {
protected:
    void SetUp() override {
        bus = std::make_shared<EventBus>();
        observer = std::make_shared<RecordingObserver>();
        bus->subscribe(observer);
        bus->start();
        queue = std::make_unique<JobQueue>(bus, 2);

        slicer = std::make_shared<core::profile::SlicerProfile>();
        slicer->name = "MiracleGrue";
        driver = std::make_shared<core::profile::DriverProfile>();
        driver->name = "MakerBotDriver";
    }

    void TearDown() override {
        bus->stop();
    }

    JobId create(const std::string &device = "bot-1") {
        return queue->create("part.stl", slicer, driver, device);
    }

    void advanceToQueued(JobId id) {
        ASSERT_TRUE(queue->transition(id, JobState::CREATED, JobState::SLICING));
        ASSERT_TRUE(queue->transition(id, JobState::SLICING, JobState::QUEUED));
    }

    std::shared_ptr<EventBus> bus;
    std::shared_ptr<RecordingObserver> observer;
    std::unique_ptr<JobQueue> queue;
    std::shared_ptr<core::profile::SlicerProfile> slicer;
    std::shared_ptr<core::profile::DriverProfile> driver;
};

TEST_F(JobQueueTest, CreateAssignsIncreasingIds) {
    auto first = create();
    auto second = create();
    EXPECT_EQ(first, 1u);
    EXPECT_EQ(second, 2u);

    auto snapshot = queue->snapshot(first);
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->state, JobState::CREATED);
    EXPECT_EQ(snapshot->slicerProfile, "MiracleGrue");
    EXPECT_EQ(snapshot->driverProfile, "MakerBotDriver");
    ASSERT_EQ(snapshot->history.size(), 1u);
    EXPECT_FALSE(snapshot->history[0].from.has_value());
}

TEST_F(JobQueueTest, TransitionIsCompareAndSet) {
    auto id = create();
    EXPECT_FALSE(queue->transition(id, JobState::SLICING, JobState::QUEUED));
    EXPECT_TRUE(queue->transition(id, JobState::CREATED, JobState::SLICING));
    EXPECT_FALSE(queue->transition(id, JobState::CREATED, JobState::SLICING));
    EXPECT_FALSE(queue->transition(999, JobState::CREATED, JobState::SLICING));
}

TEST_F(JobQueueTest, IllegalTransitionThrows) {
    auto id = create();
    EXPECT_THROW(queue->transition(id, JobState::CREATED, JobState::PRINTING),
                 core::types::IllegalTransitionException);
    EXPECT_EQ(queue->snapshot(id)->state, JobState::CREATED);
}

TEST_F(JobQueueTest, WaitPositionFollowsSubmissionOrder) {
    auto first = create();
    auto second = create();
    auto other = create("bot-2");

    EXPECT_EQ(queue->snapshot(first)->waitPosition, 1u);
    EXPECT_EQ(queue->snapshot(second)->waitPosition, 2u);
    EXPECT_EQ(queue->snapshot(other)->waitPosition, 1u);

    advanceToQueued(first);
    ASSERT_TRUE(queue->transition(first, JobState::QUEUED, JobState::PRINTING));
    EXPECT_FALSE(queue->snapshot(first)->waitPosition.has_value());
    EXPECT_EQ(queue->snapshot(second)->waitPosition, 1u);
}

TEST_F(JobQueueTest, ReadyHeadOnlyWhenHeadIsQueued) {
    auto first = create();
    auto second = create();
    advanceToQueued(second);

    EXPECT_FALSE(queue->readyHead("bot-1").has_value());

    advanceToQueued(first);
    EXPECT_EQ(queue->readyHead("bot-1"), first);
    EXPECT_FALSE(queue->readyHead("unknown").has_value());
}

TEST_F(JobQueueTest, CancelBeforePrintingIsImmediate) {
    auto id = create();
    auto outcome = queue->requestCancel(id);

    EXPECT_EQ(outcome.disposition, JobQueue::CancelDisposition::CANCELLED);
    EXPECT_EQ(outcome.previousState, JobState::CREATED);

    auto snapshot = queue->snapshot(id);
    EXPECT_EQ(snapshot->state, JobState::CANCELLED);
    EXPECT_TRUE(snapshot->cancelRequested);
    EXPECT_TRUE(queue->waitList("bot-1").empty());

    auto ctx = queue->context(id);
    ASSERT_TRUE(ctx.has_value());
    EXPECT_TRUE(ctx->cancellation->isCancelled());
}

TEST_F(JobQueueTest, CancelWhilePrintingIsForwarded) {
    auto id = create();
    advanceToQueued(id);
    ASSERT_TRUE(queue->transition(id, JobState::QUEUED, JobState::PRINTING));

    auto outcome = queue->requestCancel(id);
    EXPECT_EQ(outcome.disposition, JobQueue::CancelDisposition::FORWARDED);
    EXPECT_EQ(queue->snapshot(id)->state, JobState::PRINTING);
    EXPECT_TRUE(queue->context(id)->cancellation->isCancelled());
}

TEST_F(JobQueueTest, CancelTerminalOrUnknown) {
    auto id = create();
    ASSERT_TRUE(queue->fail(id, "boom"));

    auto outcome = queue->requestCancel(id);
    EXPECT_EQ(outcome.disposition, JobQueue::CancelDisposition::ALREADY_TERMINAL);
    EXPECT_EQ(outcome.previousState, JobState::FAILED);
    EXPECT_EQ(queue->requestCancel(42).disposition, JobQueue::CancelDisposition::NOT_FOUND);
}

TEST_F(JobQueueTest, FailRecordsErrorOnce) {
    auto id = create();
    EXPECT_TRUE(queue->fail(id, "slicer crashed"));
    EXPECT_FALSE(queue->fail(id, "again"));

    auto snapshot = queue->snapshot(id);
    EXPECT_EQ(snapshot->state, JobState::FAILED);
    EXPECT_EQ(snapshot->error, "slicer crashed");
}

TEST_F(JobQueueTest, ProgressOnlyWhilePrinting) {
    auto id = create();
    queue->setProgress(id, 0.5);
    EXPECT_FALSE(queue->snapshot(id)->progress.has_value());

    advanceToQueued(id);
    ASSERT_TRUE(queue->transition(id, JobState::QUEUED, JobState::PRINTING));
    queue->setProgress(id, 1.7);
    EXPECT_DOUBLE_EQ(*queue->snapshot(id)->progress, 1.0);

    ASSERT_TRUE(queue->transition(id, JobState::PRINTING, JobState::COMPLETED));
    EXPECT_DOUBLE_EQ(*queue->snapshot(id)->progress, 1.0);
}

TEST_F(JobQueueTest, FinishedJobsAreEvictedOldestFirst) {
    std::vector<JobId> ids;
    for (int i = 0; i < 4; ++i) {
        ids.push_back(create());
        ASSERT_TRUE(queue->fail(ids.back(), "failed"));
    }

    EXPECT_TRUE(queue->snapshot(ids[0])->evicted);
    EXPECT_TRUE(queue->snapshot(ids[1])->evicted);
    EXPECT_FALSE(queue->snapshot(ids[2])->evicted);
    EXPECT_FALSE(queue->snapshot(ids[3])->evicted);
    EXPECT_TRUE(queue->snapshot(ids[0])->history.empty());
    EXPECT_EQ(queue->list().size(), 2u);

    auto stats = queue->getStatistics();
    EXPECT_EQ(stats.totalJobs, 4u);
    EXPECT_EQ(stats.failedJobs, 4u);
    EXPECT_EQ(stats.activeJobs, 0u);
}

TEST_F(JobQueueTest, EvictedJobsKeepTheirFinalState) {
    JobQueue small(bus, 1);
    auto first = small.create("part.stl", slicer, driver, "bot-1");
    auto second = small.create("part.stl", slicer, driver, "bot-1");
    ASSERT_TRUE(small.fail(first, "nozzle jam"));
    ASSERT_TRUE(small.fail(second, "thermal runaway"));

    auto outcome = small.requestCancel(first);
    EXPECT_EQ(outcome.disposition, JobQueue::CancelDisposition::ALREADY_TERMINAL);
    EXPECT_EQ(outcome.previousState, JobState::FAILED);

    auto status = small.snapshot(first);
    ASSERT_TRUE(status.has_value());
    EXPECT_TRUE(status->evicted);
    EXPECT_EQ(status->state, JobState::FAILED);
    EXPECT_EQ(status->error, "nozzle jam");
    EXPECT_EQ(status->deviceId, "bot-1");

    EXPECT_FALSE(small.context(first).has_value());
    EXPECT_EQ(small.requestCancel(3).disposition, JobQueue::CancelDisposition::NOT_FOUND);
    EXPECT_FALSE(small.snapshot(3).has_value());
}

TEST_F(JobQueueTest, SliceJobsSkipTheWaitList) {
    auto id = queue->createSliceJob("part.stl", slicer, "/tmp/part.gcode");

    auto snapshot = queue->snapshot(id);
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->kind, JobKind::SLICE);
    EXPECT_EQ(snapshot->toolpath, "/tmp/part.gcode");
    EXPECT_TRUE(snapshot->deviceId.empty());
    EXPECT_TRUE(snapshot->driverProfile.empty());
    EXPECT_FALSE(snapshot->waitPosition.has_value());
    EXPECT_TRUE(queue->waitList("").empty());

    ASSERT_TRUE(queue->transition(id, JobState::CREATED, JobState::SLICING));
    EXPECT_THROW(queue->transition(id, JobState::SLICING, JobState::QUEUED), core::types::IllegalTransitionException);
    ASSERT_TRUE(queue->transition(id, JobState::SLICING, JobState::COMPLETED));
    EXPECT_EQ(queue->snapshot(id)->state, JobState::COMPLETED);
}

TEST_F(JobQueueTest, PrintJobsCannotCompleteFromSlicing) {
    auto id = create();
    ASSERT_TRUE(queue->transition(id, JobState::CREATED, JobState::SLICING));
    EXPECT_THROW(queue->transition(id, JobState::SLICING, JobState::COMPLETED),
                 core::types::IllegalTransitionException);
}

TEST_F(JobQueueTest, ProgressCarriesTemperature) {
    auto id = create();
    advanceToQueued(id);
    ASSERT_TRUE(queue->transition(id, JobState::QUEUED, JobState::PRINTING));

    core::device::TemperatureReport report;
    report.tools[0] = {205.5, 210.0};
    queue->setProgress(id, 0.5, report);
    queue->setProgress(id, 0.6);

    auto snapshot = queue->snapshot(id);
    ASSERT_TRUE(snapshot->temperature.has_value());
    EXPECT_DOUBLE_EQ(snapshot->temperature->tools.at(0).current, 205.5);
    EXPECT_EQ(snapshot->temperature->tools.at(0).target, 210.0);

    ASSERT_TRUE(waitUntil([this] {
        for (const auto &event: observer->events()) {
            if (event.type == EventType::JOB_PROGRESS && event.temperature) return true;
        }
        return false;
    }));
}

TEST_F(JobQueueTest, ListAppliesFilter) {
    auto first = create();
    create("bot-2");
    ASSERT_TRUE(queue->fail(first, "failed"));

    JobFilter active;
    active.activeOnly = true;
    EXPECT_EQ(queue->list().size(), 2u);
    EXPECT_EQ(queue->list(active).size(), 1u);

    JobFilter onBot2;
    onBot2.deviceId = "bot-2";
    ASSERT_EQ(queue->list(onBot2).size(), 1u);
    EXPECT_EQ(queue->list(onBot2)[0].deviceId, "bot-2");
}

TEST_F(JobQueueTest, EventsFollowTransitionOrder) {
    auto id = create();
    advanceToQueued(id);
    ASSERT_TRUE(queue->transition(id, JobState::QUEUED, JobState::PRINTING));
    ASSERT_TRUE(queue->transition(id, JobState::PRINTING, JobState::COMPLETED));

    ASSERT_TRUE(waitUntil([this] { return observer->events().size() == 5; }));
    auto events = observer->events();

    std::vector<JobState> expected = {JobState::CREATED, JobState::SLICING, JobState::QUEUED,
                                      JobState::PRINTING, JobState::COMPLETED};
    for (size_t i = 0; i < events.size(); ++i) {
        EXPECT_EQ(events[i].type, EventType::JOB_STATE_CHANGED);
        EXPECT_EQ(events[i].jobId, id);
        EXPECT_EQ(events[i].newState, expected[i]);
        if (i > 0) {
            EXPECT_GT(events[i].sequence, events[i - 1].sequence);
            EXPECT_EQ(events[i].oldState, expected[i - 1]);
        }
    }
    EXPECT_FALSE(events[0].oldState.has_value());
}

TEST_F(JobQueueTest, ProgressEventsAreThrottled) {
    auto id = create();
    advanceToQueued(id);
    ASSERT_TRUE(queue->transition(id, JobState::QUEUED, JobState::PRINTING));

    for (int i = 1; i <= 1000; ++i) {
        queue->setProgress(id, i / 1000.0);
    }
    ASSERT_TRUE(waitUntil([this] { return bus->pendingCount() == 0; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    size_t progressEvents = 0;
    for (const auto &event: observer->events()) {
        if (event.type == EventType::JOB_PROGRESS) {
            progressEvents++;
        }
    }
    EXPECT_GT(progressEvents, 0u);
    EXPECT_LE(progressEvents, 100u);
}
