///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "progress.hpp"
#include <gtest/gtest.h>
#include <thread>
#include <vector>


///////////////////////////
///       HELPERS       ///
///////////////////////////
static ProgressConfig manualConfig() {
    ProgressConfig config;
    config.intervalMs = 0; // the test drives step()
    return config;
}


///////////////////////////
///    STAGE REPORTER   ///
///////////////////////////
TEST(StageReporterTest, OutOfOrderReportsNeverMoveBackwards) {
    StageReporter reporter;
    reporter.setTotal(100);
    reporter.report(50);
    reporter.report(10);
    EXPECT_EQ(reporter.done(), 50);
    reporter.report(500);
    EXPECT_EQ(reporter.done(), 100);
    EXPECT_DOUBLE_EQ(reporter.fraction(), 1.0);
}

TEST(StageReporterTest, ConcurrentIncrementsAreClampedToTotal) {
    StageReporter reporter;
    reporter.setTotal(1000);
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&reporter]() {
            for (int i = 0; i < 400; ++i) reporter.increment();
        });
    }
    for (auto& worker : workers) worker.join();
    EXPECT_EQ(reporter.done(), 1000);
}

TEST(StageReporterTest, ZeroTotalBecomesOne) {
    StageReporter reporter;
    reporter.setTotal(0);
    EXPECT_EQ(reporter.total(), 1);
    EXPECT_DOUBLE_EQ(reporter.fraction(), 0.0);
}


///////////////////////////
///     COORDINATOR     ///
///////////////////////////
TEST(ProgressCoordinatorTest, StartsQueuedAtZero) {
    ProgressCoordinator progress(manualConfig());
    ProgressSnapshot snap = progress.snapshot();
    EXPECT_EQ(snap.status, JobStatus::QUEUED);
    EXPECT_DOUBLE_EQ(snap.percent, 0.0);
    EXPECT_FALSE(snap.etaSeconds.has_value());

    progress.step();
    EXPECT_DOUBLE_EQ(progress.displayedPercent(), 0.0);
}

TEST(ProgressCoordinatorTest, BurstyReportsAreSmoothedAndMonotonic) {
    ProgressCoordinator progress(manualConfig());
    progress.start();
    StageReporter& solving = progress.beginStage(PipelineStage::SOLVING);
    solving.setTotal(10);

    double last = 0.0;
    const long reports[] = {9, 2, 10, 3, 10};
    for (long done : reports) {
        solving.report(done);
        for (int i = 0; i < 5; ++i) {
            progress.step();
            double now = progress.displayedPercent();
            EXPECT_GE(now, last);
            EXPECT_LE(now, progress.stageBounds(PipelineStage::SOLVING).second);
            last = now;
        }
    }
}

TEST(ProgressCoordinatorTest, LargeJumpIsNotDisplayedAtOnce) {
    ProgressCoordinator progress(manualConfig());
    progress.start();
    StageReporter& solving = progress.beginStage(PipelineStage::SOLVING);
    solving.setTotal(10);
    solving.report(9);

    progress.step();
    EXPECT_GT(progress.displayedPercent(), 0.0);
    EXPECT_LT(progress.displayedPercent(), progress.targetPercent());
}

TEST(ProgressCoordinatorTest, ConvergesToTheStageEnd) {
    ProgressCoordinator progress(manualConfig());
    progress.start();
    StageReporter& solving = progress.beginStage(PipelineStage::SOLVING);
    solving.setTotal(4);
    solving.report(4);

    for (int i = 0; i < 500; ++i) progress.step();
    EXPECT_DOUBLE_EQ(progress.displayedPercent(), progress.stageBounds(PipelineStage::SOLVING).second);
    ASSERT_TRUE(progress.snapshot().etaSeconds.has_value());
    EXPECT_GE(*progress.snapshot().etaSeconds, 1.0);
}

TEST(ProgressCoordinatorTest, CreepStaysBelowTheHeadroom) {
    ProgressConfig config = manualConfig();
    ProgressCoordinator progress(config);
    progress.start();
    progress.beginStage(PipelineStage::CLUSTERING);

    for (int i = 0; i < 1000; ++i) progress.step();
    double shown = progress.displayedPercent();
    EXPECT_GT(shown, 0.0);
    EXPECT_LE(shown, config.creepHeadroom + 1e-9);
}

TEST(ProgressCoordinatorTest, HundredIsReservedForCompletion) {
    ProgressCoordinator progress(manualConfig());
    progress.start();
    StageReporter& last = progress.beginStage(PipelineStage::FINALIZING);
    last.setTotal(1);
    last.report(1);
    for (int i = 0; i < 2000; ++i) progress.step();
    EXPECT_LE(progress.displayedPercent(), 99.9);

    progress.complete();
    ProgressSnapshot snap = progress.snapshot();
    EXPECT_EQ(snap.status, JobStatus::COMPLETED);
    EXPECT_DOUBLE_EQ(snap.percent, 100.0);
    ASSERT_TRUE(snap.etaSeconds.has_value());
    EXPECT_DOUBLE_EQ(*snap.etaSeconds, 0.0);
}

TEST(ProgressCoordinatorTest, EarlierStageDoesNotRewindTheActiveStage) {
    ProgressCoordinator progress(manualConfig());
    progress.start();
    progress.beginStage(PipelineStage::REFINING);
    StageReporter& late = progress.beginStage(PipelineStage::SOLVING);
    late.report(1);
    EXPECT_EQ(progress.snapshot().stage, PipelineStage::REFINING);
    EXPECT_GE(progress.targetPercent(), progress.stageBounds(PipelineStage::REFINING).first);
}

TEST(ProgressCoordinatorTest, FailureFreezesTheDisplayedValue) {
    ProgressCoordinator progress(manualConfig());
    progress.start();
    StageReporter& refining = progress.beginStage(PipelineStage::REFINING);
    refining.report(1);
    for (int i = 0; i < 20; ++i) progress.step();
    double frozen = progress.displayedPercent();

    progress.fail("unknown faculty 9");
    for (int i = 0; i < 20; ++i) progress.step();
    ProgressSnapshot snap = progress.snapshot();
    EXPECT_EQ(snap.status, JobStatus::FAILED);
    EXPECT_EQ(snap.message, "unknown faculty 9");
    EXPECT_DOUBLE_EQ(snap.percent, frozen);

    // Terminal states are final.
    progress.complete();
    progress.cancel();
    EXPECT_EQ(progress.snapshot().status, JobStatus::FAILED);
}

TEST(ProgressCoordinatorTest, QueuedJobCanBeCancelled) {
    ProgressCoordinator progress(manualConfig());
    progress.cancel();
    EXPECT_EQ(progress.snapshot().status, JobStatus::CANCELLED);
    progress.start();
    EXPECT_EQ(progress.snapshot().status, JobStatus::CANCELLED);
}

TEST(ProgressCoordinatorTest, ReportingLoopAdvancesOnItsOwn) {
    ProgressConfig config;
    config.intervalMs = 2;
    ProgressCoordinator progress(config);
    progress.start();
    StageReporter& solving = progress.beginStage(PipelineStage::SOLVING);
    solving.setTotal(2);
    solving.report(1);

    for (int i = 0; i < 200 && progress.displayedPercent() < config.clusteringEnd; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_GE(progress.displayedPercent(), config.clusteringEnd);
    progress.complete();
    EXPECT_DOUBLE_EQ(progress.displayedPercent(), 100.0);
}
