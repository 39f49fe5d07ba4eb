///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "catalog.hpp"
#include "cluster_worker_pool.hpp"
#include "demo_instances.hpp"
#include "schedule_state.hpp"
#include "test_instances.hpp"
#include "timetable_service.hpp"
#include <gtest/gtest.h>


///////////////////////////
///       FIXTURE       ///
///////////////////////////
class TimetableServiceTest : public ::testing::Test {
protected:
    static PipelineConfig quickConfig() {
        PipelineConfig config;
        config.workerThreads = 2;
        config.solver.strategyTimeLimitSeconds = 2.0;
        config.refiner.generations = 10;
        config.refiner.timeLimitSeconds = 5.0;
        config.repair.timeLimitSeconds = 5.0;
        config.progress.intervalMs = 5;
        return config;
    }

    /// Every session of the small instance in slot 0 of its first fitting room.
    static std::vector<SessionAssignment> stackedAssignment(const ProblemInstance& inst) {
        SessionCatalog catalog(inst);
        ScheduleState state(catalog);
        for (int s = 0; s < catalog.sessionCount(); ++s) {
            state.assignAllowingConflicts(s, 0, catalog.fittingRooms(catalog.session(s).courseIndex).front());
        }
        return state.toAssignment();
    }

    TimetableService service{quickConfig(), std::make_shared<ThreadedClusterStage>(2)};
};


///////////////////////////
///        JOBS         ///
///////////////////////////
TEST_F(TimetableServiceTest, JobRunsToCompletion) {
    ProblemInstance inst = cohortInstance(12);
    std::string id = service.submit(inst);
    EXPECT_EQ(id, "job-1");

    ASSERT_TRUE(service.waitFor(id, std::chrono::seconds(120)));
    std::optional<JobResult> result = service.getResult(id);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, JobStatus::COMPLETED);
    EXPECT_EQ(result->jobId, id);
    EXPECT_EQ((int)result->assignment.size(), SessionCatalog(inst).sessionCount());
    EXPECT_LE(result->submittedAt, result->startedAt);
    EXPECT_LE(result->startedAt, result->finishedAt);

    std::optional<ProgressSnapshot> progress = service.getProgress(id);
    ASSERT_TRUE(progress.has_value());
    EXPECT_EQ(progress->status, JobStatus::COMPLETED);
    EXPECT_DOUBLE_EQ(progress->percent, 100.0);

    // Finished jobs cannot be cancelled.
    EXPECT_FALSE(service.cancel(id));
}

TEST_F(TimetableServiceTest, ProgressIsMonotonicWhileRunning) {
    std::string id = service.submit(makeDemoInstance(DemoSize::S));
    double last = 0.0;
    while (!service.waitFor(id, std::chrono::milliseconds(10))) {
        std::optional<ProgressSnapshot> progress = service.getProgress(id);
        ASSERT_TRUE(progress.has_value());
        EXPECT_GE(progress->percent, last);
        if (progress->status == JobStatus::RUNNING) EXPECT_LT(progress->percent, 100.0);
        last = progress->percent;
    }
    EXPECT_EQ(service.getProgress(id)->status, JobStatus::COMPLETED);
}

TEST_F(TimetableServiceTest, InvalidInstanceFailsTheJob) {
    ProblemInstance inst = cohortInstance();
    inst.courses[2].facultyId = 77;
    std::string id = service.submit(inst);

    ASSERT_TRUE(service.waitFor(id, std::chrono::seconds(30)));
    EXPECT_FALSE(service.getResult(id).has_value());
    std::optional<JobResult> job = service.getJob(id);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->status, JobStatus::FAILED);
    EXPECT_NE(job->message.find("unknown faculty 77"), std::string::npos);
    EXPECT_TRUE(job->assignment.empty());
    EXPECT_EQ(service.getProgress(id)->message, job->message);
}

TEST_F(TimetableServiceTest, CancelledJobHasNoResult) {
    std::string id = service.submit(makeDemoInstance(DemoSize::M));
    bool accepted = service.cancel(id);

    ASSERT_TRUE(service.waitFor(id, std::chrono::seconds(120)));
    std::optional<JobResult> job = service.getJob(id);
    ASSERT_TRUE(job.has_value());
    if (accepted) {
        EXPECT_EQ(job->status, JobStatus::CANCELLED);
        EXPECT_FALSE(service.getResult(id).has_value());
    }
}

TEST_F(TimetableServiceTest, UnknownJobIdsAreReported) {
    EXPECT_FALSE(service.getProgress("job-42").has_value());
    EXPECT_FALSE(service.getResult("job-42").has_value());
    EXPECT_FALSE(service.getJob("job-42").has_value());
    EXPECT_FALSE(service.cancel("job-42"));
    EXPECT_FALSE(service.waitFor("job-42", std::chrono::milliseconds(1)));
}

TEST_F(TimetableServiceTest, JobIdsAreSequential) {
    std::string first = service.submit(cohortInstance());
    std::string second = service.submit(cohortInstance());
    EXPECT_NE(first, second);
    EXPECT_EQ(second, "job-2");
    EXPECT_TRUE(service.waitFor(first, std::chrono::seconds(120)));
    EXPECT_TRUE(service.waitFor(second, std::chrono::seconds(120)));
}


///////////////////////////
///      CONFLICTS      ///
///////////////////////////
TEST_F(TimetableServiceTest, DetectConflictsReportsRecords) {
    ProblemInstance inst = smallInstance();
    DetectionResult detected = service.detectConflicts(inst, stackedAssignment(inst));
    ASSERT_TRUE(detected.success) << detected.message;
    EXPECT_FALSE(detected.conflicts.empty());

    std::vector<SessionAssignment> bogus{{999, 0, 0, 10}};
    DetectionResult rejected = service.detectConflicts(inst, bogus);
    EXPECT_FALSE(rejected.success);
    EXPECT_FALSE(rejected.message.empty());
}

TEST_F(TimetableServiceTest, ResolveWithoutApplyLeavesTheAssignment) {
    ProblemInstance inst = smallInstance();
    std::vector<SessionAssignment> assignment = stackedAssignment(inst);
    std::vector<SessionAssignment> before = assignment;

    ResolutionReport report = service.resolveConflict(inst, assignment, "F1@0", false);
    ASSERT_TRUE(report.success) << report.message;
    EXPECT_EQ(report.resolved + report.manualReview, 1);
    ASSERT_EQ(assignment.size(), before.size());
    for (size_t i = 0; i < before.size(); ++i) {
        EXPECT_EQ(assignment[i].slotId, before[i].slotId);
        EXPECT_EQ(assignment[i].roomId, before[i].roomId);
    }
}

TEST_F(TimetableServiceTest, ResolveAllAppliesRepairs) {
    ProblemInstance inst = smallInstance();
    std::vector<SessionAssignment> assignment = stackedAssignment(inst);
    size_t conflictsBefore = service.detectConflicts(inst, assignment).conflicts.size();

    ResolutionReport report = service.resolveConflict(inst, assignment, "all", true);
    ASSERT_TRUE(report.success) << report.message;
    EXPECT_EQ((size_t)(report.resolved + report.manualReview), conflictsBefore);
    EXPECT_EQ(report.details.size(), conflictsBefore);
    EXPECT_GT(report.resolved, 0);

    DetectionResult after = service.detectConflicts(inst, assignment);
    ASSERT_TRUE(after.success);
    if (report.manualReview == 0) EXPECT_TRUE(after.conflicts.empty());
    EXPECT_LE((int)after.conflicts.size(), (int)conflictsBefore);

    ResolutionReport clean = service.resolveConflict(inst, assignment, "all", true);
    if (after.conflicts.empty()) {
        EXPECT_TRUE(clean.success);
        EXPECT_EQ(clean.message, "no conflicts");
    }
}

TEST_F(TimetableServiceTest, PartlyClearedStudentConflictStaysForReview) {
    // Student 7 takes courses 1, 2 and 3 in slot 0; faculty 1 and 2 are busy in slot 1.
    ProblemInstance inst = emptyInstance(1, 2);
    for (int r = 1; r <= 3; ++r) inst.rooms.push_back({r, "R" + std::to_string(r), 40, RoomType::LECTURE});
    for (int f = 1; f <= 3; ++f) inst.faculty.push_back({f, "F" + std::to_string(f)});
    inst.courses.push_back(makeCourse(1, 0, 1, 1, RoomType::LECTURE, 1, {7}));
    inst.courses.push_back(makeCourse(2, 0, 2, 1, RoomType::LECTURE, 1, {7}));
    inst.courses.push_back(makeCourse(3, 0, 3, 1, RoomType::LECTURE, 1, {7}));
    inst.courses.push_back(makeCourse(4, 0, 1, 1, RoomType::LECTURE, 1, {20}));
    inst.courses.push_back(makeCourse(5, 0, 2, 1, RoomType::LECTURE, 1, {21}));
    std::vector<SessionAssignment> assignment{{1, 0, 0, 1}, {2, 0, 0, 2}, {3, 0, 0, 3}, {4, 0, 1, 1}, {5, 0, 1, 2}};

    ResolutionReport report = service.resolveConflict(inst, assignment, "S1-2-3@0", true);
    ASSERT_TRUE(report.success) << report.message;
    EXPECT_EQ(report.resolved, 0);
    EXPECT_EQ(report.manualReview, 1);
    ASSERT_EQ(report.details.size(), 1u);
    EXPECT_EQ(report.details[0], "S1-2-3@0: manual review");

    // Only course 3 could leave slot 0.
    for (const SessionAssignment& a : assignment) {
        if (a.courseId == 3) EXPECT_EQ(a.slotId, 1);
        if (a.courseId == 1 || a.courseId == 2) EXPECT_EQ(a.slotId, 0);
    }
    DetectionResult after = service.detectConflicts(inst, assignment);
    ASSERT_TRUE(after.success);
    ASSERT_EQ(after.conflicts.size(), 1u);
    EXPECT_EQ(after.conflicts[0].id, "S1-2@0");
}

TEST_F(TimetableServiceTest, ClearedFacultyCellCountsAsResolved) {
    ProblemInstance inst = emptyInstance(1, 2);
    inst.rooms.push_back({1, "R1", 40, RoomType::LECTURE});
    inst.rooms.push_back({2, "R2", 40, RoomType::LECTURE});
    inst.faculty.push_back({1, "F1"});
    inst.courses.push_back(makeCourse(1, 0, 1, 1, RoomType::LECTURE, 1, {1}));
    inst.courses.push_back(makeCourse(2, 0, 1, 1, RoomType::LECTURE, 1, {2}));
    std::vector<SessionAssignment> assignment{{1, 0, 0, 1}, {2, 0, 0, 2}};

    ResolutionReport report = service.resolveConflict(inst, assignment, "F1@0", true);
    ASSERT_TRUE(report.success) << report.message;
    EXPECT_EQ(report.resolved, 1);
    EXPECT_EQ(report.manualReview, 0);
    EXPECT_TRUE(service.detectConflicts(inst, assignment).conflicts.empty());
}

TEST_F(TimetableServiceTest, ResolveUnknownConflictFails) {
    ProblemInstance inst = smallInstance();
    std::vector<SessionAssignment> assignment = stackedAssignment(inst);
    ResolutionReport report = service.resolveConflict(inst, assignment, "R99@5", true);
    EXPECT_FALSE(report.success);
    EXPECT_NE(report.message.find("R99@5"), std::string::npos);
}


///////////////////////////
///     INCREMENTAL     ///
///////////////////////////
TEST_F(TimetableServiceTest, PointUpdatesGoThroughTheService) {
    ProblemInstance inst = smallInstance();
    std::vector<SessionAssignment> assignment;
    IncrementalResult added = service.addCourse(inst, assignment,
                                                makeCourse(300, 0, 2, 2, RoomType::SEMINAR, 5, studentRange(60, 62)));
    ASSERT_TRUE(added.success) << added.message;
    EXPECT_EQ(assignment.size(), 2u);

    IncrementalResult updated = service.updateCourse(inst, assignment,
                                                     makeCourse(300, 0, 2, 1, RoomType::SEMINAR, 5, studentRange(60, 62)));
    ASSERT_TRUE(updated.success) << updated.message;
    EXPECT_EQ(assignment.size(), 1u);

    IncrementalResult removed = service.removeCourse(inst, assignment, 300);
    ASSERT_TRUE(removed.success);
    EXPECT_TRUE(assignment.empty());
}
