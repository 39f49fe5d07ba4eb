///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "catalog.hpp"
#include "incremental_updater.hpp"
#include "schedule_state.hpp"
#include "test_instances.hpp"
#include <gtest/gtest.h>


///////////////////////////
///       FIXTURE       ///
///////////////////////////
class IncrementalUpdaterTest : public ::testing::Test {
protected:
    void SetUp() override {
        instance = smallInstance();
        SessionCatalog catalog(instance);
        ScheduleState state(catalog);
        // First-fit, conflict-free.
        for (int s = 0; s < catalog.sessionCount(); ++s) {
            bool placed = false;
            for (int t = 0; t < catalog.slotCount() && !placed; ++t) {
                for (int r : catalog.fittingRooms(catalog.session(s).courseIndex)) {
                    if (state.tryAssign(s, t, r)) {
                        placed = true;
                        break;
                    }
                }
            }
            ASSERT_TRUE(placed);
        }
        assignment = state.toAssignment();
    }

    int conflictsOf(const ProblemInstance& inst, const std::vector<SessionAssignment>& a) const {
        SessionCatalog catalog(inst);
        return ScheduleState::fromAssignment(catalog, a).conflictCount();
    }

    static bool samePlacement(const SessionAssignment& a, const SessionAssignment& b) {
        return a.courseId == b.courseId && a.sessionNumber == b.sessionNumber &&
               a.slotId == b.slotId && a.roomId == b.roomId;
    }

    void expectUnchanged(const std::vector<SessionAssignment>& before) const {
        ASSERT_EQ(assignment.size(), before.size());
        for (size_t i = 0; i < before.size(); ++i) EXPECT_TRUE(samePlacement(assignment[i], before[i]));
    }

    IncrementalUpdater updater;
    ProblemInstance instance;
    std::vector<SessionAssignment> assignment;
};


///////////////////////////
///        TESTS        ///
///////////////////////////
TEST_F(IncrementalUpdaterTest, AddPlacesEverySessionWithoutTouchingOthers) {
    std::vector<SessionAssignment> before = assignment;
    Course added = makeCourse(200, 0, 2, 3, RoomType::LECTURE, 10, studentRange(1, 3));

    IncrementalResult result = updater.addCourse(instance, assignment, added);
    ASSERT_TRUE(result.success) << result.message;
    ASSERT_EQ(result.assignedSessions.size(), 3u);
    EXPECT_EQ(assignment.size(), before.size() + 3);
    for (size_t i = 0; i < before.size(); ++i) EXPECT_TRUE(samePlacement(assignment[i], before[i]));
    for (const SessionAssignment& a : result.assignedSessions) EXPECT_EQ(a.courseId, 200);
    EXPECT_EQ(instance.courses.back().id, 200);
    EXPECT_EQ(conflictsOf(instance, assignment), 0);
}

TEST_F(IncrementalUpdaterTest, AddSpreadsSessionsOverDays) {
    Course added = makeCourse(201, 1, 2, 2, RoomType::SEMINAR, 5, studentRange(40, 44));
    IncrementalResult result = updater.addCourse(instance, assignment, added);
    ASSERT_TRUE(result.success) << result.message;
    ASSERT_EQ(result.assignedSessions.size(), 2u);
    EXPECT_NE(instance.grid.dayOf(result.assignedSessions[0].slotId),
              instance.grid.dayOf(result.assignedSessions[1].slotId));
}

TEST_F(IncrementalUpdaterTest, AddFailsWithoutConflictFreeSlotAndChangesNothing) {
    std::vector<SessionAssignment> before = assignment;
    size_t courses = instance.courses.size();
    // Faculty 1 already teaches four of the six slots.
    Course added = makeCourse(202, 0, 1, 3, RoomType::LECTURE, 10, studentRange(50, 55));

    IncrementalResult result = updater.addCourse(instance, assignment, added);
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.message.empty());
    EXPECT_TRUE(result.assignedSessions.empty());
    EXPECT_EQ(instance.courses.size(), courses);
    expectUnchanged(before);
}

TEST_F(IncrementalUpdaterTest, AddRejectsInvalidCourses) {
    std::vector<SessionAssignment> before = assignment;
    IncrementalResult duplicate = updater.addCourse(instance, assignment,
                                                    makeCourse(101, 0, 1, 1, RoomType::LECTURE, 10, {}));
    EXPECT_FALSE(duplicate.success);

    IncrementalResult unknownFaculty = updater.addCourse(instance, assignment,
                                                         makeCourse(203, 0, 99, 1, RoomType::LECTURE, 10, {}));
    EXPECT_FALSE(unknownFaculty.success);
    EXPECT_NE(unknownFaculty.message.find("Validation error"), std::string::npos);
    EXPECT_EQ(instance.courses.size(), 4u);
    expectUnchanged(before);
}

TEST_F(IncrementalUpdaterTest, RemoveDropsTheCourseAndItsSessions) {
    IncrementalResult result = updater.removeCourse(instance, assignment, 101);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.removedSessions.size(), 2u);
    EXPECT_EQ(instance.courses.size(), 3u);
    for (const SessionAssignment& a : assignment) EXPECT_NE(a.courseId, 101);
    EXPECT_EQ(conflictsOf(instance, assignment), 0);

    EXPECT_FALSE(updater.removeCourse(instance, assignment, 101).success);
}

TEST_F(IncrementalUpdaterTest, UpdateReplacesTheCourse) {
    Course changed = makeCourse(104, 1, 2, 2, RoomType::LECTURE, 10, studentRange(21, 30));
    IncrementalResult result = updater.updateCourse(instance, assignment, changed);
    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(result.removedSessions.size(), 1u);
    EXPECT_EQ(result.assignedSessions.size(), 2u);
    EXPECT_EQ(conflictsOf(instance, assignment), 0);
}

TEST_F(IncrementalUpdaterTest, FailedUpdateRestoresThePreviousCourse) {
    std::vector<SessionAssignment> before = assignment;
    // Five sessions for faculty 1 next to the two of course 101: seven for six slots.
    Course changed = makeCourse(102, 0, 1, 5, RoomType::LECTURE, 10, studentRange(11, 20));

    IncrementalResult result = updater.updateCourse(instance, assignment, changed);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.message.find("update of course 102"), std::string::npos);
    ASSERT_EQ(instance.courses.size(), 4u);
    bool found = false;
    for (const Course& c : instance.courses) {
        if (c.id == 102) {
            found = true;
            EXPECT_EQ(c.sessionCount, 2);
        }
    }
    EXPECT_TRUE(found);
    expectUnchanged(before);
}
