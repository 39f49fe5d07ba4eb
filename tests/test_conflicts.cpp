///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "catalog.hpp"
#include "conflicts.hpp"
#include "schedule_state.hpp"
#include "test_instances.hpp"
#include <gtest/gtest.h>
#include <algorithm>


///////////////////////////
///       HELPERS       ///
///////////////////////////
static const Conflict* findConflict(const std::vector<Conflict>& conflicts, const std::string& id) {
    auto it = std::find_if(conflicts.begin(), conflicts.end(), [&id](const Conflict& c) { return c.id == id; });
    return it == conflicts.end() ? nullptr : &*it;
}


///////////////////////////
///        TESTS        ///
///////////////////////////
TEST(ConflictDetectionTest, ConflictFreeStateHasNoRecords) {
    ProblemInstance inst = smallInstance();
    SessionCatalog catalog(inst);
    ScheduleState state(catalog);
    ASSERT_TRUE(state.tryAssign(catalog.sessionsOf(0)[0], 0, 0));
    EXPECT_TRUE(detectConflicts(state).empty());
}

TEST(ConflictDetectionTest, FacultyAndRoomOverlapsArePerCell) {
    ProblemInstance inst = smallInstance();
    SessionCatalog catalog(inst);
    ScheduleState state(catalog);
    int a = catalog.sessionsOf(catalog.courseIndexOf(101))[0];
    int b = catalog.sessionsOf(catalog.courseIndexOf(102))[0];
    state.assignAllowingConflicts(a, 3, 0);
    state.assignAllowingConflicts(b, 3, 0);

    std::vector<Conflict> conflicts = detectConflicts(state);
    ASSERT_EQ(conflicts.size(), 2u);

    const Conflict* faculty = findConflict(conflicts, "F1@3");
    ASSERT_NE(faculty, nullptr);
    EXPECT_EQ(faculty->type, ConflictType::FACULTY);
    EXPECT_EQ(faculty->severity, 1);
    EXPECT_EQ(faculty->courseIds, (std::vector<int>{101, 102}));
    EXPECT_EQ(faculty->resourceId, 1);

    const Conflict* room = findConflict(conflicts, "R10@3");
    ASSERT_NE(room, nullptr);
    EXPECT_EQ(room->type, ConflictType::ROOM);
    EXPECT_EQ(room->slotId, 3);

    std::vector<int> sessions = conflictSessions(state, *faculty);
    std::sort(sessions.begin(), sessions.end());
    std::vector<int> expected{a, b};
    std::sort(expected.begin(), expected.end());
    EXPECT_EQ(sessions, expected);
}

TEST(ConflictDetectionTest, StudentOverlapsAreGroupedByCourseSet) {
    ProblemInstance inst = smallInstance();
    SessionCatalog catalog(inst);
    ScheduleState state(catalog);
    state.assignAllowingConflicts(catalog.sessionsOf(catalog.courseIndexOf(101))[0], 0, 0);
    state.assignAllowingConflicts(catalog.sessionsOf(catalog.courseIndexOf(103))[0], 0, 2);

    std::vector<Conflict> conflicts = detectConflicts(state);
    ASSERT_EQ(conflicts.size(), 1u);
    EXPECT_EQ(conflicts[0].id, "S101-103@0");
    EXPECT_EQ(conflicts[0].type, ConflictType::STUDENT);
    EXPECT_EQ(conflicts[0].severity, 5);
    EXPECT_EQ(conflicts[0].resourceId, 5);
}

TEST(ConflictDetectionTest, SeveritySumsToConflictCount) {
    ProblemInstance inst = cohortInstance();
    SessionCatalog catalog(inst);
    ScheduleState state(catalog);
    // Everything in the first two slots and rooms.
    for (int s = 0; s < catalog.sessionCount(); ++s) state.assignAllowingConflicts(s, s % 2, s % 2);

    int total = 0;
    for (const Conflict& conflict : detectConflicts(state)) total += conflict.severity;
    EXPECT_GT(total, 0);
    EXPECT_EQ(total, state.conflictCount());
}

TEST(ConflictDetectionTest, IdsAreStableAcrossDetections) {
    ProblemInstance inst = cohortInstance();
    SessionCatalog catalog(inst);
    ScheduleState state(catalog);
    for (int s = 0; s < catalog.sessionCount(); ++s) state.assignAllowingConflicts(s, s % 3, 0);

    std::vector<Conflict> first = detectConflicts(state);
    std::vector<Conflict> second = detectConflicts(ScheduleState(state));
    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) EXPECT_EQ(first[i].id, second[i].id);
}
