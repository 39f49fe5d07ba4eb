///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "catalog.hpp"
#include "clustering.hpp"
#include "conflict_repair.hpp"
#include "schedule_state.hpp"
#include "search_context.hpp"
#include "test_instances.hpp"
#include <gtest/gtest.h>
#include <random>


///////////////////////////
///       HELPERS       ///
///////////////////////////
static void placeRandomly(ScheduleState& state, unsigned seed) {
    const SessionCatalog& catalog = state.catalog();
    std::mt19937 rng(seed);
    for (int s = 0; s < catalog.sessionCount(); ++s) {
        const std::vector<int>& rooms = catalog.fittingRooms(catalog.session(s).courseIndex);
        std::uniform_int_distribution<int> slot(0, 2);
        std::uniform_int_distribution<int> room(0, (int)rooms.size() - 1);
        state.assignAllowingConflicts(s, slot(rng), rooms[room(rng)]);
    }
}


///////////////////////////
///        TESTS        ///
///////////////////////////
TEST(ConflictRepairTest, FeasibleCandidatesAreAcceptedByTheOracle) {
    ProblemInstance inst = smallInstance();
    SessionCatalog catalog(inst);
    ScheduleState state(catalog);
    int a = catalog.sessionsOf(catalog.courseIndexOf(101))[0];
    int b = catalog.sessionsOf(catalog.courseIndexOf(102))[0];
    state.assignAllowingConflicts(a, 0, 0);
    state.assignAllowingConflicts(b, 0, 0);

    PipelineConfig config;
    SearchContext context(config);
    ConflictRepairer repairer(catalog, config.repair, config.clustering, context);

    std::vector<Placement> candidates = repairer.feasibleCandidates(state, b);
    ASSERT_FALSE(candidates.empty());
    int previousSlot = -1;
    for (const Placement& p : candidates) {
        EXPECT_FALSE(state.wouldConflict(b, p.slot, p.roomIndex));
        EXPECT_GT(p.slot, previousSlot);
        previousSlot = p.slot;
    }
    EXPECT_NE(candidates.front().slot, 0);
}

TEST(ConflictRepairTest, ResolvesASimpleOverlap) {
    ProblemInstance inst = smallInstance();
    SessionCatalog catalog(inst);
    ScheduleState state(catalog);
    for (int s = 0; s < catalog.sessionCount(); ++s) {
        int c = catalog.session(s).courseIndex;
        state.assignAllowingConflicts(s, 0, catalog.fittingRooms(c).front());
    }
    ASSERT_GT(state.conflictCount(), 0);

    PipelineConfig config;
    SearchContext context(config);
    ConflictRepairer repairer(catalog, config.repair, config.clustering, context);
    RepairReport report = repairer.repair(state);

    EXPECT_EQ(report.after, state.conflictCount());
    EXPECT_EQ(report.after, 0);
    EXPECT_GT(report.moves + report.swaps, 0);
    EXPECT_TRUE(report.manualReviewCourseIds.empty());
    EXPECT_FALSE(context.valueTable.empty());
}

TEST(ConflictRepairTest, NeverIncreasesConflicts) {
    ProblemInstance inst = cohortInstance(16);
    SessionCatalog catalog(inst);
    PipelineConfig config;

    for (unsigned seed = 1; seed <= 5; ++seed) {
        ScheduleState state(catalog);
        placeRandomly(state, seed);
        int before = state.conflictCount();

        SearchContext context(config);
        ConflictRepairer repairer(catalog, config.repair, config.clustering, context, 4);
        RepairReport report = repairer.repair(state);
        EXPECT_EQ(report.before, before);
        EXPECT_LE(state.conflictCount(), before) << "seed " << seed;
        EXPECT_TRUE(state.isComplete());
        for (const ScopeReport& scope : report.scopes) {
            EXPECT_LE(scope.after, scope.before) << "seed " << seed;
            if (scope.rolledBack) EXPECT_EQ(scope.after, scope.before);
        }
    }
}

TEST(ConflictRepairTest, EveryScopeEndsNoWorseThanItStarted) {
    ProblemInstance inst = cohortInstance(16);
    SessionCatalog catalog(inst);
    PipelineConfig config;
    CourseClusterer clusterer(catalog, config.clustering);

    for (unsigned seed = 1; seed <= 5; ++seed) {
        ScheduleState state(catalog);
        placeRandomly(state, seed);
        SearchContext context(config);
        ConflictRepairer repairer(catalog, config.repair, config.clustering, context);

        std::vector<int> courses;
        for (int c = 0; c < catalog.courseCount(); ++c) courses.push_back(c);
        for (const std::vector<int>& scope : clusterer.superClusters(courses)) {
            ScopeFootprint fp = repairer.footprint(state, scope);
            int before = repairer.footprintConflicts(state, fp);
            std::vector<Placement> snapshot = state.placements();

            ScopeReport report = repairer.repairScope(state, scope);
            EXPECT_EQ(report.before, before);
            EXPECT_LE(report.after, report.before) << "seed " << seed;
            EXPECT_EQ(report.after, repairer.footprintConflicts(state, fp));
            if (report.rolledBack) {
                EXPECT_EQ(state.placements(), snapshot);
                EXPECT_EQ(report.manualReview, report.after > 0);
            }
        }
    }
}

TEST(ConflictRepairTest, WarmTableNeverIncreasesConflicts) {
    ProblemInstance inst = cohortInstance(16);
    SessionCatalog catalog(inst);
    PipelineConfig config;
    SearchContext context(config);
    context.valueTable.update("faculty|p5|c1|move", 4.0, 1.0);
    context.valueTable.update("student|p0|c3|move", 2.0, 1.0);

    ScheduleState state(catalog);
    placeRandomly(state, 9);
    int before = state.conflictCount();
    ConflictRepairer repairer(catalog, config.repair, config.clustering, context);
    RepairReport report = repairer.repair(state);
    EXPECT_LE(state.conflictCount(), before);
    for (const ScopeReport& scope : report.scopes) EXPECT_LE(scope.after, scope.before);
}

TEST(ConflictRepairTest, UnrepairableScopeIsRolledBackAndFlagged) {
    // One slot, one room, two courses of the same faculty stacked on it.
    ProblemInstance inst = emptyInstance(1, 1);
    inst.rooms.push_back({1, "Only", 40, RoomType::LECTURE});
    inst.faculty.push_back({1, "Prof"});
    inst.courses.push_back(makeCourse(1, 0, 1, 1, RoomType::LECTURE, 10, studentRange(1, 5)));
    inst.courses.push_back(makeCourse(2, 0, 1, 1, RoomType::LECTURE, 10, studentRange(6, 10)));
    SessionCatalog catalog(inst);
    ScheduleState state(catalog);
    state.assignAllowingConflicts(0, 0, 0);
    state.assignAllowingConflicts(1, 0, 0);
    std::vector<Placement> before = state.placements();

    PipelineConfig config;
    SearchContext context(config);
    ConflictRepairer repairer(catalog, config.repair, config.clustering, context);
    ScopeReport scope = repairer.repairScope(state, {0, 1});

    EXPECT_TRUE(scope.rolledBack);
    EXPECT_TRUE(scope.manualReview);
    EXPECT_EQ(scope.before, 2);
    EXPECT_EQ(scope.after, 2);
    EXPECT_EQ(state.placements(), before);

    RepairReport report = repairer.repair(state);
    EXPECT_EQ(report.after, 2);
    EXPECT_EQ(report.rollbacks, 1);
    EXPECT_EQ(report.manualReviewCourseIds, (std::vector<int>{1, 2}));
}

TEST(ConflictRepairTest, SpentBudgetLeavesTheStateAlone) {
    ProblemInstance inst = cohortInstance(16);
    SessionCatalog catalog(inst);
    ScheduleState state(catalog);
    placeRandomly(state, 3);
    ASSERT_GT(state.conflictCount(), 0);
    std::vector<Placement> before = state.placements();

    PipelineConfig config;
    config.repair.timeLimitSeconds = 0.0;
    SearchContext context(config);
    ConflictRepairer repairer(catalog, config.repair, config.clustering, context, 4);
    RepairReport report = repairer.repair(state);

    EXPECT_TRUE(report.timedOut);
    EXPECT_EQ(report.moves + report.swaps, 0);
    EXPECT_EQ(report.after, report.before);
    EXPECT_EQ(state.placements(), before);
}

TEST(ConflictRepairTest, MoveSignatureNamesTheDominantConflict) {
    ProblemInstance inst = smallInstance();
    SessionCatalog catalog(inst);
    ScheduleState state(catalog);
    int a = catalog.sessionsOf(catalog.courseIndexOf(101))[0];
    int b = catalog.sessionsOf(catalog.courseIndexOf(102))[0];
    state.assignAllowingConflicts(a, 0, 0);
    state.assignAllowingConflicts(b, 0, 1);

    PipelineConfig config;
    SearchContext context(config);
    ConflictRepairer repairer(catalog, config.repair, config.clustering, context);
    EXPECT_EQ(repairer.moveSignature(state, b, 4, false), "faculty|p1|c1|move");
    EXPECT_EQ(repairer.moveSignature(state, b, 2, true), "faculty|p2|c1|swap");
}
