///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "sat_model.hpp"
#include <gtest/gtest.h>


///////////////////////////
///        TESTS        ///
///////////////////////////
TEST(BoolSolverTest, ExactlyOneWithAtMostOneCells) {
    // Two sessions, two cells; each cell holds at most one session.
    BoolModel model;
    int a0 = model.newVar(), a1 = model.newVar();
    int b0 = model.newVar(), b1 = model.newVar();
    model.addExactlyOne({a0, a1});
    model.addExactlyOne({b0, b1});
    model.addAtMostOne({a0, b0});
    model.addAtMostOne({a1, b1});

    SolveResult result = BoolSolver(1.0).solve(model);
    ASSERT_EQ(result.status, SolveStatus::OPTIMAL);
    EXPECT_EQ(result.values[a0] + result.values[a1], 1);
    EXPECT_EQ(result.values[b0] + result.values[b1], 1);
    EXPECT_NE(result.values[a0], result.values[b0]);
}

TEST(BoolSolverTest, PigeonholeIsInfeasible) {
    // Three sessions competing for two cells.
    BoolModel model;
    std::vector<std::vector<int>> vars(3);
    for (auto& row : vars) {
        row = {model.newVar(), model.newVar()};
        model.addExactlyOne(row);
    }
    model.addAtMostOne({vars[0][0], vars[1][0], vars[2][0]});
    model.addAtMostOne({vars[0][1], vars[1][1], vars[2][1]});

    SolveResult result = BoolSolver(1.0).solve(model);
    EXPECT_EQ(result.status, SolveStatus::INFEASIBLE);
}

TEST(BoolSolverTest, EmptyExactlyOneIsInfeasible) {
    BoolModel model;
    model.newVar();
    model.addExactlyOne({});
    EXPECT_EQ(BoolSolver(1.0).solve(model).status, SolveStatus::INFEASIBLE);
}

TEST(BoolSolverTest, CheapestChoiceReachesTheLowerBound) {
    BoolModel model;
    int expensive = model.newVar(3.0);
    int cheap = model.newVar(1.0);
    model.addExactlyOne({expensive, cheap});

    SolveResult result = BoolSolver(1.0).solve(model);
    ASSERT_EQ(result.status, SolveStatus::OPTIMAL);
    EXPECT_EQ(result.values[cheap], 1);
    EXPECT_DOUBLE_EQ(result.objective, 1.0);
    EXPECT_DOUBLE_EQ(model.costLowerBound(), 1.0);
}

TEST(BoolSolverTest, ContentionAboveTheBoundIsFeasible) {
    // Both sessions want the cheap cell; one has to pay.
    BoolModel model;
    int a0 = model.newVar(0.0), a1 = model.newVar(2.0);
    int b0 = model.newVar(0.0), b1 = model.newVar(2.0);
    model.addExactlyOne({a0, a1});
    model.addExactlyOne({b0, b1});
    model.addAtMostOne({a0, b0});

    SolveResult result = BoolSolver(1.0).solve(model);
    EXPECT_EQ(result.status, SolveStatus::FEASIBLE);
    EXPECT_DOUBLE_EQ(result.objective, 2.0);
}

TEST(BoolSolverTest, CancelledSearchReportsUnknown) {
    BoolModel model;
    for (int s = 0; s < 4; ++s) model.addExactlyOne({model.newVar(), model.newVar()});

    CancellationToken cancel;
    cancel.cancel();
    SolveResult result = BoolSolver(10.0, &cancel).solve(model);
    EXPECT_EQ(result.status, SolveStatus::UNKNOWN);
}
