#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "cancellation.hpp"
#include <string>
#include <vector>


///////////////////////////
///       MODEL         ///
///////////////////////////
/**
 * @brief Outcome class of one solve call.
 */
enum class SolveStatus { OPTIMAL, FEASIBLE, INFEASIBLE, UNKNOWN };

std::string formatSolveStatus(SolveStatus status);

/**
 * @brief Boolean model made of cardinality-one constraints.
 *
 * Every scheduling constraint of a cluster is either "exactly one of these
 * variables" (a session takes one (slot, room) pair) or "at most one of
 * these variables" (a room, faculty or student cell). Each variable carries a
 * cost; the objective is the summed cost of the true variables.
 */
class BoolModel {
public:
    /// Create a variable and return its index.
    int newVar(double cost = 0.0);

    void addExactlyOne(const std::vector<int>& vars);
    void addAtMostOne(const std::vector<int>& vars);

    int varCount() const { return (int)costs_.size(); }
    int constraintCount() const { return (int)constraints_.size(); }
    double cost(int var) const { return costs_[var]; }

    /// Sum over exactly-one constraints of their cheapest variable.
    double costLowerBound() const;

private:
    friend class BoolSolver;

    struct Constraint {
        std::vector<int> vars;
        bool exactlyOne;
    };

    std::vector<double> costs_;
    std::vector<Constraint> constraints_;
    std::vector<std::vector<int>> varConstraints_; ///< Constraints each variable appears in.

    void addConstraint(const std::vector<int>& vars, bool exactlyOne);
};


///////////////////////////
///       SOLVER        ///
///////////////////////////
/**
 * @brief Result of BoolSolver::solve.
 */
struct SolveResult {
    SolveStatus status = SolveStatus::UNKNOWN;
    std::vector<char> values; ///< Truth value per variable (valid when feasible).
    double objective = 0.0; ///< Summed cost of the true variables.
    double seconds = 0.0; ///< Wall-clock time spent.
    long decisions = 0; ///< Branching decisions taken.
};

/**
 * @brief Backtracking search with propagation over cardinality-one constraints.
 *
 * A true variable forces every other variable of its constraints false; an
 * exactly-one constraint left with a single open variable forces it true.
 * Branching picks the open exactly-one constraint with the fewest open
 * variables and tries them cheapest first (ties by index), so the first model
 * found is cost-greedy. The model is OPTIMAL when its objective reaches the
 * model's lower bound, FEASIBLE otherwise.
 */
class BoolSolver {
public:
    /**
     * @param timeLimitSeconds Wall-clock budget; UNKNOWN is returned when it runs out.
     * @param cancel           Optional cancellation flag polled with the clock.
     */
    BoolSolver(double timeLimitSeconds, const CancellationToken* cancel = nullptr);

    SolveResult solve(const BoolModel& model);

private:
    double timeLimit_;
    const CancellationToken* cancel_;
};
