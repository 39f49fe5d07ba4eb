#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "cancellation.hpp"
#include "catalog.hpp"
#include "config.hpp"
#include "sat_model.hpp"
#include "schedule_state.hpp"
#include <string>
#include <utility>
#include <vector>


///////////////////////////
///        TYPES        ///
///////////////////////////
/**
 * @brief Constraint sets tried in order, each under its own time budget.
 */
enum class SolveStrategy {
    FULL,             ///< Priority students exact, remainder sampled.
    RELAXED_STUDENTS, ///< Smaller priority set, no sampling.
    ESSENTIAL,        ///< Assignment, room and faculty constraints only.
    GREEDY            ///< Greedy fallback (no exact model).
};

std::string formatStrategy(SolveStrategy strategy);

/**
 * @brief What happened while solving one cluster.
 */
struct ClusterSolveReport {
    int clusterIndex = -1;
    int courses = 0;
    int sessions = 0;
    long domainPairs = 0; ///< Valid (session, slot, room) triples after domain reduction.
    SolveStrategy strategy = SolveStrategy::GREEDY; ///< Strategy whose result was accepted.
    SolveStatus status = SolveStatus::UNKNOWN; ///< Status of the accepted exact solve.
    bool usedFallback = false; ///< Greedy fallback produced the placements.
    bool skippedByPrecheck = false; ///< Capacity pre-check sent the cluster straight to fallback.
    bool suspectedModelingDefect = false; ///< An instant INFEASIBLE on a large domain was seen.
    int relaxedSessions = 0; ///< Fallback sessions placed without a conflict-free pair.
    double seconds = 0.0;
};

/**
 * @brief Placements of one cluster plus its report.
 */
struct ClusterResult {
    std::vector<std::pair<int, Placement>> placements; ///< (session, placement) for every session.
    ClusterSolveReport report;
};


///////////////////////////
///   CLUSTER SOLVER    ///
///////////////////////////
/**
 * @brief Per-cluster exact solving with staged relaxation and greedy fallback.
 *
 * One boolean variable exists per valid (session, slot, room) triple. Each
 * session takes exactly one; each room cell, faculty cell and selected student
 * cell takes at most one, always at session granularity. Strategies are
 * tried in order and the first FEASIBLE/OPTIMAL result is accepted.
 *
 * Instances are stateless after construction and may be shared by workers.
 */
class ClusterSolver {
public:
    ClusterSolver(const SessionCatalog& catalog, const SolverConfig& config,
                  const CancellationToken* cancel = nullptr);

    /**
     * @brief Solve one cluster; always returns a placement for every session.
     *
     * @param courses      Dense course indices of the cluster.
     * @param clusterIndex Index used in the report and to derive the seed.
     * @param seed         Base seed of the run.
     */
    ClusterResult solve(const std::vector<int>& courses, int clusterIndex, unsigned seed) const;

    /**
     * @brief Build and solve the model of one strategy.
     *
     * @param placements Filled with the decoded placements when the result is feasible.
     */
    SolveResult solveWith(const std::vector<int>& courses, SolveStrategy strategy, unsigned seed,
                          std::vector<std::pair<int, Placement>>& placements) const;

    /**
     * @brief Whether the cluster's (slot x room) supply can plausibly cover its sessions.
     *
     * Fails when a course has no fitting room, when one faculty teaches more
     * sessions than there are slots, or when the fitting (slot, room) pairs
     * cover less than capacityPrecheckRatio of the sessions.
     */
    bool passesCapacityPrecheck(const std::vector<int>& courses) const;

    /// Valid (session, slot, room) triples of the cluster.
    long domainPairs(const std::vector<int>& courses) const;

    /**
     * @brief Students enrolled in at least two cluster courses, highest priority first.
     *
     * Priority: total enrollment count, then number of distinct departments.
     */
    std::vector<int> rankedStudents(const std::vector<int>& courses) const;

private:
    const SessionCatalog& catalog_;
    SolverConfig config_;
    const CancellationToken* cancel_;

    std::vector<int> modeledStudents(const std::vector<int>& courses, SolveStrategy strategy, unsigned seed) const;
};
