#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "cancellation.hpp"
#include "catalog.hpp"
#include "conflicts.hpp"
#include "config.hpp"
#include "progress.hpp"
#include "schedule_state.hpp"
#include "search_context.hpp"
#include <string>
#include <vector>


///////////////////////////
///        TYPES        ///
///////////////////////////
/**
 * @brief Resources a repair scope may read or write.
 *
 * Faculty and students of the scope's courses, plus every room the scope's
 * sessions currently use or could move to. Two scopes with disjoint
 * footprints touch disjoint occupancy cells.
 */
struct ScopeFootprint {
    std::vector<int> faculty;
    std::vector<int> students;
    std::vector<int> rooms;
};

/**
 * @brief Outcome of repairing one scope.
 */
struct ScopeReport {
    std::vector<int> courseIds; ///< Courses of the scope.
    int before = 0; ///< Footprint conflicts before the pass.
    int after = 0; ///< Footprint conflicts after the pass (== before when rolled back).
    int moves = 0; ///< Validated relocations applied.
    int swaps = 0; ///< Validated exchanges applied.
    int rejected = 0; ///< Sessions for which no validated move existed.
    bool rolledBack = false; ///< The pass did not reduce conflicts and was discarded.
    bool manualReview = false; ///< Scope flagged for manual review.
};

/**
 * @brief Outcome of a repair run.
 */
struct RepairReport {
    int before = 0; ///< Global conflicts before repair.
    int after = 0; ///< Global conflicts after repair.
    int passes = 0;
    int moves = 0;
    int swaps = 0;
    int rollbacks = 0;
    std::vector<ScopeReport> scopes; ///< Scopes of the last pass.
    std::vector<int> manualReviewCourseIds; ///< Courses of scopes left unresolved.
    bool timedOut = false;
    bool cancelled = false;
};


///////////////////////////
///   CONFLICT REPAIR   ///
///////////////////////////
/**
 * @brief Local-search conflict repair over super-cluster scopes.
 *
 * For each conflicting session of a scope, a feasible-slot generator lists
 * (slot, room) pairs the conflict oracle accepts against the current state;
 * they are ranked by the learned value table when it is non-empty, otherwise
 * by earliest slot. Moves are applied one at a time through the validated
 * operations, so a move only counts once the oracle has accepted it. A scope
 * whose pass does not reduce its conflicts is rolled back and flagged for
 * manual review. Scopes with disjoint footprints run concurrently; the rest
 * run one after another.
 */
class ConflictRepairer {
public:
    ConflictRepairer(const SessionCatalog& catalog, const RepairConfig& config,
                     const ClusteringConfig& clustering, SearchContext& context, int numThreads = 1);

    /**
     * @brief Repair every conflict of the state.
     *
     * Guarantees state.conflictCount() after <= before.
     */
    RepairReport repair(ScheduleState& state, StageReporter* reporter = nullptr,
                        const CancellationToken* cancel = nullptr);

    /**
     * @brief Repair one scope of courses (dense indices) once.
     *
     * Guarantees the scope's footprint conflicts after <= before.
     */
    ScopeReport repairScope(ScheduleState& state, const std::vector<int>& courses);

    /// Oracle-accepted placements of a session: at most one room per slot, earliest slot first.
    std::vector<Placement> feasibleCandidates(const ScheduleState& state, int session) const;

    ScopeFootprint footprint(const ScheduleState& state, const std::vector<int>& courses) const;

    /// Summed excess over every cell of a footprint.
    int footprintConflicts(const ScheduleState& state, const ScopeFootprint& footprint) const;

    /// Value-table key of moving a session to a slot.
    std::string moveSignature(const ScheduleState& state, int session, int slot, bool swap) const;

private:
    const SessionCatalog& catalog_;
    RepairConfig config_;
    ClusteringConfig clustering_;
    SearchContext& context_;
    int numThreads_;

    void rankCandidates(const ScheduleState& state, int session, std::vector<Placement>& candidates) const;
    bool trySwapFor(ScheduleState& state, int session, const std::vector<int>& scopeSessions);
    std::vector<std::vector<int>> disjointWaves(const ScheduleState& state,
                                                const std::vector<std::vector<int>>& scopes) const;
};
