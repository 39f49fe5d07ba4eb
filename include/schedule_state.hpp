#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "catalog.hpp"
#include <atomic>
#include <vector>


///////////////////////////
///      PLACEMENT      ///
///////////////////////////
/**
 * @brief (slot, room) of one session in dense indices; slot == -1 means unassigned.
 */
struct Placement {
    int slot = -1; ///< Dense slot id, or -1.
    int roomIndex = -1; ///< Dense room index, or -1.

    bool assigned() const { return slot >= 0; }
    bool operator==(const Placement& other) const {
        return slot == other.slot && roomIndex == other.roomIndex;
    }
    bool operator!=(const Placement& other) const { return !(*this == other); }
};


///////////////////////////
///    SCHEDULE STATE   ///
///////////////////////////
/**
 * @brief Live assignment plus faculty, room and student occupancy counts.
 *
 * Every cell (resource, slot) counts the sessions occupying it; the conflict
 * count is the summed excess (n - 1) over all cells and is maintained
 * incrementally. Mutation goes through the validated operations (tryAssign,
 * tryMove, trySwap), which consult the conflict oracle first and leave the
 * state untouched on rejection. The unvalidated paths are
 * assignAllowingConflicts (greedy fallback and merging, reports the conflicts
 * it introduced), restore (scope rollback) and adopt (refined chromosome).
 *
 * Sessions with disjoint faculty, student and room footprints may be mutated
 * from different threads; the shared totals are atomic.
 */
class ScheduleState {
public:
    explicit ScheduleState(const SessionCatalog& catalog);
    ScheduleState(const ScheduleState& other);
    ScheduleState& operator=(const ScheduleState& other);

    const SessionCatalog& catalog() const { return *catalog_; }

    /**
     * @brief Conflict oracle.
     *
     * @return true when placing the session at (slot, roomIndex) would be outside
     *         its domain or would share a faculty, room or student cell with another
     *         session. The session's own current placement is ignored.
     */
    bool wouldConflict(int session, int slot, int roomIndex) const;

    /// Assign an unassigned session if the oracle accepts the placement.
    bool tryAssign(int session, int slot, int roomIndex);

    /// Relocate an assigned session if the oracle accepts the new placement.
    bool tryMove(int session, int slot, int roomIndex);

    /**
     * @brief Exchange the placements of two assigned sessions.
     *
     * Accepted only when both halves pass the oracle against the state in which
     * the other half has already moved.
     */
    bool trySwap(int sessionA, int sessionB);

    /**
     * @brief Place a session without consulting the oracle.
     *
     * Reserved for the greedy fallback and for merging independent results.
     * Moves the session if it is already assigned.
     *
     * @return Conflict excess added by the placement (after lifting the session).
     */
    int assignAllowingConflicts(int session, int slot, int roomIndex);

    /// Remove a session's placement (no-op when unassigned).
    void unassign(int session);

    /// Put a session back to a recorded placement (rollback of a repair scope).
    void restore(int session, const Placement& placement);

    const Placement& placement(int session) const { return placements_[session]; }
    const std::vector<Placement>& placements() const { return placements_; }

    /// Summed excess over every faculty, room and student cell.
    int conflictCount() const { return excess_.load(); }

    /// Sessions without a placement.
    int unassignedCount() const { return catalog_->sessionCount() - assigned_.load(); }

    bool isComplete() const { return unassignedCount() == 0; }

    /**
     * @brief Summed excess over the cells occupied by the given sessions.
     *
     * Used as the conflict count of a repair scope.
     */
    int conflictScore(const std::vector<int>& sessions) const;

    /// Conflict excess a session currently takes part in (its cells with n > 1).
    int sessionConflicts(int session) const;

    /// Placed sessions whose room is outside the course domain.
    int capacityViolations() const;

    /// Summed department preference penalty of all placed sessions.
    double preferencePenalty() const;

    int facultyLoad(int facultyIndex, int slot) const { return facultyLoad_[facultyIndex * slots_ + slot]; }
    int roomLoad(int roomIndex, int slot) const { return roomLoad_[roomIndex * slots_ + slot]; }
    int studentLoad(int studentIndex, int slot) const { return studentLoad_[(long)studentIndex * slots_ + slot]; }

    /// Snapshot-id view of every placed session.
    std::vector<SessionAssignment> toAssignment() const;

    /**
     * @brief Rebuild a state from a caller-supplied assignment.
     *
     * Conflicting placements are accepted (they are what detection reports).
     *
     * @throws ValidationError for unknown courses or rooms, session numbers out of
     *         range, slots outside the grid, or a session listed twice.
     */
    static ScheduleState fromAssignment(const SessionCatalog& catalog,
                                        const std::vector<SessionAssignment>& assignment);

    /// Replace every placement (validation-free; used to adopt a refined chromosome).
    void adopt(const std::vector<Placement>& placements);

private:
    const SessionCatalog* catalog_;
    int slots_;

    std::vector<Placement> placements_;
    std::vector<int> facultyLoad_;
    std::vector<int> roomLoad_;
    std::vector<int> studentLoad_;

    std::atomic<int> excess_{0};
    std::atomic<int> assigned_{0};

    bool cellsFree(int session, int slot, int roomIndex) const;

    /// Occupy the session's cells; returns the excess added.
    int add(int session, int slot, int roomIndex);
    void remove(int session);
    int bump(int& cell, int delta);
};
