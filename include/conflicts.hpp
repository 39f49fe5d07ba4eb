#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "schedule_state.hpp"
#include <string>
#include <vector>


///////////////////////////
///      CONFLICTS      ///
///////////////////////////
enum class ConflictType { FACULTY, ROOM, STUDENT };

/**
 * @brief One overlap derived from a schedule state.
 *
 * Ids are stable across detections of the same state:
 * "F<faculty>@<slot>", "R<room>@<slot>", "S<course>-<course>...@<slot>".
 */
struct Conflict {
    std::string id; ///< Stable conflict id.
    ConflictType type; ///< Overlapping resource kind.
    int severity; ///< Summed excess (n - 1) of the cells behind the record.
    std::vector<int> courseIds; ///< Involved course ids, ascending.
    int slotId; ///< Slot of the overlap.
    int resourceId; ///< Faculty or room id; for student conflicts the number of students affected.
};

std::string formatConflictType(ConflictType type);

/**
 * @brief Derive every conflict record of a state.
 *
 * Faculty and room conflicts are reported per cell; student conflicts are
 * grouped by (slot, set of involved courses). The summed severity always
 * equals ScheduleState::conflictCount().
 */
std::vector<Conflict> detectConflicts(const ScheduleState& state);

/**
 * @brief Sessions (dense indices) placed at the conflict's slot that belong to its courses.
 */
std::vector<int> conflictSessions(const ScheduleState& state, const Conflict& conflict);
