#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <string>
#include <vector>


///////////////////////////
///        TYPES        ///
///////////////////////////
/**
 * @brief Outcome of a point update.
 */
struct IncrementalResult {
    bool success = false;
    std::string message; ///< Reason of a failure.
    std::vector<SessionAssignment> assignedSessions; ///< Sessions added to the assignment.
    std::vector<SessionAssignment> removedSessions; ///< Sessions removed from the assignment.
};


///////////////////////////
///     INCREMENTAL     ///
///////////////////////////
/**
 * @brief Point updates of an existing schedule without regeneration.
 *
 * Every existing placement is left exactly as it is: a new course's sessions
 * only go where the conflict oracle accepts them, and when any session has
 * no such place the update fails and nothing is changed. The instance and
 * the assignment are only written on success.
 */
class IncrementalUpdater {
public:
    /// Add a course and place all of its sessions conflict-free.
    IncrementalResult addCourse(ProblemInstance& instance, std::vector<SessionAssignment>& assignment,
                                const Course& course) const;

    /// Remove a course and every placement of its sessions.
    IncrementalResult removeCourse(ProblemInstance& instance, std::vector<SessionAssignment>& assignment,
                                   int courseId) const;

    /**
     * @brief Replace a course (same id): remove, then add.
     *
     * When the add fails the previous course and placements are kept.
     */
    IncrementalResult updateCourse(ProblemInstance& instance, std::vector<SessionAssignment>& assignment,
                                   const Course& course) const;
};
