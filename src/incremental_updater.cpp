///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "incremental_updater.hpp"
#include "catalog.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "schedule_state.hpp"
#include <algorithm>
#include <set>


///////////////////////////
///     INCREMENTAL     ///
///////////////////////////
IncrementalResult IncrementalUpdater::addCourse(ProblemInstance& instance, std::vector<SessionAssignment>& assignment,
                                                const Course& course) const {
    IncrementalResult result;
    for (const Course& existing : instance.courses) {
        if (existing.id == course.id) {
            result.message = "course " + std::to_string(course.id) + " already exists";
            return result;
        }
    }

    // Work on a copy; the caller's data changes only on success.
    ProblemInstance extended = instance;
    extended.courses.push_back(course);
    try {
        SessionCatalog catalog(extended);
        ScheduleState state = ScheduleState::fromAssignment(catalog, assignment);
        int c = catalog.courseIndexOf(course.id);
        const TimeGrid& grid = catalog.grid();

        std::set<int> usedDays;
        for (int s : catalog.sessionsOf(c)) {
            // Earliest conflict-free slot, preferring days the course does not use yet.
            Placement chosen;
            for (int pass = 0; pass < 2 && !chosen.assigned(); ++pass) {
                for (int t = 0; t < catalog.slotCount() && !chosen.assigned(); ++t) {
                    if (pass == 0 && usedDays.count(grid.dayOf(t))) continue;
                    for (int r : catalog.fittingRooms(c)) {
                        if (state.tryAssign(s, t, r)) {
                            chosen = {t, r};
                            break;
                        }
                    }
                }
            }
            if (!chosen.assigned()) {
                result.message = "no conflict-free slot for session " +
                                 std::to_string(catalog.session(s).sessionNumber) + " of course " +
                                 std::to_string(course.id);
                logWarning("Incremental add rejected: " + result.message);
                result.assignedSessions.clear();
                return result;
            }
            usedDays.insert(grid.dayOf(chosen.slot));
            result.assignedSessions.push_back({course.id, catalog.session(s).sessionNumber, chosen.slot,
                                               catalog.room(chosen.roomIndex).id});
        }
    } catch (const ValidationError& e) {
        result.assignedSessions.clear();
        result.message = e.what();
        return result;
    }

    instance.courses.push_back(course);
    assignment.insert(assignment.end(), result.assignedSessions.begin(), result.assignedSessions.end());
    result.success = true;
    logInfo("Added course " + std::to_string(course.id) + " with " +
            std::to_string(result.assignedSessions.size()) + " sessions");
    return result;
}

IncrementalResult IncrementalUpdater::removeCourse(ProblemInstance& instance, std::vector<SessionAssignment>& assignment,
                                                   int courseId) const {
    IncrementalResult result;
    auto it = std::find_if(instance.courses.begin(), instance.courses.end(),
                           [courseId](const Course& c) { return c.id == courseId; });
    if (it == instance.courses.end()) {
        result.message = "unknown course " + std::to_string(courseId);
        return result;
    }
    instance.courses.erase(it);

    std::vector<SessionAssignment> kept;
    kept.reserve(assignment.size());
    for (const SessionAssignment& a : assignment) {
        if (a.courseId == courseId) result.removedSessions.push_back(a);
        else kept.push_back(a);
    }
    assignment.swap(kept);
    result.success = true;
    logInfo("Removed course " + std::to_string(courseId) + " (" +
            std::to_string(result.removedSessions.size()) + " sessions)");
    return result;
}

IncrementalResult IncrementalUpdater::updateCourse(ProblemInstance& instance, std::vector<SessionAssignment>& assignment,
                                                   const Course& course) const {
    ProblemInstance previousInstance = instance;
    std::vector<SessionAssignment> previousAssignment = assignment;

    IncrementalResult removed = removeCourse(instance, assignment, course.id);
    if (!removed.success) return removed;

    IncrementalResult added = addCourse(instance, assignment, course);
    if (!added.success) {
        instance = std::move(previousInstance);
        assignment = std::move(previousAssignment);
        added.message = "update of course " + std::to_string(course.id) + " failed: " + added.message;
        return added;
    }
    added.removedSessions = std::move(removed.removedSessions);
    return added;
}
