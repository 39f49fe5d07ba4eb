#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <string>
#include <vector>


///////////////////////////
///       MODELS        ///
///////////////////////////
/**
 * @brief Kind of teaching space; a course can only be placed in rooms of its required type.
 */
enum class RoomType { LECTURE, SEMINAR, LAB };

/**
 * @brief A single teaching room.
 */
struct Room {
    int id; ///< Unique room identifier.
    std::string name; ///< Room label (e.g., "C301").
    int capacity; ///< Maximum number of students the room can hold.
    RoomType type; ///< Kind of teaching space.
};

/**
 * @brief Faculty member. Only its identity takes part in conflict checks.
 */
struct Faculty {
    int id; ///< Unique faculty identifier.
    std::string name; ///< Display name.
};

/**
 * @brief One cell of the weekly time grid.
 *
 * Slot ids are dense: id == day * periodsPerDay + period.
 */
struct TimeSlot {
    int id; ///< Dense slot identifier.
    int day; ///< Day index (0 = Monday).
    int period; ///< Period index within the day.
};

/**
 * @brief Weekly time grid (days x periods).
 */
struct TimeGrid {
    int days = 5; ///< Teaching days per week.
    int periodsPerDay = 8; ///< Periods per teaching day.

    int slotCount() const { return days * periodsPerDay; }
    int slotId(int day, int period) const { return day * periodsPerDay + period; }
    int dayOf(int slotId) const { return slotId / periodsPerDay; }
    int periodOf(int slotId) const { return slotId % periodsPerDay; }
};

/**
 * @brief A course with its weekly sessions, faculty member and enrolled students.
 *
 * Immutable once a generation run starts. Each course owns sessionCount sessions
 * which are the atomic units of assignment.
 */
struct Course {
    int id; ///< Unique course identifier.
    std::string code; ///< Human-readable course code.
    int departmentId; ///< Owning department (drives soft preferences).
    int facultyId; ///< Faculty member teaching every session of the course.
    int sessionCount; ///< Number of weekly sessions to place.
    RoomType requiredRoomType; ///< Room type every session needs.
    int minCapacity; ///< Minimum room capacity requested by the department.
    std::vector<int> studentIds; ///< Enrolled student ids.

    /// Seats a room must offer: the larger of the requested minimum and the enrollment.
    int requiredCapacity() const {
        int enrolled = (int)studentIds.size();
        return enrolled > minCapacity ? enrolled : minCapacity;
    }
};

/**
 * @brief Soft time preference submitted by a department.
 *
 * A session placed outside the preferred days or periods costs `weight`.
 * Empty lists mean "no preference" for that dimension.
 */
struct DepartmentPreference {
    int departmentId; ///< Department the preference applies to.
    std::vector<int> preferredDays; ///< Acceptable day indices.
    std::vector<int> preferredPeriods; ///< Acceptable period indices.
    double weight = 1.0; ///< Penalty per session placed outside the preference.
};

/**
 * @brief Placement of one session, expressed in snapshot ids.
 *
 * This is the shape exchanged with callers: results, conflict detection input and
 * incremental updates all use it.
 */
struct SessionAssignment {
    int courseId; ///< Course the session belongs to.
    int sessionNumber; ///< 0-based session index within the course.
    int slotId; ///< Assigned time slot id.
    int roomId; ///< Assigned room id.
};

/**
 * @brief Read-only snapshot of everything the pipeline schedules.
 *
 * Mirrors one organization/semester/academic-year export of the data store.
 */
struct ProblemInstance {
    TimeGrid grid; ///< Weekly time grid.
    std::vector<TimeSlot> slots; ///< One entry per grid cell, ordered by id.
    std::vector<Room> rooms; ///< All rooms available for teaching.
    std::vector<Faculty> faculty; ///< All faculty members.
    std::vector<Course> courses; ///< All courses to schedule.
    std::vector<DepartmentPreference> preferences; ///< Department soft preferences.
};

/**
 * @brief Build the dense slot list for a time grid.
 */
std::vector<TimeSlot> makeTimeSlots(const TimeGrid& grid);

/**
 * @brief Human-readable label of a room type.
 */
std::string formatRoomType(RoomType type);
