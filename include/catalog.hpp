#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <unordered_map>
#include <vector>


///////////////////////////
///       CATALOG       ///
///////////////////////////
/**
 * @brief One session of a course, addressed by dense indices.
 */
struct Session {
    int courseIndex; ///< Dense index of the owning course.
    int sessionNumber; ///< 0-based session index within the course.
};

/**
 * @brief Validated, densely indexed view of a problem snapshot.
 *
 * Snapshot ids are arbitrary integers; every stage works on dense indices
 * (course, session, room, faculty, student, slot) computed here once per run.
 * The catalog keeps a reference to the instance, which must outlive it.
 */
class SessionCatalog {
public:
    /**
     * @brief Validate the snapshot and build every index.
     *
     * @throws ValidationError on duplicate ids, unknown faculty references,
     *         non-positive session counts, negative capacities, duplicate
     *         enrollments, or a slot list that does not match the grid.
     */
    explicit SessionCatalog(const ProblemInstance& inst);

    const ProblemInstance& instance() const { return inst_; }
    const TimeGrid& grid() const { return inst_.grid; }

    int courseCount() const { return (int)inst_.courses.size(); }
    int sessionCount() const { return (int)sessions_.size(); }
    int roomCount() const { return (int)inst_.rooms.size(); }
    int facultyCount() const { return (int)inst_.faculty.size(); }
    int studentCount() const { return (int)studentIds_.size(); }
    int slotCount() const { return inst_.grid.slotCount(); }

    const Course& course(int courseIndex) const { return inst_.courses[courseIndex]; }
    const Room& room(int roomIndex) const { return inst_.rooms[roomIndex]; }
    const Session& session(int sessionIndex) const { return sessions_[sessionIndex]; }

    /// Dense session indices of a course, ordered by session number.
    const std::vector<int>& sessionsOf(int courseIndex) const { return courseSessions_[courseIndex]; }

    /// Dense faculty index teaching a course.
    int facultyOf(int courseIndex) const { return courseFaculty_[courseIndex]; }

    /// Dense student indices enrolled in a course.
    const std::vector<int>& studentsOf(int courseIndex) const { return courseStudents_[courseIndex]; }

    /// Dense course indices a student is enrolled in.
    const std::vector<int>& coursesOfStudent(int studentIndex) const { return studentCourses_[studentIndex]; }

    /// Snapshot id of a dense student index.
    int studentId(int studentIndex) const { return studentIds_[studentIndex]; }

    /// Number of distinct departments among a student's courses.
    int departmentSpread(int studentIndex) const { return studentDepartments_[studentIndex]; }

    /**
     * @brief Rooms whose type and capacity fit a course.
     *
     * A course's domain is every slot crossed with these rooms.
     */
    const std::vector<int>& fittingRooms(int courseIndex) const { return fittingRooms_[courseIndex]; }

    /// Whether a room is in a course's domain.
    bool roomFits(int courseIndex, int roomIndex) const;

    /// Number of valid (slot, room) pairs of one session of the course.
    long domainSize(int courseIndex) const {
        return (long)slotCount() * (long)fittingRooms_[courseIndex].size();
    }

    /// Soft-preference cost of placing one session of the course at a slot.
    double preferencePenalty(int courseIndex, int slot) const;

    /// Number of students enrolled in both courses.
    int sharedStudents(int courseA, int courseB) const;

    /// Dense index of a course id, or -1 if unknown.
    int courseIndexOf(int courseId) const;

    /// Dense index of a room id, or -1 if unknown.
    int roomIndexOf(int roomId) const;

    /// Dense index of a faculty id, or -1 if unknown.
    int facultyIndexOf(int facultyId) const;

private:
    const ProblemInstance& inst_;

    std::vector<Session> sessions_;
    std::vector<std::vector<int>> courseSessions_;
    std::vector<int> courseFaculty_;
    std::vector<std::vector<int>> courseStudents_; ///< Sorted dense student indices.
    std::vector<std::vector<int>> studentCourses_;
    std::vector<int> studentIds_;
    std::vector<int> studentDepartments_;
    std::vector<std::vector<int>> fittingRooms_;
    std::vector<std::vector<char>> roomFits_; ///< roomFits_[course][room].

    /// penaltyBySlot_[preferenceIndex][slot]; courses map to a preference via coursePreference_.
    std::vector<std::vector<double>> penaltyBySlot_;
    std::vector<int> coursePreference_; ///< -1 when the department has no preference.

    std::unordered_map<int, int> courseIndex_;
    std::unordered_map<int, int> roomIndex_;
    std::unordered_map<int, int> facultyIndex_;

    void validateGrid() const;
    void indexResources();
    void indexCourses();
    void indexPreferences();
};
