///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "formatting.hpp"
#include <algorithm>
#include <array>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>

///////////////////////////
///       HELPERS       ///
///////////////////////////

/**
 * @brief Human-readable names for each teaching day.
 *
 * Indexed by the 0-based day index of the time grid; days past Sunday print as "Day N".
 */
static const std::array<std::string, 7> kDayNames = {
        "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday", "Sunday"
};

static std::string formatDay(int day) {
    if (day >= 0 && day < (int)kDayNames.size()) return kDayNames[day];
    return "Day " + std::to_string(day + 1);
}

/**
 * @brief One-hour time range of a period; period 0 starts at 08:00.
 */
static std::string formatPeriod(int period) {
    std::ostringstream out;
    out << std::setfill('0') << std::setw(2) << 8 + period << ":00-" << std::setw(2) << 9 + period << ":00";
    return out.str();
}

/**
 * @brief Lightweight view of a single placed session for one faculty member.
 *
 * Holds resolved pointers to course and room to simplify sorting and rendering.
 */
struct FacultySlotView {
    int day; ///< Day index of the session.
    int period; ///< Period index within the day.
    int sessionNumber; ///< Session index within the course.
    const Course* course; ///< Course of the session (non-owning).
    const Room* room; ///< Room of the session (may be null).
};

/**
 * @brief Print the header row for a per-day schedule table.
 */
static void printDayTableHeader() {
    std::cout << "    "
              << std::left << std::setw(11) << "Time"
              << " | " << std::left << std::setw(10) << "Course"
              << " | " << std::left << std::setw(8)  << "Session"
              << " | " << std::left << std::setw(8)  << "Type"
              << " | " << std::left << std::setw(8)  << "Room"
              << " | " << std::left << std::setw(8)  << "Students"
              << "\n";

    std::cout << "    "
              << std::string(11, '-')
              << "-+-" << std::string(10, '-')
              << "-+-" << std::string(8, '-')
              << "-+-" << std::string(8, '-')
              << "-+-" << std::string(8, '-')
              << "-+-" << std::string(8, '-')
              << "\n";
}

/**
 * @brief Print per-faculty schedules of an assignment.
 *
 * For each faculty member, collects the placed sessions of the courses they
 * teach, then prints them grouped by day and ordered by period.
 */
void printFacultySchedules(const ProblemInstance& inst, const std::vector<SessionAssignment>& assignment) {
    std::map<int, const Course*> courseById;
    for (const Course& course : inst.courses) courseById[course.id] = &course;
    std::map<int, const Room*> roomById;
    for (const Room& room : inst.rooms) roomById[room.id] = &room;

    for (const Faculty& faculty : inst.faculty) {
        std::vector<FacultySlotView> slots;
        for (const SessionAssignment& a : assignment) {
            auto courseIt = courseById.find(a.courseId);
            if (courseIt == courseById.end() || courseIt->second->facultyId != faculty.id) continue;

            auto roomIt = roomById.find(a.roomId);
            FacultySlotView view;
            view.day = inst.grid.dayOf(a.slotId);
            view.period = inst.grid.periodOf(a.slotId);
            view.sessionNumber = a.sessionNumber;
            view.course = courseIt->second;
            view.room = roomIt == roomById.end() ? nullptr : roomIt->second;
            slots.push_back(view);
        }

        std::cout << "----------------------------------------\n";
        std::cout << "Schedule for " << faculty.name << ":\n";
        if (slots.empty()) {
            std::cout << "  (no sessions)\n";
            continue;
        }

        std::sort(slots.begin(), slots.end(),
                  [](const FacultySlotView& a, const FacultySlotView& b) {
                      if (a.day != b.day) return a.day < b.day;
                      return a.period < b.period;
                  });

        int currentDay = -1;
        for (const FacultySlotView& s : slots) {
            if (s.day != currentDay) {
                currentDay = s.day;
                std::cout << "\n  " << formatDay(s.day) << ":\n";
                printDayTableHeader();
            }

            std::string roomName = s.room ? s.room->name : "UnknownRoom";
            std::cout << "    "
                      << std::left << std::setw(11) << formatPeriod(s.period)
                      << " | " << std::left << std::setw(10) << s.course->code
                      << " | " << std::left << std::setw(8)  << s.sessionNumber + 1
                      << " | " << std::left << std::setw(8)  << formatRoomType(s.course->requiredRoomType)
                      << " | " << std::left << std::setw(8)  << roomName
                      << " | " << std::left << std::setw(8)  << s.course->studentIds.size()
                      << "\n";
        }
        std::cout << "\n";
    }
}

void printConflictReport(const ProblemInstance& inst, const std::vector<Conflict>& conflicts) {
    std::map<int, std::string> codeById;
    for (const Course& course : inst.courses) codeById[course.id] = course.code;

    std::cout << "----------------------------------------\n";
    if (conflicts.empty()) {
        std::cout << "No conflicts.\n";
        return;
    }

    int severity = 0;
    for (const Conflict& conflict : conflicts) severity += conflict.severity;
    std::cout << conflicts.size() << " conflicts (total severity " << severity << "):\n";
    for (const Conflict& conflict : conflicts) {
        std::cout << "  " << std::left << std::setw(16) << conflict.id
                  << " " << std::left << std::setw(8) << formatConflictType(conflict.type)
                  << " " << formatDay(inst.grid.dayOf(conflict.slotId)) << " "
                  << formatPeriod(inst.grid.periodOf(conflict.slotId))
                  << "  severity " << conflict.severity << "  courses:";
        for (int courseId : conflict.courseIds) std::cout << " " << codeById[courseId];
        if (conflict.type == ConflictType::STUDENT) std::cout << "  (" << conflict.resourceId << " students)";
        std::cout << "\n";
    }
}

void printSummary(const PipelineSummary& summary) {
    std::cout << "----------------------------------------\n";
    std::cout << "Clusters:            " << summary.clusters
              << " (modularity " << std::fixed << std::setprecision(3) << summary.modularity << ")\n";
    std::cout << "Fallback clusters:   " << summary.fallbackClusters
              << " (" << summary.precheckSkips << " by pre-check, "
              << summary.suspectedDefects << " suspected defects)\n";
    std::cout << "Merge conflicts:     " << summary.mergeConflicts << "\n";
    std::cout << "Conflicts:           " << summary.conflictsAfterSolving << " solved -> "
              << summary.conflictsAfterRefinement << " refined (" << summary.refinementGenerations
              << " generations) -> " << summary.conflictsAfterRepair << " repaired\n";
    std::cout << "Repair rollbacks:    " << summary.repairRollbacks << "\n";
    std::cout << "Manual review:       " << summary.manualReviewCourseIds.size() << " courses\n";
    std::cout << "Time:                " << std::setprecision(2) << summary.seconds << " s\n";
    std::cout.unsetf(std::ios::fixed);
    std::cout << std::setprecision(6);
}
