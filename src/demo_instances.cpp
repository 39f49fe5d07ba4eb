///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "demo_instances.hpp"
#include <algorithm>
#include <random>
#include <string>


///////////////////////////
///       PRESETS       ///
///////////////////////////
namespace {

/**
 * @brief Shape parameters of one demo size.
 */
struct DemoShape {
    int departments; ///< Number of departments.
    int coursesPerDepartment; ///< Courses owned by each department.
    int studentsPerDepartment; ///< Students whose home is each department.
    int homeCoursesPerStudent; ///< Courses a student takes in the home department.
    int lectureRooms; ///< Rooms of each type.
    int seminarRooms;
    int labRooms;
    TimeGrid grid; ///< Weekly time grid.
};

DemoShape shapeOf(DemoSize size) {
    switch (size) {
        case DemoSize::S: return {3, 4, 20, 2, 2, 2, 1, {5, 6}};
        case DemoSize::M: return {5, 8, 60, 3, 4, 3, 2, {5, 8}};
        case DemoSize::L: return {8, 15, 150, 3, 10, 6, 4, {5, 8}};
    }
    return {3, 4, 20, 2, 2, 2, 1, {5, 6}};
}

const char* kDepartmentCodes[] = {"CS", "MA", "PH", "CH", "BI", "EC", "HI", "LI"};

/// Largest capacity of a room type, used to cap enrollment so every course has a fitting room.
int largestCapacity(const std::vector<Room>& rooms, RoomType type) {
    int best = 0;
    for (const Room& room : rooms) {
        if (room.type == type) best = std::max(best, room.capacity);
    }
    return best;
}

}  // namespace


///////////////////////////
///        DEMOS        ///
///////////////////////////
ProblemInstance makeDemoInstance(DemoSize size, unsigned seed) {
    DemoShape shape = shapeOf(size);
    std::mt19937 rng(seed);
    ProblemInstance inst;
    inst.grid = shape.grid;
    inst.slots = makeTimeSlots(inst.grid);

    // Rooms
    int nextRoomId = 100;
    for (int i = 0; i < shape.lectureRooms; ++i) {
        inst.rooms.push_back({nextRoomId++, "L" + std::to_string(101 + i), 80 + 40 * (i % 3), RoomType::LECTURE});
    }
    for (int i = 0; i < shape.seminarRooms; ++i) {
        inst.rooms.push_back({nextRoomId++, "S" + std::to_string(201 + i), 30 + 10 * (i % 2), RoomType::SEMINAR});
    }
    for (int i = 0; i < shape.labRooms; ++i) {
        inst.rooms.push_back({nextRoomId++, "B" + std::to_string(301 + i), 24 + 6 * (i % 2), RoomType::LAB});
    }

    // Faculty and courses; each faculty member teaches two courses of their department.
    std::vector<std::vector<int>> coursesByDepartment(shape.departments);
    int nextFacultyId = 1;
    int nextCourseId = 1000;
    std::uniform_int_distribution<int> sessionsDist(1, 3);
    std::uniform_int_distribution<int> typeDist(0, 9);
    for (int d = 0; d < shape.departments; ++d) {
        std::string code = kDepartmentCodes[d % 8];
        int facultyId = -1;
        for (int k = 0; k < shape.coursesPerDepartment; ++k) {
            if (k % 2 == 0) {
                facultyId = nextFacultyId++;
                inst.faculty.push_back({facultyId, "Prof. " + code + std::to_string(facultyId)});
            }
            int roll = typeDist(rng);
            RoomType type = roll < 6 ? RoomType::LECTURE : (roll < 9 ? RoomType::SEMINAR : RoomType::LAB);

            Course course;
            course.id = nextCourseId++;
            course.code = code + std::to_string(100 + k);
            course.departmentId = d;
            course.facultyId = facultyId;
            course.sessionCount = type == RoomType::LAB ? 1 : sessionsDist(rng);
            course.requiredRoomType = type;
            course.minCapacity = type == RoomType::LECTURE ? 20 : 10;
            coursesByDepartment[d].push_back((int)inst.courses.size());
            inst.courses.push_back(course);
        }
    }

    // Students: home courses plus one cross-department elective, skipping full courses.
    int nextStudentId = 1;
    for (int d = 0; d < shape.departments; ++d) {
        for (int k = 0; k < shape.studentsPerDepartment; ++k) {
            int studentId = nextStudentId++;
            std::vector<int> picks = coursesByDepartment[d];
            std::shuffle(picks.begin(), picks.end(), rng);
            picks.resize(std::min((int)picks.size(), shape.homeCoursesPerStudent));
            if (shape.departments > 1) {
                int other = (d + 1 + (int)(rng() % (unsigned)(shape.departments - 1))) % shape.departments;
                const std::vector<int>& electives = coursesByDepartment[other];
                picks.push_back(electives[rng() % electives.size()]);
            }
            for (int c : picks) {
                Course& course = inst.courses[c];
                if ((int)course.studentIds.size() >= largestCapacity(inst.rooms, course.requiredRoomType)) continue;
                course.studentIds.push_back(studentId);
            }
        }
    }

    // Soft preferences: even departments prefer mornings, every third avoids Friday.
    for (int d = 0; d < shape.departments; ++d) {
        DepartmentPreference pref;
        pref.departmentId = d;
        if (d % 2 == 0) {
            for (int p = 0; p < inst.grid.periodsPerDay / 2; ++p) pref.preferredPeriods.push_back(p);
        }
        if (d % 3 == 0) {
            for (int day = 0; day < inst.grid.days - 1; ++day) pref.preferredDays.push_back(day);
        }
        if (pref.preferredDays.empty() && pref.preferredPeriods.empty()) continue;
        pref.weight = 1.0 + d % 3;
        inst.preferences.push_back(pref);
    }
    return inst;
}
