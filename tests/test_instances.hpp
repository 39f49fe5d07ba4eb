#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <string>
#include <vector>


///////////////////////////
///      BUILDERS       ///
///////////////////////////
inline Course makeCourse(int id, int departmentId, int facultyId, int sessionCount, RoomType type,
                         int minCapacity, std::vector<int> studentIds) {
    Course course;
    course.id = id;
    course.code = "C" + std::to_string(id);
    course.departmentId = departmentId;
    course.facultyId = facultyId;
    course.sessionCount = sessionCount;
    course.requiredRoomType = type;
    course.minCapacity = minCapacity;
    course.studentIds = std::move(studentIds);
    return course;
}

inline std::vector<int> studentRange(int first, int last) {
    std::vector<int> ids;
    for (int id = first; id <= last; ++id) ids.push_back(id);
    return ids;
}

inline ProblemInstance emptyInstance(int days, int periods) {
    ProblemInstance inst;
    inst.grid.days = days;
    inst.grid.periodsPerDay = periods;
    inst.slots = makeTimeSlots(inst.grid);
    return inst;
}

/**
 * @brief Small mixed instance: 2 days x 3 periods, 3 rooms, 2 faculty, 4 courses.
 *
 * Courses 101 and 102 share faculty 1; 101 and 103 share students 1..5.
 */
inline ProblemInstance smallInstance() {
    ProblemInstance inst = emptyInstance(2, 3);
    inst.rooms.push_back({10, "L1", 50, RoomType::LECTURE});
    inst.rooms.push_back({11, "L2", 40, RoomType::LECTURE});
    inst.rooms.push_back({12, "S1", 20, RoomType::SEMINAR});
    inst.faculty.push_back({1, "Prof. One"});
    inst.faculty.push_back({2, "Prof. Two"});
    inst.courses.push_back(makeCourse(101, 0, 1, 2, RoomType::LECTURE, 10, studentRange(1, 10)));
    inst.courses.push_back(makeCourse(102, 0, 1, 2, RoomType::LECTURE, 10, studentRange(11, 20)));
    inst.courses.push_back(makeCourse(103, 1, 2, 1, RoomType::SEMINAR, 5, studentRange(1, 5)));
    inst.courses.push_back(makeCourse(104, 1, 2, 1, RoomType::LECTURE, 10, studentRange(21, 30)));
    return inst;
}

/**
 * @brief Two cohorts of courses over a 5 x 6 grid; plenty of room supply.
 *
 * Courses 1..n/2 are dense with shared students; the rest form a second cohort.
 */
inline ProblemInstance cohortInstance(int courseCount = 12) {
    ProblemInstance inst = emptyInstance(5, 6);
    for (int r = 0; r < 4; ++r) inst.rooms.push_back({100 + r, "R" + std::to_string(r), 60, RoomType::LECTURE});
    for (int f = 1; f <= courseCount / 2; ++f) inst.faculty.push_back({f, "F" + std::to_string(f)});
    for (int c = 0; c < courseCount; ++c) {
        int cohort = c < courseCount / 2 ? 0 : 1;
        int base = cohort * 100;
        std::vector<int> students = studentRange(base + 1 + c % 3, base + 20 + c % 3);
        inst.courses.push_back(makeCourse(200 + c, cohort, 1 + c / 2, 1 + c % 2, RoomType::LECTURE, 10, students));
    }
    return inst;
}
