///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "catalog.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <algorithm>
#include <unordered_set>


///////////////////////////
///    CONSTRUCTION     ///
///////////////////////////
SessionCatalog::SessionCatalog(const ProblemInstance& inst) : inst_(inst) {
    validateGrid();
    indexResources();
    if (inst_.rooms.empty() && !inst_.courses.empty()) {
        throw ValidationError("instance has courses but no rooms");
    }
    indexCourses();
    indexPreferences();
}

void SessionCatalog::validateGrid() const {
    const TimeGrid& grid = inst_.grid;
    if (grid.days < 1 || grid.periodsPerDay < 1) {
        throw ValidationError("time grid needs at least one day and one period");
    }
    if (inst_.slots.empty()) return; // grid alone defines the slots
    if ((int)inst_.slots.size() != grid.slotCount()) {
        throw ValidationError("slot list has " + std::to_string(inst_.slots.size()) +
                              " entries, grid defines " + std::to_string(grid.slotCount()));
    }
    for (int i = 0; i < (int)inst_.slots.size(); ++i) {
        const TimeSlot& slot = inst_.slots[i];
        if (slot.id != i || slot.id != grid.slotId(slot.day, slot.period)) {
            throw ValidationError("slot " + std::to_string(slot.id) + " does not match the grid");
        }
    }
}

void SessionCatalog::indexResources() {
    for (int i = 0; i < (int)inst_.rooms.size(); ++i) {
        const Room& room = inst_.rooms[i];
        if (room.capacity < 0) {
            throw ValidationError("room " + std::to_string(room.id) + " has negative capacity");
        }
        if (!roomIndex_.emplace(room.id, i).second) {
            throw ValidationError("duplicate room id " + std::to_string(room.id));
        }
    }
    for (int i = 0; i < (int)inst_.faculty.size(); ++i) {
        if (!facultyIndex_.emplace(inst_.faculty[i].id, i).second) {
            throw ValidationError("duplicate faculty id " + std::to_string(inst_.faculty[i].id));
        }
    }
}

void SessionCatalog::indexCourses() {
    int n = (int)inst_.courses.size();
    courseSessions_.resize(n);
    courseFaculty_.resize(n);
    courseStudents_.resize(n);
    fittingRooms_.resize(n);
    roomFits_.assign(n, std::vector<char>(inst_.rooms.size(), 0));

    std::unordered_map<int, int> studentIndex;
    std::vector<std::unordered_set<int>> studentDepartments;

    for (int c = 0; c < n; ++c) {
        const Course& course = inst_.courses[c];
        std::string label = "course " + std::to_string(course.id);

        if (!courseIndex_.emplace(course.id, c).second) {
            throw ValidationError("duplicate course id " + std::to_string(course.id));
        }
        if (course.sessionCount < 1) throw ValidationError(label + " needs at least one session");
        if (course.minCapacity < 0) throw ValidationError(label + " has negative minimum capacity");

        auto fac = facultyIndex_.find(course.facultyId);
        if (fac == facultyIndex_.end()) {
            throw ValidationError(label + " references unknown faculty " + std::to_string(course.facultyId));
        }
        courseFaculty_[c] = fac->second;

        for (int k = 0; k < course.sessionCount; ++k) {
            courseSessions_[c].push_back((int)sessions_.size());
            sessions_.push_back({c, k});
        }

        for (int sid : course.studentIds) {
            auto it = studentIndex.find(sid);
            int st;
            if (it == studentIndex.end()) {
                st = (int)studentIds_.size();
                studentIndex.emplace(sid, st);
                studentIds_.push_back(sid);
                studentCourses_.emplace_back();
                studentDepartments.emplace_back();
            } else {
                st = it->second;
            }
            if (!studentCourses_[st].empty() && studentCourses_[st].back() == c) {
                throw ValidationError(label + " enrolls student " + std::to_string(sid) + " twice");
            }
            studentCourses_[st].push_back(c);
            studentDepartments[st].insert(course.departmentId);
            courseStudents_[c].push_back(st);
        }
        std::sort(courseStudents_[c].begin(), courseStudents_[c].end());

        int required = course.requiredCapacity();
        for (int r = 0; r < (int)inst_.rooms.size(); ++r) {
            const Room& room = inst_.rooms[r];
            if (room.type == course.requiredRoomType && room.capacity >= required) {
                fittingRooms_[c].push_back(r);
                roomFits_[c][r] = 1;
            }
        }
        if (fittingRooms_[c].empty()) {
            logWarning(label + " (" + course.code + ") has no fitting " +
                       formatRoomType(course.requiredRoomType) + " room for " +
                       std::to_string(required) + " seats");
        }
    }

    studentDepartments_.resize(studentIds_.size());
    for (int st = 0; st < (int)studentIds_.size(); ++st) {
        studentDepartments_[st] = (int)studentDepartments[st].size();
    }
}

void SessionCatalog::indexPreferences() {
    int slots = slotCount();
    std::unordered_map<int, int> byDepartment;

    for (const DepartmentPreference& pref : inst_.preferences) {
        if (pref.weight < 0.0) {
            throw ValidationError("department " + std::to_string(pref.departmentId) +
                                  " has a negative preference weight");
        }
        std::vector<double> penalty(slots, 0.0);
        for (int t = 0; t < slots; ++t) {
            int day = inst_.grid.dayOf(t);
            int period = inst_.grid.periodOf(t);
            bool dayOk = pref.preferredDays.empty() ||
                         std::find(pref.preferredDays.begin(), pref.preferredDays.end(), day) != pref.preferredDays.end();
            bool periodOk = pref.preferredPeriods.empty() ||
                            std::find(pref.preferredPeriods.begin(), pref.preferredPeriods.end(), period) != pref.preferredPeriods.end();
            if (!dayOk || !periodOk) penalty[t] = pref.weight;
        }
        byDepartment[pref.departmentId] = (int)penaltyBySlot_.size(); // last one wins
        penaltyBySlot_.push_back(std::move(penalty));
    }

    coursePreference_.assign(inst_.courses.size(), -1);
    for (int c = 0; c < (int)inst_.courses.size(); ++c) {
        auto it = byDepartment.find(inst_.courses[c].departmentId);
        if (it != byDepartment.end()) coursePreference_[c] = it->second;
    }
}


///////////////////////////
///       LOOKUPS       ///
///////////////////////////
bool SessionCatalog::roomFits(int courseIndex, int roomIndex) const {
    if (roomIndex < 0 || roomIndex >= roomCount()) return false;
    return roomFits_[courseIndex][roomIndex] != 0;
}

double SessionCatalog::preferencePenalty(int courseIndex, int slot) const {
    int pref = coursePreference_[courseIndex];
    if (pref < 0 || slot < 0) return 0.0;
    return penaltyBySlot_[pref][slot];
}

int SessionCatalog::sharedStudents(int courseA, int courseB) const {
    const std::vector<int>& a = courseStudents_[courseA];
    const std::vector<int>& b = courseStudents_[courseB];
    int shared = 0;
    size_t i = 0, j = 0;
    while (i < a.size() && j < b.size()) {
        if (a[i] < b[j]) ++i;
        else if (b[j] < a[i]) ++j;
        else { ++shared; ++i; ++j; }
    }
    return shared;
}

int SessionCatalog::courseIndexOf(int courseId) const {
    auto it = courseIndex_.find(courseId);
    return it == courseIndex_.end() ? -1 : it->second;
}

int SessionCatalog::roomIndexOf(int roomId) const {
    auto it = roomIndex_.find(roomId);
    return it == roomIndex_.end() ? -1 : it->second;
}

int SessionCatalog::facultyIndexOf(int facultyId) const {
    auto it = facultyIndex_.find(facultyId);
    return it == facultyIndex_.end() ? -1 : it->second;
}
