///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "conflicts.hpp"
#include <algorithm>
#include <map>
#include <unordered_map>


///////////////////////////
///       HELPERS       ///
///////////////////////////
std::string formatConflictType(ConflictType type) {
    switch (type) {
        case ConflictType::FACULTY: return "faculty";
        case ConflictType::ROOM:    return "room";
        case ConflictType::STUDENT: return "student";
    }
    return "unknown";
}

static std::vector<int> distinctCourseIds(const SessionCatalog& catalog, const std::vector<int>& sessions) {
    std::vector<int> ids;
    for (int s : sessions) ids.push_back(catalog.course(catalog.session(s).courseIndex).id);
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
    return ids;
}


///////////////////////////
///      DETECTION      ///
///////////////////////////
std::vector<Conflict> detectConflicts(const ScheduleState& state) {
    const SessionCatalog& catalog = state.catalog();
    std::vector<Conflict> conflicts;

    // Bucket placed sessions by slot; every overlap lives inside one slot.
    std::vector<std::vector<int>> bySlot(catalog.slotCount());
    for (int s = 0; s < catalog.sessionCount(); ++s) {
        const Placement& p = state.placement(s);
        if (p.assigned()) bySlot[p.slot].push_back(s);
    }

    for (int t = 0; t < catalog.slotCount(); ++t) {
        const std::vector<int>& here = bySlot[t];
        if (here.size() < 2) continue;

        std::map<int, std::vector<int>> byFaculty;
        std::map<int, std::vector<int>> byRoom;
        std::unordered_map<int, std::vector<int>> byStudent;
        for (int s : here) {
            int c = catalog.session(s).courseIndex;
            byFaculty[catalog.facultyOf(c)].push_back(s);
            byRoom[state.placement(s).roomIndex].push_back(s);
            for (int st : catalog.studentsOf(c)) byStudent[st].push_back(s);
        }

        for (const auto& entry : byFaculty) {
            if (entry.second.size() < 2) continue;
            int facultyId = catalog.instance().faculty[entry.first].id;
            conflicts.push_back({"F" + std::to_string(facultyId) + "@" + std::to_string(t),
                                 ConflictType::FACULTY, (int)entry.second.size() - 1,
                                 distinctCourseIds(catalog, entry.second), t, facultyId});
        }
        for (const auto& entry : byRoom) {
            if (entry.second.size() < 2) continue;
            int roomId = catalog.room(entry.first).id;
            conflicts.push_back({"R" + std::to_string(roomId) + "@" + std::to_string(t),
                                 ConflictType::ROOM, (int)entry.second.size() - 1,
                                 distinctCourseIds(catalog, entry.second), t, roomId});
        }

        // Student cells are grouped by the set of courses they involve.
        std::map<std::vector<int>, std::pair<int, int>> groups; // courses -> (severity, students)
        for (const auto& entry : byStudent) {
            if (entry.second.size() < 2) continue;
            auto& group = groups[distinctCourseIds(catalog, entry.second)];
            group.first += (int)entry.second.size() - 1;
            group.second += 1;
        }
        for (const auto& group : groups) {
            std::string id = "S";
            for (size_t i = 0; i < group.first.size(); ++i) {
                if (i) id += "-";
                id += std::to_string(group.first[i]);
            }
            id += "@" + std::to_string(t);
            conflicts.push_back({id, ConflictType::STUDENT, group.second.first, group.first, t, group.second.second});
        }
    }
    return conflicts;
}

std::vector<int> conflictSessions(const ScheduleState& state, const Conflict& conflict) {
    const SessionCatalog& catalog = state.catalog();
    std::vector<int> sessions;
    for (int courseId : conflict.courseIds) {
        int c = catalog.courseIndexOf(courseId);
        if (c < 0) continue;
        for (int s : catalog.sessionsOf(c)) {
            if (state.placement(s).slot == conflict.slotId) sessions.push_back(s);
        }
    }
    return sessions;
}
