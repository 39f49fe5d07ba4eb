///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"


///////////////////////////
///       HELPERS       ///
///////////////////////////
std::vector<TimeSlot> makeTimeSlots(const TimeGrid& grid) {
    std::vector<TimeSlot> slots;
    slots.reserve(grid.slotCount());
    for (int day = 0; day < grid.days; ++day) {
        for (int period = 0; period < grid.periodsPerDay; ++period) {
            slots.push_back({grid.slotId(day, period), day, period});
        }
    }
    return slots;
}

std::string formatRoomType(RoomType type) {
    switch (type) {
        case RoomType::LECTURE: return "Lecture";
        case RoomType::SEMINAR: return "Seminar";
        case RoomType::LAB:     return "Lab";
    }
    return "Unknown";
}
