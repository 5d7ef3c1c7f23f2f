#ifndef ECS_EVENTS_HPP
#define ECS_EVENTS_HPP

#include <glm/glm.hpp>
#include <cstdint>

// Event raised by a system during a world update. The meaning of type and
// value is defined by the game that registers the systems.
struct EventEntry {
    uint8_t type = 0;
    int32_t value = 0;
    glm::vec2 position = glm::vec2(0.0f);
};

inline EventEntry MakeEvent(uint8_t type, int32_t value = 0, const glm::vec2& position = glm::vec2(0.0f)) {
    EventEntry entry;
    entry.type = type;
    entry.value = value;
    entry.position = position;
    return entry;
}

#endif // ECS_EVENTS_HPP
