#pragma once

#include <cstdint>

// Event types raised into the world event list by the gameplay systems.
// The session consumes them after every world update.
enum DriftrockEventType : uint8_t {
	EVENT_ROCK_DESTROYED = 1,   // value: score gained, position: rock center
	EVENT_CRAFT_DESTROYED = 2   // position: craft center
};
