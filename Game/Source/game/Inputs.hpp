#pragma once

#include <cstdint>

// Per-frame input snapshot for the craft. Flags are independent; any
// combination may be set in the same frame.
enum InputMask : uint8_t {
    INPUT_NONE = 0,
    INPUT_TURN_LEFT = 1 << 0,
    INPUT_TURN_RIGHT = 1 << 1,
    INPUT_THRUST = 1 << 2,
    INPUT_FIRE = 1 << 3,
    INPUT_HYPERSPACE = 1 << 4
};

using CraftInput = uint8_t;

inline bool HasInput(CraftInput input, InputMask flag) {
    return (input & flag) != 0;
}
