#pragma once
#include <cstdint>

namespace kclick::io {

enum class InputEventType {
    KeyDown,
    KeyUp,
    FlagsChanged, // modifier state changed
    MouseDown,
    MouseUp
};

struct InputEvent {
    InputEventType type = InputEventType::KeyDown;
    int code = 0;           // virtual key code, or mouse button index
    uint32_t modifiers = 0; // Modifier bits held while the event happened
    bool isRepeat = false;  // key auto-repeat
    // Host timestamp (X server time, ms). The same physical event carries the
    // same value on every observation path; 0 when unknown.
    uint64_t time = 0;

    [[nodiscard]] bool isKey() const {
        return type == InputEventType::KeyDown || type == InputEventType::KeyUp;
    }
    [[nodiscard]] bool isMouse() const {
        return type == InputEventType::MouseDown || type == InputEventType::MouseUp;
    }
    [[nodiscard]] bool isDown() const {
        return type == InputEventType::KeyDown || type == InputEventType::MouseDown;
    }
    [[nodiscard]] bool isUp() const {
        return type == InputEventType::KeyUp || type == InputEventType::MouseUp;
    }
};

const char* toString(InputEventType type);

} // namespace kclick::io
