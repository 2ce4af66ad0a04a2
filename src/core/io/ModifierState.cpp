#include "ModifierState.hpp"
#include "KeyMap.hpp"
#include "core/Shortcut.hpp"

namespace kclick::io {

uint32_t ModifierState::FlagFor(int code) {
    switch (code) {
        case vk::Shift:
        case vk::RightShift:
            return ModShift;
        case vk::Control:
        case vk::RightControl:
            return ModControl;
        case vk::Option:
        case vk::RightOption:
            return ModOption;
        case vk::Command:
        case vk::RightCommand:
            return ModCommand;
        case vk::Function:
            return ModFunction;
        case vk::CapsLock:
            return ModCapsLock;
        default:
            return ModNone;
    }
}

bool ModifierState::update(int code, bool down) {
    if (FlagFor(code) == ModNone) return false;

    const uint32_t before = flags();
    if (down) {
        held.insert(code);
    } else {
        held.erase(code);
    }
    return flags() != before;
}

uint32_t ModifierState::flags() const {
    uint32_t result = ModNone;
    for (int code : held) {
        result |= FlagFor(code);
    }
    return result;
}

} // namespace kclick::io
