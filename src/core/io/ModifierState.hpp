#pragma once
#include <cstdint>
#include <set>

namespace kclick::io {

/**
 * ModifierState - which modifier keys are physically held.
 *
 * Left and right keys are tracked separately so releasing one side while
 * the other is still down keeps the flag set.
 */
class ModifierState {
public:
    // Modifier bit of a virtual key code, 0 for non-modifier keys
    static uint32_t FlagFor(int code);

    // Returns true when the combined flags changed
    bool update(int code, bool down);
    void clear() { held.clear(); }

    [[nodiscard]] uint32_t flags() const;
    [[nodiscard]] bool isHeld(int code) const { return held.count(code) != 0; }

private:
    std::set<int> held;
};

} // namespace kclick::io
