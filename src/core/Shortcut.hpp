#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace kclick {

// Device-independent modifier flags
enum Modifier : uint32_t {
    ModNone = 0,
    ModShift = 1u << 0,
    ModControl = 1u << 1,
    ModOption = 1u << 2,
    ModCommand = 1u << 3,
    ModFunction = 1u << 4,
    ModCapsLock = 1u << 5
};

// Bits that take part in shortcut matching
constexpr uint32_t CANONICAL_MODIFIERS = ModShift | ModControl | ModOption | ModCommand;

constexpr uint32_t canonicalModifiers(uint32_t modifiers) {
    return modifiers & CANONICAL_MODIFIERS;
}

// "Fn", "Shift", "Ctrl", "Alt", "Super" and their long forms
std::optional<Modifier> parseModifier(const std::string& name);
std::string modifierName(Modifier modifier);

struct Shortcut {
    enum class Kind { Keyboard, Mouse };

    Kind kind = Kind::Keyboard;
    uint16_t code = 0;      // virtual key code, or mouse button index
    uint32_t modifiers = 0; // canonical, keyboard only

    static Shortcut keyboard(uint16_t keyCode, uint32_t modifiers) {
        return {Kind::Keyboard, keyCode, canonicalModifiers(modifiers)};
    }
    static Shortcut mouse(uint16_t button) {
        return {Kind::Mouse, button, 0};
    }

    // "⌘⇧K", "Mouse Button 2"
    [[nodiscard]] std::string descriptor() const;

    // "keyboard:<code>:<modifiers>" / "mouse:<button>:0"
    [[nodiscard]] std::string serialize() const;
    static std::optional<Shortcut> parse(const std::string& text);

    bool operator==(const Shortcut& other) const {
        return kind == other.kind && code == other.code && modifiers == other.modifiers;
    }
    bool operator!=(const Shortcut& other) const { return !(*this == other); }
};

// Descriptor of an optional binding, "Not Set" when absent
std::string describe(const std::optional<Shortcut>& shortcut);

} // namespace kclick
