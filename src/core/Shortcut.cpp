#include "Shortcut.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <vector>
#include "core/io/KeyMap.hpp"

namespace kclick {

namespace {

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

// Whole-string unsigned decimal, no sign, no whitespace
std::optional<uint32_t> parseUnsigned(const std::string& text) {
    if (text.empty()) return std::nullopt;
    uint32_t value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) return std::nullopt;
    return value;
}

std::vector<std::string> split(const std::string& text, char delim) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = text.find(delim, start);
        if (pos == std::string::npos) {
            parts.push_back(text.substr(start));
            return parts;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
}

} // namespace

std::optional<Modifier> parseModifier(const std::string& name) {
    const std::string key = lowercase(name);
    if (key == "fn" || key == "function") return ModFunction;
    if (key == "shift") return ModShift;
    if (key == "ctrl" || key == "control") return ModControl;
    if (key == "alt" || key == "option") return ModOption;
    if (key == "super" || key == "command" || key == "meta" || key == "win") return ModCommand;
    if (key == "capslock") return ModCapsLock;
    return std::nullopt;
}

std::string modifierName(Modifier modifier) {
    switch (modifier) {
        case ModShift: return "Shift";
        case ModControl: return "Ctrl";
        case ModOption: return "Alt";
        case ModCommand: return "Super";
        case ModFunction: return "Fn";
        case ModCapsLock: return "CapsLock";
        case ModNone: break;
    }
    return "None";
}

std::string Shortcut::descriptor() const {
    if (kind == Kind::Mouse) {
        return "Mouse Button " + std::to_string(code);
    }

    std::string str;
    if (modifiers & ModCommand) str += "⌘";
    if (modifiers & ModOption) str += "⌥";
    if (modifiers & ModControl) str += "⌃";
    if (modifiers & ModShift) str += "⇧";
    str += io::KeyMap::DisplayName(code);
    return str;
}

std::string Shortcut::serialize() const {
    const char* kindName = kind == Kind::Mouse ? "mouse" : "keyboard";
    return std::string(kindName) + ":" + std::to_string(code) + ":" + std::to_string(modifiers);
}

std::optional<Shortcut> Shortcut::parse(const std::string& text) {
    const auto parts = split(text, ':');
    if (parts.size() != 3) return std::nullopt;

    const auto code = parseUnsigned(parts[1]);
    const auto modifiers = parseUnsigned(parts[2]);
    if (!code || !modifiers || *code > 0xFFFF) return std::nullopt;

    if (parts[0] == "keyboard") {
        if ((*modifiers & ~CANONICAL_MODIFIERS) != 0) return std::nullopt;
        return Shortcut{Kind::Keyboard, static_cast<uint16_t>(*code), *modifiers};
    }
    if (parts[0] == "mouse") {
        // Button 0 is the primary button and is never a trigger
        if (*modifiers != 0 || *code == 0) return std::nullopt;
        return Shortcut{Kind::Mouse, static_cast<uint16_t>(*code), 0};
    }
    return std::nullopt;
}

std::string describe(const std::optional<Shortcut>& shortcut) {
    return shortcut ? shortcut->descriptor() : "Not Set";
}

} // namespace kclick
