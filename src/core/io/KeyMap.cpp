#include "KeyMap.hpp"
#include <algorithm>
#include <cctype>
#include <mutex>
#include <X11/keysym.h>

namespace kclick::io {

// Static member definitions
std::unordered_map<int, std::string> KeyMap::codeToName;
std::unordered_map<unsigned long, int> KeyMap::x11ToCode;

namespace {
std::once_flag initFlag;
}

void KeyMap::Initialize() {
    // The X11 monitor thread and the GUI thread both translate keys
    std::call_once(initFlag, &KeyMap::LoadKeyTable);
}

void KeyMap::AddKey(const std::string& name, int code, unsigned long x11) {
    codeToName[code] = name;
    if (x11 != 0) {
        x11ToCode[x11] = code;
    }
}

void KeyMap::AddX11Alias(unsigned long x11, int code) {
    x11ToCode[x11] = code;
}

std::string KeyMap::ToString(int code) {
    Initialize();
    auto it = codeToName.find(code);
    if (it != codeToName.end()) {
        return it->second;
    }
    return "";
}

std::string KeyMap::DisplayName(int code) {
    switch (code) {
        case vk::Return: return "↩";
        case vk::Tab: return "⇥";
        case vk::Space: return "Space";
        case vk::Delete: return "⌫";
        case vk::Escape: return "⎋";
        case vk::LeftArrow: return "←";
        case vk::RightArrow: return "→";
        case vk::DownArrow: return "↓";
        case vk::UpArrow: return "↑";
        default: break;
    }

    std::string name = ToString(code);
    if (name.empty()) {
        return "K" + std::to_string(code);
    }
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return name;
}

int KeyMap::FromX11(unsigned long keysym) {
    Initialize();
    if (keysym >= XK_A && keysym <= XK_Z) {
        keysym = keysym - XK_A + XK_a;
    }
    auto it = x11ToCode.find(keysym);
    if (it != x11ToCode.end()) {
        return it->second;
    }
    return -1;
}

bool KeyMap::IsModifier(int code) {
    return code == vk::Command || code == vk::RightCommand ||
           code == vk::Shift || code == vk::RightShift ||
           code == vk::Option || code == vk::RightOption ||
           code == vk::Control || code == vk::RightControl ||
           code == vk::CapsLock || code == vk::Function;
}

std::optional<int> KeyMap::FromX11Button(unsigned int button) {
    switch (button) {
        case 1: return 0;
        case 3: return 1;
        case 2: return 2;
        case 4: case 5: case 6: case 7:
            return std::nullopt;
        default:
            break;
    }
    if (button >= 8) {
        return static_cast<int>(button) - 5;
    }
    return std::nullopt;
}

unsigned int KeyMap::ToX11Button(int index) {
    if (index < 0) return 0;
    switch (index) {
        case 0: return 1;
        case 1: return 3;
        case 2: return 2;
        default: return static_cast<unsigned int>(index + 5);
    }
}

unsigned int KeyMap::LogicalButton(const std::vector<unsigned char>& pointerMap, unsigned int physical) {
    if (physical == 0 || physical > pointerMap.size()) return physical;
    return pointerMap[physical - 1];
}

unsigned int KeyMap::PhysicalButton(const std::vector<unsigned char>& pointerMap, unsigned int logical) {
    if (logical == 0) return 0;
    // An identity entry wins when several physical buttons share a logical one
    if (logical <= pointerMap.size() && pointerMap[logical - 1] == logical) return logical;
    for (size_t i = 0; i < pointerMap.size(); ++i) {
        if (pointerMap[i] == logical) return static_cast<unsigned int>(i + 1);
    }
    return logical > pointerMap.size() ? logical : 0;
}

} // namespace kclick::io
