#pragma once
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace kclick::io {

// Virtual key codes, laid out like the ANSI hardware key code table so a
// stored binding does not depend on the keyboard layout of the host.
namespace vk {
    constexpr int A = 0;
    constexpr int S = 1;
    constexpr int Z = 6;
    constexpr int V = 9;
    constexpr int K = 40;
    constexpr int Return = 36;
    constexpr int Tab = 48;
    constexpr int Space = 49;
    constexpr int Delete = 51;
    constexpr int Escape = 53;
    constexpr int RightCommand = 54;
    constexpr int Command = 55;
    constexpr int Shift = 56;
    constexpr int CapsLock = 57;
    constexpr int Option = 58;
    constexpr int Control = 59;
    constexpr int RightShift = 60;
    constexpr int RightOption = 61;
    constexpr int RightControl = 62;
    constexpr int Function = 63;
    constexpr int F1 = 122;
    constexpr int LeftArrow = 123;
    constexpr int RightArrow = 124;
    constexpr int DownArrow = 125;
    constexpr int UpArrow = 126;
}

// Key mapping class - converts between virtual key codes, names and X11 keysyms
class KeyMap {
public:
    // Populates the tables once; every accessor calls it
    static void Initialize();

    // Primary name of a code ("A", "Space", "F5"), empty when unknown
    static std::string ToString(int code);

    // Name used in shortcut descriptors: arrows and editing keys as glyphs,
    // everything else the upper-cased label, "K<code>" when unknown
    static std::string DisplayName(int code);

    // Code of an X11 keysym, -1 when unknown. Upper-case Latin keysyms map to
    // the same code as their lower-case form.
    static int FromX11(unsigned long keysym);

    // Check if a code is a modifier key
    static bool IsModifier(int code);

    // X11 pointer button -> button index (0 primary, 1 secondary, 2 middle,
    // 3 back, 4 forward, ...). Wheel buttons 4-7 have no index.
    static std::optional<int> FromX11Button(unsigned int button);
    static unsigned int ToX11Button(int index);

    // Pointer mapping as returned by XGetPointerMapping: entry n-1 is the
    // logical button of physical button n, 0 when disabled. Buttons outside
    // the map pass through unchanged.
    static unsigned int LogicalButton(const std::vector<unsigned char>& pointerMap, unsigned int physical);
    // Physical button that produces a logical one, 0 when none does
    static unsigned int PhysicalButton(const std::vector<unsigned char>& pointerMap, unsigned int logical);

private:
    static void LoadKeyTable();
    static void AddKey(const std::string& name, int code, unsigned long x11);
    static void AddX11Alias(unsigned long x11, int code);

    static std::unordered_map<int, std::string> codeToName;
    static std::unordered_map<unsigned long, int> x11ToCode;
};

} // namespace kclick::io
