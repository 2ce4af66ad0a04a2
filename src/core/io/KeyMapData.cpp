#include "KeyMap.hpp"
#include <X11/keysym.h>

// Key table: virtual code, primary name, X11 keysym (unshifted level)

namespace kclick::io {

void KeyMap::LoadKeyTable() {
    // Letters
    AddKey("a", 0, XK_a);
    AddKey("s", 1, XK_s);
    AddKey("d", 2, XK_d);
    AddKey("f", 3, XK_f);
    AddKey("h", 4, XK_h);
    AddKey("g", 5, XK_g);
    AddKey("z", 6, XK_z);
    AddKey("x", 7, XK_x);
    AddKey("c", 8, XK_c);
    AddKey("v", 9, XK_v);
    AddKey("§", 10, XK_section);
    AddKey("b", 11, XK_b);
    AddKey("q", 12, XK_q);
    AddKey("w", 13, XK_w);
    AddKey("e", 14, XK_e);
    AddKey("r", 15, XK_r);
    AddKey("y", 16, XK_y);
    AddKey("t", 17, XK_t);
    AddKey("o", 31, XK_o);
    AddKey("u", 32, XK_u);
    AddKey("i", 34, XK_i);
    AddKey("p", 35, XK_p);
    AddKey("l", 37, XK_l);
    AddKey("j", 38, XK_j);
    AddKey("k", 40, XK_k);
    AddKey("n", 45, XK_n);
    AddKey("m", 46, XK_m);

    // Digits
    AddKey("1", 18, XK_1);
    AddKey("2", 19, XK_2);
    AddKey("3", 20, XK_3);
    AddKey("4", 21, XK_4);
    AddKey("6", 22, XK_6);
    AddKey("5", 23, XK_5);
    AddKey("9", 25, XK_9);
    AddKey("7", 26, XK_7);
    AddKey("8", 28, XK_8);
    AddKey("0", 29, XK_0);

    // Punctuation
    AddKey("=", 24, XK_equal);
    AddKey("-", 27, XK_minus);
    AddKey("]", 30, XK_bracketright);
    AddKey("[", 33, XK_bracketleft);
    AddKey("'", 39, XK_apostrophe);
    AddKey(";", 41, XK_semicolon);
    AddKey("\\", 42, XK_backslash);
    AddKey(",", 43, XK_comma);
    AddKey("/", 44, XK_slash);
    AddKey(".", 47, XK_period);
    AddKey("`", 50, XK_grave);

    // Editing and whitespace
    AddKey("Return", 36, XK_Return);
    AddKey("Tab", 48, XK_Tab);
    AddKey("Space", 49, XK_space);
    AddKey("Backspace", 51, XK_BackSpace);
    AddKey("Escape", 53, XK_Escape);
    AddKey("Help", 114, XK_Insert);
    AddKey("Home", 115, XK_Home);
    AddKey("PgUp", 116, XK_Prior);
    AddKey("Del", 117, XK_Delete);
    AddKey("End", 119, XK_End);
    AddKey("PgDn", 121, XK_Next);
    AddKey("Left", 123, XK_Left);
    AddKey("Right", 124, XK_Right);
    AddKey("Down", 125, XK_Down);
    AddKey("Up", 126, XK_Up);
    AddX11Alias(XK_ISO_Left_Tab, 48);

    // Modifiers
    AddKey("RCommand", 54, XK_Super_R);
    AddKey("Command", 55, XK_Super_L);
    AddKey("Shift", 56, XK_Shift_L);
    AddKey("CapsLock", 57, XK_Caps_Lock);
    AddKey("Option", 58, XK_Alt_L);
    AddKey("Control", 59, XK_Control_L);
    AddKey("RShift", 60, XK_Shift_R);
    AddKey("ROption", 61, XK_Alt_R);
    AddKey("RControl", 62, XK_Control_R);
    AddKey("Fn", 63, XK_Hyper_L);
    AddX11Alias(XK_Meta_L, 58);
    AddX11Alias(XK_Meta_R, 61);
    AddX11Alias(XK_ISO_Level3_Shift, 61);
    AddX11Alias(XK_Hyper_R, 63);

    // Function keys
    AddKey("F1", 122, XK_F1);
    AddKey("F2", 120, XK_F2);
    AddKey("F3", 99, XK_F3);
    AddKey("F4", 118, XK_F4);
    AddKey("F5", 96, XK_F5);
    AddKey("F6", 97, XK_F6);
    AddKey("F7", 98, XK_F7);
    AddKey("F8", 100, XK_F8);
    AddKey("F9", 101, XK_F9);
    AddKey("F10", 109, XK_F10);
    AddKey("F11", 103, XK_F11);
    AddKey("F12", 111, XK_F12);
    AddKey("F13", 105, XK_F13);
    AddKey("F14", 107, XK_F14);
    AddKey("F15", 113, XK_F15);
    AddKey("F16", 106, XK_F16);
    AddKey("F17", 64, XK_F17);
    AddKey("F18", 79, XK_F18);
    AddKey("F19", 80, XK_F19);
    AddKey("F20", 90, XK_F20);

    // Keypad
    AddKey("KP.", 65, XK_KP_Decimal);
    AddKey("KP*", 67, XK_KP_Multiply);
    AddKey("KP+", 69, XK_KP_Add);
    AddKey("Clear", 71, XK_Num_Lock);
    AddKey("KP/", 75, XK_KP_Divide);
    AddKey("KPEnter", 76, XK_KP_Enter);
    AddKey("KP-", 78, XK_KP_Subtract);
    AddKey("KP=", 81, XK_KP_Equal);
    AddKey("KP0", 82, XK_KP_0);
    AddKey("KP1", 83, XK_KP_1);
    AddKey("KP2", 84, XK_KP_2);
    AddKey("KP3", 85, XK_KP_3);
    AddKey("KP4", 86, XK_KP_4);
    AddKey("KP5", 87, XK_KP_5);
    AddKey("KP6", 88, XK_KP_6);
    AddKey("KP7", 89, XK_KP_7);
    AddKey("KP8", 91, XK_KP_8);
    AddKey("KP9", 92, XK_KP_9);
}

} // namespace kclick::io
