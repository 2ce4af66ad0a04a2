#pragma once
// Safe X11 wrapper - use this instead of direct X11 includes.
// Xlib defines macros (None, Bool, Status, KeyPress, ...) that collide
// with Qt and the standard library; they are removed below and the values
// we need live in the x11 namespace instead.
namespace x11 {
    constexpr int XTrue = 1;
    constexpr int XFalse = 0;
    constexpr int XSuccess = 0;
    constexpr int XGenericEventType = 35;  // Renamed to avoid collision
}

// Include X11 headers
#include <X11/Xlib.h>
#include <X11/Xutil.h>
#include <X11/extensions/XTest.h>
#include <X11/extensions/XInput2.h>
#include <X11/keysym.h>
#include <X11/XKBlib.h>

// IMMEDIATELY kill ALL X11 macros
#undef None
#undef True
#undef False
#undef Success
#undef Status
#undef Bool
#undef Always
#undef DestroyAll
#undef Absolute
#undef BadRequest
#undef BadValue
#undef BadWindow
#undef BadAccess
#undef BadAlloc
#undef KeyPress
#undef KeyRelease
#undef ButtonPress
#undef ButtonRelease
#undef MotionNotify
#undef EnterNotify
#undef LeaveNotify
#undef FocusIn
#undef FocusOut
#undef KeymapNotify
#undef Expose
#undef GenericEvent
#undef InputOutput
#undef InputOnly
#ifdef CursorShape
#undef CursorShape
#endif
