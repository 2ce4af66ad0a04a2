#ifdef __linux__

#include "X11PointerInjector.hpp"
#include <algorithm>
#include <utility>
#include <vector>
#include "KeyMap.hpp"
#include "utils/Logger.hpp"
#include "x11.h"

namespace kclick::io {

X11PointerInjector::X11PointerInjector(std::string displayName)
    : displayName(std::move(displayName)) {}

X11PointerInjector::~X11PointerInjector() {
    std::lock_guard<std::mutex> lock(mutex);
    CloseDisplay();
}

_XDisplay* X11PointerInjector::EnsureDisplay() {
    if (display) return display;

    display = XOpenDisplay(displayName.empty() ? nullptr : displayName.c_str());
    if (!display) {
        debug("Pointer injector: cannot open X display");
        return nullptr;
    }

    int eventBase, errorBase, major, minor;
    xtestAvailable = XTestQueryExtension(display, &eventBase, &errorBase, &major, &minor);
    if (!xtestAvailable) {
        error("XTest extension not available, clicks cannot be injected");
    } else {
        debug("Pointer injector connected (XTest {}.{})", major, minor);
    }
    return display;
}

void X11PointerInjector::CloseDisplay() {
    if (display) {
        XCloseDisplay(display);
        display = nullptr;
    }
    xtestAvailable = false;
}

std::optional<Point> X11PointerInjector::cursorPosition() {
    std::lock_guard<std::mutex> lock(mutex);
    Display* dpy = EnsureDisplay();
    if (!dpy) return std::nullopt;

    ::Window root, child;
    int rootX, rootY, winX, winY;
    unsigned int mask;
    if (!XQueryPointer(dpy, DefaultRootWindow(dpy), &root, &child, &rootX, &rootY,
                       &winX, &winY, &mask)) {
        // Pointer is on another screen
        return std::nullopt;
    }
    return Point{rootX, rootY};
}

bool X11PointerInjector::click(Point position, int button) {
    std::lock_guard<std::mutex> lock(mutex);
    Display* dpy = EnsureDisplay();
    if (!dpy || !xtestAvailable) return false;

    // XTest presses physical buttons, which the server maps like real ones
    unsigned char map[256];
    const int mapSize = XGetPointerMapping(dpy, map, sizeof(map));
    const std::vector<unsigned char> pointerMap(map, map + std::max(mapSize, 0));
    const unsigned int x11Button = KeyMap::PhysicalButton(pointerMap, KeyMap::ToX11Button(button));
    if (x11Button == 0) {
        debug("No physical button produces button index {}", button);
        return false;
    }

    // Move to the sampled position first so the press lands where it was measured
    XTestFakeMotionEvent(dpy, -1, position.x, position.y, CurrentTime);
    const bool pressed = XTestFakeButtonEvent(dpy, x11Button, x11::XTrue, CurrentTime) != 0;
    const bool released = XTestFakeButtonEvent(dpy, x11Button, x11::XFalse, CurrentTime) != 0;
    XFlush(dpy);
    return pressed && released;
}

} // namespace kclick::io

#endif // __linux__
