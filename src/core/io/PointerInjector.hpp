#pragma once

#include <optional>

namespace kclick::io {

struct Point {
    int x = 0;
    int y = 0;
};

/**
 * PointerInjector - samples the pointer and synthesizes button clicks.
 *
 * Called from the click executor's worker thread. Both operations report
 * failure through their return value and never throw.
 */
class PointerInjector {
public:
    virtual ~PointerInjector() = default;

    // Pointer position in global screen coordinates, nullopt when unavailable
    virtual std::optional<Point> cursorPosition() = 0;
    // Press and release `button` (0 = primary) at `position`
    virtual bool click(Point position, int button) = 0;
};

} // namespace kclick::io
