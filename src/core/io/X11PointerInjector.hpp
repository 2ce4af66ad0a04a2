#pragma once

#ifdef __linux__

#include <memory>
#include <mutex>
#include <string>
#include "PointerInjector.hpp"

struct _XDisplay;

namespace kclick::io {

/**
 * X11PointerInjector - XQueryPointer for the position, XTest for the click.
 *
 * Owns a private display connection, opened on first use so that it lives
 * on the thread that injects. Opening is retried on every call until it
 * succeeds.
 */
class X11PointerInjector : public PointerInjector {
public:
    explicit X11PointerInjector(std::string displayName = {});
    ~X11PointerInjector() override;

    X11PointerInjector(const X11PointerInjector&) = delete;
    X11PointerInjector& operator=(const X11PointerInjector&) = delete;

    std::optional<Point> cursorPosition() override;
    bool click(Point position, int button) override;

private:
    // Caller holds mutex
    _XDisplay* EnsureDisplay();
    void CloseDisplay();

    std::string displayName;
    std::mutex mutex;
    _XDisplay* display = nullptr;
    bool xtestAvailable = false;
};

} // namespace kclick::io

#endif // __linux__
