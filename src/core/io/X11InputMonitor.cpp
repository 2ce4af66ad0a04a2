#ifdef __linux__

#include "X11InputMonitor.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <utility>
#include <vector>
#include "KeyMap.hpp"
#include "utils/Logger.hpp"
#include "x11.h"

namespace kclick::io {

X11InputMonitor::X11InputMonitor(Dispatcher dispatcher, std::string displayName)
    : dispatcher(std::move(dispatcher))
    , displayName(std::move(displayName))
    , handlers(std::make_shared<Handlers>()) {
    if (!this->dispatcher) {
        throw std::invalid_argument("Dispatcher cannot be null");
    }
    KeyMap::Initialize();
}

X11InputMonitor::~X11InputMonitor() {
    Stop();
}

Subscription X11InputMonitor::subscribe(Handler handler) {
    if (!handler) {
        throw std::invalid_argument("Handler cannot be null");
    }
    Start();

    uint64_t id;
    {
        std::lock_guard<std::mutex> lock(handlers->mutex);
        id = handlers->nextId++;
        handlers->entries[id] = std::make_shared<Handler>(std::move(handler));
    }
    debug("X11 monitor subscriber {} added", id);

    std::weak_ptr<Handlers> weak = handlers;
    return Subscription([weak, id]() {
        if (auto shared = weak.lock()) {
            std::lock_guard<std::mutex> lock(shared->mutex);
            shared->entries.erase(id);
        }
    });
}

size_t X11InputMonitor::GetSubscriberCount() const {
    std::lock_guard<std::mutex> lock(handlers->mutex);
    return handlers->entries.size();
}

void X11InputMonitor::Start() {
    std::lock_guard<std::mutex> lock(startMutex);
    if (running.load()) return;

    // The previous loop ended on a connection error
    if (monitorThread.joinable()) {
        monitorThread.join();
    }
    if (display) {
        XCloseDisplay(display);
        display = nullptr;
    }
    modifiers.clear();

    display = XOpenDisplay(displayName.empty() ? nullptr : displayName.c_str());
    if (!display) {
        throw InputHookError("Cannot open X display for global input monitoring");
    }

    int event, xiError;
    if (!XQueryExtension(display, "XInputExtension", &xiOpcode, &event, &xiError)) {
        XCloseDisplay(display);
        display = nullptr;
        throw InputHookError("X Input extension not available");
    }

    int major = 2, minor = 2;
    if (XIQueryVersion(display, &major, &minor) != x11::XSuccess || major < 2) {
        XCloseDisplay(display);
        display = nullptr;
        throw InputHookError("XInput2 not supported by server");
    }

    unsigned char maskBits[XIMaskLen(XI_LASTEVENT)] = {0};
    XISetMask(maskBits, XI_RawKeyPress);
    XISetMask(maskBits, XI_RawKeyRelease);
    XISetMask(maskBits, XI_RawButtonPress);
    XISetMask(maskBits, XI_RawButtonRelease);

    XIEventMask mask;
    mask.deviceid = XIAllMasterDevices;
    mask.mask_len = sizeof(maskBits);
    mask.mask = maskBits;
    XISelectEvents(display, DefaultRootWindow(display), &mask, 1);
    XFlush(display);

    SeedModifierState();
    LoadPointerMapping();

    shutdown = false;
    running = true;
    monitorThread = std::thread(&X11InputMonitor::MonitorLoop, this);

    info("X11 input monitor started (XInput {}.{})", major, minor);
}

void X11InputMonitor::Stop() {
    {
        std::lock_guard<std::mutex> lock(startMutex);
        if (!running.load() && !monitorThread.joinable()) return;
        running = false;
        shutdown = true;
    }

    if (monitorThread.joinable()) {
        monitorThread.join();
    }
    if (display) {
        XCloseDisplay(display);
        display = nullptr;
    }
    info("X11 input monitor stopped");
}

void X11InputMonitor::SeedModifierState() {
    // Modifiers already held when monitoring starts
    char keys[32] = {0};
    XQueryKeymap(display, keys);
    for (int keycode = 8; keycode < 256; ++keycode) {
        if (!(keys[keycode / 8] & (1 << (keycode % 8)))) continue;
        const KeySym keysym = XkbKeycodeToKeysym(display, static_cast<KeyCode>(keycode), 0, 0);
        const int code = KeyMap::FromX11(keysym);
        if (code >= 0 && KeyMap::IsModifier(code)) {
            modifiers.update(code, true);
        }
    }
}

void X11InputMonitor::LoadPointerMapping() {
    unsigned char map[256];
    const int size = XGetPointerMapping(display, map, sizeof(map));
    pointerMap.assign(map, map + std::max(size, 0));
    debug("Pointer mapping has {} buttons", pointerMap.size());
}

void X11InputMonitor::MonitorLoop() {
    info("X11 input monitoring loop started");

    XEvent event;
    while (running.load() && !shutdown.load()) {
        int pendingEvents = XPending(display);

        if (pendingEvents == 0) {
            // No events, sleep briefly to avoid busy waiting
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            continue;
        }

        for (int i = 0; i < pendingEvents && running.load(); ++i) {
            if (XNextEvent(display, &event) != 0) {
                error("XNextEvent failed - X11 connection error");
                running = false;
                break;
            }

            // Sent to every client, never selected
            if (event.type == MappingNotify) {
                if (event.xmapping.request == MappingPointer) {
                    LoadPointerMapping();
                } else {
                    XRefreshKeyboardMapping(&event.xmapping);
                }
                continue;
            }

            XGenericEventCookie* cookie = &event.xcookie;
            if (cookie->type != x11::XGenericEventType || cookie->extension != xiOpcode) {
                continue;
            }
            if (!XGetEventData(display, cookie)) {
                continue;
            }
            try {
                HandleRawEvent(cookie->evtype, cookie->data);
            } catch (const std::exception& e) {
                error("Error processing X11 event: {}", e.what());
            }
            XFreeEventData(display, cookie);
        }
    }

    info("X11 input monitoring loop stopped");
}

void X11InputMonitor::HandleRawEvent(int evtype, const void* data) {
    const auto* raw = static_cast<const XIRawEvent*>(data);

    InputEvent input;
    input.time = static_cast<uint64_t>(raw->time);

    switch (evtype) {
        case XI_RawKeyPress:
        case XI_RawKeyRelease: {
            const bool down = evtype == XI_RawKeyPress;
            const KeySym keysym = XkbKeycodeToKeysym(display, static_cast<KeyCode>(raw->detail), 0, 0);
            const int code = KeyMap::FromX11(keysym);
            if (code < 0) {
                debug("Ignoring unmapped keysym {:#x} (keycode {})", keysym, raw->detail);
                return;
            }
            if (KeyMap::IsModifier(code)) {
                if (!modifiers.update(code, down)) return;
                input.type = InputEventType::FlagsChanged;
                input.code = code;
                input.modifiers = modifiers.flags();
            } else {
                input.type = down ? InputEventType::KeyDown : InputEventType::KeyUp;
                input.code = code;
                input.modifiers = modifiers.flags();
                input.isRepeat = (raw->flags & XIKeyRepeat) != 0;
            }
            break;
        }
        case XI_RawButtonPress:
        case XI_RawButtonRelease: {
            const unsigned int logical = KeyMap::LogicalButton(pointerMap, static_cast<unsigned int>(raw->detail));
            auto button = KeyMap::FromX11Button(logical);
            if (!button) return; // wheel or disabled
            input.type = evtype == XI_RawButtonPress ? InputEventType::MouseDown : InputEventType::MouseUp;
            input.code = *button;
            input.modifiers = modifiers.flags();
            break;
        }
        default:
            return;
    }

    Post(input);
}

void X11InputMonitor::Post(const InputEvent& event) {
    std::weak_ptr<Handlers> weak = handlers;
    dispatcher([weak, event]() { Deliver(weak, event); });
}

void X11InputMonitor::Deliver(const std::weak_ptr<Handlers>& weak, const InputEvent& event) {
    auto shared = weak.lock();
    if (!shared) return;

    std::vector<std::pair<uint64_t, std::shared_ptr<Handler>>> snapshot;
    {
        std::lock_guard<std::mutex> lock(shared->mutex);
        snapshot.assign(shared->entries.begin(), shared->entries.end());
    }

    for (const auto& [id, handler] : snapshot) {
        {
            // Released by an earlier handler in this round
            std::lock_guard<std::mutex> lock(shared->mutex);
            if (shared->entries.find(id) == shared->entries.end()) continue;
        }
        try {
            (*handler)(event);
        } catch (const std::exception& e) {
            error("Error in X11 input handler: {}", e.what());
        }
    }
}

} // namespace kclick::io

#endif // __linux__
