#include "QtEventTap.hpp"
#include <QCoreApplication>
#include <QGuiApplication>
#include <QKeyEvent>
#include <QMouseEvent>
#include <bit>
#include <stdexcept>
#include <vector>
#include "KeyMap.hpp"
#include "ModifierState.hpp"
#include "core/Shortcut.hpp"
#include "utils/Logger.hpp"
#include "x11.h"

namespace kclick::io {

QtEventTap::QtEventTap(QCoreApplication* app, QObject* parent)
    : QObject(parent), app(app) {
    if (!app) {
        throw std::invalid_argument("Application cannot be null");
    }
    KeyMap::Initialize();

#if QT_CONFIG(xcb)
    if (auto* guiApp = qobject_cast<QGuiApplication*>(app)) {
        if (auto* x11App = guiApp->nativeInterface<QNativeInterface::QX11Application>()) {
            display = x11App->display();
        }
    }
#endif
    if (!display) {
        debug("Qt event tap: no X11 connection, using Qt key symbols");
    }
}

QtEventTap::~QtEventTap() {
    if (installed && app) {
        app->removeEventFilter(this);
    }
}

Subscription QtEventTap::subscribe(Handler handler) {
    if (!handler) {
        throw std::invalid_argument("Handler cannot be null");
    }
    if (!app) {
        throw InputHookError("Application is gone, cannot install event filter");
    }

    const uint64_t id = nextId++;
    handlers[id] = std::make_shared<Handler>(std::move(handler));
    if (!installed) {
        app->installEventFilter(this);
        installed = true;
        debug("Qt event tap installed");
    }

    QPointer<QtEventTap> self(this);
    return Subscription([self, id]() {
        if (self) self->Release(id);
    });
}

void QtEventTap::Release(uint64_t id) {
    handlers.erase(id);
    if (handlers.empty() && installed) {
        if (app) app->removeEventFilter(this);
        installed = false;
        debug("Qt event tap removed");
    }
}

bool QtEventTap::eventFilter(QObject* watched, QEvent* event) {
    if (handlers.empty()) {
        return QObject::eventFilter(watched, event);
    }

    auto input = Translate(event);
    if (!input) {
        return QObject::eventFilter(watched, event);
    }

    std::vector<std::pair<uint64_t, std::shared_ptr<Handler>>> snapshot(handlers.begin(), handlers.end());
    bool consume = false;
    for (const auto& [id, handler] : snapshot) {
        if (handlers.find(id) == handlers.end()) continue;
        try {
            consume = (*handler)(*input) || consume;
        } catch (const std::exception& e) {
            error("Error in Qt input handler: {}", e.what());
        }
    }
    return consume;
}

std::optional<InputEvent> QtEventTap::Translate(const QEvent* event) const {
    switch (event->type()) {
        case QEvent::KeyPress:
        case QEvent::KeyRelease:
            return TranslateKey(static_cast<const QKeyEvent*>(event));
        case QEvent::MouseButtonPress:
        case QEvent::MouseButtonDblClick:
        case QEvent::MouseButtonRelease:
            return TranslateMouse(static_cast<const QMouseEvent*>(event));
        default:
            return std::nullopt;
    }
}

std::optional<InputEvent> QtEventTap::TranslateKey(const QKeyEvent* event) const {
    const bool down = event->type() == QEvent::KeyPress;
    // Auto-repeat produces a release before every repeated press
    if (!down && event->isAutoRepeat()) return std::nullopt;

    const int code = KeyCodeOf(event);
    if (code < 0) return std::nullopt;

    InputEvent input;
    input.code = code;
    input.time = static_cast<uint64_t>(event->timestamp());

    if (KeyMap::IsModifier(code)) {
        if (event->isAutoRepeat()) return std::nullopt;
        input.type = InputEventType::FlagsChanged;
        input.modifiers = HeldModifierFlags(event, code);
        return input;
    }

    input.type = down ? InputEventType::KeyDown : InputEventType::KeyUp;
    input.modifiers = FlagsFromQt(event->modifiers());
    input.isRepeat = event->isAutoRepeat();
    return input;
}

std::optional<InputEvent> QtEventTap::TranslateMouse(const QMouseEvent* event) const {
    auto index = ButtonIndex(event->button());
    if (!index) return std::nullopt;

    InputEvent input;
    input.type = event->type() == QEvent::MouseButtonRelease ? InputEventType::MouseUp : InputEventType::MouseDown;
    input.code = *index;
    input.modifiers = FlagsFromQt(event->modifiers());
    input.time = static_cast<uint64_t>(event->timestamp());
    return input;
}

int QtEventTap::KeyCodeOf(const QKeyEvent* event) const {
    if (display && event->nativeScanCode() != 0) {
        const KeySym keysym = XkbKeycodeToKeysym(display, static_cast<KeyCode>(event->nativeScanCode()), 0, 0);
        const int code = KeyMap::FromX11(keysym);
        if (code >= 0) return code;
    }
    // Without a keycode the native virtual key is the (shifted) keysym
    if (event->nativeVirtualKey() != 0) {
        return KeyMap::FromX11(event->nativeVirtualKey());
    }
    return -1;
}

uint32_t QtEventTap::HeldModifierFlags(const QKeyEvent* event, int code) const {
    ModifierState state;
    if (display) {
        // The server knows every held key, including those pressed while we
        // had no focus
        char keys[32] = {0};
        XQueryKeymap(display, keys);
        for (int keycode = 8; keycode < 256; ++keycode) {
            if (!(keys[keycode / 8] & (1 << (keycode % 8)))) continue;
            const int held = KeyMap::FromX11(XkbKeycodeToKeysym(display, static_cast<KeyCode>(keycode), 0, 0));
            if (held >= 0) state.update(held, true);
        }
    } else {
        const auto flags = FlagsFromQt(event->modifiers());
        if (flags & ModShift) state.update(vk::Shift, true);
        if (flags & ModControl) state.update(vk::Control, true);
        if (flags & ModOption) state.update(vk::Option, true);
        if (flags & ModCommand) state.update(vk::Command, true);
    }
    // The key of this event is authoritative for its own side
    state.update(code, event->type() == QEvent::KeyPress);
    return state.flags();
}

std::optional<int> QtEventTap::ButtonIndex(Qt::MouseButton button) {
    const auto bits = static_cast<uint32_t>(button);
    if (bits == 0 || !std::has_single_bit(bits)) return std::nullopt;
    // LeftButton 0x1, RightButton 0x2, MiddleButton 0x4, BackButton 0x8, ...
    return std::countr_zero(bits);
}

uint32_t QtEventTap::FlagsFromQt(Qt::KeyboardModifiers modifiers) {
    uint32_t flags = ModNone;
    if (modifiers & Qt::ShiftModifier) flags |= ModShift;
    if (modifiers & Qt::ControlModifier) flags |= ModControl;
    if (modifiers & Qt::AltModifier) flags |= ModOption;
    if (modifiers & Qt::MetaModifier) flags |= ModCommand;
    return flags;
}

} // namespace kclick::io
