#pragma once

#include <QObject>
#include <QPointer>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include "InputSource.hpp"

class QCoreApplication;
class QKeyEvent;
class QMouseEvent;
struct _XDisplay;

namespace kclick::io {

/**
 * QtEventTap - in-app input observation through an application event filter.
 *
 * Sees every key and mouse event delivered to our own windows, before the
 * widgets do. A handler returning true consumes the event. Key codes are
 * translated from the X keycode (level 0), so Shift does not change them.
 */
class QtEventTap : public QObject, public InputSource {
    Q_OBJECT

public:
    explicit QtEventTap(QCoreApplication* app, QObject* parent = nullptr);
    ~QtEventTap() override;

    Subscription subscribe(Handler handler) override;
    [[nodiscard]] bool canConsume() const override { return true; }
    [[nodiscard]] std::string getName() const override { return "Qt event tap"; }
    [[nodiscard]] size_t subscriberCount() const { return handlers.size(); }

    bool eventFilter(QObject* watched, QEvent* event) override;

    // Qt mouse button -> button index (0 primary, 1 secondary, 2 middle, ...)
    static std::optional<int> ButtonIndex(Qt::MouseButton button);
    // Canonical modifier bits of Qt's modifier flags
    static uint32_t FlagsFromQt(Qt::KeyboardModifiers modifiers);

private:
    std::optional<InputEvent> Translate(const QEvent* event) const;
    std::optional<InputEvent> TranslateKey(const QKeyEvent* event) const;
    std::optional<InputEvent> TranslateMouse(const QMouseEvent* event) const;
    int KeyCodeOf(const QKeyEvent* event) const;
    uint32_t HeldModifierFlags(const QKeyEvent* event, int code) const;
    void Release(uint64_t id);

    QPointer<QCoreApplication> app;
    _XDisplay* display = nullptr; // Qt's connection, not owned
    std::map<uint64_t, std::shared_ptr<Handler>> handlers;
    uint64_t nextId = 1;
    bool installed = false;
};

} // namespace kclick::io
