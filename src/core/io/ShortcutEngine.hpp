#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include "InputSource.hpp"
#include "core/ConfigManager.hpp"
#include "core/Shortcut.hpp"

namespace kclick::io {

/**
 * ShortcutEngine - owns the trigger shortcut and turns raw input into
 * "trigger started" / "trigger ended" edges.
 *
 * Two paths feed it: the global source sees every event on the system but
 * cannot consume; the local source sees events delivered to our own windows
 * and can swallow them. Recording only happens on the local path.
 * A physical event seen on both paths is processed once.
 *
 * Not thread-safe: every call and every handler runs on the GUI thread.
 */
class ShortcutEngine {
public:
    using Callback = std::function<void()>;
    using StatusCallback = std::function<void(bool)>;
    using ShortcutCallback = std::function<void(const std::optional<Shortcut>&)>;

    // Throws InputHookError when either source cannot be subscribed
    ShortcutEngine(InputSource& globalSource, InputSource& localSource, Configs& config);
    ~ShortcutEngine();

    ShortcutEngine(const ShortcutEngine&) = delete;
    ShortcutEngine& operator=(const ShortcutEngine&) = delete;

    void setShortcut(const Shortcut& shortcut);
    void clearShortcut();
    [[nodiscard]] const std::optional<Shortcut>& currentShortcut() const { return currentShortcut_; }
    [[nodiscard]] std::string descriptor() const { return describe(currentShortcut_); }

    void setRecording(bool recording);
    void startRecording() { setRecording(true); }
    void stopRecording() { setRecording(false); }
    [[nodiscard]] bool isRecording() const { return recording_; }

    void setPauseModifier(Modifier modifier);
    [[nodiscard]] Modifier pauseModifier() const { return pauseModifier_; }
    [[nodiscard]] bool isPauseModifierHeld() const { return fnPressed_; }
    [[nodiscard]] bool isTriggered() const { return triggered_; }

    void setOnTriggerStarted(Callback callback) { onTriggerStarted_ = std::move(callback); }
    void setOnTriggerEnded(Callback callback) { onTriggerEnded_ = std::move(callback); }
    void setOnPauseModifierChanged(StatusCallback callback) { onPauseChanged_ = std::move(callback); }
    void setOnRecordingChanged(StatusCallback callback) { onRecordingChanged_ = std::move(callback); }
    void setOnShortcutChanged(ShortcutCallback callback) { onShortcutChanged_ = std::move(callback); }

private:
    struct EventIdentity {
        InputEventType type;
        int code;
        uint64_t time;
    };

    static constexpr size_t RECENT_EVENT_LIMIT = 32;

    bool handleGlobalEvent(const InputEvent& event);
    bool handleLocalEvent(const InputEvent& event);

    bool recordFrom(const InputEvent& event);
    // true when the event is a press or release of the bound key or button
    bool canMatch(const InputEvent& event) const;
    void matchEvent(const InputEvent& event);
    void releaseTrigger();
    void updatePauseModifier(const InputEvent& event);

    // true when this physical event was already processed on the other path.
    // Only events that can match the binding are remembered, so a stream of
    // unrelated events (our own injected clicks) cannot push them out.
    bool isDuplicate(const InputEvent& event) const;
    void remember(const InputEvent& event);

    void adoptShortcut(std::optional<Shortcut> shortcut);
    void loadShortcut();
    void saveShortcut();

    void notify(const Callback& callback, const char* what);
    void notify(const StatusCallback& callback, bool value, const char* what);

    Configs& config_;
    std::optional<Shortcut> currentShortcut_;
    bool recording_ = false;
    bool fnPressed_ = false;
    bool triggered_ = false;
    Modifier pauseModifier_ = ModFunction;
    bool verbose_ = false;

    std::deque<EventIdentity> recentEvents_;

    Callback onTriggerStarted_;
    Callback onTriggerEnded_;
    StatusCallback onPauseChanged_;
    StatusCallback onRecordingChanged_;
    ShortcutCallback onShortcutChanged_;

    // Declared last so they are released first
    Subscription globalSubscription_;
    Subscription localSubscription_;
};

} // namespace kclick::io
