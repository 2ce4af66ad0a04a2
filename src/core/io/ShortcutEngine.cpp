#include "ShortcutEngine.hpp"
#include <algorithm>
#include <stdexcept>
#include "utils/Logger.hpp"

namespace kclick::io {

ShortcutEngine::ShortcutEngine(InputSource& globalSource, InputSource& localSource, Configs& config)
    : config_(config) {
    verbose_ = config_.Get<bool>(Configs::VERBOSE_INPUT_KEY, false);

    const auto pauseName = config_.Get<std::string>(Configs::PAUSE_MODIFIER_KEY, "Fn");
    if (auto modifier = parseModifier(pauseName)) {
        pauseModifier_ = *modifier;
    } else {
        warning("Unknown pause modifier '{}', using Fn", pauseName);
    }

    loadShortcut();

    globalSubscription_ = globalSource.subscribe(
        [this](const InputEvent& event) { return handleGlobalEvent(event); });
    localSubscription_ = localSource.subscribe(
        [this](const InputEvent& event) { return handleLocalEvent(event); });

    info("ShortcutEngine listening on {} and {}: shortcut {}, pause modifier {}",
         globalSource.getName(), localSource.getName(), descriptor(), modifierName(pauseModifier_));
}

ShortcutEngine::~ShortcutEngine() {
    localSubscription_.reset();
    globalSubscription_.reset();
    debug("ShortcutEngine input hooks released");
}

void ShortcutEngine::setShortcut(const Shortcut& shortcut) {
    if (shortcut.kind == Shortcut::Kind::Mouse && shortcut.code == 0) {
        throw std::invalid_argument("The primary mouse button cannot be a trigger");
    }
    Shortcut canonical = shortcut;
    canonical.modifiers = shortcut.kind == Shortcut::Kind::Mouse ? 0 : canonicalModifiers(shortcut.modifiers);
    adoptShortcut(canonical);
}

void ShortcutEngine::clearShortcut() {
    adoptShortcut(std::nullopt);
}

void ShortcutEngine::setRecording(bool recording) {
    if (recording_ == recording) return;
    recording_ = recording;
    debug(recording ? "Recording shortcut" : "Shortcut recording ended");
    // Matching stops while recording, so the release of a held trigger would be lost
    if (recording_) {
        releaseTrigger();
    }
    notify(onRecordingChanged_, recording_, "recording changed");
}

void ShortcutEngine::setPauseModifier(Modifier modifier) {
    if (pauseModifier_ == modifier) return;
    pauseModifier_ = modifier;
    config_.Set<std::string>(Configs::PAUSE_MODIFIER_KEY, modifierName(modifier));
    if (!config_.Save()) {
        debug("Pause modifier change not persisted");
    }
}

bool ShortcutEngine::handleGlobalEvent(const InputEvent& event) {
    if (verbose_) {
        debug("global {} code {} modifiers {:#x} time {}",
              toString(event.type), event.code, event.modifiers, event.time);
    }

    if (event.type == InputEventType::FlagsChanged) {
        updatePauseModifier(event);
        return false;
    }
    // Recording only takes events delivered to our own windows
    if (recording_) return false;

    if (!canMatch(event) || isDuplicate(event)) return false;
    remember(event);
    matchEvent(event);
    return false;
}

bool ShortcutEngine::handleLocalEvent(const InputEvent& event) {
    if (verbose_) {
        debug("local {} code {} modifiers {:#x} time {}",
              toString(event.type), event.code, event.modifiers, event.time);
    }

    if (event.type == InputEventType::FlagsChanged) {
        updatePauseModifier(event);
        return false;
    }

    if (recording_) {
        if (recordFrom(event)) {
            // The global twin of a recorded event must not fire the new binding
            remember(event);
            return true;
        }
        return false;
    }

    if (!canMatch(event) || isDuplicate(event)) return false;
    remember(event);
    matchEvent(event);
    return false;
}

bool ShortcutEngine::recordFrom(const InputEvent& event) {
    if (event.code < 0 || event.code > 0xFFFF) return false;

    if (event.type == InputEventType::KeyDown) {
        adoptShortcut(Shortcut::keyboard(static_cast<uint16_t>(event.code), event.modifiers));
        setRecording(false);
        return true;
    }
    if (event.type == InputEventType::MouseDown) {
        // The primary button is the click that opened the recorder
        if (event.code == 0) return false;
        adoptShortcut(Shortcut::mouse(static_cast<uint16_t>(event.code)));
        setRecording(false);
        return true;
    }
    return false;
}

bool ShortcutEngine::canMatch(const InputEvent& event) const {
    if (!currentShortcut_) return false;
    if (currentShortcut_->kind == Shortcut::Kind::Keyboard) {
        return event.isKey() && event.code == currentShortcut_->code;
    }
    return event.isMouse() && event.code == currentShortcut_->code;
}

void ShortcutEngine::matchEvent(const InputEvent& event) {
    if (!canMatch(event)) return;
    // Auto-repeat never releases the key
    if (event.isRepeat && event.isUp()) return;

    const Shortcut& shortcut = *currentShortcut_;
    // Modifiers are often let go before the key, so a release matches on code alone
    if (shortcut.kind == Shortcut::Kind::Keyboard && event.isDown() &&
        canonicalModifiers(event.modifiers) != shortcut.modifiers) {
        return;
    }

    if (event.isDown()) {
        if (triggered_) return;
        triggered_ = true;
        debug("Shortcut {} pressed", shortcut.descriptor());
        notify(onTriggerStarted_, "trigger started");
    } else if (triggered_) {
        triggered_ = false;
        debug("Shortcut {} released", shortcut.descriptor());
        notify(onTriggerEnded_, "trigger ended");
    }
}

void ShortcutEngine::updatePauseModifier(const InputEvent& event) {
    const bool held = (event.modifiers & pauseModifier_) != 0;
    if (held == fnPressed_) return;
    fnPressed_ = held;
    debug("Pause modifier {} {}", modifierName(pauseModifier_), held ? "held" : "released");
    notify(onPauseChanged_, held, "pause modifier changed");
}

bool ShortcutEngine::isDuplicate(const InputEvent& event) const {
    if (event.time == 0) return false;
    return std::any_of(recentEvents_.begin(), recentEvents_.end(), [&](const EventIdentity& seen) {
        return seen.type == event.type && seen.code == event.code && seen.time == event.time;
    });
}

void ShortcutEngine::remember(const InputEvent& event) {
    if (event.time == 0) return;
    recentEvents_.push_back({event.type, event.code, event.time});
    while (recentEvents_.size() > RECENT_EVENT_LIMIT) {
        recentEvents_.pop_front();
    }
}

void ShortcutEngine::adoptShortcut(std::optional<Shortcut> shortcut) {
    if (currentShortcut_ == shortcut) return;

    currentShortcut_ = std::move(shortcut);
    saveShortcut();
    info("Trigger shortcut set to {}", descriptor());

    // A held trigger cannot be released through a binding that no longer exists
    releaseTrigger();

    if (onShortcutChanged_) {
        try {
            onShortcutChanged_(currentShortcut_);
        } catch (const std::exception& e) {
            error("Error in shortcut changed callback: {}", e.what());
        }
    }
}

void ShortcutEngine::releaseTrigger() {
    if (!triggered_) return;
    triggered_ = false;
    debug("Trigger released without its key up");
    notify(onTriggerEnded_, "trigger ended");
}

void ShortcutEngine::loadShortcut() {
    if (!config_.Has(Configs::SHORTCUT_KEY)) return;

    const auto text = config_.Get<std::string>(Configs::SHORTCUT_KEY, "");
    auto parsed = Shortcut::parse(text);
    if (!parsed) {
        warning("Ignoring malformed stored shortcut '{}'", text);
        return;
    }
    currentShortcut_ = parsed;
}

void ShortcutEngine::saveShortcut() {
    if (currentShortcut_) {
        config_.Set<std::string>(Configs::SHORTCUT_KEY, currentShortcut_->serialize());
    } else {
        config_.Remove(Configs::SHORTCUT_KEY);
    }
    if (!config_.Save()) {
        debug("Shortcut change not persisted");
    }
}

void ShortcutEngine::notify(const Callback& callback, const char* what) {
    if (!callback) return;
    try {
        callback();
    } catch (const std::exception& e) {
        error("Error in {} callback: {}", what, e.what());
    }
}

void ShortcutEngine::notify(const StatusCallback& callback, bool value, const char* what) {
    if (!callback) return;
    try {
        callback(value);
    } catch (const std::exception& e) {
        error("Error in {} callback: {}", what, e.what());
    }
}

} // namespace kclick::io
