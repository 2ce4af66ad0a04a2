#pragma once

#include "core/automation/ClickEngine.hpp"
#include "core/io/ShortcutEngine.hpp"

namespace kclick {

/**
 * ClickController - routes shortcut edges to the click engine.
 *
 * Trigger started toggles (Toggle mode) or starts (Hold mode) clicking,
 * trigger ended stops it in Hold mode, and the pause modifier pauses it.
 * Both engines must outlive the controller.
 */
class ClickController {
public:
    ClickController(automation::ClickEngine& clickEngine, io::ShortcutEngine& shortcutEngine);
    ~ClickController();

    ClickController(const ClickController&) = delete;
    ClickController& operator=(const ClickController&) = delete;

    void onTriggerStarted();
    void onTriggerEnded();
    void onPauseModifierChanged(bool held);

private:
    automation::ClickEngine& clickEngine;
    io::ShortcutEngine& shortcutEngine;
};

} // namespace kclick
