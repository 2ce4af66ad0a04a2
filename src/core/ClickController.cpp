#include "ClickController.hpp"
#include "utils/Logger.hpp"

namespace kclick {

using automation::ClickMode;

ClickController::ClickController(automation::ClickEngine& clickEngine, io::ShortcutEngine& shortcutEngine)
    : clickEngine(clickEngine), shortcutEngine(shortcutEngine) {
    shortcutEngine.setOnTriggerStarted([this]() { onTriggerStarted(); });
    shortcutEngine.setOnTriggerEnded([this]() { onTriggerEnded(); });
    shortcutEngine.setOnPauseModifierChanged([this](bool held) { onPauseModifierChanged(held); });

    // A modifier already held at startup
    if (shortcutEngine.isPauseModifierHeld()) {
        clickEngine.setExternalPause(true);
    }
}

ClickController::~ClickController() {
    shortcutEngine.setOnTriggerStarted(nullptr);
    shortcutEngine.setOnTriggerEnded(nullptr);
    shortcutEngine.setOnPauseModifierChanged(nullptr);
}

void ClickController::onTriggerStarted() {
    switch (clickEngine.mode()) {
        case ClickMode::Toggle:
            clickEngine.toggle();
            break;
        case ClickMode::Hold:
            clickEngine.start();
            break;
    }
}

void ClickController::onTriggerEnded() {
    if (clickEngine.mode() == ClickMode::Hold) {
        clickEngine.stop();
    }
}

void ClickController::onPauseModifierChanged(bool held) {
    debug("Pause modifier {}", held ? "held, pausing" : "released, resuming");
    clickEngine.setExternalPause(held);
}

} // namespace kclick
