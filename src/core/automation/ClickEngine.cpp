#include "ClickEngine.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include "utils/Logger.hpp"

namespace kclick::automation {

const char* toString(ClickMode mode) {
    switch (mode) {
        case ClickMode::Toggle: return "Toggle";
        case ClickMode::Hold: return "Hold";
    }
    return "Toggle";
}

std::optional<ClickMode> parseClickMode(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower == "toggle") return ClickMode::Toggle;
    if (lower == "hold") return ClickMode::Hold;
    return std::nullopt;
}

namespace {

double clampRate(double clicksPerSecond) {
    if (std::isnan(clicksPerSecond)) return ClickEngine::MIN_CLICKS_PER_SECOND;
    return std::max(ClickEngine::MIN_CLICKS_PER_SECOND, clicksPerSecond);
}

} // namespace

ClickEngine::ClickEngine(Configs& config,
                         std::unique_ptr<RepeatingTimer> timer,
                         std::shared_ptr<io::PointerInjector> injector,
                         Executor& executor)
    : config_(config)
    , timer_(std::move(timer))
    , injector_(std::move(injector))
    , executor_(executor)
    , counters_(std::make_shared<Counters>()) {
    if (!timer_) {
        throw std::invalid_argument("Timer cannot be null");
    }
    if (!injector_) {
        throw std::invalid_argument("Pointer injector cannot be null");
    }

    clicksPerSecond_ = clampRate(config_.Get<double>(Configs::CLICKS_PER_SECOND_KEY, DEFAULT_CLICKS_PER_SECOND));

    if (config_.Has(Configs::CLICK_MODE_KEY)) {
        const auto name = config_.Get<std::string>(Configs::CLICK_MODE_KEY, "");
        if (auto parsed = parseClickMode(name)) {
            mode_ = *parsed;
        } else {
            warning("Unknown click mode '{}', using {}", name, toString(mode_));
        }
    }

    timer_->setCallback([this]() { emitClick(); });
    info("ClickEngine ready: {} cps, {} mode", clicksPerSecond_, toString(mode_));
}

ClickEngine::~ClickEngine() {
    timer_->stop();
}

void ClickEngine::start() {
    if (clicking_) return;
    setClicking(true);
    reschedule();
}

void ClickEngine::stop() {
    timer_->stop();
    setClicking(false);
}

void ClickEngine::toggle() {
    if (clicking_) {
        stop();
    } else {
        start();
    }
}

void ClickEngine::setExternalPause(bool paused) {
    if (pausedExternally_ == paused) return;
    pausedExternally_ = paused;
    debug("Clicking {} externally", paused ? "paused" : "resumed");
    notify(onPausedChanged_, paused, "paused changed");
    reschedule();
}

void ClickEngine::setRate(double clicksPerSecond) {
    clicksPerSecond_ = clampRate(clicksPerSecond);
    config_.Set<double>(Configs::CLICKS_PER_SECOND_KEY, clicksPerSecond_);
    if (!config_.Save()) {
        debug("Click rate change not persisted");
    }
    reschedule();
}

std::chrono::duration<double> ClickEngine::interval() const {
    return std::chrono::duration<double>(1.0 / std::max(MIN_CLICKS_PER_SECOND, clicksPerSecond_));
}

void ClickEngine::setMode(ClickMode mode) {
    if (mode_ != mode) {
        mode_ = mode;
        config_.Set<std::string>(Configs::CLICK_MODE_KEY, toString(mode));
        if (!config_.Save()) {
            debug("Click mode change not persisted");
        }
        info("Click mode set to {}", toString(mode));
    }
    stop();
}

ClickEngine::Stats ClickEngine::stats() const {
    Stats stats;
    stats.firings = counters_->firings.load();
    stats.injected = counters_->injected.load();
    stats.suppressed = counters_->suppressed.load();
    stats.failed = counters_->failed.load();
    return stats;
}

void ClickEngine::reschedule() {
    timer_->stop();
    if (!clicking_ || pausedExternally_) return;

    emitClick();
    timer_->start(std::chrono::duration_cast<std::chrono::nanoseconds>(interval()));
}

bool ClickEngine::pointerOverOwnUI() const {
    if (suppressed_.load()) return true;
    if (!windowProbe_) return false;
    try {
        return windowProbe_();
    } catch (const std::exception& e) {
        error("Window probe failed: {}", e.what());
        return false;
    }
}

void ClickEngine::emitClick() {
    counters_->firings.fetch_add(1);

    if (pointerOverOwnUI()) {
        counters_->suppressed.fetch_add(1);
        return;
    }

    // Only shared state is captured: the task may outlive the engine
    auto injector = injector_;
    auto counters = counters_;
    const bool posted = executor_.post([injector, counters]() {
        auto position = injector->cursorPosition();
        if (!position) {
            counters->failed.fetch_add(1);
            debug("Click skipped: pointer position unavailable");
            return;
        }
        if (!injector->click(*position, 0)) {
            counters->failed.fetch_add(1);
            debug("Click at ({}, {}) failed", position->x, position->y);
            return;
        }
        counters->injected.fetch_add(1);
    });

    if (!posted) {
        counters_->failed.fetch_add(1);
        debug("Click skipped: executor rejected the task");
    }
}

void ClickEngine::setClicking(bool clicking) {
    if (clicking_ == clicking) return;
    clicking_ = clicking;
    info("Clicking {}", clicking ? "started" : "stopped");
    notify(onClickingChanged_, clicking, "clicking changed");
}

void ClickEngine::notify(const StatusCallback& callback, bool value, const char* what) {
    if (!callback) return;
    try {
        callback(value);
    } catch (const std::exception& e) {
        error("Error in {} callback: {}", what, e.what());
    }
}

} // namespace kclick::automation
