#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "Executor.hpp"
#include "RepeatingTimer.hpp"
#include "Task.hpp"
#include "core/ConfigManager.hpp"
#include "core/io/PointerInjector.hpp"

namespace kclick::automation {

enum class ClickMode {
    Toggle, // one trigger starts, the next stops
    Hold    // clicks only while the trigger is held
};

const char* toString(ClickMode mode);
// Case-insensitive, nullopt for anything but "toggle" / "hold"
std::optional<ClickMode> parseClickMode(const std::string& name);

/**
 * ClickEngine - clicks the primary button at the pointer at a fixed rate.
 *
 * The loop runs while clicking and not paused externally. Each firing is
 * dropped when the pointer is over our own UI. Injection happens on the
 * executor; the timer lives on the owner (GUI) thread.
 */
class ClickEngine : public Task {
public:
    static constexpr double DEFAULT_CLICKS_PER_SECOND = 10.0;
    static constexpr double MIN_CLICKS_PER_SECOND = 1.0;

    using StatusCallback = std::function<void(bool)>;
    using WindowProbe = std::function<bool()>;

    struct Stats {
        uint64_t firings = 0;
        uint64_t injected = 0;
        uint64_t suppressed = 0;
        uint64_t failed = 0;
    };

    ClickEngine(Configs& config,
                std::unique_ptr<RepeatingTimer> timer,
                std::shared_ptr<io::PointerInjector> injector,
                Executor& executor);
    ~ClickEngine() override;

    ClickEngine(const ClickEngine&) = delete;
    ClickEngine& operator=(const ClickEngine&) = delete;

    void start() override;
    void stop() override;
    void toggle() override;
    [[nodiscard]] bool isRunning() const override { return clicking_; }
    [[nodiscard]] std::string getName() const override { return "ClickEngine"; }

    void setExternalPause(bool paused);
    [[nodiscard]] bool isPausedExternally() const { return pausedExternally_; }

    void setRate(double clicksPerSecond);
    [[nodiscard]] double clicksPerSecond() const { return clicksPerSecond_; }
    [[nodiscard]] std::chrono::duration<double> interval() const;

    void setMode(ClickMode mode);
    [[nodiscard]] ClickMode mode() const { return mode_; }

    void setSuppressed(bool suppressed) { suppressed_.store(suppressed); }
    [[nodiscard]] bool isSuppressed() const { return suppressed_.load(); }
    void setWindowProbe(WindowProbe probe) { windowProbe_ = std::move(probe); }

    void setOnClickingChanged(StatusCallback callback) { onClickingChanged_ = std::move(callback); }
    void setOnPausedChanged(StatusCallback callback) { onPausedChanged_ = std::move(callback); }

    [[nodiscard]] Stats stats() const;

private:
    struct Counters {
        std::atomic<uint64_t> firings{0};
        std::atomic<uint64_t> injected{0};
        std::atomic<uint64_t> suppressed{0};
        std::atomic<uint64_t> failed{0};
    };

    void reschedule();
    void emitClick();
    bool pointerOverOwnUI() const;
    void setClicking(bool clicking);
    void notify(const StatusCallback& callback, bool value, const char* what);

    Configs& config_;
    std::unique_ptr<RepeatingTimer> timer_;
    std::shared_ptr<io::PointerInjector> injector_;
    Executor& executor_;
    std::shared_ptr<Counters> counters_;

    bool clicking_ = false;
    bool pausedExternally_ = false;
    double clicksPerSecond_ = DEFAULT_CLICKS_PER_SECOND;
    ClickMode mode_ = ClickMode::Toggle;
    std::atomic<bool> suppressed_{false};
    WindowProbe windowProbe_;

    StatusCallback onClickingChanged_;
    StatusCallback onPausedChanged_;
};

} // namespace kclick::automation
