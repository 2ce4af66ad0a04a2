#pragma once

#include <memory>
#include "RepeatingTimer.hpp"

class QTimer;

namespace kclick::automation {

// RepeatingTimer on a precise QTimer; fires on the thread that owns it
class QtRepeatingTimer : public RepeatingTimer {
public:
    QtRepeatingTimer();
    ~QtRepeatingTimer() override;

    void setCallback(Callback callback) override;
    void start(std::chrono::nanoseconds interval) override;
    void stop() override;
    [[nodiscard]] bool isActive() const override;

    // QTimer resolution is one millisecond
    [[nodiscard]] static int ToMilliseconds(std::chrono::nanoseconds interval);
    [[nodiscard]] int intervalMs() const;

private:
    std::unique_ptr<QTimer> timer;
    Callback callback;
};

} // namespace kclick::automation
