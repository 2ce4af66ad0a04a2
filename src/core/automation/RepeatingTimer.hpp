#pragma once

#include <chrono>
#include <functional>

namespace kclick::automation {

/**
 * RepeatingTimer - fires a callback on the owner thread every interval
 * until stopped. start() on a running timer restarts it with the new
 * interval, so one object never has two pending schedules.
 */
class RepeatingTimer {
public:
    using Callback = std::function<void()>;

    virtual ~RepeatingTimer() = default;

    virtual void setCallback(Callback callback) = 0;
    virtual void start(std::chrono::nanoseconds interval) = 0;
    virtual void stop() = 0;
    [[nodiscard]] virtual bool isActive() const = 0;
};

} // namespace kclick::automation
