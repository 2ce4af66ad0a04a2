#include "QtRepeatingTimer.hpp"
#include <QTimer>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include "utils/Logger.hpp"

namespace kclick::automation {

QtRepeatingTimer::QtRepeatingTimer()
    : timer(std::make_unique<QTimer>()) {
    timer->setTimerType(Qt::PreciseTimer);
    timer->setSingleShot(false);
    QObject::connect(timer.get(), &QTimer::timeout, [this]() {
        if (!callback) return;
        try {
            callback();
        } catch (const std::exception& e) {
            error("Error in timer callback: {}", e.what());
        }
    });
}

QtRepeatingTimer::~QtRepeatingTimer() {
    timer->stop();
}

void QtRepeatingTimer::setCallback(Callback newCallback) {
    callback = std::move(newCallback);
}

int QtRepeatingTimer::ToMilliseconds(std::chrono::nanoseconds interval) {
    const double ms = std::round(static_cast<double>(interval.count()) / 1e6);
    return static_cast<int>(std::clamp(ms, 1.0, 2147483647.0));
}

void QtRepeatingTimer::start(std::chrono::nanoseconds interval) {
    // QTimer::start restarts a running timer
    timer->start(ToMilliseconds(interval));
}

void QtRepeatingTimer::stop() {
    timer->stop();
}

bool QtRepeatingTimer::isActive() const {
    return timer->isActive();
}

int QtRepeatingTimer::intervalMs() const {
    return timer->interval();
}

} // namespace kclick::automation
