#include "InputSource.hpp"
#include <utility>

namespace kclick::io {

const char* toString(InputEventType type) {
    switch (type) {
        case InputEventType::KeyDown: return "KeyDown";
        case InputEventType::KeyUp: return "KeyUp";
        case InputEventType::FlagsChanged: return "FlagsChanged";
        case InputEventType::MouseDown: return "MouseDown";
        case InputEventType::MouseUp: return "MouseUp";
    }
    return "Unknown";
}

Subscription::Subscription(std::function<void()> release)
    : release_(std::move(release)) {}

Subscription::~Subscription() {
    reset();
}

Subscription::Subscription(Subscription&& other) noexcept
    : release_(std::exchange(other.release_, nullptr)) {}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        reset();
        release_ = std::exchange(other.release_, nullptr);
    }
    return *this;
}

void Subscription::reset() {
    if (release_) {
        auto release = std::exchange(release_, nullptr);
        release();
    }
}

} // namespace kclick::io
