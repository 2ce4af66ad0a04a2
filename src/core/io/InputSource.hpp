#pragma once
#include <functional>
#include <stdexcept>
#include <string>
#include "InputEvent.hpp"

namespace kclick::io {

// An input observation hook could not be installed
class InputHookError : public std::runtime_error {
public:
    explicit InputHookError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Subscription - owns one registration with an InputSource.
 *
 * Releasing the handle (explicitly or by destroying it) deregisters the
 * observer. Move-only.
 */
class Subscription {
public:
    Subscription() = default;
    explicit Subscription(std::function<void()> release);
    ~Subscription();

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;
    Subscription(Subscription&& other) noexcept;
    Subscription& operator=(Subscription&& other) noexcept;

    void reset();
    [[nodiscard]] bool active() const { return static_cast<bool>(release_); }

private:
    std::function<void()> release_;
};

/**
 * InputSource - a stream of keyboard and mouse events.
 *
 * The handler runs on the GUI thread. Returning true asks the source to
 * consume the event; sources that only observe ignore the request.
 */
class InputSource {
public:
    using Handler = std::function<bool(const InputEvent&)>;

    virtual ~InputSource() = default;

    // Throws InputHookError when the hook cannot be installed
    [[nodiscard]] virtual Subscription subscribe(Handler handler) = 0;
    [[nodiscard]] virtual bool canConsume() const = 0;
    [[nodiscard]] virtual std::string getName() const = 0;
};

} // namespace kclick::io
