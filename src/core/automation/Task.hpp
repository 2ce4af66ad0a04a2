#pragma once

#include <string>

namespace kclick::automation {

// A repeating job that can be switched on and off
class Task {
public:
    virtual ~Task() = default;

    virtual void start() = 0;
    virtual void stop() = 0;
    virtual void toggle() = 0;
    [[nodiscard]] virtual bool isRunning() const = 0;
    [[nodiscard]] virtual std::string getName() const = 0;
};

} // namespace kclick::automation
