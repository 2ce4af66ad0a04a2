#pragma once

#include <functional>

namespace kclick::automation {

// Runs posted work off the calling thread
class Executor {
public:
    using Work = std::function<void()>;

    virtual ~Executor() = default;

    // false when the executor no longer accepts work
    virtual bool post(Work work) = 0;
};

} // namespace kclick::automation
