#pragma once

#include <chrono>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unistd.h>
#include "core/automation/Executor.hpp"
#include "core/automation/RepeatingTimer.hpp"
#include "core/io/InputSource.hpp"
#include "core/io/PointerInjector.hpp"

namespace kclick::test {

// Timer driven by hand; the state outlives the engine that owns the timer
class FakeTimer : public automation::RepeatingTimer {
public:
    struct State {
        Callback callback;
        bool active = false;
        std::chrono::nanoseconds interval{0};
        int starts = 0;

        void fire() {
            if (active && callback) callback();
        }
    };

    FakeTimer() : state(std::make_shared<State>()) {}

    void setCallback(Callback callback) override { state->callback = std::move(callback); }
    void start(std::chrono::nanoseconds interval) override {
        state->active = true;
        state->interval = interval;
        state->starts++;
    }
    void stop() override { state->active = false; }
    [[nodiscard]] bool isActive() const override { return state->active; }

    std::shared_ptr<State> state;
};

class FakePointerInjector : public io::PointerInjector {
public:
    std::optional<io::Point> cursorPosition() override {
        positionQueries++;
        return position;
    }

    bool click(io::Point at, int button) override {
        if (!clickSucceeds) return false;
        clicks++;
        lastPosition = at;
        lastButton = button;
        return true;
    }

    std::optional<io::Point> position = io::Point{100, 200};
    bool clickSucceeds = true;
    int clicks = 0;
    int positionQueries = 0;
    io::Point lastPosition;
    int lastButton = -1;
};

// Runs work immediately on the calling thread
class InlineExecutor : public automation::Executor {
public:
    bool post(Work work) override {
        if (rejecting) return false;
        work();
        return true;
    }

    bool rejecting = false;
};

// Holds work until the test runs it
class QueueExecutor : public automation::Executor {
public:
    bool post(Work work) override {
        queue.push_back(std::move(work));
        return true;
    }

    void runAll() {
        while (!queue.empty()) {
            auto work = std::move(queue.front());
            queue.pop_front();
            work();
        }
    }

    std::deque<Work> queue;
};

class FakeInputSource : public io::InputSource {
public:
    explicit FakeInputSource(bool consumable, std::string name = "fake")
        : consumable(consumable), name(std::move(name)) {}

    io::Subscription subscribe(Handler handler) override {
        if (failSubscribe) {
            throw io::InputHookError("hook refused");
        }
        const int id = nextId++;
        handlers[id] = std::move(handler);
        return io::Subscription([this, id]() { handlers.erase(id); });
    }

    [[nodiscard]] bool canConsume() const override { return consumable; }
    [[nodiscard]] std::string getName() const override { return name; }

    // Returns true when a handler asked to consume the event
    bool emit(const io::InputEvent& event) {
        bool consumed = false;
        auto snapshot = handlers;
        for (auto& [id, handler] : snapshot) {
            consumed = handler(event) || consumed;
        }
        return consumed && consumable;
    }

    [[nodiscard]] size_t subscriberCount() const { return handlers.size(); }

    bool failSubscribe = false;

private:
    bool consumable;
    std::string name;
    std::map<int, Handler> handlers;
    int nextId = 1;
};

inline io::InputEvent keyEvent(io::InputEventType type, int code, uint32_t modifiers, uint64_t time,
                               bool repeat = false) {
    io::InputEvent event;
    event.type = type;
    event.code = code;
    event.modifiers = modifiers;
    event.time = time;
    event.isRepeat = repeat;
    return event;
}

inline io::InputEvent mouseEvent(io::InputEventType type, int button, uint64_t time) {
    io::InputEvent event;
    event.type = type;
    event.code = button;
    event.time = time;
    return event;
}

inline io::InputEvent flagsEvent(int code, uint32_t modifiers, uint64_t time) {
    io::InputEvent event;
    event.type = io::InputEventType::FlagsChanged;
    event.code = code;
    event.modifiers = modifiers;
    event.time = time;
    return event;
}

// A settings file private to one test, removed on destruction
class TempConfigFile {
public:
    explicit TempConfigFile(const std::string& name)
        : path((std::filesystem::temp_directory_path() /
                ("kclick-test-" + name + "-" + std::to_string(::getpid()) + ".cfg")).string()) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }
    ~TempConfigFile() {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }

    TempConfigFile(const TempConfigFile&) = delete;
    TempConfigFile& operator=(const TempConfigFile&) = delete;

    const std::string path;
};

} // namespace kclick::test
