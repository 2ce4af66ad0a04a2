#pragma once

#ifdef __linux__

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "InputSource.hpp"
#include "ModifierState.hpp"

struct _XDisplay;

namespace kclick::io {

/**
 * X11InputMonitor - system-wide input observation through XInput2 raw events.
 *
 * Raw key and button events are selected on the root window of a private
 * display connection and read on a monitor thread. Each event is translated
 * to virtual codes and handed to the owner thread through the dispatcher,
 * where the subscribed handlers run. Raw events cannot be consumed.
 *
 * Modifier keys produce FlagsChanged events carrying the full modifier state.
 */
class X11InputMonitor : public InputSource {
public:
    using Dispatcher = std::function<void(std::function<void()>)>;

    // displayName empty means $DISPLAY
    explicit X11InputMonitor(Dispatcher dispatcher, std::string displayName = {});
    ~X11InputMonitor() override;

    X11InputMonitor(const X11InputMonitor&) = delete;
    X11InputMonitor& operator=(const X11InputMonitor&) = delete;

    // Connects and starts the monitor thread on first use
    Subscription subscribe(Handler handler) override;
    [[nodiscard]] bool canConsume() const override { return false; }
    [[nodiscard]] std::string getName() const override { return "X11 raw input monitor"; }

    [[nodiscard]] bool IsRunning() const { return running.load(); }
    [[nodiscard]] size_t GetSubscriberCount() const;

private:
    // Shared with queued deliveries, which may run after the monitor is gone
    struct Handlers {
        std::mutex mutex;
        std::map<uint64_t, std::shared_ptr<Handler>> entries;
        uint64_t nextId = 1;
    };

    void Start();
    void Stop();
    void MonitorLoop();
    void HandleRawEvent(int evtype, const void* data);
    void SeedModifierState();
    void LoadPointerMapping();
    void Post(const InputEvent& event);

    static void Deliver(const std::weak_ptr<Handlers>& weak, const InputEvent& event);

    Dispatcher dispatcher;
    std::string displayName;
    std::shared_ptr<Handlers> handlers;

    std::atomic<bool> running{false};
    std::atomic<bool> shutdown{false};
    std::thread monitorThread;
    std::mutex startMutex;

    _XDisplay* display = nullptr;
    int xiOpcode = -1;
    ModifierState modifiers; // monitor thread only
    // Raw events carry physical buttons; Qt and our matching use logical ones
    std::vector<unsigned char> pointerMap;
};

} // namespace kclick::io

#endif // __linux__
