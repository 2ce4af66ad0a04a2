#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include "Executor.hpp"

namespace kclick::automation {

/**
 * SerialExecutor - a single worker thread draining a FIFO queue.
 *
 * Tasks run one at a time in submission order. shutdown() stops accepting
 * work, lets the queue drain and joins the worker; the destructor does the
 * same. An exception escaping a task is logged and the worker carries on.
 */
class SerialExecutor : public Executor {
public:
    explicit SerialExecutor(std::string name = "kclick-worker", size_t maxQueue = 1024);
    ~SerialExecutor() override;

    SerialExecutor(const SerialExecutor&) = delete;
    SerialExecutor& operator=(const SerialExecutor&) = delete;

    bool post(Work work) override;

    // Blocks until the queue is empty and no task is running
    void waitIdle();
    void shutdown();

    [[nodiscard]] bool isShutdown() const;
    [[nodiscard]] size_t pending() const;
    [[nodiscard]] const std::string& getName() const { return name_; }

private:
    void workerLoop();

    std::string name_;
    size_t maxQueue_;
    std::deque<Work> queue_;
    mutable std::mutex mutex_;
    std::condition_variable queueCv_;
    std::condition_variable idleCv_;
    bool stopping_ = false;
    bool busy_ = false;
    std::thread worker_;
};

} // namespace kclick::automation
