#include "SerialExecutor.hpp"
#include <exception>
#include <utility>
#include <pthread.h>
#include "utils/Logger.hpp"

namespace kclick::automation {

SerialExecutor::SerialExecutor(std::string name, size_t maxQueue)
    : name_(std::move(name)), maxQueue_(maxQueue) {
    worker_ = std::thread([this]() { workerLoop(); });
    // Linux limits thread names to 15 characters
    pthread_setname_np(worker_.native_handle(), name_.substr(0, 15).c_str());
}

SerialExecutor::~SerialExecutor() {
    shutdown();
}

bool SerialExecutor::post(Work work) {
    if (!work) return false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return false;
        if (queue_.size() >= maxQueue_) {
            warning("{}: queue full, dropping task", name_);
            return false;
        }
        queue_.push_back(std::move(work));
    }
    queueCv_.notify_one();
    return true;
}

void SerialExecutor::waitIdle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idleCv_.wait(lock, [this]() { return queue_.empty() && !busy_; });
}

void SerialExecutor::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && !worker_.joinable()) return;
        stopping_ = true;
    }
    queueCv_.notify_all();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
        debug("{} stopped", name_);
    }
}

bool SerialExecutor::isShutdown() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stopping_;
}

size_t SerialExecutor::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void SerialExecutor::workerLoop() {
    while (true) {
        Work work;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            queueCv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) break; // stopping and drained
            work = std::move(queue_.front());
            queue_.pop_front();
            busy_ = true;
        }

        try {
            work();
        } catch (const std::exception& e) {
            error("{}: task threw exception: {}", name_, e.what());
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            busy_ = false;
            if (queue_.empty()) idleCv_.notify_all();
        }
    }
    std::lock_guard<std::mutex> lock(mutex_);
    idleCv_.notify_all();
}

} // namespace kclick::automation
