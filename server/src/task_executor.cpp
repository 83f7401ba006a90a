#include "task_executor.hpp"

#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

namespace filedrop::server {

TaskExecutor::TaskExecutor() = default;

TaskExecutor::~TaskExecutor() {
    shutdown();
}

void TaskExecutor::start(std::size_t worker_count, ErrorHandler on_error) {
    if (!workers_.empty()) {
        return;
    }
    if (worker_count == 0) {
        throw std::invalid_argument("worker_count must be > 0");
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = false;
        on_error_ = std::move(on_error);
    }
    for (std::size_t i = 0; i < worker_count; ++i) {
        workers_.emplace_back(&TaskExecutor::worker_loop, this);
    }
}

void TaskExecutor::submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ || workers_.empty()) {
            throw std::runtime_error("TaskExecutor is not running");
        }
        tasks_.push(std::move(task));
    }
    cv_.notify_one();
}

void TaskExecutor::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    std::lock_guard<std::mutex> lock(mutex_);
    workers_.clear();
    std::queue<std::function<void()>> empty;
    std::swap(tasks_, empty);
}

void TaskExecutor::report(std::string_view what) {
    ErrorHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = on_error_;
    }
    if (handler) {
        handler(what);
    } else {
        std::cerr << "[ERROR] task failed: " << what << std::endl;
    }
}

void TaskExecutor::worker_loop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [&] { return stopping_ || !tasks_.empty(); });
            if (stopping_) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }
        try {
            task();
        } catch (const std::exception& ex) {
            report(ex.what());
        } catch (...) {
            report("unknown exception");
        }
    }
}

}  // namespace filedrop::server
