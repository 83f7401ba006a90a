#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <string_view>
#include <thread>
#include <vector>

namespace filedrop::server {

// Fixed-size worker pool. Tasks still queued at shutdown are dropped.
class TaskExecutor {
public:
    using ErrorHandler = std::function<void(std::string_view)>;

    TaskExecutor();
    ~TaskExecutor();

    TaskExecutor(const TaskExecutor&) = delete;
    TaskExecutor& operator=(const TaskExecutor&) = delete;

    void start(std::size_t worker_count, ErrorHandler on_error = {});
    void submit(std::function<void()> task);
    void shutdown();

private:
    void worker_loop();
    void report(std::string_view what);

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_{false};
    ErrorHandler on_error_;
};

}  // namespace filedrop::server
