#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <thread>
#include "core/errors/delta_errors.hpp"

namespace xcdelta::runtime {

// Runs every submitted task on a dedicated thread. Finished threads are joined
// lazily on the next submit, and all of them on stop().
class OperationExecutor {
public:
    OperationExecutor() = default;
    OperationExecutor(const OperationExecutor&) = delete;
    OperationExecutor& operator=(const OperationExecutor&) = delete;
    ~OperationExecutor();

    core::errors::Result<bool> submit(std::function<void()> task);
    void stop();

    std::size_t active_count() const;

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic_bool> done;
    };

    void collect_finished_locked();

    mutable std::mutex mutex_;
    std::list<Worker> workers_;
    bool stopped_ = false;
};

}  // namespace xcdelta::runtime
