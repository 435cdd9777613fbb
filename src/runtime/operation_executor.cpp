#include "runtime/operation_executor.hpp"

#include <exception>
#include <string>
#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"

namespace xcdelta::runtime {

using core::errors::DeltaError;
using core::errors::ErrorCategory;

OperationExecutor::~OperationExecutor() {
    stop();
}

core::errors::Result<bool> OperationExecutor::submit(std::function<void()> task) {
    if (!task) {
        return DeltaError{ErrorCategory::Internal, "Cannot submit an empty task.",
                          "empty_task"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) {
        return DeltaError{ErrorCategory::Internal,
                          "Executor is shutting down.", "executor_stopped"};
    }
    collect_finished_locked();

    auto done = std::make_shared<std::atomic_bool>(false);
    try {
        std::thread thread([task = std::move(task), done]() {
            try {
                task();
            } catch (const std::exception& ex) {
                XCDELTA_LOG_ERROR(std::string("OperationExecutor: task exception: ") +
                                  ex.what());
            }
            done->store(true);
        });
        workers_.push_back(Worker{std::move(thread), std::move(done)});
    } catch (const std::system_error& ex) {
        return DeltaError{ErrorCategory::Internal,
                          std::string("Unable to start operation thread: ") + ex.what(),
                          "thread_spawn_failed"};
    }
    return true;
}

void OperationExecutor::stop() {
    std::list<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
        workers.swap(workers_);
    }
    for (auto& worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

std::size_t OperationExecutor::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t active = 0;
    for (const auto& worker : workers_) {
        if (!worker.done->load()) {
            ++active;
        }
    }
    return active;
}

void OperationExecutor::collect_finished_locked() {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->done->load()) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

}  // namespace xcdelta::runtime
