#pragma once

#include <memory>
#include <optional>
#include <string>
#include "core/errors/delta_errors.hpp"

namespace xcdelta::protocol {

enum class OperationStatus {
    Succeeded,
    Failed,
    Cancelled
};

struct OperationOutcome {
    OperationStatus status = OperationStatus::Succeeded;
    std::optional<core::errors::DeltaError> error;
};

// Push channel an operation reports through while it runs.
template <typename Fragment>
class OperationSink {
public:
    virtual ~OperationSink() = default;

    virtual void append_fragment(Fragment fragment) = 0;
    virtual void append_log(const std::string& text) = 0;
    virtual void set_artifact_path(const std::string& path) = 0;
};

// A started unit of work. run() executes on the operation's own thread and
// returns once the work is over; cancel() may be called from any thread and
// must only signal, never block.
template <typename Fragment>
class Operation {
public:
    virtual ~Operation() = default;

    virtual OperationOutcome run(OperationSink<Fragment>& sink) = 0;
    virtual void cancel() = 0;
};

// Binds requests to operations for a manager.
template <typename Fragment, typename Request>
class OperationProvider {
public:
    virtual ~OperationProvider() = default;

    // Rejections must come back as InvalidRequest errors.
    virtual core::errors::Result<bool> validate(const Request& request) const = 0;

    virtual core::errors::Result<std::shared_ptr<Operation<Fragment>>> make_operation(
        const std::string& session_id, const Request& request) = 0;
};

}  // namespace xcdelta::protocol
