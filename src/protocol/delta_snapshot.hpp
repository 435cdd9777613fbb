#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/delta_errors.hpp"

namespace xcdelta::protocol {

enum class SessionState {
    Pending,
    Running,
    Completed,
    Failed,
    Cancelled
};

inline bool is_terminal(const SessionState state) {
    return state == SessionState::Completed || state == SessionState::Failed ||
           state == SessionState::Cancelled;
}

inline std::string to_string(const SessionState state) {
    switch (state) {
        case SessionState::Pending:
            return "pending";
        case SessionState::Running:
            return "running";
        case SessionState::Completed:
            return "completed";
        case SessionState::Failed:
            return "failed";
        case SessionState::Cancelled:
            return "cancelled";
        default:
            return "unknown";
    }
}

// Poller-held position: how many fragments and log bytes were already seen.
struct DeltaCursor {
    std::size_t fragments = 0;
    std::size_t log_offset = 0;

    DeltaCursor() = default;
    DeltaCursor(std::size_t fragment_count, std::size_t log_bytes = 0)
        : fragments(fragment_count), log_offset(log_bytes) {}
};

template <typename Fragment>
struct DeltaSnapshot {
    std::string identifier;
    std::vector<Fragment> results;
    std::string log_output;
    SessionState state = SessionState::Pending;
    std::optional<core::errors::DeltaError> error;
    std::optional<std::string> artifact_path;
    // Cursor to send on the next poll.
    DeltaCursor next;
};

}  // namespace xcdelta::protocol
