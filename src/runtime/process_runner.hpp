#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "core/errors/delta_errors.hpp"

namespace xcdelta::runtime {

enum class OutputStream {
    Stdout,
    Stderr
};

struct ProcessSpec {
    std::vector<std::string> argv;
    std::map<std::string, std::string> environment;
    std::filesystem::path working_directory = ".";
    // Zero means no timeout.
    std::uint64_t timeout_ms = 0;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

struct ProcessExit {
    int exit_code = -1;
    bool timed_out = false;
    bool cancelled = false;
    double duration_ms = 0.0;
};

// Called once per complete output line, without the trailing newline.
using LineHandler = std::function<void(OutputStream stream, const std::string& line)>;

class ProcessRunner {
public:
    core::errors::Result<ProcessExit> run(const ProcessSpec& spec,
                                          const LineHandler& on_line) const;
};

}  // namespace xcdelta::runtime
