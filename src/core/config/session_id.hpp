#pragma once
#include <cctype>
#include <random>
#include <sstream>
#include <string>

namespace xcdelta::core::config {

    // Generates a 12-character hex ID prefixed with "session-"
    inline std::string generate_session_id() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << "session-";
        for (int i = 0; i < 12; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

    // Caller-supplied identifiers end up in directory names, so keep them to
    // a conservative character set.
    inline bool is_valid_session_id(const std::string& id) {
        constexpr std::size_t kMaxLength = 128;
        if (id.empty() || id.size() > kMaxLength) {
            return false;
        }
        if (id == "." || id == "..") {
            return false;
        }
        for (const char c : id) {
            const auto uc = static_cast<unsigned char>(c);
            if (std::isalnum(uc) == 0 && c != '-' && c != '_' && c != '.') {
                return false;
            }
        }
        return true;
    }

} // namespace xcdelta::core::config
