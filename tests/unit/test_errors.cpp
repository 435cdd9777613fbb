#include <gtest/gtest.h>
#include "core/errors/delta_errors.hpp"

using namespace xcdelta::core::errors;

// Stand-in for a lookup that can miss
Result<std::string> simulate_lookup(bool should_fail) {
    if (should_fail) {
        return DeltaError{ErrorCategory::NotFound, "Session not found"};
    }
    return std::string("session-0123");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_lookup(false);

    EXPECT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "session-0123");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_lookup(true);

    EXPECT_TRUE(is_error(result));

    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::NotFound);
    EXPECT_EQ(error.message, "Session not found");
    EXPECT_EQ(error.code, "unknown_error");
}

TEST(ErrorModelTest, CategoriesHaveStableNames) {
    EXPECT_EQ(to_string(ErrorCategory::InvalidRequest), "invalid_request");
    EXPECT_EQ(to_string(ErrorCategory::AlreadyExists), "already_exists");
    EXPECT_EQ(to_string(ErrorCategory::NotFound), "not_found");
    EXPECT_EQ(to_string(ErrorCategory::OperationFailed), "operation_failed");
}
