#include <gtest/gtest.h>
#include "core/errors/safety_errors.hpp"

using namespace saferclaw::core::errors;

// A dummy function to simulate a queue lookup failing
Result<std::string> simulate_job_lookup(bool should_fail) {
    if (should_fail) {
        return SafetyError{ErrorCategory::Queue, "Job not found", "job_not_found"};
    }
    return std::string("job payload here");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_job_lookup(false);

    // Check that it is NOT an error
    EXPECT_FALSE(is_error(result));
    // Check that the value is correct
    EXPECT_EQ(get_value(result), "job payload here");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_job_lookup(true);

    // Check that it IS an error
    EXPECT_TRUE(is_error(result));

    // Check the error details
    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::Queue);
    EXPECT_EQ(error.message, "Job not found");
    EXPECT_EQ(error.code, "job_not_found");
    EXPECT_TRUE(error.hint.empty());
}

TEST(ErrorModelTest, CategoriesHaveStableNames) {
    EXPECT_EQ(to_string(ErrorCategory::Input), "input");
    EXPECT_EQ(to_string(ErrorCategory::Policy), "policy");
    EXPECT_EQ(to_string(ErrorCategory::Execution), "execution");
    EXPECT_EQ(to_string(ErrorCategory::Queue), "queue");
    EXPECT_EQ(to_string(ErrorCategory::Internal), "internal");
}
