#include "executor/result_normalizer.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using executor::ResultNormalizer;
using ::testing::EndsWith;

isolation::RunOutcome Outcome(const std::string& out, const std::string& err,
                              int32_t exit_code) {
  isolation::RunOutcome outcome;
  outcome.stdout_text = out;
  outcome.stderr_text = err;
  outcome.exit_code = exit_code;
  outcome.wall_time_millis = 1500;
  return outcome;
}

TEST(ResultNormalizerTest, Success) {
  proto::Response response =
      ResultNormalizer::Normalize(Outcome("  hello\n\n", "\n", 0), 10, true);
  EXPECT_EQ(response.output(), "hello");
  EXPECT_EQ(response.error(), "");
  EXPECT_EQ(response.exit_code(), 0);
  EXPECT_TRUE(response.sandboxed());
  EXPECT_FALSE(response.has_execution_time());
  EXPECT_EQ(response.status(), proto::Status::SUCCESS);
}

TEST(ResultNormalizerTest, NonZero) {
  proto::Response response = ResultNormalizer::Normalize(
      Outcome("", "Traceback\nZeroDivisionError\n", 1), 10, false);
  EXPECT_EQ(response.error(), "Traceback\nZeroDivisionError");
  EXPECT_EQ(response.exit_code(), 1);
  EXPECT_FALSE(response.sandboxed());
  ASSERT_TRUE(response.has_execution_time());
  EXPECT_DOUBLE_EQ(response.execution_time(), 1.5);
  EXPECT_EQ(response.status(), proto::Status::NONZERO);
}

TEST(ResultNormalizerTest, Timeout) {
  isolation::RunOutcome outcome = Outcome("partial\n", "", 124);
  outcome.timed_out = true;
  proto::Response response = ResultNormalizer::Normalize(outcome, 2, true);
  EXPECT_EQ(response.output(), "partial");
  EXPECT_EQ(response.error(), "Execution timed out after 2 seconds");
  EXPECT_EQ(response.exit_code(), 124);
  EXPECT_TRUE(response.has_execution_time());
  EXPECT_EQ(response.status(), proto::Status::TIMEOUT);
}

TEST(ResultNormalizerTest, TimeoutKeepsStderr) {
  isolation::RunOutcome outcome = Outcome("", "warning\n", 124);
  outcome.timed_out = true;
  proto::Response response = ResultNormalizer::Normalize(outcome, 5, true);
  EXPECT_EQ(response.error(),
            "warning\nExecution timed out after 5 seconds");
  EXPECT_THAT(response.error(),
              EndsWith("Execution timed out after 5 seconds"));
}

TEST(ResultNormalizerTest, ContainerError) {
  proto::Response response = ResultNormalizer::ContainerError("no such image");
  EXPECT_EQ(response.output(), "");
  EXPECT_EQ(response.error(), "Container error: no such image");
  EXPECT_EQ(response.exit_code(), 1);
  EXPECT_TRUE(response.sandboxed());
  EXPECT_FALSE(response.has_execution_time());
  EXPECT_EQ(response.status(), proto::Status::CONTAINER_ERROR);
}

TEST(ResultNormalizerTest, ExecutionError) {
  proto::Response response =
      ResultNormalizer::ExecutionError("disk full", false);
  EXPECT_EQ(response.output(), "");
  EXPECT_EQ(response.error(), "Execution error: disk full");
  EXPECT_EQ(response.exit_code(), 1);
  EXPECT_FALSE(response.sandboxed());
  EXPECT_EQ(response.status(), proto::Status::EXECUTION_ERROR);
}

}  // namespace
