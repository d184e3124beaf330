#ifndef ISOLATION_RUNTIME_HPP
#define ISOLATION_RUNTIME_HPP

#include <stdexcept>
#include <string>

#include "isolation/resource_policy.hpp"
#include "language/language_profile.hpp"

namespace isolation {

// The isolated environment could not be created or run correctly.
class container_error : public std::runtime_error {
 public:
  explicit container_error(const std::string& msg) : std::runtime_error(msg) {}
};

// Exit code reported for executions killed at the timeout, as timeout(1)
// does.
static const constexpr int32_t kTimeoutExitCode = 124;

// Captured streams may grow this much past --output_limit_kb before the
// writer is stopped, so that reads can tell that output was cut.
static const constexpr int64_t kOutputSlackKb = 64;

// Reads a captured stream, keeping at most --output_limit_kb and marking
// the cut with "[output truncated]".
std::string ReadCapturedOutput(const std::string& path);

// What came out of a program that ran to completion or was killed at the
// timeout.
struct RunOutcome {
  std::string stdout_text;
  std::string stderr_text;
  int32_t exit_code = 0;
  bool timed_out = false;
  int64_t wall_time_millis = 0;
};

// Handle to an isolation substrate. Availability is decided once, when the
// implementation is constructed. Run may be called concurrently.
class Runtime {
 public:
  virtual bool Available() const = 0;

  // Runs source_code in a fresh environment configured by profile and policy,
  // feeding it stdin_payload and killing it after timeout_seconds. Throws
  // container_error if the environment cannot be created, and
  // std::system_error on local I/O failures. Nothing created for the call
  // survives it.
  virtual RunOutcome Run(const std::string& source_code,
                         const language::LanguageProfile& profile,
                         const ResourcePolicy& policy,
                         const std::string& stdin_payload,
                         int32_t timeout_seconds) = 0;

  Runtime() = default;
  virtual ~Runtime() = default;
  Runtime(const Runtime&) = delete;
  Runtime& operator=(const Runtime&) = delete;
  Runtime(Runtime&&) = delete;
  Runtime& operator=(Runtime&&) = delete;
};

}  // namespace isolation

#endif
