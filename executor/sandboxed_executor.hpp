#ifndef EXECUTOR_SANDBOXED_EXECUTOR_HPP
#define EXECUTOR_SANDBOXED_EXECUTOR_HPP

#include <memory>
#include <string>

#include "executor/executor.hpp"
#include "isolation/runtime.hpp"

namespace executor {

// Runs requests in the isolation runtime, or through the fallback executor
// when the runtime was not available at construction. Execute may be called
// concurrently.
class SandboxedExecutor : public Executor {
 public:
  static const constexpr int32_t kDefaultTimeoutSeconds = 10;

  SandboxedExecutor(std::unique_ptr<isolation::Runtime> runtime,
                    std::unique_ptr<Executor> fallback);
  ~SandboxedExecutor() override = default;

  std::string Id() const override { return "SANDBOXED"; }
  proto::Response Execute(const proto::Request& request) override;
  proto::Response Execute(const std::string& source_code,
                          const std::string& language,
                          const std::string& stdin_payload = "",
                          int32_t timeout_seconds = kDefaultTimeoutSeconds);

  bool Sandboxed() const { return sandboxed_; }

 private:
  std::unique_ptr<isolation::Runtime> runtime_;
  std::unique_ptr<Executor> fallback_;
  bool sandboxed_;
};

}  // namespace executor

#endif
