#ifndef EXECUTOR_FALLBACK_EXECUTOR_HPP
#define EXECUTOR_FALLBACK_EXECUTOR_HPP

#include <string>

#include "executor/executor.hpp"

namespace executor {

// Runs programs directly on the host, with process limits only: no network,
// filesystem or privilege isolation. Responses always have sandboxed unset.
class FallbackExecutor : public Executor {
 public:
  FallbackExecutor();
  ~FallbackExecutor() override = default;

  std::string Id() const override { return "FALLBACK"; }
  proto::Response Execute(const proto::Request& request) override;

 private:
  static const constexpr char* kShell = "/bin/sh";
  static const constexpr int32_t kMaxFiles = 256;
  // RLIMIT_NPROC counts every process of the user, not only the program's.
  static const constexpr int32_t kMaxProcs = 512;
};

}  // namespace executor

#endif
