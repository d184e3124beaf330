#ifndef EXECUTOR_RESULT_NORMALIZER_HPP
#define EXECUTOR_RESULT_NORMALIZER_HPP

#include <string>

#include "isolation/runtime.hpp"
#include "proto/response.pb.h"

namespace executor {

// Builds responses in their canonical shape: outputs trimmed, exit_code
// always set, execution_time only for runs that did not exit cleanly.
class ResultNormalizer {
 public:
  static proto::Response Normalize(const isolation::RunOutcome& outcome,
                                   int32_t timeout_seconds, bool sandboxed);

  // The isolated environment could not be created or run.
  static proto::Response ContainerError(const std::string& what);

  // Any other failure.
  static proto::Response ExecutionError(const std::string& what,
                                        bool sandboxed);
};

}  // namespace executor

#endif
