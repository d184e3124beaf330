#include "executor/result_normalizer.hpp"

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"

namespace executor {

proto::Response ResultNormalizer::Normalize(
    const isolation::RunOutcome& outcome, int32_t timeout_seconds,
    bool sandboxed) {
  proto::Response response;
  response.set_output(
      std::string(absl::StripAsciiWhitespace(outcome.stdout_text)));
  std::string error(absl::StripAsciiWhitespace(outcome.stderr_text));
  response.set_exit_code(outcome.exit_code);
  response.set_sandboxed(sandboxed);
  if (outcome.timed_out) {
    if (!error.empty()) error += "\n";
    absl::StrAppend(&error, "Execution timed out after ", timeout_seconds,
                    " seconds");
    response.set_status(proto::Status::TIMEOUT);
  } else if (outcome.exit_code != 0) {
    response.set_status(proto::Status::NONZERO);
  } else {
    response.set_status(proto::Status::SUCCESS);
  }
  response.set_error(error);
  if (outcome.timed_out || outcome.exit_code != 0) {
    response.set_execution_time(outcome.wall_time_millis / 1000.0);
  }
  return response;
}

proto::Response ResultNormalizer::ContainerError(const std::string& what) {
  proto::Response response;
  response.set_error(absl::StrCat("Container error: ", what));
  response.set_exit_code(1);
  response.set_sandboxed(true);
  response.set_status(proto::Status::CONTAINER_ERROR);
  return response;
}

proto::Response ResultNormalizer::ExecutionError(const std::string& what,
                                                 bool sandboxed) {
  proto::Response response;
  response.set_error(absl::StrCat("Execution error: ", what));
  response.set_exit_code(1);
  response.set_sandboxed(sandboxed);
  response.set_status(proto::Status::EXECUTION_ERROR);
  return response;
}

}  // namespace executor
