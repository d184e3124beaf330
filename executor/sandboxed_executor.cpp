#include "executor/sandboxed_executor.hpp"

#include <string>

#include "executor/result_normalizer.hpp"
#include "glog/logging.h"
#include "isolation/resource_policy.hpp"
#include "language/language_profile.hpp"

namespace executor {

SandboxedExecutor::SandboxedExecutor(
    std::unique_ptr<isolation::Runtime> runtime,
    std::unique_ptr<Executor> fallback)
    : runtime_(std::move(runtime)),
      fallback_(std::move(fallback)),
      sandboxed_(runtime_ && runtime_->Available()) {
  if (!sandboxed_) {
    LOG(WARNING) << "Isolation runtime unavailable, requests will run on "
                 << (fallback_ ? fallback_->Id() : "no executor");
  }
}

proto::Response SandboxedExecutor::Execute(const proto::Request& request) {
  if (!sandboxed_) {
    if (!fallback_) {
      return ResultNormalizer::ExecutionError("no executor available",
                                              /*sandboxed = */ false);
    }
    proto::Response response = fallback_->Execute(request);
    response.set_sandboxed(false);
    return response;
  }

  int32_t timeout_seconds = request.timeout_seconds();
  if (timeout_seconds == 0) timeout_seconds = kDefaultTimeoutSeconds;
  if (timeout_seconds < 0) {
    return ResultNormalizer::ExecutionError(
        "invalid timeout " + std::to_string(timeout_seconds),
        /*sandboxed = */ true);
  }

  const language::LanguageProfile& profile =
      language::Resolve(request.language());
  try {
    isolation::RunOutcome outcome =
        runtime_->Run(request.source_code(), profile, isolation::Apply(),
                      request.stdin_payload(), timeout_seconds);
    return ResultNormalizer::Normalize(outcome, timeout_seconds,
                                       /*sandboxed = */ true);
  } catch (const isolation::container_error& e) {
    LOG(ERROR) << "Container error running " << profile.name << ": "
               << e.what();
    return ResultNormalizer::ContainerError(e.what());
  } catch (const std::exception& e) {
    LOG(ERROR) << "Error running " << profile.name << ": " << e.what();
    return ResultNormalizer::ExecutionError(e.what(), /*sandboxed = */ true);
  }
}

proto::Response SandboxedExecutor::Execute(const std::string& source_code,
                                           const std::string& language,
                                           const std::string& stdin_payload,
                                           int32_t timeout_seconds) {
  proto::Request request;
  request.set_source_code(source_code);
  request.set_language(language);
  request.set_stdin_payload(stdin_payload);
  request.set_timeout_seconds(timeout_seconds);
  return Execute(request);
}

}  // namespace executor
