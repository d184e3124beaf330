#include "executor/fallback_executor.hpp"

#include <memory>

#include "executor/result_normalizer.hpp"
#include "executor/sandboxed_executor.hpp"
#include "glog/logging.h"
#include "isolation/resource_policy.hpp"
#include "isolation/runtime.hpp"
#include "language/language_profile.hpp"
#include "sandbox/sandbox.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"

namespace executor {

FallbackExecutor::FallbackExecutor() {
  LOG(WARNING) << "Running untrusted code without isolation: only time, "
                  "file and memory limits are enforced";
}

proto::Response FallbackExecutor::Execute(const proto::Request& request) {
  int32_t timeout_seconds = request.timeout_seconds();
  if (timeout_seconds == 0) {
    timeout_seconds = SandboxedExecutor::kDefaultTimeoutSeconds;
  }
  if (timeout_seconds < 0) {
    return ResultNormalizer::ExecutionError(
        "invalid timeout " + std::to_string(timeout_seconds),
        /*sandboxed = */ false);
  }
  const language::LanguageProfile& profile =
      language::Resolve(request.language());

  try {
    util::TempDir tmp(FLAGS_temp_directory);
    util::File::Write(util::File::JoinPath(tmp.Path(), profile.source_filename),
                      request.source_code());

    sandbox::ExecutionOptions options(tmp.Path(), kShell);
    options.args = {"-c", profile.RunCommand(tmp.Path(), tmp.Path())};
    if (!request.stdin_payload().empty()) {
      options.stdin_file = util::File::JoinPath(tmp.Path(), "stdin");
      util::File::Write(options.stdin_file, request.stdin_payload());
    }
    options.stdout_file = util::File::JoinPath(tmp.Path(), "stdout");
    options.stderr_file = util::File::JoinPath(tmp.Path(), "stderr");

    // Limits.
    options.wall_limit_millis = int64_t{timeout_seconds} * 1000;
    // One more second of CPU, so that busy loops end at the wall limit.
    options.cpu_limit_millis = (int64_t{timeout_seconds} + 1) * 1000;
    options.max_file_size_kb =
        int64_t{FLAGS_output_limit_kb} + isolation::kOutputSlackKb;
    options.max_files = kMaxFiles;
    options.max_procs = kMaxProcs;
    if (profile.limit_address_space) {
      options.memory_limit_kb = isolation::Apply().memory_limit_kb;
    }

    std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create();
    if (!sb) {
      return ResultNormalizer::ExecutionError("no process sandbox available",
                                              /*sandboxed = */ false);
    }
    sandbox::ExecutionInfo info;
    std::string error_msg;
    if (!sb->Execute(options, &info, &error_msg)) {
      return ResultNormalizer::ExecutionError(error_msg,
                                              /*sandboxed = */ false);
    }

    isolation::RunOutcome outcome;
    outcome.stdout_text = isolation::ReadCapturedOutput(options.stdout_file);
    outcome.stderr_text = isolation::ReadCapturedOutput(options.stderr_file);
    outcome.wall_time_millis = info.wall_time_millis;
    if (info.killed) {
      LOG(WARNING) << "Host execution of " << profile.name
                   << " timed out after " << timeout_seconds << "s";
      outcome.timed_out = true;
      outcome.exit_code = isolation::kTimeoutExitCode;
    } else if (info.signal != 0) {
      outcome.exit_code = 128 + info.signal;
      if (!outcome.stderr_text.empty()) outcome.stderr_text += "\n";
      outcome.stderr_text += info.message;
    } else {
      outcome.exit_code = info.status_code;
    }
    return ResultNormalizer::Normalize(outcome, timeout_seconds,
                                       /*sandboxed = */ false);
  } catch (const std::exception& e) {
    LOG(ERROR) << "Host execution of " << profile.name << " failed: "
               << e.what();
    return ResultNormalizer::ExecutionError(e.what(), /*sandboxed = */ false);
  }
}

}  // namespace executor
