#include "isolation/docker_runtime.hpp"

#include <unistd.h>

#include <memory>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "glog/logging.h"
#include "sandbox/sandbox.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/which.hpp"

namespace isolation {

DockerRuntime::DockerRuntime() : DockerRuntime(FLAGS_docker_binary) {}

DockerRuntime::DockerRuntime(const std::string& docker_binary)
    : docker_(util::which(docker_binary)) {
  if (docker_.empty()) {
    LOG(WARNING) << "Container engine client " << docker_binary
                 << " not found, sandboxed execution is unavailable";
    return;
  }
  try {
    available_ = CheckEngine();
  } catch (const std::exception& e) {
    LOG(WARNING) << "Checking the container engine failed: " << e.what();
    available_ = false;
  }
  if (available_) {
    LOG(INFO) << "Container engine available through " << docker_;
  } else {
    LOG(WARNING) << "Container engine not reachable through " << docker_
                 << ", sandboxed execution is unavailable";
  }
}

bool DockerRuntime::CheckEngine() {
  util::TempDir tmp(FLAGS_temp_directory);
  return RunClient({"version", "--format", "{{.Server.Version}}"},
                   FLAGS_docker_version_timeout_ms, tmp.Path()) == 0;
}

int DockerRuntime::RunClient(const std::vector<std::string>& args,
                             int64_t wall_limit_millis,
                             const std::string& scratch_dir,
                             std::string* output,
                             std::string* error_output) const {
  std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create();
  if (!sb) return -1;
  sandbox::ExecutionOptions options(scratch_dir, docker_);
  options.args = args;
  options.stdout_file = util::File::JoinPath(scratch_dir, "client.out");
  options.stderr_file = util::File::JoinPath(scratch_dir, "client.err");
  options.wall_limit_millis = wall_limit_millis;
  sandbox::ExecutionInfo info;
  std::string error_msg;
  if (!sb->Execute(options, &info, &error_msg)) {
    LOG(ERROR) << "docker " << absl::StrJoin(args, " ") << ": " << error_msg;
    return -1;
  }
  if (output != nullptr) {
    *output = std::string(absl::StripAsciiWhitespace(
        util::File::Read(options.stdout_file, kClientOutputLimit)));
  }
  if (error_output != nullptr) {
    *error_output = std::string(absl::StripAsciiWhitespace(
        util::File::Read(options.stderr_file, kClientOutputLimit)));
  }
  if (info.killed || info.signal != 0) {
    LOG(ERROR) << "docker " << absl::StrJoin(args, " ") << ": "
               << info.message;
    return -1;
  }
  if (info.status_code != 0) {
    VLOG(1) << "docker " << absl::StrJoin(args, " ") << " exited with "
            << info.status_code;
  }
  return info.status_code;
}

bool DockerRuntime::Started(const std::string& container_name,
                            const std::string& scratch_dir) const {
  std::string started_at;
  if (RunClient({"container", "inspect", "--format", "{{.State.StartedAt}}",
                 container_name},
                FLAGS_docker_cleanup_timeout_ms, scratch_dir,
                &started_at) != 0) {
    return true;
  }
  return !absl::StartsWith(started_at, kNeverStarted);
}

bool DockerRuntime::Remove(const std::string& container_name,
                           const std::string& scratch_dir) const {
  return RunClient({"rm", "--force", container_name},
                   FLAGS_docker_cleanup_timeout_ms, scratch_dir) == 0;
}

std::vector<std::string> DockerRuntime::CreateArgs(
    const std::string& container_name,
    const language::LanguageProfile& profile, const ResourcePolicy& policy,
    const std::string& code_dir, bool attach_stdin) {
  std::vector<std::string> args = {"create", "--pull", "never", "--name",
                                   container_name};
  if (attach_stdin) args.emplace_back("--interactive");
  std::vector<std::string> policy_args = DockerRunArgs(policy, code_dir);
  args.insert(args.end(), policy_args.begin(), policy_args.end());
  args.push_back(profile.Image());
  args.insert(args.end(),
              {"sh", "-c",
               profile.RunCommand(policy.code_mount, policy.scratch_dir)});
  return args;
}

std::vector<std::string> DockerRuntime::StartArgs(
    const std::string& container_name, bool attach_stdin) {
  std::vector<std::string> args = {"start", "--attach"};
  if (attach_stdin) args.emplace_back("--interactive");
  args.push_back(container_name);
  return args;
}

RunOutcome DockerRuntime::Run(const std::string& source_code,
                              const language::LanguageProfile& profile,
                              const ResourcePolicy& policy,
                              const std::string& stdin_payload,
                              int32_t timeout_seconds) {
  if (!available_) {
    throw container_error("container engine is not available");
  }
  util::TempDir tmp(FLAGS_temp_directory);
  // The container user is unprivileged, so the code must be world-readable.
  std::string code_dir = util::File::JoinPath(tmp.Path(), kCodeDir);
  util::File::MakeDirs(code_dir);
  util::File::SetMode(code_dir, 0755);
  util::File::Write(util::File::JoinPath(code_dir, profile.source_filename),
                    source_code, 0644);

  std::string container_name =
      absl::StrCat("codebox-", getpid(), "-", util::File::BaseName(tmp.Path()));
  bool attach_stdin = !stdin_payload.empty();

  VLOG(1) << "Creating container " << container_name << " from "
          << profile.Image();
  std::string create_error;
  int created = RunClient(
      CreateArgs(container_name, profile, policy, code_dir, attach_stdin),
      FLAGS_docker_create_timeout_ms, tmp.Path(), nullptr, &create_error);
  if (created != 0) {
    // A client that did not finish may have created the container anyway.
    if (created == -1) Remove(container_name, tmp.Path());
    if (create_error.empty()) {
      create_error = "cannot create a container from " + profile.Image();
    }
    throw container_error(create_error);
  }

  sandbox::ExecutionOptions options(tmp.Path(), docker_);
  options.args = StartArgs(container_name, attach_stdin);
  if (attach_stdin) {
    options.stdin_file = util::File::JoinPath(tmp.Path(), "stdin");
    util::File::Write(options.stdin_file, stdin_payload);
  }
  options.stdout_file = util::File::JoinPath(tmp.Path(), "stdout");
  options.stderr_file = util::File::JoinPath(tmp.Path(), "stderr");
  options.wall_limit_millis = int64_t{timeout_seconds} * 1000;
  // Hitting this limit stops the client.
  options.max_file_size_kb = int64_t{FLAGS_output_limit_kb} + kOutputSlackKb;

  std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create();
  sandbox::ExecutionInfo info;
  std::string error_msg;
  if (!sb) error_msg = "no process sandbox available";
  if (!sb || !sb->Execute(options, &info, &error_msg)) {
    Remove(container_name, tmp.Path());
    throw container_error("cannot start " + docker_ + ": " + error_msg);
  }

  RunOutcome outcome;
  outcome.stdout_text = ReadCapturedOutput(options.stdout_file);
  outcome.stderr_text = ReadCapturedOutput(options.stderr_file);
  outcome.wall_time_millis = info.wall_time_millis;
  if (info.killed || info.signal != 0) {
    // The client is gone, but the container may still be running.
    LOG(WARNING) << "Forcibly removing container " << container_name;
    if (!Remove(container_name, tmp.Path())) {
      LOG(ERROR) << "Failed to remove container " << container_name;
    }
  }
  if (info.killed) {
    LOG(WARNING) << "Container " << container_name << " timed out after "
                 << timeout_seconds << "s";
    outcome.timed_out = true;
    outcome.exit_code = kTimeoutExitCode;
  } else if (info.signal != 0) {
    outcome.exit_code = 128 + info.signal;
    absl::StrAppend(&outcome.stderr_text, "\n", info.message);
  } else if (info.status_code != 0 && !Started(container_name, tmp.Path())) {
    // The engine failed to run a container it had created.
    Remove(container_name, tmp.Path());
    std::string what(absl::StripAsciiWhitespace(outcome.stderr_text));
    if (what.empty()) what = "cannot start a container from " + profile.Image();
    throw container_error(what);
  } else {
    outcome.exit_code = info.status_code;
  }
  return outcome;
}

}  // namespace isolation
