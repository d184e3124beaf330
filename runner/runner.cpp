#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "absl/memory/memory.h"
#include "absl/types/optional.h"
#include "executor/fallback_executor.hpp"
#include "executor/sandboxed_executor.hpp"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "isolation/docker_runtime.hpp"
#include "runner/batch.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"

DEFINE_string(source, "", "source file to run");  // NOLINT
DEFINE_string(language, "python", "language of the source file");  // NOLINT
DEFINE_string(stdin_file, "", "file to feed to the program");  // NOLINT
DEFINE_int32(timeout_seconds,
             executor::SandboxedExecutor::kDefaultTimeoutSeconds,
             "wall clock limit of the execution");  // NOLINT
DEFINE_bool(batch, false,
            "read JSON requests from stdin, one per line, and print one "
            "JSON result per line");  // NOLINT

namespace {
static const constexpr size_t kMaxInputSize = 16 * 1024 * 1024;
}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage(
      "codebox_run --source=FILE --language=LANG [--stdin_file=FILE]\n"
      "codebox_run --batch < requests.jsonl");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);
  google::InstallFailureSignalHandler();
  util::File::MakeDirs(FLAGS_temp_directory);

  std::unique_ptr<isolation::Runtime> runtime =
      absl::make_unique<isolation::DockerRuntime>();
  std::unique_ptr<executor::Executor> fallback;
  if (!runtime->Available()) {
    fallback = absl::make_unique<executor::FallbackExecutor>();
  }
  executor::SandboxedExecutor executor(std::move(runtime), std::move(fallback));

  if (FLAGS_batch) {
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(std::cin, line)) {
      if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
      lines.push_back(line);
    }
    for (const proto::Response& response :
         runner::RunBatch(&executor, lines, FLAGS_num_workers)) {
      std::cout << runner::ToJson(response) << std::endl;
    }
    return 0;
  }

  CHECK_NE(FLAGS_source, "") << "You need to specify a source file!";
  absl::optional<std::string> source =
      runner::ReadInput(FLAGS_source, kMaxInputSize);
  if (!source) return 2;
  absl::optional<std::string> stdin_payload = std::string();
  if (!FLAGS_stdin_file.empty()) {
    stdin_payload = runner::ReadInput(FLAGS_stdin_file, kMaxInputSize);
    if (!stdin_payload) return 2;
  }
  proto::Response response = executor.Execute(
      *source, FLAGS_language, *stdin_payload, FLAGS_timeout_seconds);
  std::cout << runner::ToJson(response) << std::endl;
  return response.exit_code() == 0 ? 0 : 1;
}
