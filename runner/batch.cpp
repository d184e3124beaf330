#include "runner/batch.hpp"

#include <atomic>
#include <system_error>
#include <thread>

#include "executor/result_normalizer.hpp"
#include "glog/logging.h"
#include "google/protobuf/util/json_util.h"
#include "util/file.hpp"

namespace runner {

std::string ToJson(const proto::Response& response) {
  google::protobuf::util::JsonPrintOptions options;
  options.always_print_primitive_fields = true;
  std::string json;
  auto status =
      google::protobuf::util::MessageToJsonString(response, &json, options);
  CHECK(status.ok()) << status.ToString();
  return json;
}

proto::Response RunJsonLine(executor::Executor* executor,
                            const std::string& line) {
  proto::Request request;
  auto status = google::protobuf::util::JsonStringToMessage(line, &request);
  if (!status.ok()) {
    LOG(WARNING) << "Invalid request: " << status.ToString();
    return executor::ResultNormalizer::ExecutionError(
        "invalid request: " + status.ToString(), /*sandboxed = */ false);
  }
  return executor->Execute(request);
}

std::vector<proto::Response> RunBatch(executor::Executor* executor,
                                      const std::vector<std::string>& lines,
                                      int num_workers) {
  std::vector<proto::Response> responses(lines.size());
  if (num_workers <= 0) num_workers = std::thread::hardware_concurrency();
  if (num_workers <= 0) num_workers = 1;
  LOG(INFO) << "Running " << lines.size() << " requests on " << num_workers
            << " workers";
  std::atomic<size_t> next{0};
  std::vector<std::thread> workers;
  for (int i = 0; i < num_workers; i++) {
    workers.emplace_back([&]() {
      for (size_t idx = next++; idx < lines.size(); idx = next++) {
        responses[idx] = RunJsonLine(executor, lines[idx]);
      }
    });
  }
  for (std::thread& worker : workers) worker.join();
  return responses;
}

absl::optional<std::string> ReadInput(const std::string& path, size_t limit) {
  try {
    return util::File::Read(path, limit);
  } catch (const std::system_error& e) {
    LOG(ERROR) << e.what();
    return absl::nullopt;
  }
}

}  // namespace runner
