#ifndef RUNNER_BATCH_HPP
#define RUNNER_BATCH_HPP

#include <string>
#include <vector>

#include "absl/types/optional.h"
#include "executor/executor.hpp"

namespace runner {

// JSON form of a response, with every field present.
std::string ToJson(const proto::Response& response);

// Runs one JSON-encoded request. Malformed requests get an execution error
// response.
proto::Response RunJsonLine(executor::Executor* executor,
                            const std::string& line);

// Runs the JSON requests on num_workers threads (autodetected if not
// positive). Responses are in the same order as the requests.
std::vector<proto::Response> RunBatch(executor::Executor* executor,
                                      const std::vector<std::string>& lines,
                                      int num_workers);

// Reads at most limit bytes of an input file, logging the error if it
// cannot be read.
absl::optional<std::string> ReadInput(const std::string& path, size_t limit);

}  // namespace runner

#endif
