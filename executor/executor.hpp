#ifndef EXECUTOR_EXECUTOR_HPP
#define EXECUTOR_EXECUTOR_HPP

#include <string>

#include "proto/request.pb.h"
#include "proto/response.pb.h"

namespace executor {

class Executor {
 public:
  // A string that identifies this executor.
  virtual std::string Id() const = 0;

  // Runs the request and returns its result. Failures are reported in the
  // response; implementations do not throw.
  virtual proto::Response Execute(const proto::Request& request) = 0;

  Executor() = default;
  virtual ~Executor() = default;
  Executor(const Executor&) = delete;
  Executor& operator=(const Executor&) = delete;
  Executor(Executor&&) = delete;
  Executor& operator=(Executor&&) = delete;
};

}  // namespace executor

#endif
