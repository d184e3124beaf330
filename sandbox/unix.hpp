#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP
#include "sandbox/sandbox.hpp"

namespace sandbox {

// Sandbox for UNIX-like systems. The program runs in its own
// session with POSIX resource limits applied; on wall limit expiry the whole
// process group is killed.
class Unix : public Sandbox {
 public:
  bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
               std::string* error_msg) override;
  static Sandbox* Create() { return new Unix(); }
  static int Score() { return 2; }

 private:
  Unix() = default;

  // Executed before creating the child process. Returns false and sets
  // error_msg if setup fails.
  bool Setup(std::string* error_msg);

  // Creates a child process and saves its PID in child_pid_. The child process
  // executes Child and never returns.
  bool DoFork(std::string* error_msg);

  // Function that is executed in the child process.
  [[noreturn]] void Child();

  // Waits for the termination of the child, killing its process group if it
  // exceeds the provided wall time limit.
  bool Wait(ExecutionInfo* info, std::string* error_msg);

  std::vector<std::vector<char>> arg_storage_;
  std::vector<char*> argv_;
  int pipe_fds_[2] = {};
  int child_pid_ = 0;
  const ExecutionOptions* options_ = nullptr;
};

}  // namespace sandbox
#endif
