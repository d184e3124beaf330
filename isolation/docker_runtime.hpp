#ifndef ISOLATION_DOCKER_RUNTIME_HPP
#define ISOLATION_DOCKER_RUNTIME_HPP

#include <string>
#include <vector>

#include "isolation/runtime.hpp"

namespace isolation {

// Runtime backed by the docker command-line client. Each Run creates one
// uniquely named, auto-removed container and then starts it attached, so
// that failures of the engine are never confused with the exit status of
// the program.
class DockerRuntime : public Runtime {
 public:
  // Uses FLAGS_docker_binary.
  DockerRuntime();
  explicit DockerRuntime(const std::string& docker_binary);

  bool Available() const override { return available_; }
  RunOutcome Run(const std::string& source_code,
                 const language::LanguageProfile& profile,
                 const ResourcePolicy& policy,
                 const std::string& stdin_payload,
                 int32_t timeout_seconds) override;

  // Arguments of the docker client (without the binary itself) that create
  // the container. Images are never pulled.
  static std::vector<std::string> CreateArgs(
      const std::string& container_name,
      const language::LanguageProfile& profile, const ResourcePolicy& policy,
      const std::string& code_dir, bool attach_stdin);

  // Arguments that start the created container and wait for it, forwarding
  // its streams and exit status.
  static std::vector<std::string> StartArgs(const std::string& container_name,
                                            bool attach_stdin);

 private:
  static const constexpr char* kCodeDir = "code";
  static const constexpr size_t kClientOutputLimit = 4096;
  // StartedAt of a container that never ran.
  static const constexpr char* kNeverStarted = "0001-01-01";

  // Returns true if the engine answers within FLAGS_docker_version_timeout_ms.
  bool CheckEngine();

  // Runs a short docker command, returning its exit code or -1 if it could
  // not run or was killed. If not null, output and error_output receive the
  // trimmed beginning of its stdout and stderr.
  int RunClient(const std::vector<std::string>& args, int64_t wall_limit_millis,
                const std::string& scratch_dir, std::string* output = nullptr,
                std::string* error_output = nullptr) const;

  // Returns false if the container exists but was never started. A missing
  // container has been auto-removed after running.
  bool Started(const std::string& container_name,
               const std::string& scratch_dir) const;

  // Kills and removes a container.
  bool Remove(const std::string& container_name,
              const std::string& scratch_dir) const;

  std::string docker_;
  bool available_ = false;
};

}  // namespace isolation

#endif
