#ifndef ISOLATION_RESOURCE_POLICY_HPP
#define ISOLATION_RESOURCE_POLICY_HPP

#include <string>
#include <vector>

namespace isolation {

// Constraints applied to every isolated execution. Sizes come from the
// deployment configuration; the containment fields are fixed and cannot be
// changed by a request.
struct ResourcePolicy {
  int64_t memory_limit_kb;
  int64_t cpu_quota_micros;
  int64_t cpu_period_micros;
  int32_t pids_limit;
  int64_t tmpfs_size_kb;
  std::string user;

  bool network_disabled = true;
  bool read_only_root = true;
  bool no_new_privileges = true;
  bool auto_remove = true;
  std::vector<std::string> dropped_capabilities = {"ALL"};
  // The code directory is always mounted read-only here.
  std::string code_mount = "/code";
  // The only writable location in the container.
  std::string scratch_dir = "/tmp";
};

// Returns the policy. Every call returns the same values.
const ResourcePolicy& Apply();

// Renders policy as `docker run` options, mounting code_dir (a host path) at
// policy.code_mount.
std::vector<std::string> DockerRunArgs(const ResourcePolicy& policy,
                                       const std::string& code_dir);

}  // namespace isolation

#endif
