#include "isolation/resource_policy.hpp"

#include "absl/strings/str_cat.h"
#include "util/flags.hpp"

namespace isolation {

const ResourcePolicy& Apply() {
  static const ResourcePolicy policy = []() {
    ResourcePolicy p;
    p.memory_limit_kb = int64_t{FLAGS_memory_limit_mb} * 1024;
    p.cpu_quota_micros = FLAGS_cpu_quota_micros;
    p.cpu_period_micros = FLAGS_cpu_period_micros;
    p.pids_limit = FLAGS_pids_limit;
    p.tmpfs_size_kb = int64_t{FLAGS_tmpfs_size_mb} * 1024;
    p.user = FLAGS_container_user;
    return p;
  }();
  return policy;
}

std::vector<std::string> DockerRunArgs(const ResourcePolicy& policy,
                                       const std::string& code_dir) {
  std::vector<std::string> args;
  if (policy.auto_remove) args.emplace_back("--rm");
  if (policy.network_disabled) {
    args.insert(args.end(), {"--network", "none"});
  }
  if (policy.read_only_root) args.emplace_back("--read-only");
  for (const std::string& cap : policy.dropped_capabilities) {
    args.insert(args.end(), {"--cap-drop", cap});
  }
  if (policy.no_new_privileges) {
    args.insert(args.end(), {"--security-opt", "no-new-privileges"});
  }
  // Swap equal to memory means no swap at all.
  args.insert(args.end(),
              {"--memory", absl::StrCat(policy.memory_limit_kb, "k"),
               "--memory-swap", absl::StrCat(policy.memory_limit_kb, "k"),
               "--cpu-period", absl::StrCat(policy.cpu_period_micros),
               "--cpu-quota", absl::StrCat(policy.cpu_quota_micros),
               "--pids-limit", absl::StrCat(policy.pids_limit)});
  if (!policy.user.empty()) args.insert(args.end(), {"--user", policy.user});
  args.insert(args.end(),
              {"--tmpfs", absl::StrCat(policy.scratch_dir,
                                       ":rw,exec,nosuid,nodev,size=",
                                       policy.tmpfs_size_kb, "k,mode=1777")});
  args.insert(args.end(),
              {"--mount",
               absl::StrCat("type=bind,source=", code_dir,
                            ",target=", policy.code_mount, ",readonly"),
               "--workdir", policy.code_mount});
  return args;
}

}  // namespace isolation
