#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include "gflags/gflags.h"

DECLARE_string(temp_directory);
DECLARE_int32(output_limit_kb);
DECLARE_int32(num_workers);

// Container engine.
DECLARE_string(docker_binary);
DECLARE_string(image_prefix);
DECLARE_int32(docker_version_timeout_ms);
DECLARE_int32(docker_create_timeout_ms);
DECLARE_int32(docker_cleanup_timeout_ms);

// Resource policy.
DECLARE_int32(memory_limit_mb);
DECLARE_int32(cpu_quota_micros);
DECLARE_int32(cpu_period_micros);
DECLARE_int32(pids_limit);
DECLARE_int32(tmpfs_size_mb);
DECLARE_string(container_user);

#endif
