#include "util/flags.hpp"

DEFINE_string(temp_directory, "/tmp/codebox",
              "Where the per-execution directories should be created");
DEFINE_int32(output_limit_kb, 4096,
             "Maximum size of the captured stdout and stderr, each");
DEFINE_int32(num_workers, 0,
             "Number of concurrent executions in batch mode. If unset, "
             "autodetect");

DEFINE_string(docker_binary, "docker",
              "Container engine client, either a path or a name in PATH");
DEFINE_string(image_prefix, "code-sandbox-",
              "Prefix of the per-language images, <prefix><language>:latest");
DEFINE_int32(docker_version_timeout_ms, 5000,
             "How long to wait for the engine to answer at startup");
DEFINE_int32(docker_create_timeout_ms, 30000,
             "How long to wait for a container to be created");
DEFINE_int32(docker_cleanup_timeout_ms, 10000,
             "How long to wait for a forced container removal");

DEFINE_int32(memory_limit_mb, 256, "Memory ceiling of every execution");
DEFINE_int32(cpu_quota_micros, 50000, "CPU time granted per period");
DEFINE_int32(cpu_period_micros, 100000, "CPU scheduling period");
DEFINE_int32(pids_limit, 128, "Maximum number of processes in a container");
DEFINE_int32(tmpfs_size_mb, 64, "Size of the writable /tmp in a container");
DEFINE_string(container_user, "65534:65534",
              "Unprivileged uid:gid the submitted code runs as");
