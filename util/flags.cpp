#include "util/flags.hpp"

DEFINE_string(runtime, "",
              "Container runtime to use (docker or podman). If unset, use the "
              "best one available");
DEFINE_string(docker_binary, "docker", "Docker command line client");
DEFINE_string(podman_binary, "podman", "Podman command line client");
DEFINE_string(memory_limit, "", "Memory limit of the containers, e.g. 512m");
DEFINE_string(cpu_limit, "", "Number of CPUs available to the containers");
DEFINE_string(network, "",
              "Network mode of the containers, the runtime default if empty");

DEFINE_string(temp_directory, "/tmp/codebox",
              "Where the code is staged before being copied in a container");
DEFINE_string(workdir, "/sandbox", "Working directory inside the containers");
DEFINE_bool(stream, true,
            "Stream the output of the commands by default. Commands that "
            "receive output callbacks are always streamed");
DEFINE_int64(execution_timeout_millis, 60000,
             "Default time limit for a single command. When streaming, the "
             "limit applies between two consecutive chunks of output");

DEFINE_int32(pool_max_size, 4, "Maximum number of sessions in the pool");
DEFINE_int32(pool_min_size, 0, "Number of sessions opened when prewarming");
DEFINE_int64(pool_acquire_timeout_millis, 30000,
             "How long to wait for a free session before giving up");
DEFINE_int64(pool_idle_timeout_millis, 300000,
             "Free sessions unused for this long are closed");
DEFINE_int32(pool_max_uses, 0,
             "Number of leases after which a session is recycled. If unset, "
             "sessions are reused forever");
DEFINE_bool(pool_fail_fast, false,
            "Fail immediately instead of waiting when the pool is exhausted");
