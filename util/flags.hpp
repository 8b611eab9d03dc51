#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include "gflags/gflags.h"

// Container runtime
DECLARE_string(runtime);
DECLARE_string(docker_binary);
DECLARE_string(podman_binary);
DECLARE_string(memory_limit);
DECLARE_string(cpu_limit);
DECLARE_string(network);

// Sessions
DECLARE_string(temp_directory);
DECLARE_string(workdir);
DECLARE_bool(stream);
DECLARE_int64(execution_timeout_millis);

// Session pool
DECLARE_int32(pool_max_size);
DECLARE_int32(pool_min_size);
DECLARE_int64(pool_acquire_timeout_millis);
DECLARE_int64(pool_idle_timeout_millis);
DECLARE_int32(pool_max_uses);
DECLARE_bool(pool_fail_fast);

#endif
