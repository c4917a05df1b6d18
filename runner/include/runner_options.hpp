#pragma once

#include <cstdint>
#include <string>

struct runner_options {
    int64_t memory_limit = -1;  // Virtual memory limit in bytes
    int cpu_time = -1;          // CPU time in seconds, the wall clock is watched by the host
    int report_fd = 3;          // fd to write the json execution report to
    std::string log_dir;        // glog is disabled unless this is set
};
