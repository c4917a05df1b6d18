#include "sandbox/limits.hpp"
#include <stdexcept>
#include <string>
#include "config.hpp"

namespace sandbox {
using namespace std;

resource_limits resource_limits::defaults() {
    resource_limits limits;
    limits.time_limit = TIME_LIMIT;
    limits.memory_limit = int64_t(MEMORY_LIMIT) * 1024 * 1024;
    limits.output_limit = int64_t(OUTPUT_LIMIT) * 1024;
    return limits;
}

void resource_limits::validate() const {
    if (time_limit <= 0)
        throw invalid_argument("time limit should be positive, got " + to_string(time_limit));
    if (memory_limit <= 0)
        throw invalid_argument("memory limit should be positive, got " + to_string(memory_limit));
    if (output_limit <= 0)
        throw invalid_argument("output limit should be positive, got " + to_string(output_limit));
}

}  // namespace sandbox
