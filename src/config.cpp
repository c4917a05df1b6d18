#include "config.hpp"

#ifndef SANDBOX_RUNNER_PATH
#define SANDBOX_RUNNER_PATH "sandbox-runner"
#endif

namespace sandbox {
using namespace std;

int TIME_LIMIT = 5;        // 5s
int MEMORY_LIMIT = 50;     // 50M
int OUTPUT_LIMIT = 1024;   // 1M

filesystem::path RUNNER_PATH(SANDBOX_RUNNER_PATH);
string RUNNER_LOG_DIR;

}  // namespace sandbox
