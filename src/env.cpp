#include "env.hpp"
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <stdexcept>
#include "common/utils.hpp"
#include "config.hpp"

namespace sandbox {
using namespace std;

static void load_positive(const char *key, int &value) {
    string text = get_env(key, "");
    if (text.empty()) return;

    int parsed;
    try {
        parsed = boost::lexical_cast<int>(text);
    } catch (boost::bad_lexical_cast &) {
        throw invalid_argument(string(key) + " should be a positive integer, got " + text);
    }
    if (parsed <= 0)
        throw invalid_argument(string(key) + " should be a positive integer, got " + text);
    value = parsed;
    LOG(INFO) << key << " = " << value;
}

void load_env_config() {
    string runner = get_env("SANDBOX_RUNNER", "");
    if (!runner.empty()) {
        RUNNER_PATH = runner;
        LOG(INFO) << "SANDBOX_RUNNER = " << runner;
    }

    load_positive("SANDBOX_TIME_LIMIT", TIME_LIMIT);
    load_positive("SANDBOX_MEMORY_LIMIT", MEMORY_LIMIT);
    load_positive("SANDBOX_OUTPUT_LIMIT", OUTPUT_LIMIT);
}

}  // namespace sandbox
