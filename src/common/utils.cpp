#include "common/utils.hpp"
#include <stdlib.h>
#include <cerrno>
#include <system_error>

namespace sandbox {
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

void set_env(const string &key, const string &value, bool replace) {
    if (setenv(key.c_str(), value.c_str(), replace) != 0)
        throw system_error(errno, generic_category(), "setenv " + key);
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace sandbox
