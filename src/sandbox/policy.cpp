#include "sandbox/policy.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/assign/list_of.hpp>

namespace sandbox {
using namespace std;

// clang-format off
static const vector<string> deny_list = boost::assign::list_of
    ("os")("subprocess")("sys")("socket")("urllib")("requests")
    ("shutil")("pickle")("shelve")("__import__")("eval")("exec")
    ("compile")("open")("file")("input")("raw_input");
// clang-format on

string policy_violation::message() const {
    return "Blocked operation detected: " + token;
}

const vector<string> &blocked_tokens() {
    return deny_list;
}

optional<policy_violation> screen(const string &code) {
    for (auto &token : deny_list)
        if (boost::algorithm::icontains(code, token))
            return policy_violation{token};
    return nullopt;
}

}  // namespace sandbox
