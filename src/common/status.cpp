#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace sandbox {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::SUCCESS, "Success")
    (status::INVALID_INPUT, "Invalid Input")
    (status::POLICY_VIOLATION, "Policy Violation")
    (status::SYNTAX_ERROR, "Syntax Error")
    (status::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (status::MEMORY_LIMIT_EXCEEDED, "Memory Limit Exceeded")
    (status::RUNTIME_ERROR, "Runtime Error")
    (status::SYSTEM_ERROR, "System Error");

static const unordered_map<status, const char *> status_name = boost::assign::map_list_of
    (status::SUCCESS, "success")
    (status::INVALID_INPUT, "invalid_input")
    (status::POLICY_VIOLATION, "policy_violation")
    (status::SYNTAX_ERROR, "syntax_error")
    (status::TIME_LIMIT_EXCEEDED, "time_limit_exceeded")
    (status::MEMORY_LIMIT_EXCEEDED, "memory_limit_exceeded")
    (status::RUNTIME_ERROR, "runtime_error")
    (status::SYSTEM_ERROR, "system_error");
// clang-format on

const char *get_display_message(status stat) {
    return status_string.at(stat);
}

const char *get_status_name(status stat) {
    return status_name.at(stat);
}

optional<status> parse_status_name(const string &name) {
    for (auto &[stat, str] : status_name)
        if (name == str) return stat;
    return nullopt;
}

}  // namespace sandbox
