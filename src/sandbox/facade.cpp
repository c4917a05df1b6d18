#include "sandbox/facade.hpp"
#include <glog/logging.h>
#include <memory>
#include "common/json_utils.hpp"

namespace sandbox {
using namespace std;
using namespace nlohmann;

optional<execution_request> execution_request::parse(const string &input) {
    json document;
    try {
        document = json::parse(input);
    } catch (json::parse_error &) {
        return nullopt;
    }
    if (!document.is_object()) return nullopt;

    execution_request request;
    request.code = get_value_def<string>(document, "", "code");
    request.expected_output = get_text_optional(document, "expected_output");
    // 显式给出的 null 不是默认值，按未知模式 "null" 报告
    auto mode = document.find("compare_mode");
    if (mode != document.end())
        request.compare_mode = mode->is_string() ? mode->get<string>() : mode->dump();
    return request;
}

// 非法的 UTF-8 字节替换为 U+FFFD，保证结果总能序列化
static string valid_text(const string &text) {
    return json::parse(json(text).dump(-1, ' ', false, json::error_handler_t::replace)).get<string>();
}

json execution_result::to_json() const {
    json j = {{"code", valid_text(code)},
              {"execution_success", outcome.succeeded()},
              {"output", valid_text(outcome.output)},
              {"errors", valid_text(outcome.errors)},
              {"message", valid_text(outcome.message)},
              {"memory_limit_enforced", outcome.memory_limit_enforced}};
    if (outcome.output_truncated) j["output_truncated"] = true;
    if (structured) {
        j["expected_output"] = expected_output ? json(valid_text(*expected_output)) : json(nullptr);
        if (comparison) {
            j["comparison"] = {{"mode", valid_text(comparison->mode)},
                               {"match", comparison->matched},
                               {"similarity", comparison->similarity},
                               {"details", valid_text(comparison->details)}};
        } else {
            j["comparison"] = nullptr;
        }
    }
    return j;
}

execution_facade::execution_facade(const resource_limits &limits, const filesystem::path &runner)
    : exec(limits, runner) {}

execution_result execution_facade::execute(const execution_request &request) {
    execution_result result;
    result.structured = true;
    result.code = request.code;
    result.expected_output = request.expected_output;
    result.outcome = exec.execute(request.code);
    if (result.outcome.succeeded() && request.expected_output)
        result.comparison = compare(result.outcome.output, *request.expected_output, request.compare_mode);
    return result;
}

execution_result execution_facade::execute_simple(const string &code) {
    DLOG(INFO) << "Executing raw code input";
    execution_result result;
    result.code = code;
    result.outcome = exec.execute(code);
    return result;
}

execution_result execution_facade::execute_and_compare(const string &input) {
    try {
        if (auto request = execution_request::parse(input))
            return execute(*request);
        return execute_simple(input);
    } catch (exception &ex) {
        LOG(ERROR) << "Unexpected failure while handling tool input: " << ex.what();
        execution_result result;
        result.code = input;
        result.outcome.result = status::SYSTEM_ERROR;
        result.outcome.message = string("Tool error: ") + ex.what();
        return result;
    }
}

function<json(const string &)> make_tool_function(const resource_limits &limits) {
    auto facade = make_shared<execution_facade>(limits);
    return [facade](const string &input) {
        return facade->execute_and_compare(input).to_json();
    };
}

}  // namespace sandbox
