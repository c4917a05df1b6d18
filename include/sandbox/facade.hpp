#pragma once

#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "sandbox/comparator.hpp"
#include "sandbox/executor.hpp"

namespace sandbox {

/**
 * @brief 结构化的执行请求
 * 对应 json 对象 {"code": ..., "expected_output": ..., "compare_mode": ...}
 */
struct execution_request {
    std::string code;

    /**
     * @brief 期望输出，不存在时不进行比较
     */
    std::optional<std::string> expected_output;

    /**
     * @brief 比较模式名，只在存在期望输出时有意义
     */
    std::string compare_mode = "exact";

    /**
     * @brief 从输入文本解析执行请求
     * 非字符串的 code 视为空代码；非字符串的 expected_output 使用其 json 文本；
     * 非字符串的 compare_mode（包括 null）使用其 json 文本，并最终被报告为未知模式；
     * 只有缺少 compare_mode 时才使用 exact。
     * @return 输入不是 json 对象时返回空，调用方应将整个输入作为代码执行
     */
    static std::optional<execution_request> parse(const std::string &input);
};

/**
 * @brief 一次工具调用的完整结果
 */
struct execution_result {
    std::string code;
    execution_outcome outcome;

    /**
     * @brief 是否来自结构化请求，结构化请求的结果包含 expected_output 和 comparison 两项
     */
    bool structured = false;

    std::optional<std::string> expected_output;

    /**
     * @brief 只有执行成功并且提供了期望输出时才存在
     */
    std::optional<comparison_result> comparison;

    nlohmann::json to_json() const;
};

/**
 * @brief 代码执行工具的入口
 * 接受 json 请求或者裸代码，返回统一的结果，任何异常都不会传播到调用方。
 */
struct execution_facade {
    explicit execution_facade(const resource_limits &limits = resource_limits::defaults(),
                              const std::filesystem::path &runner = RUNNER_PATH);

    /**
     * @brief 执行并比较
     * 输入无法解析为 json 对象时退化为 execute_simple(input)。
     */
    execution_result execute_and_compare(const std::string &input);

    /**
     * @brief 将整个输入作为代码执行，不进行比较
     */
    execution_result execute_simple(const std::string &code);

    execution_result execute(const execution_request &request);

private:
    code_executor exec;
};

/**
 * @brief 构造一个以默认限制运行的工具函数，返回值为结果的 json 表示
 */
std::function<nlohmann::json(const std::string &)> make_tool_function(
    const resource_limits &limits = resource_limits::defaults());

}  // namespace sandbox
