#pragma once

#include "python.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include "common/status.hpp"

/**
 * @brief sandbox-runner 写给宿主进程的执行报告
 */
struct run_report {
    sandbox::status result = sandbox::status::SYSTEM_ERROR;

    /**
     * @brief 运行时错误的异常类型名，比如 ZeroDivisionError
     */
    std::string kind;

    /**
     * @brief 语法错误或者运行时错误的描述，即 str(exception)
     */
    std::string detail;

    nlohmann::json to_json() const;
};

/**
 * @brief 构造受限的全局命名空间
 * 返回的字典只包含 __builtins__，其内容是按白名单从 builtins 模块中逐个取出的函数。
 * 每次执行都会构造一个新的字典。
 */
py_ref build_environment();

/**
 * @brief 在给定的全局命名空间中编译并执行代码
 * 代码中抛出的异常会被转换为执行报告：MemoryError 对应内存超限，SyntaxError
 * 对应语法错误，其余异常对应运行时错误。
 */
run_report run_code(const std::string &code, const py_ref &globals);

/**
 * @brief 向宿主进程写一行 json 报告
 */
void write_report(int fd, const nlohmann::json &report);
