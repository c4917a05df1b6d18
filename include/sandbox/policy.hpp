#pragma once

#include <optional>
#include <string>
#include <vector>

namespace sandbox {

/**
 * @brief 表示代码命中了禁止关键字
 */
struct policy_violation {
    /**
     * @brief 第一个命中的禁止关键字
     */
    std::string token;

    /**
     * @brief 返回给调用方的信息，形如 "Blocked operation detected: os"
     */
    std::string message() const;
};

/**
 * @brief 禁止关键字表，按检查顺序排列
 * 包括进程、文件系统、网络相关的模块名，动态求值的内置函数，以及交互式输入。
 */
const std::vector<std::string> &blocked_tokens();

/**
 * @brief 执行前的静态检查：忽略大小写，在代码原文中查找禁止关键字
 *
 * 这只是一个文本层面的启发式过滤，不是语义分析，也不提供任何隔离保证：
 * 1. 会误拦：关键字出现在注释、字符串字面量或者更长的单词里（比如 "cost" 包含 "os"）
 *    同样会被拒绝；
 * 2. 会漏拦：通过没有列出的别名或者拼接构造出来的能力无法被发现。
 * 真正的限制来自 sandbox-runner 中的内置函数白名单和资源限制。
 *
 * @param code 待检查的代码
 * @return 命中的第一个关键字，没有命中返回空
 */
std::optional<policy_violation> screen(const std::string &code);

}  // namespace sandbox
