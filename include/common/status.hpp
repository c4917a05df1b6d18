#pragma once

#include <optional>
#include <string>

namespace sandbox {

/**
 * @brief 表示一次代码执行的结果类别
 * 除 SUCCESS 外的所有类别都表示本次执行失败，失败原因会以数据的
 * 形式返回给调用方，而不会以异常的形式抛出。
 */
enum class status {
    /**
     * @brief 代码正常执行完毕
     */
    SUCCESS = 0,

    /**
     * @brief 代码为空，没有进入沙箱
     */
    INVALID_INPUT = 1,

    /**
     * @brief 代码包含被禁止的关键字，在执行前被拒绝
     */
    POLICY_VIOLATION = 2,

    /**
     * @brief 代码无法通过语法分析
     */
    SYNTAX_ERROR = 3,

    /**
     * @brief 代码运行超出墙上时间限制，被强制终止
     * CPU 时间的后备限制（SIGXCPU）也归入此类。
     */
    TIME_LIMIT_EXCEEDED = 4,

    /**
     * @brief 代码运行时超出虚拟内存上限
     * 只有在 RLIMIT_AS 生效时解释器才会因此抛出 MemoryError。
     */
    MEMORY_LIMIT_EXCEEDED = 5,

    /**
     * @brief 其他所有运行时异常，附带异常类型和信息
     */
    RUNTIME_ERROR = 6,

    /**
     * @brief 沙箱自身出错
     * 比如找不到 sandbox-runner、创建管道或进程失败、执行报告损坏。
     */
    SYSTEM_ERROR = 7
};

const char *get_display_message(status);

/**
 * @brief 获取 status 在 sandbox-runner 执行报告中的名称，比如 "syntax_error"
 */
const char *get_status_name(status);

/**
 * @brief 根据执行报告中的名称还原 status
 * @return 不认识的名称返回空
 */
std::optional<status> parse_status_name(const std::string &name);

}  // namespace sandbox
