#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include "common/status.hpp"
#include "config.hpp"
#include "sandbox/limits.hpp"

namespace sandbox {

/**
 * @brief 一次代码执行的结果
 * 每次执行只产生一个，创建后不再修改，只属于发起执行的调用方。
 */
struct execution_outcome {
    status result = status::SYSTEM_ERROR;

    /**
     * @brief 捕获的标准输出，失败时也保留失败前已经产生的输出
     */
    std::string output;

    /**
     * @brief 捕获的标准错误
     */
    std::string errors;

    /**
     * @brief 可读的执行状态，成功时为 "Code executed successfully"，否则为具体的失败原因
     */
    std::string message;

    /**
     * @brief 虚拟内存上限是否真的生效
     * 在不支持 RLIMIT_AS 的平台上，内存上限是一个空操作，此时为 false。
     */
    bool memory_limit_enforced = false;

    /**
     * @brief stdout 或 stderr 是否因为超出 output_limit 被截断
     */
    bool output_truncated = false;

    bool succeeded() const;
};

/**
 * @brief 受资源限制的代码执行器
 *
 * 每次执行都会：
 * 1. 拒绝空代码（"Invalid code input"），然后通过 screen 进行禁止关键字检查；
 * 2. 将代码写入一个匿名内存文件，作为 sandbox-runner 的标准输入；
 * 3. fork 出 sandbox-runner 进程，将其 stdout、stderr 和执行报告（fd 3）分别连接到
 *    本次执行独占的管道上。输出重定向只发生在子进程内，宿主进程的标准流不会被替换；
 * 4. sandbox-runner 嵌入 Python 解释器，设置 RLIMIT_AS，构造白名单内置函数环境并执行代码，
 *    最后将执行结果以 json 写入 fd 3；
 * 5. 父进程一边读取管道一边作为看门狗计时，超过墙上时间后用 SIGKILL 杀死整个进程组；
 * 6. 回收子进程，根据执行报告和退出状态生成 execution_outcome。
 *
 * 计时器属于每一次调用，而不是进程级别的 SIGALRM，因此不同的 code_executor 实例可以
 * 在同一个进程的多个线程中并发执行。同一个实例内部的执行通过互斥锁串行化。
 *
 * 这不是操作系统级别的沙箱：没有系统调用过滤，也没有容器或者虚拟机隔离，
 * 只适用于低风险的演示场景。
 */
struct code_executor {
    explicit code_executor(const resource_limits &limits = resource_limits::defaults(),
                           const std::filesystem::path &runner = RUNNER_PATH);

    /**
     * @brief 执行一段代码
     * 任何失败都会被转换为 execution_outcome 返回，这个函数不会抛出异常。
     * @param code 待执行的代码
     */
    execution_outcome execute(const std::string &code);

    const resource_limits &limits() const;

    /**
     * @brief 当前平台是否支持按进程设置虚拟内存上限
     */
    static bool memory_limit_supported();

private:
    execution_outcome run(const std::string &code);

    resource_limits lim;
    std::filesystem::path runner;
    std::mutex mut;
};

}  // namespace sandbox
