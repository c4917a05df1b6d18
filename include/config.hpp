#pragma once

#include <filesystem>
#include <string>

namespace sandbox {

/**
 * @brief 代码执行的墙上时间限制，单位为秒
 * @defaultValue 5
 */
extern int TIME_LIMIT;

/**
 * @brief 代码执行的虚拟内存上限，单位为 MB
 * @defaultValue 50
 */
extern int MEMORY_LIMIT;

/**
 * @brief stdout、stderr 各自最多保留多少 KB 的输出，超出的部分会被丢弃
 * @defaultValue 1024
 */
extern int OUTPUT_LIMIT;

/**
 * @brief sandbox-runner 可执行文件的路径
 * 每次执行代码都会启动一个新的 sandbox-runner 进程，由它嵌入 Python 解释器、
 * 设置资源限制并执行代码。
 * @defaultValue 构建目录下的 bin/sandbox-runner，可以通过环境变量 SANDBOX_RUNNER 或者命令行参数覆盖
 */
extern std::filesystem::path RUNNER_PATH;

/**
 * @brief sandbox-runner 写 glog 日志的文件夹
 * 为空时 sandbox-runner 不输出日志，避免日志混入被捕获的 stderr。
 */
extern std::string RUNNER_LOG_DIR;

}  // namespace sandbox
