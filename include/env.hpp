#pragma once

namespace sandbox {

/**
 * @brief 从环境变量读取配置，覆盖 config.hpp 中的默认值
 * SANDBOX_RUNNER: sandbox-runner 的路径
 * SANDBOX_TIME_LIMIT: 时间限制（秒）
 * SANDBOX_MEMORY_LIMIT: 内存限制（MB）
 * SANDBOX_OUTPUT_LIMIT: 输出限制（KB）
 * @throw std::invalid_argument 环境变量的值不是正整数
 */
void load_env_config();

}  // namespace sandbox
