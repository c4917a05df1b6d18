#pragma once

#include <string>
#include <vector>

namespace sandbox {

/**
 * @brief 受限执行环境中允许使用的内置函数白名单
 *
 * sandbox-runner 每次执行都会根据这张表从解释器的 builtins 中逐个取出函数，
 * 组成一个全新的 __builtins__ 字典，而不是从完整的 builtins 中删除危险项。
 * 表中只有纯计算、类型构造、迭代辅助函数，以及唯一的输出函数 print；
 * 没有 __import__、open、eval、exec、compile、input 等 I/O、导入和动态求值能力。
 */
const std::vector<std::string> &allowed_builtins();

}  // namespace sandbox
