#pragma once

#include "runner_options.hpp"

/**
 * Limit current process resources usage.
 *
 * CPU time, created file size and core dumps are restricted here,
 * before the interpreter starts. Memory is limited separately by
 * set_memory_limit once the interpreter is ready.
 */
void set_restrictions(const struct runner_options &opt);

/**
 * @brief 通过 RLIMIT_AS 限制虚拟内存
 * 必须在解释器初始化完成之后调用，否则解释器本身的初始化可能因为内存上限而失败。
 * @return 上限是否真的生效，平台不支持 RLIMIT_AS 时返回 false
 */
bool set_memory_limit(int64_t limit);

/**
 * @brief 当前进程的虚拟内存大小，单位字节，从 /proc/self/statm 读取
 */
int64_t current_virtual_memory();
