#pragma once

#include <cstdint>

namespace sandbox {

/**
 * @brief 一个 code_executor 的资源限制，在构造时确定，之后不能按请求修改
 */
struct resource_limits {
    /**
     * @brief 墙上时间限制，单位秒，必须大于 0
     */
    int time_limit;

    /**
     * @brief 虚拟内存上限（RLIMIT_AS），单位字节，必须大于 0
     */
    int64_t memory_limit;

    /**
     * @brief stdout、stderr 各自最多保留的字节数
     */
    int64_t output_limit;

    /**
     * @brief 根据 config.hpp 中的 TIME_LIMIT、MEMORY_LIMIT、OUTPUT_LIMIT 构造
     */
    static resource_limits defaults();

    /**
     * @brief 检查各项限制是否为正数
     * @throw std::invalid_argument 若存在非正的限制
     */
    void validate() const;
};

}  // namespace sandbox
