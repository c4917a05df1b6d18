#pragma once

#include <chrono>
#include <string>

namespace sandbox {

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 设置环境变量
 * @param key 环境变量的键
 * @param value 环境变量的值
 * @param replace 若为真，则覆盖已有的环境变量值
 * @throw std::system_error 设置失败
 */
void set_env(const std::string &key, const std::string &value, bool replace = true);

/**
 * @brief 基于 steady_clock 的计时器，从构造时开始计时
 */
struct elapsed_time {
    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace sandbox
