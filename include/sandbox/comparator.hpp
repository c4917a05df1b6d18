#pragma once

#include <optional>
#include <string>

namespace sandbox {

enum class compare_mode {
    /**
     * @brief 去除首尾空白后完全相等
     */
    EXACT,

    /**
     * @brief 相似度不低于 FUZZY_MATCH_THRESHOLD
     */
    FUZZY,

    /**
     * @brief 实际输出包含期望输出
     */
    CONTAINS
};

/**
 * @brief fuzzy 模式下判定为匹配的最低相似度
 */
constexpr double FUZZY_MATCH_THRESHOLD = 0.8;

/**
 * @brief exact 模式比较失败时，详情中展示的输出最多包含的字符数
 */
constexpr std::size_t PREVIEW_LENGTH = 200;

std::optional<compare_mode> parse_compare_mode(const std::string &name);

const char *get_mode_name(compare_mode mode);

struct comparison_result {
    std::string mode;
    bool matched = false;

    /**
     * @brief [0, 1] 之间的相似度，contains 模式下始终为 0
     */
    double similarity = 0;

    std::string details;
};

/**
 * @brief 计算两个字符串的相似度 2 * M / T
 * 其中 M 为最长匹配块递归求得的匹配字符数，T 为两个字符串的总字符数，两者均为空时为 1。
 * 字符串按 UTF-8 码点比较。b 长度不少于 200 时，在 b 中出现次数超过 1% 的字符
 * 不作为匹配起点，但仍然可以被匹配块的扩展覆盖。
 */
double similarity_ratio(const std::string &a, const std::string &b);

/**
 * @brief 比较程序实际输出和期望输出，两者都会先去掉首尾空白
 */
comparison_result compare(const std::string &actual, const std::string &expected, compare_mode mode);

/**
 * @brief 按模式名比较，未知的模式名返回 matched = false 以及 "Unknown comparison mode: <mode>"
 */
comparison_result compare(const std::string &actual, const std::string &expected, const std::string &mode);

}  // namespace sandbox
