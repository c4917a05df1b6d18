#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)
#define defer auto DEFER_0(_defered_option) = scoped_guard() + [&]

/**
 * @brief 在作用域结束时执行清理函数
 * 配合 defer 宏使用：
 * @code{.cpp}
 *     int fd = open(...);
 *     defer { close(fd); };
 * @endcode
 * 无论是正常返回还是抛出异常，清理函数都会被执行。
 */
struct scoped_guard {
    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other) noexcept;
    ~scoped_guard();

    scoped_guard(const scoped_guard &) = delete;
    scoped_guard &operator=(const scoped_guard &) = delete;

    scoped_guard operator+(const std::function<void()> &f) const;

private:
    std::function<void()> f;
};
