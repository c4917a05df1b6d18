#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace sandbox {

struct sandbox_exception : std::exception {
    explicit sandbox_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const sandbox_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示沙箱自身的内部错误
 * 比如管道、进程创建失败，或者找不到 sandbox-runner
 */
struct internal_error : public sandbox_exception {
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示 sandbox-runner 返回的执行报告无法解析
 */
struct report_error : public sandbox_exception {
    explicit report_error(const std::string &message);
};

}  // namespace sandbox
