#include "common/defer.hpp"
#include <glog/logging.h>
#include <exception>

scoped_guard::scoped_guard() : f() {}
scoped_guard::scoped_guard(const std::function<void()> &f) : f(f) {}
scoped_guard::scoped_guard(scoped_guard &&other) noexcept : f(std::move(other.f)) {
    other.f = nullptr;
}

scoped_guard::~scoped_guard() {
    if (!f) return;
    // 析构函数中不能再抛出异常，清理失败只记录日志
    try {
        f();
    } catch (const std::exception &ex) {
        LOG(ERROR) << "cleanup failed: " << ex.what();
    }
}

scoped_guard scoped_guard::operator+(const std::function<void()> &f) const {
    return scoped_guard(f);
}
