#pragma once

#define PY_SSIZE_T_CLEAN
#include <Python.h>
#include <string>

/**
 * @brief 持有一个 Python 对象的强引用，析构时释放
 */
class py_ref {
public:
    py_ref();
    explicit py_ref(PyObject *object);
    py_ref(py_ref &&other);
    ~py_ref();

    py_ref(const py_ref &) = delete;
    py_ref &operator=(const py_ref &) = delete;
    py_ref &operator=(py_ref &&other);

    PyObject *get() const;
    PyObject *release();

    explicit operator bool() const;

private:
    PyObject *object;
};

/**
 * @brief 嵌入式解释器的生命周期
 * 构造时以隔离模式初始化解释器：不读取环境变量，不导入 site，不写字节码，
 * 不安装信号处理函数，标准输出不缓冲并以 utf-8 编码。析构时关闭解释器。
 */
class interpreter_guard {
public:
    explicit interpreter_guard(const char *program);
    ~interpreter_guard();

    interpreter_guard(const interpreter_guard &) = delete;
    interpreter_guard &operator=(const interpreter_guard &) = delete;
};

/**
 * @brief str(object)，失败时返回 "<unprintable>"
 */
std::string py_str(PyObject *object);

/**
 * @brief type.__name__
 */
std::string py_type_name(PyObject *type);

/**
 * @brief 取出并清除当前的 Python 异常，以 "<type>: <value>" 的形式返回
 */
std::string py_fetch_error();
