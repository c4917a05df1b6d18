#include "interpreter.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "sandbox/environment.hpp"

using namespace std;
using namespace sandbox;

nlohmann::json run_report::to_json() const {
    nlohmann::json j = {{"status", get_status_name(result)}};
    if (!kind.empty()) j["kind"] = kind;
    if (!detail.empty()) j["detail"] = detail;
    return j;
}

py_ref build_environment() {
    py_ref builtins(PyImport_ImportModule("builtins"));
    if (!builtins) throw internal_error("unable to import builtins: " + py_fetch_error());
    PyObject *available = PyModule_GetDict(builtins.get());  // borrowed

    py_ref restricted(PyDict_New());
    if (!restricted) throw internal_error("unable to create builtins dict: " + py_fetch_error());
    for (const string &name : allowed_builtins()) {
        PyObject *function = PyDict_GetItemString(available, name.c_str());  // borrowed
        if (!function) throw internal_error("builtin function " + name + " is not available");
        if (PyDict_SetItemString(restricted.get(), name.c_str(), function) < 0)
            throw internal_error("unable to register builtin " + name + ": " + py_fetch_error());
    }

    py_ref globals(PyDict_New());
    if (!globals || PyDict_SetItemString(globals.get(), "__builtins__", restricted.get()) < 0)
        throw internal_error("unable to create globals: " + py_fetch_error());
    return globals;
}

static run_report describe_exception() {
    PyObject *type, *value, *traceback;
    PyErr_Fetch(&type, &value, &traceback);
    PyErr_NormalizeException(&type, &value, &traceback);
    py_ref t(type), v(value), tb(traceback);

    run_report report;
    if (!t) {
        report.detail = "execution failed without an exception";
        return report;
    }

    if (PyErr_GivenExceptionMatches(t.get(), PyExc_MemoryError)) {
        report.result = status::MEMORY_LIMIT_EXCEEDED;
    } else if (PyErr_GivenExceptionMatches(t.get(), PyExc_SyntaxError)) {
        report.result = status::SYNTAX_ERROR;
        report.detail = py_str(v.get());
    } else {
        report.result = status::RUNTIME_ERROR;
        report.kind = py_type_name(t.get());
        report.detail = py_str(v.get());
    }
    return report;
}

static void flush_stdio() {
    for (const char *name : {"stdout", "stderr"}) {
        PyObject *stream = PySys_GetObject(name);  // borrowed
        if (!stream || stream == Py_None) continue;
        py_ref result(PyObject_CallMethod(stream, "flush", nullptr));
        if (!result) LOG(WARNING) << "unable to flush sys." << name << ": " << py_fetch_error();
    }
}

run_report run_code(const string &code, const py_ref &globals) {
    if (code.find('\0') != string::npos) {
        run_report report;
        report.result = status::SYNTAX_ERROR;
        report.detail = "source code string cannot contain null bytes";
        return report;
    }

    py_ref compiled(Py_CompileString(code.c_str(), "<string>", Py_file_input));
    if (!compiled) return describe_exception();

    // 单一命名空间，顶层定义的函数可以互相引用
    py_ref result(PyEval_EvalCode(compiled.get(), globals.get(), globals.get()));
    run_report report;
    if (result)
        report.result = status::SUCCESS;
    else
        report = describe_exception();
    flush_stdio();
    return report;
}

void write_report(int fd, const nlohmann::json &report) {
    write_fully(fd, report.dump() + "\n");
}
