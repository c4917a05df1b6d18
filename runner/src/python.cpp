#include "python.hpp"
#include <utility>
#include "common/defer.hpp"
#include "common/exceptions.hpp"

using namespace std;

py_ref::py_ref() : object(nullptr) {}

py_ref::py_ref(PyObject *object) : object(object) {}

py_ref::py_ref(py_ref &&other) : object(other.release()) {}

py_ref::~py_ref() {
    Py_XDECREF(object);
}

py_ref &py_ref::operator=(py_ref &&other) {
    if (this != &other) {
        Py_XDECREF(object);
        object = other.release();
    }
    return *this;
}

PyObject *py_ref::get() const {
    return object;
}

PyObject *py_ref::release() {
    return exchange(object, nullptr);
}

py_ref::operator bool() const {
    return object != nullptr;
}

static void check_status(const PyStatus &status, const char *action) {
    if (PyStatus_Exception(status))
        throw sandbox::internal_error(string("unable to ") + action + ": " +
                                      (status.err_msg ? status.err_msg : "unknown error"));
}

interpreter_guard::interpreter_guard(const char *program) {
    PyConfig config;
    PyConfig_InitIsolatedConfig(&config);
    defer { PyConfig_Clear(&config); };

    config.buffered_stdio = 0;
    config.site_import = 0;
    config.write_bytecode = 0;
    config.install_signal_handlers = 0;
    check_status(PyConfig_SetBytesString(&config, &config.program_name, program), "set program name");
    check_status(PyConfig_SetString(&config, &config.stdio_encoding, L"utf-8"), "set stdio encoding");
    check_status(PyConfig_SetString(&config, &config.stdio_errors, L"backslashreplace"), "set stdio errors");
    check_status(Py_InitializeFromConfig(&config), "initialize python");
}

interpreter_guard::~interpreter_guard() {
    Py_FinalizeEx();
}

string py_str(PyObject *object) {
    if (!object) return "";
    py_ref text(PyObject_Str(object));
    if (text) {
        Py_ssize_t size = 0;
        const char *data = PyUnicode_AsUTF8AndSize(text.get(), &size);
        if (data) return string(data, size);
    }
    PyErr_Clear();
    return "<unprintable>";
}

string py_type_name(PyObject *type) {
    py_ref name(PyObject_GetAttrString(type, "__name__"));
    if (name && PyUnicode_Check(name.get())) return py_str(name.get());
    PyErr_Clear();
    return PyType_Check(type) ? ((PyTypeObject *)type)->tp_name : "<unknown>";
}

string py_fetch_error() {
    PyObject *type, *value, *traceback;
    PyErr_Fetch(&type, &value, &traceback);
    if (!type) return "no python error set";
    PyErr_NormalizeException(&type, &value, &traceback);
    py_ref t(type), v(value), tb(traceback);
    return py_type_name(t.get()) + ": " + py_str(v.get());
}
