// Python.h goes before any standard header
#define PY_SSIZE_T_CLEAN
#include <Python.h>

#include "mre/python_syntax_checker.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>
#include <memory>
#include <string>

namespace sanitizer {

namespace {

struct PyObjectDeleter {
    void operator()(PyObject* obj) const { Py_XDECREF(obj); }
};

using PyObjectPtr = std::unique_ptr<PyObject, PyObjectDeleter>;

/**
 * @brief Process-wide embedded interpreter.
 *
 * Releases the GIL right after start-up so any thread can take it through
 * GilLock. An interpreter started by the host process is used as-is and
 * never finalized here.
 */
class PythonRuntime {
public:
    static void ensure_started() {
        static PythonRuntime runtime;
    }

    ~PythonRuntime() {
        if (saved_thread_ != nullptr) {
            PyEval_RestoreThread(saved_thread_);
            if (Py_FinalizeEx() < 0) {
                utils::log::warn("Python parser: interpreter finalization reported an error");
            }
        }
    }

    PythonRuntime(const PythonRuntime&) = delete;
    PythonRuntime& operator=(const PythonRuntime&) = delete;

private:
    PythonRuntime() {
        if (Py_IsInitialized()) {
            return;
        }

        PyConfig config;
        PyConfig_InitIsolatedConfig(&config);
        config.install_signal_handlers = 0;
        config.site_import = 0;
        config.write_bytecode = 0;

        const PyStatus status = Py_InitializeFromConfig(&config);
        PyConfig_Clear(&config);
        if (PyStatus_Exception(status)) {
            throw SanitizerError(ErrorCategory::INTERNAL_ERROR,
                std::format("Python parser: interpreter failed to start: {}",
                            status.err_msg ? status.err_msg : "unknown error"));
        }

        saved_thread_ = PyEval_SaveThread();
        utils::log::debug(std::format("Python parser: embedded interpreter {} started",
                                      Py_GetVersion()));
    }

    PyThreadState* saved_thread_ = nullptr;
};

class GilLock {
public:
    GilLock() : state_(PyGILState_Ensure()) {}
    ~GilLock() { PyGILState_Release(state_); }

    GilLock(const GilLock&) = delete;
    GilLock& operator=(const GilLock&) = delete;

private:
    PyGILState_STATE state_;
};

std::string to_utf8(PyObject* obj) {
    if (obj == nullptr) {
        return {};
    }
    PyObjectPtr text(PyObject_Str(obj));
    if (!text) {
        PyErr_Clear();
        return {};
    }
    const char* utf8 = PyUnicode_AsUTF8(text.get());
    if (utf8 == nullptr) {
        PyErr_Clear();
        return {};
    }
    return utf8;
}

/**
 * @brief Turn the pending Python exception into "<message> (line N)".
 *
 * SyntaxError and its subclasses carry msg and lineno. Anything else the
 * parser raises (MemoryError, RecursionError on deep nesting) is reported
 * by type name and text.
 */
std::string take_parse_error() {
    PyObject* raw_type = nullptr;
    PyObject* raw_value = nullptr;
    PyObject* raw_traceback = nullptr;
    PyErr_Fetch(&raw_type, &raw_value, &raw_traceback);
    PyErr_NormalizeException(&raw_type, &raw_value, &raw_traceback);
    PyObjectPtr type(raw_type);
    PyObjectPtr value(raw_value);
    PyObjectPtr traceback(raw_traceback);

    if (!value) {
        return "unknown parser error";
    }

    if (PyErr_GivenExceptionMatches(type.get(), PyExc_SyntaxError)) {
        PyObjectPtr msg(PyObject_GetAttrString(value.get(), "msg"));
        PyObjectPtr lineno(PyObject_GetAttrString(value.get(), "lineno"));
        PyErr_Clear();

        auto message = to_utf8(msg.get());
        if (message.empty()) {
            message = "invalid syntax";
        }
        if (lineno && PyLong_Check(lineno.get())) {
            const long line = PyLong_AsLong(lineno.get());
            if (line > 0) {
                return std::format("{} (line {})", message, line);
            }
        }
        PyErr_Clear();
        return message;
    }

    const auto* type_object = reinterpret_cast<PyTypeObject*>(type.get());
    const auto text = to_utf8(value.get());
    return text.empty() ? std::string(type_object->tp_name)
                        : std::format("{}: {}", type_object->tp_name, text);
}

} // anonymous namespace

std::optional<std::string> PythonSyntaxChecker::check(std::string_view code) {
    if (code.find('\0') != std::string_view::npos) {
        return "source code cannot contain null bytes";
    }

    PythonRuntime::ensure_started();
    GilLock gil;

    const std::string source(code);
    PyCompilerFlags flags{};
    flags.cf_flags = PyCF_ONLY_AST;
    flags.cf_feature_version = PY_MINOR_VERSION;

    PyObjectPtr tree(Py_CompileStringExFlags(source.c_str(), "<snippet>",
                                             Py_file_input, &flags, -1));
    if (tree) {
        return std::nullopt;
    }
    return take_parse_error();
}

} // namespace sanitizer
