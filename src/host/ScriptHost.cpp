#define PY_SSIZE_T_CLEAN
#include <Python.h>

#include "hb/host/ScriptHost.hpp"

#include "hb/Broadcaster.hpp"
#include "hb/Errors.hpp"
#include "hb/Json.hpp"
#include "hb/util/Logger.hpp"
#include "hb/util/Metrics.hpp"

#include <rapidjson/error/en.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace hb {
namespace host {

namespace {

std::atomic<ScriptHost*> g_active{nullptr};
thread_local const EvalContext* t_context = nullptr;

// ---------------------- Python helpers ----------------------

class Gil {
public:
  Gil() : state_(PyGILState_Ensure()) {}
  ~Gil() { PyGILState_Release(state_); }
  Gil(const Gil&) = delete;
  Gil& operator=(const Gil&) = delete;
private:
  PyGILState_STATE state_;
};

class PyRef {
public:
  explicit PyRef(PyObject* p = nullptr) : p_(p) {}
  ~PyRef() { Py_XDECREF(p_); }
  PyRef(const PyRef&) = delete;
  PyRef& operator=(const PyRef&) = delete;
  PyObject* get() const noexcept { return p_; }
  explicit operator bool() const noexcept { return p_ != nullptr; }
private:
  PyObject* p_;
};

class ContextScope {
public:
  explicit ContextScope(const EvalContext* ctx) : prev_(t_context) { t_context = ctx; }
  ~ContextScope() { t_context = prev_; }
private:
  const EvalContext* prev_;
};

std::string toUtf8(PyObject* o) {
  if (!o) return {};
  PyRef s(PyObject_Str(o));
  if (!s) { PyErr_Clear(); return {}; }
  Py_ssize_t n = 0;
  const char* c = PyUnicode_AsUTF8AndSize(s.get(), &n);
  if (!c) { PyErr_Clear(); return {}; }
  return std::string(c, static_cast<std::size_t>(n));
}

// "<Type>: <message>" for the pending Python exception; clears it.
std::string takeError() {
  PyObject* type = nullptr;
  PyObject* value = nullptr;
  PyObject* tb = nullptr;
  PyErr_Fetch(&type, &value, &tb);
  PyErr_NormalizeException(&type, &value, &tb);
  PyRef t(type), v(value), b(tb);

  std::string name = "Error";
  if (type && PyType_Check(type)) {
    name = reinterpret_cast<PyTypeObject*>(type)->tp_name;
    auto dot = name.rfind('.');
    if (dot != std::string::npos) name = name.substr(dot + 1);
  }
  std::string msg = toUtf8(value);
  return msg.empty() ? name : name + ": " + msg;
}

// Converts a C++ failure inside a binding into a Python exception.
PyObject* raise(const std::exception& ex) {
  PyObject* kind = dynamic_cast<const ValidationError*>(&ex) ? PyExc_ValueError : PyExc_RuntimeError;
  PyErr_SetString(kind, ex.what());
  return nullptr;
}

const EvalContext* context() {
  if (t_context) return t_context;
  if (auto* h = g_active.load()) return h->currentContext();
  return nullptr;
}

// ---------------------- _hostbridge module ----------------------

PyObject* py_emit(PyObject*, PyObject* args) {
  int level = 0;
  const char* text = nullptr;
  if (!PyArg_ParseTuple(args, "is", &level, &text)) return nullptr;
  try {
    const EvalContext* ctx = context();
    const EvalContext::LineFn* fn = nullptr;
    if (ctx) fn = level >= 2 ? &ctx->error : level == 1 ? &ctx->warn : &ctx->log;
    if (fn && *fn) {
      (*fn)(text);
    } else {
      util::logger().log(level >= 2 ? util::LogLevel::Error : level == 1 ? util::LogLevel::Warn : util::LogLevel::Info,
                         text, {{"source", "script"}});
    }
  } catch (const std::exception& ex) {
    return raise(ex);
  }
  Py_RETURN_NONE;
}

PyObject* py_broadcast(PyObject*, PyObject* args) {
  const char* event = nullptr;
  const char* data = nullptr;
  if (!PyArg_ParseTuple(args, "ss", &event, &data)) return nullptr;
  try {
    rapidjson::Document doc;
    doc.Parse(data);
    if (doc.HasParseError()) throw ValidationError("event data is not valid JSON");
    BroadcastEvent ev(event, std::move(doc));

    const EvalContext* ctx = context();
    if (!ctx || !ctx->broadcast) throw ExecutionError("broadcast unavailable");
    ctx->broadcast(ev);
  } catch (const std::exception& ex) {
    return raise(ex);
  }
  Py_RETURN_NONE;
}

PyObject* py_status(PyObject*, PyObject*) {
  std::string out;
  try {
    const EvalContext* ctx = context();
    if (!ctx || !ctx->status) throw ExecutionError("status unavailable");
    out = json::toString(ctx->status());
  } catch (const std::exception& ex) {
    return raise(ex);
  }
  return PyUnicode_FromStringAndSize(out.data(), static_cast<Py_ssize_t>(out.size()));
}

PyObject* py_track_terminal(PyObject*, PyObject* args) {
  const char* name = nullptr;
  PyObject* pid = Py_None;
  if (!PyArg_ParseTuple(args, "s|O", &name, &pid)) return nullptr;
  auto* h = g_active.load();
  if (!h) { PyErr_SetString(PyExc_RuntimeError, "host not initialized"); return nullptr; }

  std::optional<int> processId;
  if (pid != Py_None) {
    long v = PyLong_AsLong(pid);
    if (v == -1 && PyErr_Occurred()) return nullptr;
    processId = static_cast<int>(v);
  }
  try {
    h->trackTerminal(name, processId);
  } catch (const std::exception& ex) {
    return raise(ex);
  }
  Py_RETURN_NONE;
}

PyObject* py_forget_terminal(PyObject*, PyObject* args) {
  const char* name = nullptr;
  if (!PyArg_ParseTuple(args, "s", &name)) return nullptr;
  auto* h = g_active.load();
  if (!h) { PyErr_SetString(PyExc_RuntimeError, "host not initialized"); return nullptr; }
  try {
    return PyBool_FromLong(h->forgetTerminal(name) ? 1 : 0);
  } catch (const std::exception& ex) {
    return raise(ex);
  }
}

PyObject* py_set_active_terminal(PyObject*, PyObject* args) {
  const char* name = nullptr;
  if (!PyArg_ParseTuple(args, "s", &name)) return nullptr;
  auto* h = g_active.load();
  if (!h) { PyErr_SetString(PyExc_RuntimeError, "host not initialized"); return nullptr; }
  try {
    return PyBool_FromLong(h->setActiveTerminal(name) ? 1 : 0);
  } catch (const std::exception& ex) {
    return raise(ex);
  }
}

PyMethodDef kMethods[] = {
  {"emit",                py_emit,                METH_VARARGS, "emit(level, text)"},
  {"broadcast",           py_broadcast,           METH_VARARGS, "broadcast(event, data_json)"},
  {"status",              py_status,              METH_NOARGS,  "status() -> json text"},
  {"track_terminal",      py_track_terminal,      METH_VARARGS, "track_terminal(name, pid=None)"},
  {"forget_terminal",     py_forget_terminal,     METH_VARARGS, "forget_terminal(name) -> bool"},
  {"set_active_terminal", py_set_active_terminal, METH_VARARGS, "set_active_terminal(name) -> bool"},
  {nullptr, nullptr, 0, nullptr}
};

PyModuleDef kModule = {
  PyModuleDef_HEAD_INIT,
  "_hostbridge",
  "hostbridge host bindings",
  -1,
  kMethods,
  nullptr, nullptr, nullptr, nullptr
};

PyObject* initModule() {
  return PyModule_Create(&kModule);
}

const char* kPrelude = R"PY(
import ast
import contextlib
import io
import json
import types
import _hostbridge


def _fmt(value):
    if isinstance(value, str):
        return value
    try:
        return json.dumps(value, default=str)
    except (TypeError, ValueError):
        return repr(value)


def _emitter(level):
    def emit(*args):
        _hostbridge.emit(level, ' '.join(_fmt(a) for a in args))
    return emit


console = types.SimpleNamespace(log=_emitter(0), warn=_emitter(1), error=_emitter(2))


def _broadcast(event, data=None):
    _hostbridge.broadcast(str(event), json.dumps({} if data is None else data, default=str))


def _status():
    return json.loads(_hostbridge.status())


bridge = types.SimpleNamespace(
    log=console.log,
    warn=console.warn,
    error=console.error,
    broadcast=_broadcast,
    status=_status,
    track_terminal=_hostbridge.track_terminal,
    forget_terminal=_hostbridge.forget_terminal,
    set_active_terminal=_hostbridge.set_active_terminal,
)

_TEMPLATE = "def __hostbridge_eval__(bridge, console):\n    pass\n"


def _fresh_session():
    return {'__builtins__': __builtins__, '__name__': '__hostbridge__', 'json': json}


_session = _fresh_session()


def _compile_body(source):
    body = ast.parse(source, filename='<eval>', mode='exec').body
    tree = ast.parse(_TEMPLATE, filename='<eval>', mode='exec')
    tree.body[0].body = body or [ast.Pass()]
    ast.fix_missing_locations(tree)
    return compile(tree, '<eval>', 'exec')


class _LineWriter(io.TextIOBase):
    """Text stream that emits each completed line at a fixed level."""

    def __init__(self, level):
        self._level = level
        self._pending = ''

    def writable(self):
        return True

    def write(self, text):
        self._pending += text
        *lines, self._pending = self._pending.split('\n')
        for line in lines:
            _hostbridge.emit(self._level, line)
        return len(text)

    def flush(self):
        if self._pending:
            line, self._pending = self._pending, ''
            _hostbridge.emit(self._level, line)


@contextlib.contextmanager
def _captured_output():
    out, err = _LineWriter(0), _LineWriter(2)
    try:
        with contextlib.redirect_stdout(out), contextlib.redirect_stderr(err):
            yield
    finally:
        out.flush()
        err.flush()


def _run(source):
    exec(_compile_body(source), _session)
    fn = _session.pop('__hostbridge_eval__')
    with _captured_output():
        value = fn(bridge, console)
    return json.dumps(value, default=str, allow_nan=False)


def _run_file(path):
    with open(path, encoding='utf-8') as f:
        source = f.read()
    scope = _fresh_session()
    scope.update(__file__=path, bridge=bridge, console=console)
    with _captured_output():
        exec(compile(source, path, 'exec'), scope)


def _reset():
    global _session
    _session = _fresh_session()
)PY";

std::once_flag g_interpreterOnce;

void startInterpreter() {
  std::call_once(g_interpreterOnce, [] {
    if (Py_IsInitialized()) {
      throw std::logic_error("Python interpreter already started elsewhere");
    }
    if (PyImport_AppendInittab("_hostbridge", &initModule) == -1) {
      throw std::runtime_error("cannot register _hostbridge module");
    }
    Py_InitializeEx(0);
    // Hand the GIL back; every later entry goes through PyGILState_Ensure.
    PyEval_SaveThread();
    util::logger().log(util::LogLevel::Info, "script.interpreter_started", {{"version", Py_GetVersion()}});
  });
}

std::int64_t nowMs() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace

// ---------------------- ScriptHost ----------------------

struct ScriptHost::Impl {
  PyObject* globals{nullptr}; // prelude namespace, strong ref

  mutable std::mutex           mx;
  std::vector<TerminalInfo>    terminals;
  std::optional<std::string>   activeTerminal;
  std::optional<EvalContext>   defaultContext;
  std::function<void()>        restartHook;
  TerminalListener             terminalListener;
  std::size_t                  restarts{0};

  PyObject* fn(const char* name) const {
    PyObject* f = PyDict_GetItemString(globals, name); // borrowed
    if (!f) throw ExecutionError(std::string("script runtime missing ") + name);
    return f;
  }
};

ScriptHost::ScriptHost(std::string workspaceRoot)
  : impl_(std::make_unique<Impl>()),
    workspaceRoot_(std::move(workspaceRoot))
{
  ScriptHost* expected = nullptr;
  if (!g_active.compare_exchange_strong(expected, this)) {
    throw std::logic_error("only one ScriptHost may exist at a time");
  }

  try {
    startInterpreter();

    Gil gil;
    PyRef globals(PyDict_New());
    PyRef builtins(PyImport_ImportModule("builtins"));
    if (!globals || !builtins || PyDict_SetItemString(globals.get(), "__builtins__", builtins.get()) != 0) {
      throw ExecutionError("cannot create script namespace: " + takeError());
    }
    PyRef ran(PyRun_String(kPrelude, Py_file_input, globals.get(), globals.get()));
    if (!ran) {
      throw ExecutionError("script prelude failed: " + takeError());
    }
    Py_INCREF(globals.get());
    impl_->globals = globals.get();
  } catch (...) {
    g_active.store(nullptr);
    throw;
  }
}

ScriptHost::~ScriptHost() {
  if (impl_->globals) {
    Gil gil;
    Py_CLEAR(impl_->globals);
  }
  g_active.store(nullptr);
}

ScriptHost* ScriptHost::active() noexcept {
  return g_active.load();
}

const EvalContext* ScriptHost::currentContext() const noexcept {
  std::lock_guard<std::mutex> lk(impl_->mx);
  return impl_->defaultContext ? &*impl_->defaultContext : nullptr;
}

rapidjson::Document ScriptHost::evalContext(const std::string& code, const EvalContext& ctx) {
  HB_METRIC_HIT("script.evals");
  std::string text;
  {
    Gil gil;
    ContextScope scope(&ctx);
    PyRef result(PyObject_CallFunction(impl_->fn("_run"), "s#", code.data(),
                                       static_cast<Py_ssize_t>(code.size())));
    if (!result) {
      HB_METRIC_HIT("script.errors");
      throw ExecutionError(takeError());
    }
    text = toUtf8(result.get());
  }

  rapidjson::Document doc;
  doc.Parse(text.c_str(), text.size());
  if (doc.HasParseError()) {
    throw ExecutionError(std::string("eval result is not JSON: ") + rapidjson::GetParseError_En(doc.GetParseError()));
  }
  return doc;
}

void ScriptHost::runFile(const std::string& path) {
  Gil gil;
  PyRef result(PyObject_CallFunction(impl_->fn("_run_file"), "s", path.c_str()));
  if (!result) {
    throw ExecutionError(takeError());
  }
  util::logger().log(util::LogLevel::Debug, "script.file_loaded", {{"path", path}});
}

StatusSnapshot ScriptHost::queryStatus() {
  StatusSnapshot snap;
  {
    std::lock_guard<std::mutex> lk(impl_->mx);
    snap.terminals = impl_->terminals;
    snap.activeTerminal = impl_->activeTerminal;
  }
  for (auto& t : snap.terminals) {
    t.isActive = snap.activeTerminal && *snap.activeTerminal == t.name;
  }
  if (!workspaceRoot_.empty()) {
    std::string root = workspaceRoot_;
    while (root.size() > 1 && root.back() == '/') root.pop_back();
    auto slash = root.rfind('/');
    WorkspaceFolder f;
    f.name = slash == std::string::npos ? root : root.substr(slash + 1);
    f.path = root;
    snap.folders.push_back(std::move(f));
  }
  return snap;
}

void ScriptHost::restart() {
  {
    Gil gil;
    PyRef ok(PyObject_CallFunction(impl_->fn("_reset"), nullptr));
    if (!ok) {
      throw ExecutionError(takeError());
    }
  }

  std::function<void()> hook;
  {
    std::lock_guard<std::mutex> lk(impl_->mx);
    ++impl_->restarts;
    hook = impl_->restartHook;
  }
  util::logger().log(util::LogLevel::Info, "script.restarted", {});
  if (hook) hook();
}

void ScriptHost::setDefaultContext(EvalContext ctx) {
  std::lock_guard<std::mutex> lk(impl_->mx);
  impl_->defaultContext = std::move(ctx);
}

void ScriptHost::setRestartHook(std::function<void()> hook) {
  std::lock_guard<std::mutex> lk(impl_->mx);
  impl_->restartHook = std::move(hook);
}

void ScriptHost::setTerminalListener(TerminalListener listener) {
  std::lock_guard<std::mutex> lk(impl_->mx);
  impl_->terminalListener = std::move(listener);
}

void ScriptHost::trackTerminal(const std::string& name, std::optional<int> processId) {
  TerminalInfo info;
  {
    std::lock_guard<std::mutex> lk(impl_->mx);
    auto it = std::find_if(impl_->terminals.begin(), impl_->terminals.end(),
                           [&](const TerminalInfo& t) { return t.name == name; });
    if (it != impl_->terminals.end()) {
      if (processId) it->processId = processId;
      info = *it;
    } else {
      info.name = name;
      info.processId = processId;
      info.startTime = nowMs();
      impl_->terminals.push_back(info);
    }
    if (!impl_->activeTerminal) impl_->activeTerminal = name;
    info.isActive = *impl_->activeTerminal == name;
  }
  notify("opened", info);
}

bool ScriptHost::forgetTerminal(const std::string& name) {
  TerminalInfo info;
  {
    std::lock_guard<std::mutex> lk(impl_->mx);
    auto it = std::find_if(impl_->terminals.begin(), impl_->terminals.end(),
                           [&](const TerminalInfo& t) { return t.name == name; });
    if (it == impl_->terminals.end()) return false;
    info = *it;
    info.state = "closed";
    impl_->terminals.erase(it);
    if (impl_->activeTerminal && *impl_->activeTerminal == name) {
      impl_->activeTerminal.reset();
      if (!impl_->terminals.empty()) impl_->activeTerminal = impl_->terminals.front().name;
    }
  }
  notify("closed", info);
  return true;
}

bool ScriptHost::setActiveTerminal(const std::string& name) {
  TerminalInfo info;
  {
    std::lock_guard<std::mutex> lk(impl_->mx);
    auto it = std::find_if(impl_->terminals.begin(), impl_->terminals.end(),
                           [&](const TerminalInfo& t) { return t.name == name; });
    if (it == impl_->terminals.end()) return false;
    impl_->activeTerminal = name;
    info = *it;
    info.isActive = true;
  }
  notify("activated", info);
  return true;
}

std::size_t ScriptHost::restartCount() const {
  std::lock_guard<std::mutex> lk(impl_->mx);
  return impl_->restarts;
}

void ScriptHost::notify(const std::string& change, const TerminalInfo& terminal) {
  TerminalListener listener;
  {
    std::lock_guard<std::mutex> lk(impl_->mx);
    listener = impl_->terminalListener;
  }
  if (listener) listener(change, terminal);
}

} // namespace host
} // namespace hb
