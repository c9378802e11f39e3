#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "hb/Collaborators.hpp"

namespace hb {
namespace host {

/**
 * @class ScriptHost
 * @brief Host capability surface backed by an embedded CPython interpreter.
 *
 * `eval` code becomes the body of a function taking `bridge` and `console`.
 * Its return value is converted with `json.dumps(default=str)` and handed
 * back as a JSON document. Script exceptions surface as
 * `ExecutionError("<Type>: <message>")`.
 *
 * Whitelisted bindings visible to scripts:
 * - `console.log/warn/error(*args)` and the same three on `bridge`
 * - `bridge.broadcast(event, data)`, `bridge.status()`
 * - `bridge.track_terminal(name, pid=None)`, `bridge.forget_terminal(name)`,
 *   `bridge.set_active_terminal(name)`
 *
 * `print()` and anything else written to `sys.stdout` goes to `console.log`,
 * `sys.stderr` to `console.error`, one call per line.
 *
 * Variables assigned with `global` persist between evals until restart().
 *
 * ## Thread safety
 * Any thread may call in; every Python entry acquires the GIL. Only one
 * ScriptHost may exist at a time and the interpreter lives for the rest of
 * the process once started.
 */
class ScriptHost : public IHost {
public:
  // change is "opened", "closed" or "activated".
  using TerminalListener = std::function<void(const std::string& change, const TerminalInfo& terminal)>;

  explicit ScriptHost(std::string workspaceRoot = {});
  ~ScriptHost() override;

  ScriptHost(const ScriptHost&)            = delete;
  ScriptHost& operator=(const ScriptHost&) = delete;

  rapidjson::Document evalContext(const std::string& code, const EvalContext& ctx) override;
  StatusSnapshot queryStatus() override;

  // Discards the script namespace, then runs the restart hook.
  void restart() override;

  /// Runs a script file in its own namespace. Throws ExecutionError.
  void runFile(const std::string& path);

  /// Callbacks used by scripts that run outside an eval (config files).
  void setDefaultContext(EvalContext ctx);
  void setRestartHook(std::function<void()> hook);
  void setTerminalListener(TerminalListener listener);

  void trackTerminal(const std::string& name, std::optional<int> processId = std::nullopt);
  bool forgetTerminal(const std::string& name);
  bool setActiveTerminal(const std::string& name);

  std::size_t restartCount() const;

  const std::string& workspaceRoot() const noexcept { return workspaceRoot_; }

  // Backing store for the _hostbridge binding module.
  static ScriptHost* active() noexcept;
  const EvalContext* currentContext() const noexcept;

private:
  void notify(const std::string& change, const TerminalInfo& terminal);

  struct Impl;
  std::unique_ptr<Impl> impl_;
  std::string           workspaceRoot_;
};

} // namespace host
} // namespace hb
