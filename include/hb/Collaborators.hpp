#pragma once

#include <rapidjson/document.h>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "hb/Result.hpp"

namespace hb {

class BroadcastEvent;

struct TerminalInfo {
  std::string                 name;
  std::optional<int>          processId;
  std::string                 state = "running";
  bool                        isActive = false;
  std::optional<std::int64_t> startTime; // epoch ms
};

struct EditorInfo {
  std::string file;
  std::string language;
  int         lines = 0;
  bool        isDirty = false;
  int         cursorLine = 1;   // 1-based
  int         cursorColumn = 1; // 1-based
};

struct WorkspaceFolder {
  std::string name;
  std::string path;
};

/// What the host reports for the `status` command.
struct StatusSnapshot {
  std::vector<TerminalInfo>    terminals;
  std::optional<std::string>   activeTerminal;
  std::optional<EditorInfo>    editor;
  std::vector<WorkspaceFolder> folders;
  int                          openFiles = 0;
};

/// The whitelisted callbacks a script may reach during `eval`.
struct EvalContext {
  using LineFn = std::function<void(const std::string&)>;

  LineFn log;
  LineFn warn;
  LineFn error;
  std::function<void(const BroadcastEvent&)> broadcast;
  std::function<rapidjson::Document()>       status;
};

/// Host capability surface: script execution and state queries.
class IHost {
public:
  virtual ~IHost() = default;

  // Runs `code` as a function body. Throws ExecutionError on script failure.
  virtual rapidjson::Document evalContext(const std::string& code, const EvalContext& ctx) = 0;

  virtual StatusSnapshot queryStatus() = 0;

  // Restart the host. Called only after the acknowledging response is sent.
  virtual void restart() = 0;
};

struct ViewRequest {
  std::string                viewName;
  std::string                title;
  std::optional<std::string> customPath;
};

/// Webview/panel renderer. A missing instance means "not initialized".
class IWebviewHost {
public:
  virtual ~IWebviewHost() = default;
  virtual void openView(const ViewRequest& request) = 0;
};

/// Dynamic config loader; failures come back as Error, not exceptions.
class IConfigHost {
public:
  virtual ~IConfigHost() = default;
  virtual Result<rapidjson::Document> registerConfig(const std::string& name, const std::string& filePath) = 0;
  virtual Result<rapidjson::Document> unregisterConfig(const std::string& name) = 0;
  virtual Result<rapidjson::Document> listConfigs() = 0;
};

struct Collaborators {
  IHost*        host    = nullptr;
  IWebviewHost* webview = nullptr;
  IConfigHost*  config  = nullptr;
};

} // namespace hb
