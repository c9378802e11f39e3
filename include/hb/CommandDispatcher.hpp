#pragma once

#include <rapidjson/document.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "hb/Collaborators.hpp"
#include "hb/Command.hpp"
#include "hb/ProgressEvent.hpp"
#include "hb/Response.hpp"

namespace hb {

class Broadcaster;
class OutputChannel;
class SubscriberRegistry;

/// Server facts reported by `status`.
struct ServerInfo {
  std::string                           name = "hostbridge";
  std::string                           version = "0.1.0";
  unsigned short                        port = 0;
  std::chrono::system_clock::time_point startTime = std::chrono::system_clock::now();
  std::vector<std::string>              features = {"cli-bridge", "webhooks", "eval"};
};

/// Executes the fixed command table against the collaborators and the
/// server-owned registry/output. Never throws: every failure becomes a
/// {ok:false, error} Response.
class CommandDispatcher {
public:
    CommandDispatcher(Collaborators collaborators,
                      std::shared_ptr<SubscriberRegistry> subscribers,
                      std::shared_ptr<OutputChannel> output,
                      std::shared_ptr<Broadcaster> broadcaster,
                      ServerInfo info,
                      ProgressFn onProgress = {});

    Response dispatch(const Request& request) noexcept;
    Response dispatch(const std::string& method, const rapidjson::Value& params) noexcept;

    /// Full `status` result: host snapshot plus server section.
    rapidjson::Document statusDocument();

    const ServerInfo& info() const noexcept { return _info; }

private:
    Response execute(const Command& command);

    Response run(const cmd::Status& c);
    Response run(const cmd::Eval& c);
    Response run(const cmd::Webview& c);
    Response run(const cmd::RegisterConfig& c);
    Response run(const cmd::UnregisterConfig& c);
    Response run(const cmd::ListConfigs& c);
    Response run(const cmd::Subscribe& c);
    Response run(const cmd::Unsubscribe& c);
    Response run(const cmd::ListSubscribers& c);
    Response run(const cmd::GetOutput& c);
    Response run(const cmd::RestartExtension& c);

    IHost& host() const;
    IConfigHost& config() const;
    rapidjson::Document subscriberResult(const std::string& message) const;

private:
    Collaborators _collaborators;
    std::shared_ptr<SubscriberRegistry> _subscribers;
    std::shared_ptr<OutputChannel> _output;
    std::shared_ptr<Broadcaster> _broadcaster;
    ServerInfo _info;
    ProgressFn _onProgress;
};

} // namespace hb
