#include "hb/Broadcaster.hpp"

#include "hb/Errors.hpp"
#include "hb/OutputChannel.hpp"
#include "hb/SubscriberRegistry.hpp"
#include "hb/http/WebhookClient.hpp"
#include "hb/util/Logger.hpp"
#include "hb/util/Metrics.hpp"

#include <boost/asio/post.hpp>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <exception>

namespace hb {

BroadcastEvent::BroadcastEvent(std::string event, rapidjson::Document data)
  : BroadcastEvent(std::move(event), std::move(data), nowMs())
{}

BroadcastEvent::BroadcastEvent(std::string event, rapidjson::Document data, std::int64_t timestampMs)
  : event_(std::move(event)),
    timestamp_(timestampMs),
    data_(std::move(data))
{
  if (event_.empty()) {
    throw ValidationError("event name required");
  }
  if (data_.IsNull()) {
    data_.SetObject();
  } else if (!data_.IsObject()) {
    throw ValidationError("event data must be an object");
  }
}

std::int64_t BroadcastEvent::nowMs() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string BroadcastEvent::toJson() const {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);
  w.StartObject();
  w.Key("event");
  w.String(event_.c_str(), static_cast<rapidjson::SizeType>(event_.size()));
  w.Key("timestamp");
  w.Int64(timestamp_);
  w.Key("data");
  data_.Accept(w);
  w.EndObject();
  return std::string(sb.GetString(), sb.GetSize());
}

Broadcaster::Broadcaster(boost::asio::io_context& ioc,
                         std::shared_ptr<SubscriberRegistry> subscribers,
                         std::shared_ptr<OutputChannel> output,
                         std::chrono::milliseconds timeout)
  : ioc_(ioc),
    subscribers_(std::move(subscribers)),
    output_(output),
    timeout_(timeout)
{}

static void reportFailure(const std::weak_ptr<OutputChannel>& weak,
                          const std::string& url,
                          const std::string& reason) {
  HB_METRIC_HIT("broadcast.failed");
  if (auto out = weak.lock()) {
    out->appendLine("✖ Broadcast failed to " + url + ": " + reason);
  } else {
    util::logger().log(util::LogLevel::Warn, "broadcast.failed", {{"url", url}, {"error", reason}});
  }
}

std::size_t Broadcaster::broadcast(const BroadcastEvent& event) noexcept {
  std::size_t started = 0;
  try {
    const auto urls = subscribers_->list();
    if (urls.empty()) return 0;

    auto body = std::make_shared<const std::string>(event.toJson());
    HB_METRIC_HIT("broadcast.events");

    for (const auto& url : urls) {
      auto target = http::WebhookTarget::parse(url);
      if (!target) {
        reportFailure(output_, url, "unsupported or malformed URL");
        continue;
      }

      auto client = http::WebhookClient::create(
        ioc_, std::move(*target), *body, timeout_,
        [weak = output_, url](const http::WebhookClient::ErrorCode& ec, unsigned status, std::string_view where) {
          if (where.empty()) {
            HB_METRIC_HIT("broadcast.delivered");
            return;
          }
          std::string reason = std::string(where) + ": ";
          reason += ec ? ec.message() : "HTTP " + std::to_string(status);
          reportFailure(weak, url, reason);
        });

      boost::asio::post(ioc_, [client]{ client->post(); });
      ++started;
    }
  } catch (const std::exception& ex) {
    util::logger().log(util::LogLevel::Error, "broadcast.aborted", {{"error", ex.what()}});
  }
  return started;
}

} // namespace hb
