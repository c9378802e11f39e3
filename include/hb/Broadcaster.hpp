#pragma once

#include <boost/asio/io_context.hpp>
#include <rapidjson/document.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace hb {

class OutputChannel;
class SubscriberRegistry;

/// Structured state-change notification pushed to every subscriber.
/// Immutable once constructed.
class BroadcastEvent {
public:
  BroadcastEvent(std::string event, rapidjson::Document data);
  BroadcastEvent(std::string event, rapidjson::Document data, std::int64_t timestampMs);

  const std::string& event() const noexcept { return event_; }
  std::int64_t timestamp() const noexcept { return timestamp_; }
  const rapidjson::Value& data() const noexcept { return data_; }

  // {"event":..,"timestamp":..,"data":{..}}
  std::string toJson() const;

  static std::int64_t nowMs();

private:
  std::string         event_;
  std::int64_t        timestamp_;
  rapidjson::Document data_;
};

// Fans an event out to the subscriber snapshot taken at call time, one
// detached HTTP POST per URL. Delivery is at-most-once and best-effort: a
// failed POST is written to the output channel and never reaches the caller.
class Broadcaster {
public:
  Broadcaster(boost::asio::io_context& ioc,
              std::shared_ptr<SubscriberRegistry> subscribers,
              std::shared_ptr<OutputChannel> output,
              std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

  // Safe to call from any thread. Returns the number of POSTs started.
  std::size_t broadcast(const BroadcastEvent& event) noexcept;

private:
  boost::asio::io_context&            ioc_;
  std::shared_ptr<SubscriberRegistry> subscribers_;
  std::weak_ptr<OutputChannel>        output_;
  std::chrono::milliseconds           timeout_;
};

} // namespace hb
