#pragma once

#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace hb {
namespace util {

// A small thread-safe in-process metrics registry.
// - Counters are add-only numbers.
// - Gauges are set numbers.
// Optionally runs a background reporter that writes both to the logger.
class MetricRegistry {
public:
  static MetricRegistry& instance();

  MetricRegistry() = default;
  ~MetricRegistry();

  MetricRegistry(const MetricRegistry&)            = delete;
  MetricRegistry& operator=(const MetricRegistry&) = delete;

  void startReporter(unsigned intervalSeconds);
  void stopReporter();

  void increment(const std::string& name, double v = 1.0);
  void setGauge(const std::string& name, double v);

  double counter(const std::string& name) const;

  std::map<std::string, double> snapshotCounters() const;
  std::map<std::string, double> snapshotGauges() const;

  void reset();

private:
  void reporterLoop(unsigned intervalSeconds);

private:
  mutable std::mutex mu_;
  std::map<std::string, double> counters_;
  std::map<std::string, double> gauges_;

  std::mutex              stopMu_;
  std::condition_variable stopCv_;
  std::atomic<bool>       running_{false};
  std::thread             thr_;
};

} // namespace util
} // namespace hb

#define HB_METRIC_INC(name, d) ::hb::util::MetricRegistry::instance().increment((name), (d))
#define HB_METRIC_HIT(name)    ::hb::util::MetricRegistry::instance().increment((name), 1.0)
#define HB_METRIC_SET(name, v) ::hb::util::MetricRegistry::instance().setGauge((name), (v))
