#include "hb/util/Metrics.hpp"
#include "hb/util/Logger.hpp"

#include <chrono>
#include <sstream>
#include <vector>

namespace hb {
namespace util {

MetricRegistry& MetricRegistry::instance() {
  static MetricRegistry inst;
  return inst;
}

MetricRegistry::~MetricRegistry() {
  stopReporter();
}

void MetricRegistry::startReporter(unsigned intervalSeconds) {
  // If already running, restart with the new interval.
  stopReporter();
  if (intervalSeconds == 0) return;

  running_.store(true, std::memory_order_release);
  thr_ = std::thread([this, intervalSeconds]{
    reporterLoop(intervalSeconds);
  });
}

void MetricRegistry::stopReporter() {
  {
    std::lock_guard<std::mutex> lk(stopMu_);
    running_.store(false, std::memory_order_release);
  }
  stopCv_.notify_all();
  if (thr_.joinable()) thr_.join();
}

void MetricRegistry::increment(const std::string& name, double v) {
  std::lock_guard<std::mutex> lk(mu_);
  counters_[name] += v;
}

void MetricRegistry::setGauge(const std::string& name, double v) {
  std::lock_guard<std::mutex> lk(mu_);
  gauges_[name] = v;
}

double MetricRegistry::counter(const std::string& name) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = counters_.find(name);
  return it == counters_.end() ? 0.0 : it->second;
}

std::map<std::string, double> MetricRegistry::snapshotCounters() const {
  std::lock_guard<std::mutex> lk(mu_);
  return counters_;
}

std::map<std::string, double> MetricRegistry::snapshotGauges() const {
  std::lock_guard<std::mutex> lk(mu_);
  return gauges_;
}

void MetricRegistry::reset() {
  std::lock_guard<std::mutex> lk(mu_);
  counters_.clear();
  gauges_.clear();
}

void MetricRegistry::reporterLoop(unsigned intervalSeconds) {
  const auto period = std::chrono::seconds(intervalSeconds);

  for (;;) {
    {
      std::unique_lock<std::mutex> lk(stopMu_);
      if (stopCv_.wait_for(lk, period, [this]{ return !running_.load(std::memory_order_acquire); })) {
        return;
      }
    }

    std::vector<Field> fields;
    for (auto& kv : snapshotCounters()) {
      std::ostringstream v;
      v << kv.second;
      fields.push_back({kv.first, v.str()});
    }
    for (auto& kv : snapshotGauges()) {
      std::ostringstream v;
      v << kv.second;
      fields.push_back({kv.first, v.str()});
    }
    if (!fields.empty()) {
      logger().log(LogLevel::Info, "metrics", fields);
    }
  }
}

} // namespace util
} // namespace hb
