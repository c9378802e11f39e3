#pragma once
#include <algorithm>
#include <atomic>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "hb/util/Logger.hpp"

namespace hb::runtime {

class ShutdownCoordinator {
public:
  // Lower order runs earlier; higher order runs later.
  void registerStep(std::string name, int order, std::function<void()> fn) {
    std::lock_guard<std::mutex> lk(mx_);
    steps_.push_back({std::move(name), order, std::move(fn)});
  }

  // Idempotent stop: each step executed once, in ascending order.
  // A failing step is logged and does not prevent later steps.
  void stop() {
    bool expected = false;
    if (!stopping_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
      return;
    }
    std::vector<Step> run;
    {
      std::lock_guard<std::mutex> lk(mx_);
      std::stable_sort(steps_.begin(), steps_.end(), [](const Step& a, const Step& b){
        return a.order < b.order;
      });
      run = steps_;
    }
    for (auto& s : run) {
      util::logger().log(util::LogLevel::Debug, "shutdown.step", {{"name", s.name}});
      try {
        s.fn();
      } catch (const std::exception& ex) {
        util::logger().log(util::LogLevel::Warn, "shutdown.step_failed",
                           {{"name", s.name}, {"error", ex.what()}});
      }
    }
  }

  bool stopping() const noexcept { return stopping_.load(std::memory_order_acquire); }

private:
  struct Step { std::string name; int order; std::function<void()> fn; };
  std::vector<Step> steps_;
  std::atomic<bool> stopping_{false};
  std::mutex mx_;
};

} // namespace hb::runtime
