#include "hb/SubscriberRegistry.hpp"

#include "hb/util/Logger.hpp"

#include <algorithm>

namespace hb {

bool SubscriberRegistry::add(const std::string& url) {
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (!_urls.insert(url).second) {
      return false;
    }
    _order.push_back(url);
  }

  util::logger().log(util::LogLevel::Debug, "Registered subscriber", { {"url", url} });
  return true;
}

bool SubscriberRegistry::remove(const std::string& url) {
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_urls.erase(url) == 0) {
      return false;
    }
    _order.erase(std::remove(_order.begin(), _order.end(), url), _order.end());
  }

  util::logger().log(util::LogLevel::Debug, "Removed subscriber", { {"url", url} });
  return true;
}

bool SubscriberRegistry::contains(const std::string& url) const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _urls.count(url) != 0;
}

std::vector<std::string> SubscriberRegistry::list() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _order;
}

std::size_t SubscriberRegistry::size() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _order.size();
}

void SubscriberRegistry::clear() {
  std::lock_guard<std::mutex> lock(_mutex);
  _order.clear();
  _urls.clear();
}

} // namespace hb
