#pragma once
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace hb {

/// Webhook URLs that receive broadcasts. Set semantics by exact string
/// equality; enumeration keeps subscription order.
class SubscriberRegistry {
public:
    // Returns true if the URL was not present before. Re-adding is a no-op.
    bool add(const std::string& url);
    // Returns true if the URL was present. Removing an absent URL is a no-op.
    bool remove(const std::string& url);

    bool contains(const std::string& url) const;
    std::vector<std::string> list() const;
    std::size_t size() const;
    void clear();

private:
    mutable std::mutex _mutex;
    std::vector<std::string> _order;
    std::unordered_set<std::string> _urls;
};

} // namespace hb
