#include "hb/Errors.hpp"

#include <sstream>

namespace hb {

static std::string unknownMethodMessage(const std::string& method,
                                        const std::vector<std::string>& available) {
  std::ostringstream oss;
  oss << "Unknown method: " << (method.empty() ? "(none)" : method) << ". Available methods: ";
  for (std::size_t i = 0; i < available.size(); ++i) {
    if (i) oss << ", ";
    oss << available[i];
  }
  oss << ". Hint: send {\"method\":\"status\",\"params\":{}} to inspect the host";
  return oss.str();
}

UnknownMethodError::UnknownMethodError(std::string method, const std::vector<std::string>& available)
  : BridgeError(unknownMethodMessage(method, available)),
    method_(std::move(method))
{}

TransportError::TransportError(std::string where, const std::string& cause)
  : BridgeError(where + ": " + cause),
    where_(std::move(where))
{}

static std::string bindMessage(const std::string& address, unsigned short port,
                               bool inUse, const std::string& cause) {
  std::ostringstream oss;
  if (inUse) {
    oss << "Port " << port << " already in use";
  } else {
    oss << "Cannot listen on " << address << ":" << port;
  }
  if (!cause.empty()) oss << " (" << cause << ")";
  if (inUse) oss << ". Run: lsof -ti :" << port << " | xargs kill -9";
  return oss.str();
}

BindError::BindError(std::string address, unsigned short port, bool addressInUse, const std::string& cause)
  : BridgeError(bindMessage(address, port, addressInUse, cause)),
    address_(std::move(address)),
    port_(port),
    inUse_(addressInUse)
{}

std::string BindError::hint() const {
  if (!inUse_) return {};
  return "lsof -ti :" + std::to_string(port_) + " | xargs kill -9";
}

} // namespace hb
