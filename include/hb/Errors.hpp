#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace hb {

// Root of everything the bridge throws on purpose. The dispatch boundary
// turns the first four kinds into {ok:false} responses.
class BridgeError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Request body is not a parseable JSON object.
class ProtocolError : public BridgeError {
public:
  using BridgeError::BridgeError;
};

/// A known method was called with a missing or mistyped parameter.
class ValidationError : public BridgeError {
public:
  using BridgeError::BridgeError;
};

/// Method name is not in the command table.
class UnknownMethodError : public BridgeError {
public:
  UnknownMethodError(std::string method, const std::vector<std::string>& available);

  const std::string& method() const noexcept { return method_; }

private:
  std::string method_;
};

/// The delegated action itself failed (script exception, host failure).
class ExecutionError : public BridgeError {
public:
  using BridgeError::BridgeError;
};

/// Socket-level failure on one connection: "<where>: <cause>".
/// Logged and the connection abandoned; never turned into a response.
class TransportError : public BridgeError {
public:
  TransportError(std::string where, const std::string& cause);

  const std::string& where() const noexcept { return where_; }

private:
  std::string where_;
};

/// The listener could not bind or listen. Fatal to that start attempt only.
class BindError : public BridgeError {
public:
  BindError(std::string address, unsigned short port, bool addressInUse, const std::string& cause);

  unsigned short port() const noexcept { return port_; }
  const std::string& address() const noexcept { return address_; }
  bool addressInUse() const noexcept { return inUse_; }

  // Shell command that frees the port, empty when the port was not in use.
  std::string hint() const;

private:
  std::string    address_;
  unsigned short port_;
  bool           inUse_;
};

} // namespace hb
