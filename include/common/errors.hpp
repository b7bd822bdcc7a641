#pragma once
#include <stdexcept>
#include <string>

// A collector's source could not be opened. Fatal to that collector's task.
class SourceUnavailable : public std::runtime_error {
public:
  explicit SourceUnavailable(const std::string& what) : std::runtime_error(what) {}
};

// A strategy failed its one-time state load. Aborts engine startup.
class StateSyncFailure : public std::runtime_error {
public:
  explicit StateSyncFailure(const std::string& what) : std::runtime_error(what) {}
};

// Failure of a node or relay JSON-RPC call.
class RpcError : public std::runtime_error {
public:
  enum class Kind {
    kTransport, // no response or non-2xx HTTP status
    kRelay,     // well-formed JSON-RPC error object
    kDecode     // response body could not be decoded
  };

  RpcError(Kind kind, const std::string& endpoint, const std::string& what)
    : std::runtime_error(endpoint + ": " + what), kind_(kind), endpoint_(endpoint) {}

  Kind kind() const { return kind_; }
  const std::string& endpoint() const { return endpoint_; }

private:
  Kind kind_;
  std::string endpoint_;
};

inline const char* RpcErrorKindName(RpcError::Kind kind) {
  switch (kind) {
    case RpcError::Kind::kTransport: return "transport";
    case RpcError::Kind::kRelay: return "relay";
    case RpcError::Kind::kDecode: return "decode";
  }
  return "unknown";
}
