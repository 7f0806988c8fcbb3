#pragma once
#include <stdexcept>
#include <string>

class MonitorError : public std::runtime_error {
public:
  explicit MonitorError(const std::string& what) : std::runtime_error(what) {}
};

// Operation requires state that does not exist yet (e.g. an order before any deposit).
class PreconditionViolation : public MonitorError {
public:
  explicit PreconditionViolation(const std::string& what) : MonitorError(what) {}
};

// Caller supplied a value outside the accepted domain.
class InvalidParameter : public MonitorError {
public:
  explicit InvalidParameter(const std::string& what) : MonitorError(what) {}
};

// Oracle, router, balance source or RPC endpoint failed or returned unusable data.
class ExternalFailure : public MonitorError {
public:
  explicit ExternalFailure(const std::string& what) : MonitorError(what) {}
};
