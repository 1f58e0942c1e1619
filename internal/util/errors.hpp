#pragma once

#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>

namespace ledger::util {

/*
  Central error types.

  Every engine error carries a stable code string (e.g. PLAN_NOT_ACTIVE).
  These get translated later to gRPC status codes; the code is sent as
  the message prefix so clients can branch on it.
*/

class Error : public std::runtime_error {
 public:
  Error(std::string code, const std::string& detail);

  const std::string& code() const noexcept {
    return code_;
  }

 private:
  std::string code_;
};

// validation failures: INVALID_INTERVAL, INVALID_DEBTOR, INVALID_STATE, ...
class InvalidArgument : public Error {
 public:
  using Error::Error;
};

class NotFound : public Error {
 public:
  using Error::Error;
};

class PermissionDenied : public Error {
 public:
  using Error::Error;
};

// PLAN_NOT_ACTIVE, TENANT_INACTIVE
class InvalidState : public Error {
 public:
  using Error::Error;
};

// STATE_CHANGED_RETRY, BUSY
class ConcurrentModification : public Error {
 public:
  using Error::Error;
};

// Programming error: a transaction acquired row locks out of order.
class LockOrderViolation : public Error {
 public:
  using Error::Error;
};

class QuotaExceeded : public Error {
 public:
  QuotaExceeded(std::string metric, std::string tier, std::int64_t current, std::int64_t limit, std::int64_t projected);

  const std::string& metric() const noexcept {
    return metric_;
  }
  const std::string& tier() const noexcept {
    return tier_;
  }
  std::int64_t current() const noexcept {
    return current_;
  }
  std::int64_t limit() const noexcept {
    return limit_;
  }
  std::int64_t projected() const noexcept {
    return projected_;
  }

 private:
  std::string  metric_;
  std::string  tier_;
  std::int64_t current_;
  std::int64_t limit_;
  std::int64_t projected_;
};

// True when the caller may retry the whole operation unchanged.
bool IsRetryable(const std::exception& e);

} // namespace ledger::util
