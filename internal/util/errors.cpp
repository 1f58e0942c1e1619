#include "errors.hpp"

#include <utility>

namespace ledger::util {

namespace {

std::string Describe(const std::string& code, const std::string& detail) {
  if (detail.empty()) return code;
  return code + ": " + detail;
}

} // namespace

Error::Error(std::string code, const std::string& detail) : std::runtime_error(Describe(code, detail)), code_(std::move(code)) {
}

QuotaExceeded::QuotaExceeded(std::string metric, std::string tier, std::int64_t current, std::int64_t limit, std::int64_t projected)
    : Error("QUOTA_EXCEEDED_" + metric, "tier=" + tier + " current=" + std::to_string(current) + " limit=" + std::to_string(limit) +
                                            " projected=" + std::to_string(projected)),
      metric_(std::move(metric)),
      tier_(std::move(tier)),
      current_(current),
      limit_(limit),
      projected_(projected) {
}

bool IsRetryable(const std::exception& e) {
  return dynamic_cast<const ConcurrentModification*>(&e) != nullptr || dynamic_cast<const InvalidState*>(&e) != nullptr;
}

} // namespace ledger::util
