#include "internal/db/api/repository.hpp"

namespace ledger::db {

std::string TenantLockKey(const std::string& tenant_id) {
  return "tenant:" + tenant_id;
}

std::string PlanLockKey(const std::string& plan_id) {
  return "plan:" + plan_id;
}

std::string InstanceLockKey(const std::string& instance_id) {
  return "instance:" + instance_id;
}

std::string ChoreLockKey(const std::string& chore_id) {
  return "chore:" + chore_id;
}

std::string LedgerLockKey(const std::string& tenant_id) {
  return "ledger:" + tenant_id;
}

std::string SharesLockKey(const std::string& instance_id) {
  return "shares:" + instance_id;
}

} // namespace ledger::db
