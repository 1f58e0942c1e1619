#include "pg_repository.hpp"

#include <optional>
#include <stdexcept>
#include <string>

namespace ledger::db::postgres {

namespace {

constexpr const char* kPlanColumns =
    "id,tenant_id,owner_id,every,unit,start_date::text,next_due_date::text,status,terminated_at_ms,created_at_ms,updated_at_ms";

constexpr const char* kInstanceColumns =
    "id,plan_id,tenant_id,owner_id,due_date::text,total_amount_cents,status,created_at_ms,settled_at_ms";

constexpr const char* kChoreColumns =
    "id,tenant_id,every,unit,start_date::text,cursor::text,status,completed_at_ms,updated_at_ms";

std::optional<uint64_t> OptU64(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return f.as<uint64_t>();
}

template <typename T>
T ParseOrThrow(std::optional<T> value, const std::string& what, const std::string& raw) {
  if (!value.has_value()) throw std::runtime_error("corrupt " + what + " '" + raw + "'");
  return *value;
}

std::optional<std::string> OptDate(const std::optional<util::Date>& d) {
  if (!d.has_value()) return std::nullopt;
  return util::FormatDate(*d);
}

model::PlanRecord ReadPlan(const pqxx::row& row) {
  model::PlanRecord r;
  r.id               = row[0].as<std::string>();
  r.tenant_id        = row[1].as<std::string>();
  r.owner_id         = row[2].as<std::string>();
  r.interval.every   = row[3].as<int32_t>();
  r.interval.unit    = ParseOrThrow(ledger::model::ParseUnit(row[4].as<std::string>()), "interval unit", row[4].as<std::string>());
  r.start_date       = util::ParseDate(row[5].as<std::string>());
  r.next_due_date    = util::ParseDate(row[6].as<std::string>());
  r.status           = ParseOrThrow(ledger::model::ParsePlanStatus(row[7].as<std::string>()), "plan status", row[7].as<std::string>());
  r.terminated_at_ms = OptU64(row[8]);
  r.created_at_ms    = row[9].as<uint64_t>();
  r.updated_at_ms    = row[10].as<uint64_t>();
  return r;
}

model::InstanceRecord ReadInstance(const pqxx::row& row) {
  model::InstanceRecord r;
  r.id                 = row[0].as<std::string>();
  r.plan_id            = row[1].as<std::string>();
  r.tenant_id          = row[2].as<std::string>();
  r.owner_id           = row[3].as<std::string>();
  r.due_date           = util::ParseDate(row[4].as<std::string>());
  r.total_amount_cents = row[5].as<int64_t>();
  r.status             = ParseOrThrow(ledger::model::ParseInstanceStatus(row[6].as<std::string>()), "instance status", row[6].as<std::string>());
  r.created_at_ms      = row[7].as<uint64_t>();
  r.settled_at_ms      = OptU64(row[8]);
  return r;
}

model::InstanceShareRecord ReadInstanceShare(const pqxx::row& row) {
  model::InstanceShareRecord r;
  r.instance_id    = row[0].as<std::string>();
  r.participant_id = row[1].as<std::string>();
  r.amount_cents   = row[2].as<int64_t>();
  r.status         = ParseOrThrow(ledger::model::ParseShareStatus(row[3].as<std::string>()), "share status", row[3].as<std::string>());
  r.paid_at_ms     = OptU64(row[4]);
  return r;
}

model::ChoreRecord ReadChore(const pqxx::row& row) {
  model::ChoreRecord r;
  r.id        = row[0].as<std::string>();
  r.tenant_id = row[1].as<std::string>();
  if (!row[2].is_null()) {
    ledger::model::Interval interval;
    interval.every = row[2].as<int32_t>();
    interval.unit  = ParseOrThrow(ledger::model::ParseUnit(row[3].as<std::string>()), "interval unit", row[3].as<std::string>());
    r.interval     = interval;
  }
  r.start_date = util::ParseDate(row[4].as<std::string>());
  if (!row[5].is_null()) r.cursor = util::ParseDate(row[5].as<std::string>());
  r.status          = ParseOrThrow(ledger::model::ParseChoreStatus(row[6].as<std::string>()), "chore status", row[6].as<std::string>());
  r.completed_at_ms = OptU64(row[7]);
  r.updated_at_ms   = row[8].as<uint64_t>();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool, std::chrono::milliseconds lock_timeout)
    : pool_(std::move(pool)), lock_timeout_(lock_timeout) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_, lock_timeout_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (const auto* sql = dynamic_cast<const pqxx::sql_error*>(&e)) {
    const auto& state = sql->sqlstate();
    // lock_not_available (lock_timeout), deadlock_detected
    if (state == "55P03" || state == "40P01") return Result::Err(ErrorCode::Busy, e.what());
    if (state == "40001") return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Row locks
// ------------------------------------------------------------------

Result PgRepository::LockRow(Transaction& t, LockRank rank, const std::string& key, const std::string& sql, const std::string& id,
                             ErrorCode missing_code) {
  if (t.HoldsLock(key)) return Result::Ok();
  t.CheckLockOrder(rank, key);

  try {
    auto res = TX(t).Work().exec_params(sql, id);
    if (res.empty()) return Result::Err(missing_code, key);
  } catch (const std::exception& e) {
    return Translate(e);
  }
  t.NoteLockAcquired(rank, key);
  return Result::Ok();
}

Result PgRepository::LockTenant(Transaction& t, const std::string& tenant_id) {
  return LockRow(t, LockRank::kTenant, TenantLockKey(tenant_id), "SELECT id FROM tenants WHERE id=$1 FOR UPDATE", tenant_id,
                 ErrorCode::NotFound);
}

Result PgRepository::LockPlan(Transaction& t, const std::string& plan_id) {
  return LockRow(t, LockRank::kResource, PlanLockKey(plan_id), "SELECT id FROM recurring_plans WHERE id=$1 FOR UPDATE", plan_id,
                 ErrorCode::NotFound);
}

Result PgRepository::TryLockPlan(Transaction& t, const std::string& plan_id) {
  return LockRow(t, LockRank::kResource, PlanLockKey(plan_id), "SELECT id FROM recurring_plans WHERE id=$1 FOR UPDATE SKIP LOCKED",
                 plan_id, ErrorCode::Busy);
}

Result PgRepository::LockInstance(Transaction& t, const std::string& instance_id) {
  return LockRow(t, LockRank::kResource, InstanceLockKey(instance_id), "SELECT id FROM obligation_instances WHERE id=$1 FOR UPDATE",
                 instance_id, ErrorCode::NotFound);
}

Result PgRepository::LockChore(Transaction& t, const std::string& chore_id) {
  return LockRow(t, LockRank::kResource, ChoreLockKey(chore_id), "SELECT id FROM chores WHERE id=$1 FOR UPDATE", chore_id,
                 ErrorCode::NotFound);
}

Result PgRepository::LockLedger(Transaction& t, const std::string& tenant_id) {
  const auto key = LedgerLockKey(tenant_id);
  if (t.HoldsLock(key)) return Result::Ok();
  t.CheckLockOrder(LockRank::kLedger, key);

  try {
    TX(t).Work().exec_params("INSERT INTO usage_ledger(tenant_id,updated_at_ms) VALUES($1,0) ON CONFLICT(tenant_id) DO NOTHING", tenant_id);
  } catch (const std::exception& e) {
    return Translate(e);
  }
  return LockRow(t, LockRank::kLedger, key, "SELECT tenant_id FROM usage_ledger WHERE tenant_id=$1 FOR UPDATE", tenant_id,
                 ErrorCode::NotFound);
}

Result PgRepository::LockInstanceShares(Transaction& t, const std::string& instance_id) {
  const auto key = SharesLockKey(instance_id);
  if (t.HoldsLock(key)) return Result::Ok();
  t.CheckLockOrder(LockRank::kShares, key);

  try {
    // an instance without shares has nothing to lock
    TX(t).Work().exec_params("SELECT participant_id FROM instance_shares WHERE instance_id=$1 FOR UPDATE", instance_id);
  } catch (const std::exception& e) {
    return Translate(e);
  }
  t.NoteLockAcquired(LockRank::kShares, key);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Tenants
// ------------------------------------------------------------------

Result PgRepository::UpsertTenant(Transaction& t, const model::TenantRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO tenants(id,is_active,created_at_ms) VALUES($1,$2,$3) ON CONFLICT(id) DO UPDATE SET is_active=EXCLUDED.is_active",
        r.id, r.is_active, r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::TenantRecord> PgRepository::GetTenant(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_params("SELECT id,is_active,created_at_ms FROM tenants WHERE id=$1", id);
  if (res.empty()) return std::nullopt;

  model::TenantRecord r;
  r.id            = res[0][0].as<std::string>();
  r.is_active     = res[0][1].as<bool>();
  r.created_at_ms = res[0][2].as<uint64_t>();
  return r;
}

Result PgRepository::UpsertMembership(Transaction& t, const model::MembershipRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO memberships(tenant_id,participant_id,is_current,updated_at_ms) VALUES($1,$2,$3,$4) "
        "ON CONFLICT(tenant_id,participant_id) DO UPDATE SET is_current=EXCLUDED.is_current,updated_at_ms=EXCLUDED.updated_at_ms",
        r.tenant_id, r.participant_id, r.is_current, r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::MembershipRecord> PgRepository::GetMembership(Transaction& t, const std::string& tenant_id, const std::string& participant_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT tenant_id,participant_id,is_current,updated_at_ms FROM memberships WHERE tenant_id=$1 AND participant_id=$2", tenant_id,
      participant_id);
  if (res.empty()) return std::nullopt;

  model::MembershipRecord r;
  r.tenant_id      = res[0][0].as<std::string>();
  r.participant_id = res[0][1].as<std::string>();
  r.is_current     = res[0][2].as<bool>();
  r.updated_at_ms  = res[0][3].as<uint64_t>();
  return r;
}

Result PgRepository::UpsertEntitlement(Transaction& t, const model::EntitlementRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO entitlements(tenant_id,tier,expires_at_ms) VALUES($1,$2,$3) "
        "ON CONFLICT(tenant_id) DO UPDATE SET tier=EXCLUDED.tier,expires_at_ms=EXCLUDED.expires_at_ms",
        r.tenant_id, r.tier, r.expires_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::EntitlementRecord> PgRepository::GetEntitlement(Transaction& t, const std::string& tenant_id) {
  auto res = TX(t).Work().exec_params("SELECT tenant_id,tier,expires_at_ms FROM entitlements WHERE tenant_id=$1", tenant_id);
  if (res.empty()) return std::nullopt;

  model::EntitlementRecord r;
  r.tenant_id     = res[0][0].as<std::string>();
  r.tier          = res[0][1].as<std::string>();
  r.expires_at_ms = res[0][2].as<uint64_t>();
  return r;
}

// ------------------------------------------------------------------
// Ledger
// ------------------------------------------------------------------

std::optional<model::LedgerRecord> PgRepository::GetLedger(Transaction& t, const std::string& tenant_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT tenant_id,active_chores,chore_photos,active_members,active_expenses,item_photos,updated_at_ms FROM usage_ledger WHERE tenant_id=$1",
      tenant_id);
  if (res.empty()) return std::nullopt;

  model::LedgerRecord r;
  r.tenant_id = res[0][0].as<std::string>();
  for (std::size_t i = 0; i < ledger::model::kMetricCount; ++i) {
    r.counters.Set(ledger::model::kAllMetrics[i], res[0][static_cast<int>(i) + 1].as<int64_t>());
  }
  r.updated_at_ms = res[0][6].as<uint64_t>();
  return r;
}

Result PgRepository::UpsertLedger(Transaction& t, const model::LedgerRecord& r) {
  using ledger::model::Metric;
  try {
    TX(t).Work().exec_params(
        "INSERT INTO usage_ledger(tenant_id,active_chores,chore_photos,active_members,active_expenses,item_photos,updated_at_ms) "
        "VALUES($1,$2,$3,$4,$5,$6,$7) ON CONFLICT(tenant_id) DO UPDATE SET "
        "active_chores=EXCLUDED.active_chores,chore_photos=EXCLUDED.chore_photos,active_members=EXCLUDED.active_members,"
        "active_expenses=EXCLUDED.active_expenses,item_photos=EXCLUDED.item_photos,updated_at_ms=EXCLUDED.updated_at_ms",
        r.tenant_id, r.counters.Get(Metric::kActiveChores), r.counters.Get(Metric::kChorePhotos), r.counters.Get(Metric::kActiveMembers),
        r.counters.Get(Metric::kActiveExpenses), r.counters.Get(Metric::kItemPhotos), r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Plans
// ------------------------------------------------------------------

Result PgRepository::InsertPlan(Transaction& t, const model::PlanRecord& r, const std::vector<model::PlanShareRecord>& shares) {
  try {
    auto& work = TX(t).Work();
    work.exec_params(
        "INSERT INTO recurring_plans(id,tenant_id,owner_id,every,unit,start_date,next_due_date,status,terminated_at_ms,created_at_ms,updated_at_ms) "
        "VALUES($1,$2,$3,$4,$5,$6::date,$7::date,$8,$9,$10,$11)",
        r.id, r.tenant_id, r.owner_id, r.interval.every, std::string(ledger::model::UnitName(r.interval.unit)), util::FormatDate(r.start_date),
        util::FormatDate(r.next_due_date), std::string(ledger::model::StatusName(r.status)), r.terminated_at_ms, r.created_at_ms,
        r.updated_at_ms);
    for (const auto& share : shares) {
      work.exec_params("INSERT INTO plan_shares(plan_id,participant_id,amount_cents) VALUES($1,$2,$3)", r.id, share.participant_id,
                       share.amount_cents);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::PlanRecord> PgRepository::GetPlan(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kPlanColumns + " FROM recurring_plans WHERE id=$1", id);
  if (res.empty()) return std::nullopt;
  return ReadPlan(res[0]);
}

Result PgRepository::UpdatePlan(Transaction& t, const model::PlanRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE recurring_plans SET next_due_date=$2::date,status=$3,terminated_at_ms=$4,updated_at_ms=$5 WHERE id=$1", r.id,
        util::FormatDate(r.next_due_date), std::string(ledger::model::StatusName(r.status)), r.terminated_at_ms, r.updated_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "plan " + r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::PlanShareRecord> PgRepository::GetPlanShares(Transaction& t, const std::string& plan_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT plan_id,participant_id,amount_cents FROM plan_shares WHERE plan_id=$1 ORDER BY participant_id", plan_id);

  std::vector<model::PlanShareRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::PlanShareRecord r;
    r.plan_id        = row[0].as<std::string>();
    r.participant_id = row[1].as<std::string>();
    r.amount_cents   = row[2].as<int64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

std::vector<model::PlanRecord> PgRepository::ListDuePlans(Transaction& t, const util::Date& today, std::size_t limit) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kPlanColumns +
                                          " FROM recurring_plans WHERE status='active' AND next_due_date <= $1::date "
                                          "ORDER BY next_due_date, id LIMIT $2",
                                      util::FormatDate(today), static_cast<int64_t>(limit));

  std::vector<model::PlanRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadPlan(row));
  return out;
}

std::vector<model::PlanRecord> PgRepository::ListActivePlans(Transaction& t, const std::string& tenant_id) {
  auto res = TX(t).Work().exec_params(
      std::string("SELECT ") + kPlanColumns + " FROM recurring_plans WHERE tenant_id=$1 AND status='active' ORDER BY created_at_ms, id",
      tenant_id);

  std::vector<model::PlanRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadPlan(row));
  return out;
}

// ------------------------------------------------------------------
// Instances
// ------------------------------------------------------------------

Result PgRepository::InsertInstance(Transaction& t, const model::InstanceRecord& r) {
  try {
    // A unique violation aborts only the savepoint, so the caller can
    // re-read the winning row in the same transaction.
    pqxx::subtransaction sub(TX(t).Work(), "insert_instance");
    sub.exec_params(
        "INSERT INTO obligation_instances(id,plan_id,tenant_id,owner_id,due_date,total_amount_cents,status,created_at_ms,settled_at_ms) "
        "VALUES($1,$2,$3,$4,$5::date,$6,$7,$8,$9)",
        r.id, r.plan_id, r.tenant_id, r.owner_id, util::FormatDate(r.due_date), r.total_amount_cents,
        std::string(ledger::model::StatusName(r.status)), r.created_at_ms, r.settled_at_ms);
    sub.commit();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::InstanceRecord> PgRepository::GetInstance(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kInstanceColumns + " FROM obligation_instances WHERE id=$1", id);
  if (res.empty()) return std::nullopt;
  return ReadInstance(res[0]);
}

std::optional<model::InstanceRecord> PgRepository::FindInstance(Transaction& t, const std::string& plan_id, const util::Date& due_date) {
  auto res = TX(t).Work().exec_params(
      std::string("SELECT ") + kInstanceColumns + " FROM obligation_instances WHERE plan_id=$1 AND due_date=$2::date", plan_id,
      util::FormatDate(due_date));
  if (res.empty()) return std::nullopt;
  return ReadInstance(res[0]);
}

std::vector<model::InstanceRecord> PgRepository::ListInstances(Transaction& t, const std::string& plan_id) {
  auto res = TX(t).Work().exec_params(
      std::string("SELECT ") + kInstanceColumns + " FROM obligation_instances WHERE plan_id=$1 ORDER BY due_date", plan_id);

  std::vector<model::InstanceRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadInstance(row));
  return out;
}

Result PgRepository::UpdateInstance(Transaction& t, const model::InstanceRecord& r) {
  try {
    auto res = TX(t).Work().exec_params("UPDATE obligation_instances SET status=$2,settled_at_ms=$3 WHERE id=$1", r.id,
                                        std::string(ledger::model::StatusName(r.status)), r.settled_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "instance " + r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertInstanceShares(Transaction& t, const std::vector<model::InstanceShareRecord>& shares) {
  try {
    for (const auto& share : shares) {
      TX(t).Work().exec_params(
          "INSERT INTO instance_shares(instance_id,participant_id,amount_cents,status,paid_at_ms) VALUES($1,$2,$3,$4,$5)", share.instance_id,
          share.participant_id, share.amount_cents, std::string(ledger::model::StatusName(share.status)), share.paid_at_ms);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::InstanceShareRecord> PgRepository::GetInstanceShares(Transaction& t, const std::string& instance_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT instance_id,participant_id,amount_cents,status,paid_at_ms FROM instance_shares WHERE instance_id=$1 ORDER BY participant_id",
      instance_id);

  std::vector<model::InstanceShareRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadInstanceShare(row));
  return out;
}

Result PgRepository::UpdateInstanceShare(Transaction& t, const model::InstanceShareRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE instance_shares SET status=$3,paid_at_ms=$4 WHERE instance_id=$1 AND participant_id=$2", r.instance_id, r.participant_id,
        std::string(ledger::model::StatusName(r.status)), r.paid_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "share " + r.instance_id + "/" + r.participant_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Chores
// ------------------------------------------------------------------

Result PgRepository::InsertChore(Transaction& t, const model::ChoreRecord& r) {
  std::optional<int32_t>     every;
  std::optional<std::string> unit;
  if (r.interval.has_value()) {
    every = r.interval->every;
    unit  = std::string(ledger::model::UnitName(r.interval->unit));
  }

  try {
    TX(t).Work().exec_params(
        "INSERT INTO chores(id,tenant_id,every,unit,start_date,cursor,status,completed_at_ms,updated_at_ms) "
        "VALUES($1,$2,$3,$4,$5::date,$6::date,$7,$8,$9)",
        r.id, r.tenant_id, every, unit, util::FormatDate(r.start_date), OptDate(r.cursor), std::string(ledger::model::StatusName(r.status)),
        r.completed_at_ms, r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ChoreRecord> PgRepository::GetChore(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kChoreColumns + " FROM chores WHERE id=$1", id);
  if (res.empty()) return std::nullopt;
  return ReadChore(res[0]);
}

Result PgRepository::UpdateChore(Transaction& t, const model::ChoreRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE chores SET cursor=$2::date,status=$3,completed_at_ms=$4,updated_at_ms=$5 WHERE id=$1", r.id, OptDate(r.cursor),
        std::string(ledger::model::StatusName(r.status)), r.completed_at_ms, r.updated_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "chore " + r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace ledger::db::postgres
