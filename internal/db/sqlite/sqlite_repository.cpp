#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "internal/db/sql/sql_queries.hpp"

namespace ledger::db::sqlite {

using ledger::db::ErrorCode;
using ledger::db::Result;

namespace {

// Prepared statement finalized on scope exit.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
      std::string msg = sqlite3_errmsg(db);
      if (st_) sqlite3_finalize(st_);
      throw std::runtime_error("sqlite prepare: " + msg);
    }
  }
  ~Statement() {
    sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return st_;
  }

  int Step() {
    return sqlite3_step(st_);
  }

  // Steps to completion; throws on anything but SQLITE_ROW/SQLITE_DONE.
  bool NextRow() {
    const int rc = sqlite3_step(st_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db_));
  }

 private:
  sqlite3*      db_;
  sqlite3_stmt* st_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, std::string_view s) {
  sqlite3_bind_text(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptU64(sqlite3_stmt* st, int idx, const std::optional<uint64_t>& v) {
  if (v.has_value()) {
    BindU64(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindDate(sqlite3_stmt* st, int idx, const util::Date& d) {
  BindText(st, idx, util::FormatDate(d));
}

void BindOptDate(sqlite3_stmt* st, int idx, const std::optional<util::Date>& d) {
  if (d.has_value()) {
    BindDate(st, idx, *d);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

bool ColNull(sqlite3_stmt* st, int col) {
  return sqlite3_column_type(st, col) == SQLITE_NULL;
}

std::optional<uint64_t> ColOptU64(sqlite3_stmt* st, int col) {
  if (ColNull(st, col)) return std::nullopt;
  return ColU64(st, col);
}

util::Date ColDate(sqlite3_stmt* st, int col) {
  return util::ParseDate(ColText(st, col));
}

template <typename T>
T ParseOrThrow(std::optional<T> value, const std::string& what, const std::string& raw) {
  if (!value.has_value()) throw std::runtime_error("corrupt " + what + " '" + raw + "'");
  return *value;
}

model::PlanRecord ReadPlan(sqlite3_stmt* st) {
  model::PlanRecord r;
  r.id                = ColText(st, 0);
  r.tenant_id         = ColText(st, 1);
  r.owner_id          = ColText(st, 2);
  r.interval.every    = static_cast<int32_t>(ColI64(st, 3));
  r.interval.unit     = ParseOrThrow(ledger::model::ParseUnit(ColText(st, 4)), "interval unit", ColText(st, 4));
  r.start_date        = ColDate(st, 5);
  r.next_due_date     = ColDate(st, 6);
  r.status            = ParseOrThrow(ledger::model::ParsePlanStatus(ColText(st, 7)), "plan status", ColText(st, 7));
  r.terminated_at_ms  = ColOptU64(st, 8);
  r.created_at_ms     = ColU64(st, 9);
  r.updated_at_ms     = ColU64(st, 10);
  return r;
}

model::InstanceRecord ReadInstance(sqlite3_stmt* st) {
  model::InstanceRecord r;
  r.id                 = ColText(st, 0);
  r.plan_id            = ColText(st, 1);
  r.tenant_id          = ColText(st, 2);
  r.owner_id           = ColText(st, 3);
  r.due_date           = ColDate(st, 4);
  r.total_amount_cents = ColI64(st, 5);
  r.status             = ParseOrThrow(ledger::model::ParseInstanceStatus(ColText(st, 6)), "instance status", ColText(st, 6));
  r.created_at_ms      = ColU64(st, 7);
  r.settled_at_ms      = ColOptU64(st, 8);
  return r;
}

model::InstanceShareRecord ReadInstanceShare(sqlite3_stmt* st) {
  model::InstanceShareRecord r;
  r.instance_id    = ColText(st, 0);
  r.participant_id = ColText(st, 1);
  r.amount_cents   = ColI64(st, 2);
  r.status         = ParseOrThrow(ledger::model::ParseShareStatus(ColText(st, 3)), "share status", ColText(st, 3));
  r.paid_at_ms     = ColOptU64(st, 4);
  return r;
}

model::ChoreRecord ReadChore(sqlite3_stmt* st) {
  model::ChoreRecord r;
  r.id        = ColText(st, 0);
  r.tenant_id = ColText(st, 1);
  if (!ColNull(st, 2)) {
    ledger::model::Interval interval;
    interval.every = static_cast<int32_t>(ColI64(st, 2));
    interval.unit  = ParseOrThrow(ledger::model::ParseUnit(ColText(st, 3)), "interval unit", ColText(st, 3));
    r.interval     = interval;
  }
  r.start_date = ColDate(st, 4);
  if (!ColNull(st, 5)) r.cursor = ColDate(st, 5);
  r.status          = ParseOrThrow(ledger::model::ParseChoreStatus(ColText(st, 6)), "chore status", ColText(st, 6));
  r.completed_at_ms = ColOptU64(st, 7);
  r.updated_at_ms   = ColU64(st, 8);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (const int extended = sqlite3_extended_errcode(db); extended == SQLITE_CONSTRAINT_UNIQUE || extended == SQLITE_CONSTRAINT_PRIMARYKEY) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Row locks
// ------------------------------------------------------------------

Result SqliteRepository::NoteLock(Transaction& t, LockRank rank, const std::string& key) {
  if (t.HoldsLock(key)) return Result::Ok();
  t.CheckLockOrder(rank, key);
  t.NoteLockAcquired(rank, key);
  return Result::Ok();
}

Result SqliteRepository::LockTenant(Transaction& t, const std::string& tenant_id) {
  if (!GetTenant(t, tenant_id).has_value()) return Result::Err(ErrorCode::NotFound, "tenant " + tenant_id);
  return NoteLock(t, LockRank::kTenant, TenantLockKey(tenant_id));
}

Result SqliteRepository::LockPlan(Transaction& t, const std::string& plan_id) {
  return NoteLock(t, LockRank::kResource, PlanLockKey(plan_id));
}

Result SqliteRepository::TryLockPlan(Transaction& t, const std::string& plan_id) {
  return NoteLock(t, LockRank::kResource, PlanLockKey(plan_id));
}

Result SqliteRepository::LockInstance(Transaction& t, const std::string& instance_id) {
  return NoteLock(t, LockRank::kResource, InstanceLockKey(instance_id));
}

Result SqliteRepository::LockChore(Transaction& t, const std::string& chore_id) {
  return NoteLock(t, LockRank::kResource, ChoreLockKey(chore_id));
}

Result SqliteRepository::LockLedger(Transaction& t, const std::string& tenant_id) {
  auto locked = NoteLock(t, LockRank::kLedger, LedgerLockKey(tenant_id));
  if (!locked) return locked;

  auto*     db = TX(t).Handle();
  Statement st(db, sql::ENSURE_LEDGER);
  BindText(st.get(), 1, tenant_id);
  BindU64(st.get(), 2, 0);
  return Translate(db, st.Step());
}

Result SqliteRepository::LockInstanceShares(Transaction& t, const std::string& instance_id) {
  return NoteLock(t, LockRank::kShares, SharesLockKey(instance_id));
}

// ------------------------------------------------------------------
// Tenants
// ------------------------------------------------------------------

Result SqliteRepository::UpsertTenant(Transaction& t, const model::TenantRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPSERT_TENANT);
  BindText(st.get(), 1, r.id);
  BindI64(st.get(), 2, r.is_active ? 1 : 0);
  BindU64(st.get(), 3, r.created_at_ms);
  return Translate(db, st.Step());
}

std::optional<model::TenantRecord> SqliteRepository::GetTenant(Transaction& t, const std::string& id) {
  Statement st(TX(t).Handle(), sql::SELECT_TENANT);
  BindText(st.get(), 1, id);
  if (!st.NextRow()) return std::nullopt;

  model::TenantRecord r;
  r.id            = ColText(st.get(), 0);
  r.is_active     = ColI64(st.get(), 1) != 0;
  r.created_at_ms = ColU64(st.get(), 2);
  return r;
}

Result SqliteRepository::UpsertMembership(Transaction& t, const model::MembershipRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPSERT_MEMBERSHIP);
  BindText(st.get(), 1, r.tenant_id);
  BindText(st.get(), 2, r.participant_id);
  BindI64(st.get(), 3, r.is_current ? 1 : 0);
  BindU64(st.get(), 4, r.updated_at_ms);
  return Translate(db, st.Step());
}

std::optional<model::MembershipRecord> SqliteRepository::GetMembership(Transaction& t, const std::string& tenant_id,
                                                                       const std::string& participant_id) {
  Statement st(TX(t).Handle(), sql::SELECT_MEMBERSHIP);
  BindText(st.get(), 1, tenant_id);
  BindText(st.get(), 2, participant_id);
  if (!st.NextRow()) return std::nullopt;

  model::MembershipRecord r;
  r.tenant_id      = ColText(st.get(), 0);
  r.participant_id = ColText(st.get(), 1);
  r.is_current     = ColI64(st.get(), 2) != 0;
  r.updated_at_ms  = ColU64(st.get(), 3);
  return r;
}

Result SqliteRepository::UpsertEntitlement(Transaction& t, const model::EntitlementRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPSERT_ENTITLEMENT);
  BindText(st.get(), 1, r.tenant_id);
  BindText(st.get(), 2, r.tier);
  BindU64(st.get(), 3, r.expires_at_ms);
  return Translate(db, st.Step());
}

std::optional<model::EntitlementRecord> SqliteRepository::GetEntitlement(Transaction& t, const std::string& tenant_id) {
  Statement st(TX(t).Handle(), sql::SELECT_ENTITLEMENT);
  BindText(st.get(), 1, tenant_id);
  if (!st.NextRow()) return std::nullopt;

  model::EntitlementRecord r;
  r.tenant_id     = ColText(st.get(), 0);
  r.tier          = ColText(st.get(), 1);
  r.expires_at_ms = ColU64(st.get(), 2);
  return r;
}

// ------------------------------------------------------------------
// Ledger
// ------------------------------------------------------------------

std::optional<model::LedgerRecord> SqliteRepository::GetLedger(Transaction& t, const std::string& tenant_id) {
  Statement st(TX(t).Handle(), sql::SELECT_LEDGER);
  BindText(st.get(), 1, tenant_id);
  if (!st.NextRow()) return std::nullopt;

  model::LedgerRecord r;
  r.tenant_id = ColText(st.get(), 0);
  for (std::size_t i = 0; i < ledger::model::kMetricCount; ++i) {
    r.counters.Set(ledger::model::kAllMetrics[i], ColI64(st.get(), static_cast<int>(i) + 1));
  }
  r.updated_at_ms = ColU64(st.get(), 6);
  return r;
}

Result SqliteRepository::UpsertLedger(Transaction& t, const model::LedgerRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPSERT_LEDGER);
  BindText(st.get(), 1, r.tenant_id);
  for (std::size_t i = 0; i < ledger::model::kMetricCount; ++i) {
    BindI64(st.get(), static_cast<int>(i) + 2, r.counters.Get(ledger::model::kAllMetrics[i]));
  }
  BindU64(st.get(), 7, r.updated_at_ms);
  return Translate(db, st.Step());
}

// ------------------------------------------------------------------
// Plans
// ------------------------------------------------------------------

Result SqliteRepository::InsertPlan(Transaction& t, const model::PlanRecord& r, const std::vector<model::PlanShareRecord>& shares) {
  auto* db = TX(t).Handle();
  {
    Statement st(db, sql::INSERT_PLAN);
    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, r.tenant_id);
    BindText(st.get(), 3, r.owner_id);
    BindI64(st.get(), 4, r.interval.every);
    BindText(st.get(), 5, ledger::model::UnitName(r.interval.unit));
    BindDate(st.get(), 6, r.start_date);
    BindDate(st.get(), 7, r.next_due_date);
    BindText(st.get(), 8, ledger::model::StatusName(r.status));
    BindOptU64(st.get(), 9, r.terminated_at_ms);
    BindU64(st.get(), 10, r.created_at_ms);
    BindU64(st.get(), 11, r.updated_at_ms);
    auto result = Translate(db, st.Step());
    if (!result) return result;
  }

  for (const auto& share : shares) {
    Statement st(db, sql::INSERT_PLAN_SHARE);
    BindText(st.get(), 1, r.id);
    BindText(st.get(), 2, share.participant_id);
    BindI64(st.get(), 3, share.amount_cents);
    auto result = Translate(db, st.Step());
    if (!result) return result;
  }
  return Result::Ok();
}

std::optional<model::PlanRecord> SqliteRepository::GetPlan(Transaction& t, const std::string& id) {
  Statement st(TX(t).Handle(), sql::SELECT_PLAN);
  BindText(st.get(), 1, id);
  if (!st.NextRow()) return std::nullopt;
  return ReadPlan(st.get());
}

Result SqliteRepository::UpdatePlan(Transaction& t, const model::PlanRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPDATE_PLAN);
  BindDate(st.get(), 1, r.next_due_date);
  BindText(st.get(), 2, ledger::model::StatusName(r.status));
  BindOptU64(st.get(), 3, r.terminated_at_ms);
  BindU64(st.get(), 4, r.updated_at_ms);
  BindText(st.get(), 5, r.id);

  auto result = Translate(db, st.Step());
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "plan " + r.id);
  return Result::Ok();
}

std::vector<model::PlanShareRecord> SqliteRepository::GetPlanShares(Transaction& t, const std::string& plan_id) {
  Statement st(TX(t).Handle(), sql::SELECT_PLAN_SHARES);
  BindText(st.get(), 1, plan_id);

  std::vector<model::PlanShareRecord> out;
  while (st.NextRow()) {
    model::PlanShareRecord r;
    r.plan_id        = ColText(st.get(), 0);
    r.participant_id = ColText(st.get(), 1);
    r.amount_cents   = ColI64(st.get(), 2);
    out.push_back(std::move(r));
  }
  return out;
}

std::vector<model::PlanRecord> SqliteRepository::ListDuePlans(Transaction& t, const util::Date& today, std::size_t limit) {
  Statement st(TX(t).Handle(), sql::SELECT_DUE_PLANS);
  BindDate(st.get(), 1, today);
  BindU64(st.get(), 2, limit);

  std::vector<model::PlanRecord> out;
  while (st.NextRow()) out.push_back(ReadPlan(st.get()));
  return out;
}

std::vector<model::PlanRecord> SqliteRepository::ListActivePlans(Transaction& t, const std::string& tenant_id) {
  Statement st(TX(t).Handle(), sql::SELECT_ACTIVE_PLANS);
  BindText(st.get(), 1, tenant_id);

  std::vector<model::PlanRecord> out;
  while (st.NextRow()) out.push_back(ReadPlan(st.get()));
  return out;
}

// ------------------------------------------------------------------
// Instances
// ------------------------------------------------------------------

Result SqliteRepository::InsertInstance(Transaction& t, const model::InstanceRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::INSERT_INSTANCE);
  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.plan_id);
  BindText(st.get(), 3, r.tenant_id);
  BindText(st.get(), 4, r.owner_id);
  BindDate(st.get(), 5, r.due_date);
  BindI64(st.get(), 6, r.total_amount_cents);
  BindText(st.get(), 7, ledger::model::StatusName(r.status));
  BindU64(st.get(), 8, r.created_at_ms);
  BindOptU64(st.get(), 9, r.settled_at_ms);
  return Translate(db, st.Step());
}

std::optional<model::InstanceRecord> SqliteRepository::GetInstance(Transaction& t, const std::string& id) {
  Statement st(TX(t).Handle(), sql::SELECT_INSTANCE);
  BindText(st.get(), 1, id);
  if (!st.NextRow()) return std::nullopt;
  return ReadInstance(st.get());
}

std::optional<model::InstanceRecord> SqliteRepository::FindInstance(Transaction& t, const std::string& plan_id, const util::Date& due_date) {
  Statement st(TX(t).Handle(), sql::SELECT_INSTANCE_BY_DUE);
  BindText(st.get(), 1, plan_id);
  BindDate(st.get(), 2, due_date);
  if (!st.NextRow()) return std::nullopt;
  return ReadInstance(st.get());
}

std::vector<model::InstanceRecord> SqliteRepository::ListInstances(Transaction& t, const std::string& plan_id) {
  Statement st(TX(t).Handle(), sql::SELECT_INSTANCES_FOR_PLAN);
  BindText(st.get(), 1, plan_id);

  std::vector<model::InstanceRecord> out;
  while (st.NextRow()) out.push_back(ReadInstance(st.get()));
  return out;
}

Result SqliteRepository::UpdateInstance(Transaction& t, const model::InstanceRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPDATE_INSTANCE);
  BindText(st.get(), 1, ledger::model::StatusName(r.status));
  BindOptU64(st.get(), 2, r.settled_at_ms);
  BindText(st.get(), 3, r.id);

  auto result = Translate(db, st.Step());
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "instance " + r.id);
  return Result::Ok();
}

Result SqliteRepository::InsertInstanceShares(Transaction& t, const std::vector<model::InstanceShareRecord>& shares) {
  auto* db = TX(t).Handle();
  for (const auto& share : shares) {
    Statement st(db, sql::INSERT_INSTANCE_SHARE);
    BindText(st.get(), 1, share.instance_id);
    BindText(st.get(), 2, share.participant_id);
    BindI64(st.get(), 3, share.amount_cents);
    BindText(st.get(), 4, ledger::model::StatusName(share.status));
    BindOptU64(st.get(), 5, share.paid_at_ms);
    auto result = Translate(db, st.Step());
    if (!result) return result;
  }
  return Result::Ok();
}

std::vector<model::InstanceShareRecord> SqliteRepository::GetInstanceShares(Transaction& t, const std::string& instance_id) {
  Statement st(TX(t).Handle(), sql::SELECT_INSTANCE_SHARES);
  BindText(st.get(), 1, instance_id);

  std::vector<model::InstanceShareRecord> out;
  while (st.NextRow()) out.push_back(ReadInstanceShare(st.get()));
  return out;
}

Result SqliteRepository::UpdateInstanceShare(Transaction& t, const model::InstanceShareRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPDATE_INSTANCE_SHARE);
  BindText(st.get(), 1, ledger::model::StatusName(r.status));
  BindOptU64(st.get(), 2, r.paid_at_ms);
  BindText(st.get(), 3, r.instance_id);
  BindText(st.get(), 4, r.participant_id);

  auto result = Translate(db, st.Step());
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "share " + r.instance_id + "/" + r.participant_id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Chores
// ------------------------------------------------------------------

Result SqliteRepository::InsertChore(Transaction& t, const model::ChoreRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::INSERT_CHORE);
  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.tenant_id);
  if (r.interval.has_value()) {
    BindI64(st.get(), 3, r.interval->every);
    BindText(st.get(), 4, ledger::model::UnitName(r.interval->unit));
  } else {
    sqlite3_bind_null(st.get(), 3);
    sqlite3_bind_null(st.get(), 4);
  }
  BindDate(st.get(), 5, r.start_date);
  BindOptDate(st.get(), 6, r.cursor);
  BindText(st.get(), 7, ledger::model::StatusName(r.status));
  BindOptU64(st.get(), 8, r.completed_at_ms);
  BindU64(st.get(), 9, r.updated_at_ms);
  return Translate(db, st.Step());
}

std::optional<model::ChoreRecord> SqliteRepository::GetChore(Transaction& t, const std::string& id) {
  Statement st(TX(t).Handle(), sql::SELECT_CHORE);
  BindText(st.get(), 1, id);
  if (!st.NextRow()) return std::nullopt;
  return ReadChore(st.get());
}

Result SqliteRepository::UpdateChore(Transaction& t, const model::ChoreRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPDATE_CHORE);
  BindOptDate(st.get(), 1, r.cursor);
  BindText(st.get(), 2, ledger::model::StatusName(r.status));
  BindOptU64(st.get(), 3, r.completed_at_ms);
  BindU64(st.get(), 4, r.updated_at_ms);
  BindText(st.get(), 5, r.id);

  auto result = Translate(db, st.Step());
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "chore " + r.id);
  return Result::Ok();
}

} // namespace ledger::db::sqlite
