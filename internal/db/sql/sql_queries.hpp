#pragma once

namespace ledger::db::sql {

/*
  SQLite statements (positional ? parameters).

  Column order of every SELECT matches the row readers in
  sqlite_repository.cpp.
*/

// tenants

static constexpr const char* UPSERT_TENANT =
    "INSERT INTO tenants(id,is_active,created_at_ms) VALUES(?,?,?)"
    " ON CONFLICT(id) DO UPDATE SET is_active=excluded.is_active;";

static constexpr const char* SELECT_TENANT =
    "SELECT id,is_active,created_at_ms FROM tenants WHERE id=?;";

static constexpr const char* UPSERT_MEMBERSHIP =
    "INSERT INTO memberships(tenant_id,participant_id,is_current,updated_at_ms) VALUES(?,?,?,?)"
    " ON CONFLICT(tenant_id,participant_id) DO UPDATE SET"
    " is_current=excluded.is_current, updated_at_ms=excluded.updated_at_ms;";

static constexpr const char* SELECT_MEMBERSHIP =
    "SELECT tenant_id,participant_id,is_current,updated_at_ms"
    " FROM memberships WHERE tenant_id=? AND participant_id=?;";

static constexpr const char* UPSERT_ENTITLEMENT =
    "INSERT INTO entitlements(tenant_id,tier,expires_at_ms) VALUES(?,?,?)"
    " ON CONFLICT(tenant_id) DO UPDATE SET tier=excluded.tier, expires_at_ms=excluded.expires_at_ms;";

static constexpr const char* SELECT_ENTITLEMENT =
    "SELECT tenant_id,tier,expires_at_ms FROM entitlements WHERE tenant_id=?;";

// ledger

static constexpr const char* ENSURE_LEDGER =
    "INSERT OR IGNORE INTO usage_ledger(tenant_id,updated_at_ms) VALUES(?,?);";

static constexpr const char* UPSERT_LEDGER =
    "INSERT INTO usage_ledger(tenant_id,active_chores,chore_photos,active_members,active_expenses,item_photos,updated_at_ms)"
    " VALUES(?,?,?,?,?,?,?)"
    " ON CONFLICT(tenant_id) DO UPDATE SET"
    " active_chores=excluded.active_chores,"
    " chore_photos=excluded.chore_photos,"
    " active_members=excluded.active_members,"
    " active_expenses=excluded.active_expenses,"
    " item_photos=excluded.item_photos,"
    " updated_at_ms=excluded.updated_at_ms;";

static constexpr const char* SELECT_LEDGER =
    "SELECT tenant_id,active_chores,chore_photos,active_members,active_expenses,item_photos,updated_at_ms"
    " FROM usage_ledger WHERE tenant_id=?;";

// plans

#define LEDGER_PLAN_COLUMNS \
  "id,tenant_id,owner_id,every,unit,start_date,next_due_date,status,terminated_at_ms,created_at_ms,updated_at_ms"

static constexpr const char* INSERT_PLAN =
    "INSERT INTO recurring_plans(" LEDGER_PLAN_COLUMNS ") VALUES(?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_PLAN =
    "SELECT " LEDGER_PLAN_COLUMNS " FROM recurring_plans WHERE id=?;";

static constexpr const char* UPDATE_PLAN =
    "UPDATE recurring_plans SET next_due_date=?,status=?,terminated_at_ms=?,updated_at_ms=? WHERE id=?;";

static constexpr const char* SELECT_DUE_PLANS =
    "SELECT " LEDGER_PLAN_COLUMNS " FROM recurring_plans"
    " WHERE status='active' AND next_due_date<=? ORDER BY next_due_date, id LIMIT ?;";

static constexpr const char* SELECT_ACTIVE_PLANS =
    "SELECT " LEDGER_PLAN_COLUMNS " FROM recurring_plans"
    " WHERE tenant_id=? AND status='active' ORDER BY created_at_ms, id;";

static constexpr const char* INSERT_PLAN_SHARE =
    "INSERT INTO plan_shares(plan_id,participant_id,amount_cents) VALUES(?,?,?);";

static constexpr const char* SELECT_PLAN_SHARES =
    "SELECT plan_id,participant_id,amount_cents FROM plan_shares WHERE plan_id=? ORDER BY participant_id;";

// instances

#define LEDGER_INSTANCE_COLUMNS \
  "id,plan_id,tenant_id,owner_id,due_date,total_amount_cents,status,created_at_ms,settled_at_ms"

static constexpr const char* INSERT_INSTANCE =
    "INSERT INTO obligation_instances(" LEDGER_INSTANCE_COLUMNS ") VALUES(?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_INSTANCE =
    "SELECT " LEDGER_INSTANCE_COLUMNS " FROM obligation_instances WHERE id=?;";

static constexpr const char* SELECT_INSTANCE_BY_DUE =
    "SELECT " LEDGER_INSTANCE_COLUMNS " FROM obligation_instances WHERE plan_id=? AND due_date=?;";

static constexpr const char* SELECT_INSTANCES_FOR_PLAN =
    "SELECT " LEDGER_INSTANCE_COLUMNS " FROM obligation_instances WHERE plan_id=? ORDER BY due_date;";

static constexpr const char* UPDATE_INSTANCE =
    "UPDATE obligation_instances SET status=?,settled_at_ms=? WHERE id=?;";

static constexpr const char* INSERT_INSTANCE_SHARE =
    "INSERT INTO instance_shares(instance_id,participant_id,amount_cents,status,paid_at_ms) VALUES(?,?,?,?,?);";

static constexpr const char* SELECT_INSTANCE_SHARES =
    "SELECT instance_id,participant_id,amount_cents,status,paid_at_ms"
    " FROM instance_shares WHERE instance_id=? ORDER BY participant_id;";

static constexpr const char* UPDATE_INSTANCE_SHARE =
    "UPDATE instance_shares SET status=?,paid_at_ms=? WHERE instance_id=? AND participant_id=?;";

// chores

#define LEDGER_CHORE_COLUMNS \
  "id,tenant_id,every,unit,start_date,cursor,status,completed_at_ms,updated_at_ms"

static constexpr const char* INSERT_CHORE =
    "INSERT INTO chores(" LEDGER_CHORE_COLUMNS ") VALUES(?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_CHORE =
    "SELECT " LEDGER_CHORE_COLUMNS " FROM chores WHERE id=?;";

static constexpr const char* UPDATE_CHORE =
    "UPDATE chores SET cursor=?,status=?,completed_at_ms=?,updated_at_ms=? WHERE id=?;";

#undef LEDGER_PLAN_COLUMNS
#undef LEDGER_INSTANCE_COLUMNS
#undef LEDGER_CHORE_COLUMNS

} // namespace ledger::db::sql
