#include "internal/db/sql/migrations.hpp"

#include <stdexcept>

namespace ledger::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (std::size_t i = 0; i < ordered_sql.size(); ++i) {
    try {
      executor.ExecuteSQL(ordered_sql[i]);
    } catch (const std::exception& e) {
      throw std::runtime_error("migration " + std::to_string(i + 1) + " failed: " + e.what());
    }
  }
}

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS tenants (id TEXT PRIMARY KEY, is_active INTEGER NOT NULL DEFAULT 1, created_at_ms INTEGER NOT NULL DEFAULT 0);",
      "CREATE TABLE IF NOT EXISTS memberships (tenant_id TEXT NOT NULL REFERENCES tenants(id), participant_id TEXT NOT NULL, is_current INTEGER NOT NULL DEFAULT 1, updated_at_ms INTEGER NOT NULL DEFAULT 0, PRIMARY KEY (tenant_id, participant_id));",
      "CREATE TABLE IF NOT EXISTS entitlements (tenant_id TEXT PRIMARY KEY REFERENCES tenants(id), tier TEXT NOT NULL, expires_at_ms INTEGER NOT NULL DEFAULT 0);",
      "CREATE TABLE IF NOT EXISTS usage_ledger (tenant_id TEXT PRIMARY KEY REFERENCES tenants(id), "
      "active_chores INTEGER NOT NULL DEFAULT 0 CHECK (active_chores >= 0), "
      "chore_photos INTEGER NOT NULL DEFAULT 0 CHECK (chore_photos >= 0), "
      "active_members INTEGER NOT NULL DEFAULT 0 CHECK (active_members >= 0), "
      "active_expenses INTEGER NOT NULL DEFAULT 0 CHECK (active_expenses >= 0), "
      "item_photos INTEGER NOT NULL DEFAULT 0 CHECK (item_photos >= 0), "
      "updated_at_ms INTEGER NOT NULL DEFAULT 0);",
      "CREATE TABLE IF NOT EXISTS recurring_plans (id TEXT PRIMARY KEY, tenant_id TEXT NOT NULL REFERENCES tenants(id), owner_id TEXT NOT NULL, "
      "every INTEGER NOT NULL CHECK (every >= 1), unit TEXT NOT NULL CHECK (unit IN ('day','week','month','year')), "
      "start_date TEXT NOT NULL, next_due_date TEXT NOT NULL, status TEXT NOT NULL CHECK (status IN ('active','terminated')), "
      "terminated_at_ms INTEGER, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, "
      "CHECK (next_due_date >= start_date), CHECK ((status = 'terminated') = (terminated_at_ms IS NOT NULL)));",
      "CREATE INDEX IF NOT EXISTS recurring_plans_due ON recurring_plans(status, next_due_date);",
      "CREATE TABLE IF NOT EXISTS plan_shares (plan_id TEXT NOT NULL REFERENCES recurring_plans(id), participant_id TEXT NOT NULL, "
      "amount_cents INTEGER NOT NULL CHECK (amount_cents > 0), PRIMARY KEY (plan_id, participant_id));",
      "CREATE TABLE IF NOT EXISTS obligation_instances (id TEXT PRIMARY KEY, plan_id TEXT NOT NULL REFERENCES recurring_plans(id), "
      "tenant_id TEXT NOT NULL, owner_id TEXT NOT NULL, due_date TEXT NOT NULL, total_amount_cents INTEGER NOT NULL CHECK (total_amount_cents > 0), "
      "status TEXT NOT NULL CHECK (status IN ('active','settled')), created_at_ms INTEGER NOT NULL, settled_at_ms INTEGER);",
      "CREATE UNIQUE INDEX IF NOT EXISTS obligation_instances_plan_due ON obligation_instances(plan_id, due_date);",
      "CREATE TABLE IF NOT EXISTS instance_shares (instance_id TEXT NOT NULL REFERENCES obligation_instances(id), participant_id TEXT NOT NULL, "
      "amount_cents INTEGER NOT NULL CHECK (amount_cents > 0), status TEXT NOT NULL CHECK (status IN ('unpaid','paid')), paid_at_ms INTEGER, "
      "PRIMARY KEY (instance_id, participant_id));",
      "CREATE TABLE IF NOT EXISTS chores (id TEXT PRIMARY KEY, tenant_id TEXT NOT NULL REFERENCES tenants(id), every INTEGER CHECK (every IS NULL OR every >= 1), "
      "unit TEXT CHECK (unit IS NULL OR unit IN ('day','week','month','year')), start_date TEXT NOT NULL, cursor TEXT, "
      "status TEXT NOT NULL CHECK (status IN ('draft','active','completed','cancelled')), completed_at_ms INTEGER, updated_at_ms INTEGER NOT NULL, "
      "CHECK ((every IS NULL) = (unit IS NULL)));"};
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS tenants (id TEXT PRIMARY KEY, is_active BOOLEAN NOT NULL DEFAULT TRUE, created_at_ms BIGINT NOT NULL DEFAULT 0);",
      "CREATE TABLE IF NOT EXISTS memberships (tenant_id TEXT NOT NULL REFERENCES tenants(id), participant_id TEXT NOT NULL, is_current BOOLEAN NOT NULL DEFAULT TRUE, updated_at_ms BIGINT NOT NULL DEFAULT 0, PRIMARY KEY (tenant_id, participant_id));",
      "CREATE TABLE IF NOT EXISTS entitlements (tenant_id TEXT PRIMARY KEY REFERENCES tenants(id), tier TEXT NOT NULL, expires_at_ms BIGINT NOT NULL DEFAULT 0);",
      "CREATE TABLE IF NOT EXISTS usage_ledger (tenant_id TEXT PRIMARY KEY REFERENCES tenants(id), "
      "active_chores BIGINT NOT NULL DEFAULT 0 CHECK (active_chores >= 0), "
      "chore_photos BIGINT NOT NULL DEFAULT 0 CHECK (chore_photos >= 0), "
      "active_members BIGINT NOT NULL DEFAULT 0 CHECK (active_members >= 0), "
      "active_expenses BIGINT NOT NULL DEFAULT 0 CHECK (active_expenses >= 0), "
      "item_photos BIGINT NOT NULL DEFAULT 0 CHECK (item_photos >= 0), "
      "updated_at_ms BIGINT NOT NULL DEFAULT 0);",
      "CREATE TABLE IF NOT EXISTS recurring_plans (id TEXT PRIMARY KEY, tenant_id TEXT NOT NULL REFERENCES tenants(id), owner_id TEXT NOT NULL, "
      "every INTEGER NOT NULL CHECK (every >= 1), unit TEXT NOT NULL CHECK (unit IN ('day','week','month','year')), "
      "start_date DATE NOT NULL, next_due_date DATE NOT NULL, status TEXT NOT NULL CHECK (status IN ('active','terminated')), "
      "terminated_at_ms BIGINT, created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL, "
      "CHECK (next_due_date >= start_date), CHECK ((status = 'terminated') = (terminated_at_ms IS NOT NULL)));",
      "CREATE INDEX IF NOT EXISTS recurring_plans_due ON recurring_plans(next_due_date) WHERE status = 'active';",
      "CREATE TABLE IF NOT EXISTS plan_shares (plan_id TEXT NOT NULL REFERENCES recurring_plans(id), participant_id TEXT NOT NULL, "
      "amount_cents BIGINT NOT NULL CHECK (amount_cents > 0), PRIMARY KEY (plan_id, participant_id));",
      "CREATE TABLE IF NOT EXISTS obligation_instances (id TEXT PRIMARY KEY, plan_id TEXT NOT NULL REFERENCES recurring_plans(id), "
      "tenant_id TEXT NOT NULL, owner_id TEXT NOT NULL, due_date DATE NOT NULL, total_amount_cents BIGINT NOT NULL CHECK (total_amount_cents > 0), "
      "status TEXT NOT NULL CHECK (status IN ('active','settled')), created_at_ms BIGINT NOT NULL, settled_at_ms BIGINT);",
      "CREATE UNIQUE INDEX IF NOT EXISTS obligation_instances_plan_due ON obligation_instances(plan_id, due_date);",
      "CREATE TABLE IF NOT EXISTS instance_shares (instance_id TEXT NOT NULL REFERENCES obligation_instances(id), participant_id TEXT NOT NULL, "
      "amount_cents BIGINT NOT NULL CHECK (amount_cents > 0), status TEXT NOT NULL CHECK (status IN ('unpaid','paid')), paid_at_ms BIGINT, "
      "PRIMARY KEY (instance_id, participant_id));",
      "CREATE TABLE IF NOT EXISTS chores (id TEXT PRIMARY KEY, tenant_id TEXT NOT NULL REFERENCES tenants(id), every INTEGER CHECK (every IS NULL OR every >= 1), "
      "unit TEXT CHECK (unit IS NULL OR unit IN ('day','week','month','year')), start_date DATE NOT NULL, cursor DATE, "
      "status TEXT NOT NULL CHECK (status IN ('draft','active','completed','cancelled')), completed_at_ms BIGINT, updated_at_ms BIGINT NOT NULL, "
      "CHECK ((every IS NULL) = (unit IS NULL)));"};
  return kSchema;
}

} // namespace ledger::db::sql
