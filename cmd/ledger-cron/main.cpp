#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/date.hpp"
#include "internal/util/time.hpp"

/*
  One-shot due-cycle run for an external cron trigger.

  Exit codes: 0 all plans processed, 1 usage, 2 fatal, 3 some plans failed.
*/

static void Usage() {
  std::cerr << "Usage: ledger-cron [--config <config.yaml>] [--today YYYY-MM-DD]" << std::endl;
}

int main(int argc, char** argv) {
  std::optional<std::string> config_path;
  std::optional<std::string> today_arg;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--today" && i + 1 < argc) {
      today_arg = argv[++i];
    } else {
      Usage();
      return 1;
    }
  }

  try {
    auto config = config_path ? ledger::config::ConfigLoader::LoadFromYaml(*config_path) : ledger::config::ConfigLoader::Defaults();

    ledger::observability::InitializeLogging(config);

    std::shared_ptr<ledger::util::Clock> clock;
    if (today_arg) {
      clock = std::make_shared<ledger::util::FixedClock>(ledger::util::ParseDate(*today_arg));
    } else {
      clock = std::make_shared<ledger::util::SystemClock>();
    }

    auto       app    = ledger::factory::Build(config, clock);
    const auto report = app.engine->RunDueCycles();

    std::cout << "examined=" << report.plans_examined << " processed=" << report.plans_processed << " skipped=" << report.plans_skipped
              << " failed=" << report.plans_failed << " cycles=" << report.cycles_materialized
              << " global_cap_reached=" << (report.global_cap_reached ? "true" : "false") << std::endl;

    ledger::observability::ShutdownLogging();
    return report.plans_failed > 0 ? 3 : 0;
  } catch (const std::exception& e) {
    LEDGER_LOG_ERROR("Fatal error", {ledger::observability::StringField("error", e.what())});
    ledger::observability::ShutdownLogging();
    return 2;
  }
}
