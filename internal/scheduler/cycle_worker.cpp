#include "cycle_worker.hpp"

#include <exception>

#include "internal/core/ledger_engine.hpp"
#include "internal/observability/logging.hpp"

namespace ledger::scheduler {

CycleWorker::CycleWorker(std::shared_ptr<ledger::core::LedgerEngine> engine, std::chrono::seconds interval)
    : engine_(std::move(engine)), interval_(interval) {
}

CycleWorker::~CycleWorker() {
  Stop();
}

void CycleWorker::Start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread(&CycleWorker::Run, this);
}

void CycleWorker::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void CycleWorker::Run() {
  while (running_) {
    try {
      engine_->RunDueCycles();
    } catch (const std::exception& e) {
      LEDGER_LOG_ERROR("cycle worker run failed", {observability::StringField("error", e.what())});
    }
    ++runs_;

    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, interval_, [this] { return !running_; });
  }
}

} // namespace ledger::scheduler
