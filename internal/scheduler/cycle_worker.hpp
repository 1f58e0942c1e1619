#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

namespace ledger::core {
class LedgerEngine;
}

namespace ledger::scheduler {

/*
  Background worker that runs the due-cycle catch-up.

  Executes:
      RunDueCycles(today) every interval, first run immediately
*/
class CycleWorker {
 public:
  CycleWorker(std::shared_ptr<ledger::core::LedgerEngine> engine, std::chrono::seconds interval);
  ~CycleWorker();

  void Start();
  void Stop();

  // Completed runs, including failed ones.
  std::uint64_t Runs() const {
    return runs_.load();
  }

 private:
  void Run();

  std::shared_ptr<ledger::core::LedgerEngine> engine_;
  std::chrono::seconds                        interval_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::atomic<uint64_t>   runs_{0};
};

} // namespace ledger::scheduler
