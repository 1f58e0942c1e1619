#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ledger::db::memory {

/*
  Exclusive row locks keyed by string ("tenant:<id>", "plan:<id>", ...).

  Owners are transaction ids. A lock is reentrant for its owner and is
  only released in bulk when the owning transaction ends.
*/
class RowLockTable {
 public:
  explicit RowLockTable(std::chrono::milliseconds timeout);

  // wait=false fails immediately when another owner holds the row;
  // wait=true blocks up to the timeout.
  bool Acquire(const std::string& key, uint64_t owner, bool wait);

  void ReleaseAll(uint64_t owner);

  std::size_t HeldCount() const;

 private:
  std::chrono::milliseconds timeout_;

  mutable std::mutex                                     mutex_;
  std::condition_variable                                released_;
  std::unordered_map<std::string, uint64_t>              owners_;
  std::unordered_map<uint64_t, std::vector<std::string>> held_by_;
};

} // namespace ledger::db::memory
