#include "row_lock_table.hpp"

namespace ledger::db::memory {

RowLockTable::RowLockTable(std::chrono::milliseconds timeout) : timeout_(timeout) {
}

bool RowLockTable::Acquire(const std::string& key, uint64_t owner, bool wait) {
  std::unique_lock lock(mutex_);

  auto available = [&] {
    auto it = owners_.find(key);
    return it == owners_.end() || it->second == owner;
  };

  if (!available()) {
    if (!wait) return false;
    if (!released_.wait_for(lock, timeout_, available)) return false;
  }

  auto [it, inserted] = owners_.emplace(key, owner);
  if (inserted) held_by_[owner].push_back(key);
  return true;
}

void RowLockTable::ReleaseAll(uint64_t owner) {
  {
    std::lock_guard lock(mutex_);
    auto it = held_by_.find(owner);
    if (it == held_by_.end()) return;
    for (const auto& key : it->second) {
      owners_.erase(key);
    }
    held_by_.erase(it);
  }
  released_.notify_all();
}

std::size_t RowLockTable::HeldCount() const {
  std::lock_guard lock(mutex_);
  return owners_.size();
}

} // namespace ledger::db::memory
