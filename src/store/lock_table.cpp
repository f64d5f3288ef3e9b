#include "netbackup/store/lock_table.hpp"
#include <boost/log/trivial.hpp>

namespace netbackup {
namespace store {

//==============================================
// GUARD
//==============================================

LockTable::Guard::Guard(LockTable* table, std::string key, std::shared_ptr<Entry> entry, bool exclusive)
  : table_(table)
  , key_(std::move(key))
  , entry_(std::move(entry))
  , exclusive_(exclusive) {
}

LockTable::Guard::Guard(Guard&& other) noexcept
  : table_(other.table_)
  , key_(std::move(other.key_))
  , entry_(std::move(other.entry_))
  , exclusive_(other.exclusive_) {
  other.table_ = nullptr;
}

LockTable::Guard::~Guard() {
  if (!table_ || !entry_) {
    return;
  }

  if (exclusive_) {
    entry_->mutex.unlock();
  } else {
    entry_->mutex.unlock_shared();
  }
  table_->release_entry(key_, entry_);
}


//==============================================
// LOCK ACQUISITION
//==============================================

LockTable::Guard LockTable::lock_exclusive(const std::string& key) {
  auto entry = acquire_entry(key);
  // Wait outside the table mutex so other keys stay available
  entry->mutex.lock();
  BOOST_LOG_TRIVIAL(trace) << "Lock table: Exclusive lock acquired for: " << key;
  return Guard(this, key, entry, true);
}

LockTable::Guard LockTable::lock_shared(const std::string& key) {
  auto entry = acquire_entry(key);
  entry->mutex.lock_shared();
  BOOST_LOG_TRIVIAL(trace) << "Lock table: Shared lock acquired for: " << key;
  return Guard(this, key, entry, false);
}


//==============================================
// QUERY METHODS
//==============================================

std::size_t LockTable::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}


//==============================================
// ENTRY BOOKKEEPING
//==============================================

std::shared_ptr<LockTable::Entry> LockTable::acquire_entry(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto& entry = entries_[key];
  if (!entry) {
    entry = std::make_shared<Entry>();
  }
  ++entry->users;
  return entry;
}

void LockTable::release_entry(const std::string& key, const std::shared_ptr<Entry>& entry) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (--entry->users == 0) {
    entries_.erase(key);
  }
}

} // namespace store
} // namespace netbackup
