#ifndef NETBACKUP_STORE_LOCK_TABLE_HPP
#define NETBACKUP_STORE_LOCK_TABLE_HPP

#include <cstddef>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace netbackup {
namespace store {

// Reader/writer locks keyed by filename. Entries exist only while some
// caller holds or waits for them, so unrelated names never contend.
class LockTable {
private:
  struct Entry {
    std::shared_mutex mutex;
    std::size_t users = 0;
  };

public:
  // Holds one key locked until destroyed
  class Guard {
  public:
    Guard(Guard&& other) noexcept;
    Guard& operator=(Guard&&) = delete;
    Guard(const Guard&) = delete;
    Guard& operator=(const Guard&) = delete;
    ~Guard();

  private:
    friend class LockTable;
    Guard(LockTable* table, std::string key, std::shared_ptr<Entry> entry, bool exclusive);

    LockTable* table_;
    std::string key_;
    std::shared_ptr<Entry> entry_;
    bool exclusive_;
  };

  LockTable() = default;
  LockTable(const LockTable&) = delete;
  LockTable& operator=(const LockTable&) = delete;


  // ---- LOCK ACQUISITION ----
  // Blocks until no other guard holds the key
  Guard lock_exclusive(const std::string& key);
  // Blocks only while an exclusive guard holds the key
  Guard lock_shared(const std::string& key);


  // ---- QUERY METHODS ----
  // Number of keys currently held or awaited
  std::size_t size() const;

private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;

  std::shared_ptr<Entry> acquire_entry(const std::string& key);
  void release_entry(const std::string& key, const std::shared_ptr<Entry>& entry);
};

} // namespace store
} // namespace netbackup

#endif // NETBACKUP_STORE_LOCK_TABLE_HPP
