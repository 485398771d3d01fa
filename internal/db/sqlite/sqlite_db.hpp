#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

namespace streamledger::db::sqlite {

/*
  One ledger database connection. Statements are prepared per call by
  SqliteRepository; transactions serialize on the connection's tx mutex.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Execute without throwing; returns the sqlite result code.
  int TryExec(const std::string& sql) noexcept;

  // Configure PRAGMAs (journal mode, foreign keys, busy timeout)
  void Configure();

  // One transaction at a time per connection; held for the transaction's lifetime.
  std::unique_lock<std::mutex> LockTransaction() {
    return std::unique_lock<std::mutex>(tx_mutex_);
  }

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  bool        wal_mode_ = true;
  std::mutex  tx_mutex_;
};

} // namespace streamledger::db::sqlite
