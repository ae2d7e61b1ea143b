#pragma once

#include <sqlite3.h>

#include <atomic>
#include <cstdint>
#include <mutex>
#include <memory>
#include <string>
#include <vector>

namespace telemux::store::detail {

// RAII wrapper for sqlite3_stmt*
class StmtGuard {
 public:
  StmtGuard() = default;
  explicit StmtGuard(sqlite3_stmt* stmt) : stmt_(stmt) {}
  ~StmtGuard();

  StmtGuard(const StmtGuard&) = delete;
  StmtGuard& operator=(const StmtGuard&) = delete;
  StmtGuard(StmtGuard&& other) noexcept : stmt_(other.stmt_) { other.stmt_ = nullptr; }
  StmtGuard& operator=(StmtGuard&& other) noexcept;

  sqlite3_stmt* get() const { return stmt_; }

 private:
  sqlite3_stmt* stmt_{nullptr};
};

struct ConnectionOptions {
  std::string path;
  int busy_timeout_ms{5000};
  std::string journal_mode{"WAL"};
  std::string synchronous{"NORMAL"};
};

// One sqlite3 handle. Not thread safe; callers hold lock() while using it.
class Connection {
 public:
  explicit Connection(const ConnectionOptions& options);
  ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  void exec(const std::string& sql);
  StmtGuard prepare(const char* sql);

  // Step expecting SQLITE_DONE
  void step_done(sqlite3_stmt* stmt);
  // Step expecting SQLITE_ROW or SQLITE_DONE; returns true on a row
  bool step_row(sqlite3_stmt* stmt);

  void bind_text(sqlite3_stmt* stmt, int index, const std::string& value);
  void bind_blob(sqlite3_stmt* stmt, int index, const std::vector<uint8_t>& value);
  void bind_int64(sqlite3_stmt* stmt, int index, int64_t value);
  // Binds NULL for an empty string
  void bind_text_or_null(sqlite3_stmt* stmt, int index, const std::string& value);

  [[nodiscard]] int changes() const;
  [[nodiscard]] std::mutex& mutex() { return mutex_; }

 private:
  sqlite3* db_{nullptr};
  std::mutex mutex_;

  [[noreturn]] void fail(const std::string& context) const;
};

// Fixed set of connections to one database file. Each caller takes one
// connection for the duration of a transaction.
class ConnectionPool {
 public:
  ConnectionPool(const ConnectionOptions& options, size_t size);

  class Lease {
   public:
    Lease(Connection& conn, std::unique_lock<std::mutex> lock)
        : conn_(conn), lock_(std::move(lock)) {}
    Connection* operator->() { return &conn_; }
    Connection& operator*() { return conn_; }

   private:
    Connection& conn_;
    std::unique_lock<std::mutex> lock_;
  };

  Lease acquire();

 private:
  std::vector<std::unique_ptr<Connection>> connections_;
  std::atomic<size_t> next_{0};
};

// BEGIN IMMEDIATE ... COMMIT; rolls back if commit() was not reached
class Transaction {
 public:
  explicit Transaction(Connection& conn);
  ~Transaction();

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  void commit();

 private:
  Connection& conn_;
  bool done_{false};
};

std::string column_text(sqlite3_stmt* stmt, int column);
std::vector<uint8_t> column_blob(sqlite3_stmt* stmt, int column);

}  // namespace telemux::store::detail
