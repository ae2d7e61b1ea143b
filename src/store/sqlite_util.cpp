#include "store/sqlite_util.h"

#include <spdlog/spdlog.h>

#include "telemux/store/chunk_store.hpp"

namespace telemux::store::detail {

StmtGuard::~StmtGuard() {
  if (stmt_ != nullptr) {
    sqlite3_finalize(stmt_);
  }
}

StmtGuard& StmtGuard::operator=(StmtGuard&& other) noexcept {
  if (this != &other) {
    if (stmt_ != nullptr) {
      sqlite3_finalize(stmt_);
    }
    stmt_ = other.stmt_;
    other.stmt_ = nullptr;
  }
  return *this;
}

Connection::Connection(const ConnectionOptions& options) {
  int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX;
  int rc = sqlite3_open_v2(options.path.c_str(), &db_, flags, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = db_ != nullptr ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    sqlite3_close(db_);
    db_ = nullptr;
    throw StoreError("failed to open " + options.path + ": " + msg);
  }

  sqlite3_busy_timeout(db_, options.busy_timeout_ms);
  try {
    exec("PRAGMA journal_mode = " + options.journal_mode + ";");
    exec("PRAGMA synchronous = " + options.synchronous + ";");
  } catch (const StoreError&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

Connection::~Connection() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

void Connection::fail(const std::string& context) const {
  throw StoreError(context + ": " + sqlite3_errmsg(db_));
}

void Connection::exec(const std::string& sql) {
  char* err = nullptr;
  int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err != nullptr ? err : "unknown error";
    sqlite3_free(err);
    throw StoreError("exec failed: " + msg);
  }
}

StmtGuard Connection::prepare(const char* sql) {
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    fail("prepare failed");
  }
  return StmtGuard(stmt);
}

void Connection::step_done(sqlite3_stmt* stmt) {
  if (sqlite3_step(stmt) != SQLITE_DONE) {
    fail("step failed");
  }
}

bool Connection::step_row(sqlite3_stmt* stmt) {
  int rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    return true;
  }
  if (rc != SQLITE_DONE) {
    fail("step failed");
  }
  return false;
}

void Connection::bind_text(sqlite3_stmt* stmt, int index, const std::string& value) {
  if (sqlite3_bind_text(stmt, index, value.data(), static_cast<int>(value.size()),
                        SQLITE_TRANSIENT) != SQLITE_OK) {
    fail("bind failed");
  }
}

void Connection::bind_blob(sqlite3_stmt* stmt, int index, const std::vector<uint8_t>& value) {
  // sqlite3_bind_blob treats a null pointer as SQL NULL; keep empty payloads as blobs
  int rc = value.empty()
               ? sqlite3_bind_zeroblob(stmt, index, 0)
               : sqlite3_bind_blob(stmt, index, value.data(), static_cast<int>(value.size()),
                                   SQLITE_TRANSIENT);
  if (rc != SQLITE_OK) {
    fail("bind failed");
  }
}

void Connection::bind_int64(sqlite3_stmt* stmt, int index, int64_t value) {
  if (sqlite3_bind_int64(stmt, index, value) != SQLITE_OK) {
    fail("bind failed");
  }
}

void Connection::bind_text_or_null(sqlite3_stmt* stmt, int index, const std::string& value) {
  if (!value.empty()) {
    bind_text(stmt, index, value);
    return;
  }
  if (sqlite3_bind_null(stmt, index) != SQLITE_OK) {
    fail("bind failed");
  }
}

int Connection::changes() const {
  return sqlite3_changes(db_);
}

ConnectionPool::ConnectionPool(const ConnectionOptions& options, size_t size) {
  if (size == 0) {
    size = 1;
  }
  connections_.reserve(size);
  for (size_t i = 0; i < size; ++i) {
    connections_.push_back(std::make_unique<Connection>(options));
  }
}

ConnectionPool::Lease ConnectionPool::acquire() {
  size_t start = next_.fetch_add(1, std::memory_order_relaxed);
  for (size_t i = 0; i < connections_.size(); ++i) {
    auto& conn = *connections_[(start + i) % connections_.size()];
    std::unique_lock<std::mutex> lock(conn.mutex(), std::try_to_lock);
    if (lock.owns_lock()) {
      return Lease(conn, std::move(lock));
    }
  }

  auto& conn = *connections_[start % connections_.size()];
  return Lease(conn, std::unique_lock<std::mutex>(conn.mutex()));
}

Transaction::Transaction(Connection& conn) : conn_(conn) {
  conn_.exec("BEGIN IMMEDIATE;");
}

Transaction::~Transaction() {
  if (done_) {
    return;
  }
  try {
    conn_.exec("ROLLBACK;");
  } catch (const StoreError& e) {
    spdlog::error("Transaction rollback failed: {}", e.what());
  }
}

void Transaction::commit() {
  conn_.exec("COMMIT;");
  done_ = true;
}

std::string column_text(sqlite3_stmt* stmt, int column) {
  const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
  if (text == nullptr) {
    return {};
  }
  return std::string(text, static_cast<size_t>(sqlite3_column_bytes(stmt, column)));
}

std::vector<uint8_t> column_blob(sqlite3_stmt* stmt, int column) {
  const auto* data = static_cast<const uint8_t*>(sqlite3_column_blob(stmt, column));
  int size = sqlite3_column_bytes(stmt, column);
  if (data == nullptr || size <= 0) {
    return {};
  }
  return std::vector<uint8_t>(data, data + size);
}

}  // namespace telemux::store::detail
