#include "telemux/audit/raw_audit_log.hpp"

#include <spdlog/spdlog.h>

#include "store/sqlite_util.h"
#include "telemux/crypto/crypto.hpp"

namespace telemux::audit {

namespace {

constexpr const char* SCHEMA_SQL = R"sql(
CREATE TABLE IF NOT EXISTS telemetry_raw (
    id                   INTEGER PRIMARY KEY AUTOINCREMENT,
    tenant_id            TEXT    NOT NULL,
    device_id            TEXT    NOT NULL,
    payload              BLOB    NOT NULL,
    payload_size_bytes   INTEGER NOT NULL,
    payload_digest       TEXT    NOT NULL,
    correlation_id       TEXT,
    total_chunks         INTEGER NOT NULL,
    partial              INTEGER NOT NULL DEFAULT 0,
    received_at_ms       INTEGER NOT NULL,
    completed_at_ms      INTEGER NOT NULL,
    ingestion_source     TEXT    NOT NULL DEFAULT 'mqtt'
        CHECK (ingestion_source IN ('mqtt', 'http', 'bridge')),
    mqtt_topic           TEXT,
    client_id            TEXT,
    created_at_ms        INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_telemetry_raw_device_time
    ON telemetry_raw(device_id, received_at_ms DESC);
CREATE INDEX IF NOT EXISTS idx_telemetry_raw_tenant ON telemetry_raw(tenant_id);
CREATE INDEX IF NOT EXISTS idx_telemetry_raw_correlation
    ON telemetry_raw(tenant_id, correlation_id) WHERE correlation_id IS NOT NULL;
CREATE INDEX IF NOT EXISTS idx_telemetry_raw_source ON telemetry_raw(ingestion_source);
CREATE INDEX IF NOT EXISTS idx_telemetry_raw_created ON telemetry_raw(created_at_ms DESC);

CREATE TRIGGER IF NOT EXISTS telemetry_raw_immutable
    BEFORE UPDATE ON telemetry_raw
BEGIN
    SELECT RAISE(ABORT, 'telemetry_raw is append-only');
END;
)sql";

constexpr const char* SELECT_COLUMNS =
    "SELECT id, tenant_id, device_id, payload, payload_size_bytes, payload_digest, "
    "correlation_id, total_chunks, partial, received_at_ms, completed_at_ms, "
    "ingestion_source, mqtt_topic, client_id, created_at_ms FROM telemetry_raw ";

RawAuditEntry read_entry(sqlite3_stmt* stmt) {
    RawAuditEntry entry;
    entry.id = sqlite3_column_int64(stmt, 0);
    entry.message.tenant_id = store::detail::column_text(stmt, 1);
    entry.message.device_id = store::detail::column_text(stmt, 2);
    entry.message.payload = store::detail::column_blob(stmt, 3);
    entry.payload_size_bytes = static_cast<size_t>(sqlite3_column_int64(stmt, 4));
    entry.payload_digest = store::detail::column_text(stmt, 5);
    entry.message.correlation_id = store::detail::column_text(stmt, 6);
    entry.message.chunk_count = static_cast<uint32_t>(sqlite3_column_int64(stmt, 7));
    entry.message.partial = sqlite3_column_int(stmt, 8) != 0;
    entry.message.first_received_at_ms = static_cast<uint64_t>(sqlite3_column_int64(stmt, 9));
    entry.message.completed_at_ms = static_cast<uint64_t>(sqlite3_column_int64(stmt, 10));
    entry.message.source = chunk::string_to_ingestion_source(store::detail::column_text(stmt, 11));
    entry.message.topic = store::detail::column_text(stmt, 12);
    entry.message.client_id = store::detail::column_text(stmt, 13);
    entry.created_at_ms = static_cast<uint64_t>(sqlite3_column_int64(stmt, 14));
    return entry;
}

}  // namespace

SqliteRawAuditLog::SqliteRawAuditLog(const store::SqliteStoreConfig& config) {
    store::detail::ConnectionOptions options;
    options.path = config.path;
    options.busy_timeout_ms = config.busy_timeout_ms;
    options.journal_mode = config.journal_mode;
    pool_ = std::make_unique<store::detail::ConnectionPool>(options, config.pool_size);

    auto conn = pool_->acquire();
    conn->exec(SCHEMA_SQL);
    spdlog::info("Raw audit log opened (db: {})", config.path);
}

SqliteRawAuditLog::~SqliteRawAuditLog() = default;

void SqliteRawAuditLog::append(const chunk::ReassembledMessage& message, uint64_t created_at_ms) {
    auto digest = crypto::payload_digest(message.payload);

    auto conn = pool_->acquire();
    auto stmt = conn->prepare(
        "INSERT INTO telemetry_raw (tenant_id, device_id, payload, payload_size_bytes, "
        "payload_digest, correlation_id, total_chunks, partial, received_at_ms, "
        "completed_at_ms, ingestion_source, mqtt_topic, client_id, created_at_ms) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, ?14)");

    conn->bind_text(stmt.get(), 1, message.tenant_id);
    conn->bind_text(stmt.get(), 2, message.device_id);
    conn->bind_blob(stmt.get(), 3, message.payload);
    conn->bind_int64(stmt.get(), 4, static_cast<int64_t>(message.payload.size()));
    conn->bind_text(stmt.get(), 5, crypto::to_hex(digest));
    conn->bind_text_or_null(stmt.get(), 6, message.correlation_id);
    conn->bind_int64(stmt.get(), 7, message.chunk_count);
    conn->bind_int64(stmt.get(), 8, message.partial ? 1 : 0);
    conn->bind_int64(stmt.get(), 9, static_cast<int64_t>(message.first_received_at_ms));
    conn->bind_int64(stmt.get(), 10, static_cast<int64_t>(message.completed_at_ms));
    conn->bind_text(stmt.get(), 11, chunk::ingestion_source_to_string(message.source));
    conn->bind_text_or_null(stmt.get(), 12, message.topic);
    conn->bind_text_or_null(stmt.get(), 13, message.client_id);
    conn->bind_int64(stmt.get(), 14, static_cast<int64_t>(created_at_ms));
    conn->step_done(stmt.get());
}

std::vector<RawAuditEntry> SqliteRawAuditLog::find_by_correlation(const chunk::GroupKey& key) {
    auto conn = pool_->acquire();
    std::string sql = std::string(SELECT_COLUMNS) +
                      "WHERE tenant_id = ?1 AND correlation_id = ?2 ORDER BY id";
    auto stmt = conn->prepare(sql.c_str());
    conn->bind_text(stmt.get(), 1, key.tenant_id);
    conn->bind_text(stmt.get(), 2, key.correlation_id);

    std::vector<RawAuditEntry> entries;
    while (conn->step_row(stmt.get())) {
        entries.push_back(read_entry(stmt.get()));
    }
    return entries;
}

std::vector<RawAuditEntry> SqliteRawAuditLog::recent_for_device(const std::string& device_id,
                                                                size_t limit) {
    auto conn = pool_->acquire();
    std::string sql = std::string(SELECT_COLUMNS) +
                      "WHERE device_id = ?1 ORDER BY received_at_ms DESC, id DESC LIMIT ?2";
    auto stmt = conn->prepare(sql.c_str());
    conn->bind_text(stmt.get(), 1, device_id);
    conn->bind_int64(stmt.get(), 2, static_cast<int64_t>(limit));

    std::vector<RawAuditEntry> entries;
    while (conn->step_row(stmt.get())) {
        entries.push_back(read_entry(stmt.get()));
    }
    return entries;
}

size_t SqliteRawAuditLog::count(const std::string& tenant_id) {
    auto conn = pool_->acquire();
    auto stmt = conn->prepare(
        "SELECT COUNT(*) FROM telemetry_raw WHERE ?1 = '' OR tenant_id = ?1");
    conn->bind_text(stmt.get(), 1, tenant_id);
    if (!conn->step_row(stmt.get())) {
        return 0;
    }
    return static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0));
}

}  // namespace telemux::audit
