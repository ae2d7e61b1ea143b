#include "telemux/store/sqlite_chunk_store.hpp"

#include <spdlog/spdlog.h>

#include "store/sqlite_util.h"

namespace telemux::store {

namespace {

constexpr const char* SCHEMA_SQL = R"sql(
CREATE TABLE IF NOT EXISTS telemetry_chunk_groups (
    tenant_id            TEXT    NOT NULL,
    correlation_id       TEXT    NOT NULL,
    device_id            TEXT    NOT NULL,
    total_chunks         INTEGER NOT NULL,
    conflicted           INTEGER NOT NULL DEFAULT 0,
    completed            INTEGER NOT NULL DEFAULT 0,
    claim_owner          TEXT,
    lease_until_ms       INTEGER NOT NULL DEFAULT 0,
    first_received_at_ms INTEGER NOT NULL,
    expires_at_ms        INTEGER NOT NULL,
    PRIMARY KEY (tenant_id, correlation_id)
);
CREATE INDEX IF NOT EXISTS idx_telemetry_chunk_groups_expires
    ON telemetry_chunk_groups(expires_at_ms);

CREATE TABLE IF NOT EXISTS telemetry_chunks (
    tenant_id       TEXT    NOT NULL,
    device_id       TEXT    NOT NULL,
    correlation_id  TEXT    NOT NULL,
    sequence_number INTEGER NOT NULL,
    total_chunks    INTEGER NOT NULL,
    chunk_payload   BLOB    NOT NULL,
    received_at_ms  INTEGER NOT NULL,
    expires_at_ms   INTEGER NOT NULL,
    CONSTRAINT telemetry_chunks_unique_sequence
        UNIQUE (tenant_id, correlation_id, sequence_number)
);
CREATE INDEX IF NOT EXISTS idx_telemetry_chunks_tenant ON telemetry_chunks(tenant_id);
CREATE INDEX IF NOT EXISTS idx_telemetry_chunks_device ON telemetry_chunks(device_id);
CREATE INDEX IF NOT EXISTS idx_telemetry_chunks_expires ON telemetry_chunks(expires_at_ms);
)sql";

uint32_t count_group(detail::Connection& conn, const chunk::GroupKey& key) {
    auto stmt = conn.prepare(
        "SELECT COUNT(*) FROM telemetry_chunks WHERE tenant_id = ?1 AND correlation_id = ?2");
    conn.bind_text(stmt.get(), 1, key.tenant_id);
    conn.bind_text(stmt.get(), 2, key.correlation_id);
    if (!conn.step_row(stmt.get())) {
        return 0;
    }
    return static_cast<uint32_t>(sqlite3_column_int64(stmt.get(), 0));
}

std::vector<chunk::ChunkRecord> read_group(detail::Connection& conn, const chunk::GroupKey& key) {
    auto stmt = conn.prepare(
        "SELECT device_id, sequence_number, total_chunks, chunk_payload, received_at_ms, "
        "expires_at_ms FROM telemetry_chunks WHERE tenant_id = ?1 AND correlation_id = ?2 "
        "ORDER BY sequence_number");
    conn.bind_text(stmt.get(), 1, key.tenant_id);
    conn.bind_text(stmt.get(), 2, key.correlation_id);

    std::vector<chunk::ChunkRecord> records;
    while (conn.step_row(stmt.get())) {
        chunk::ChunkRecord record;
        record.tenant_id = key.tenant_id;
        record.correlation_id = key.correlation_id;
        record.device_id = detail::column_text(stmt.get(), 0);
        record.sequence_number = static_cast<uint32_t>(sqlite3_column_int64(stmt.get(), 1));
        record.total_chunks = static_cast<uint32_t>(sqlite3_column_int64(stmt.get(), 2));
        record.payload = detail::column_blob(stmt.get(), 3);
        record.received_at_ms = static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 4));
        record.expires_at_ms = static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 5));
        records.push_back(std::move(record));
    }
    return records;
}

size_t remove_group(detail::Connection& conn, const chunk::GroupKey& key) {
    auto chunks = conn.prepare(
        "DELETE FROM telemetry_chunks WHERE tenant_id = ?1 AND correlation_id = ?2");
    conn.bind_text(chunks.get(), 1, key.tenant_id);
    conn.bind_text(chunks.get(), 2, key.correlation_id);
    conn.step_done(chunks.get());
    auto deleted = static_cast<size_t>(conn.changes());

    auto group = conn.prepare(
        "DELETE FROM telemetry_chunk_groups WHERE tenant_id = ?1 AND correlation_id = ?2");
    conn.bind_text(group.get(), 1, key.tenant_id);
    conn.bind_text(group.get(), 2, key.correlation_id);
    conn.step_done(group.get());

    return deleted;
}

}  // namespace

SqliteChunkStore::SqliteChunkStore(const SqliteStoreConfig& config)
    : config_(config) {
    detail::ConnectionOptions options;
    options.path = config.path;
    options.busy_timeout_ms = config.busy_timeout_ms;
    options.journal_mode = config.journal_mode;
    pool_ = std::make_unique<detail::ConnectionPool>(options, config.pool_size);

    ensure_schema();
    spdlog::info("Chunk store opened (db: {}, connections: {})", config.path, config.pool_size);
}

SqliteChunkStore::~SqliteChunkStore() = default;

void SqliteChunkStore::ensure_schema() {
    auto conn = pool_->acquire();
    conn->exec(SCHEMA_SQL);
}

InsertResult SqliteChunkStore::insert(const chunk::ChunkRecord& record) {
    auto key = record.key();
    auto conn = pool_->acquire();
    detail::Transaction txn(*conn);

    auto select = conn->prepare(
        "SELECT device_id, total_chunks, conflicted, completed FROM telemetry_chunk_groups "
        "WHERE tenant_id = ?1 AND correlation_id = ?2");
    conn->bind_text(select.get(), 1, key.tenant_id);
    conn->bind_text(select.get(), 2, key.correlation_id);

    if (!conn->step_row(select.get())) {
        auto create = conn->prepare(
            "INSERT INTO telemetry_chunk_groups (tenant_id, correlation_id, device_id, "
            "total_chunks, first_received_at_ms, expires_at_ms) VALUES (?1, ?2, ?3, ?4, ?5, ?6)");
        conn->bind_text(create.get(), 1, key.tenant_id);
        conn->bind_text(create.get(), 2, key.correlation_id);
        conn->bind_text(create.get(), 3, record.device_id);
        conn->bind_int64(create.get(), 4, record.total_chunks);
        conn->bind_int64(create.get(), 5, static_cast<int64_t>(record.received_at_ms));
        conn->bind_int64(create.get(), 6, static_cast<int64_t>(record.expires_at_ms));
        conn->step_done(create.get());
    } else {
        std::string device_id = detail::column_text(select.get(), 0);
        auto total = static_cast<uint32_t>(sqlite3_column_int64(select.get(), 1));
        bool conflicted = sqlite3_column_int(select.get(), 2) != 0;
        bool completed = sqlite3_column_int(select.get(), 3) != 0;

        bool mismatch = total != record.total_chunks || device_id != record.device_id ||
                        record.sequence_number >= total;

        // A completed group keeps its identity so late chunks are still checked
        if (completed) {
            txn.commit();
            return {mismatch ? InsertStatus::CONFLICT : InsertStatus::COMPLETED, 0, total};
        }

        if (conflicted || mismatch) {
            auto flag = conn->prepare(
                "UPDATE telemetry_chunk_groups SET conflicted = 1 "
                "WHERE tenant_id = ?1 AND correlation_id = ?2");
            conn->bind_text(flag.get(), 1, key.tenant_id);
            conn->bind_text(flag.get(), 2, key.correlation_id);
            conn->step_done(flag.get());

            uint32_t present = count_group(*conn, key);
            txn.commit();
            return {InsertStatus::CONFLICT, present, total};
        }
    }

    auto insert = conn->prepare(
        "INSERT OR IGNORE INTO telemetry_chunks (tenant_id, device_id, correlation_id, "
        "sequence_number, total_chunks, chunk_payload, received_at_ms, expires_at_ms) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)");
    conn->bind_text(insert.get(), 1, record.tenant_id);
    conn->bind_text(insert.get(), 2, record.device_id);
    conn->bind_text(insert.get(), 3, record.correlation_id);
    conn->bind_int64(insert.get(), 4, record.sequence_number);
    conn->bind_int64(insert.get(), 5, record.total_chunks);
    conn->bind_blob(insert.get(), 6, record.payload);
    conn->bind_int64(insert.get(), 7, static_cast<int64_t>(record.received_at_ms));
    conn->bind_int64(insert.get(), 8, static_cast<int64_t>(record.expires_at_ms));
    conn->step_done(insert.get());
    bool inserted = conn->changes() > 0;

    if (inserted) {
        auto touch = conn->prepare(
            "UPDATE telemetry_chunk_groups SET "
            "first_received_at_ms = MIN(first_received_at_ms, ?3), "
            "expires_at_ms = MIN(expires_at_ms, ?4) "
            "WHERE tenant_id = ?1 AND correlation_id = ?2");
        conn->bind_text(touch.get(), 1, key.tenant_id);
        conn->bind_text(touch.get(), 2, key.correlation_id);
        conn->bind_int64(touch.get(), 3, static_cast<int64_t>(record.received_at_ms));
        conn->bind_int64(touch.get(), 4, static_cast<int64_t>(record.expires_at_ms));
        conn->step_done(touch.get());
    }

    uint32_t present = count_group(*conn, key);
    txn.commit();

    return {inserted ? InsertStatus::INSERTED : InsertStatus::DUPLICATE,
            present,
            record.total_chunks};
}

uint32_t SqliteChunkStore::count_distinct(const chunk::GroupKey& key) {
    auto conn = pool_->acquire();
    return count_group(*conn, key);
}

std::vector<chunk::ChunkRecord> SqliteChunkStore::fetch_group(const chunk::GroupKey& key) {
    auto conn = pool_->acquire();
    return read_group(*conn, key);
}

std::optional<std::vector<chunk::ChunkRecord>> SqliteChunkStore::try_claim(
    const chunk::GroupKey& key,
    const std::string& owner,
    uint64_t now_ms,
    uint64_t lease_ms) {
    auto conn = pool_->acquire();
    detail::Transaction txn(*conn);

    auto select = conn->prepare(
        "SELECT total_chunks, conflicted, claim_owner, lease_until_ms, completed "
        "FROM telemetry_chunk_groups WHERE tenant_id = ?1 AND correlation_id = ?2");
    conn->bind_text(select.get(), 1, key.tenant_id);
    conn->bind_text(select.get(), 2, key.correlation_id);

    if (!conn->step_row(select.get())) {
        txn.commit();
        return std::nullopt;
    }

    auto total = static_cast<uint32_t>(sqlite3_column_int64(select.get(), 0));
    bool conflicted = sqlite3_column_int(select.get(), 1) != 0;
    bool has_owner = sqlite3_column_type(select.get(), 2) != SQLITE_NULL;
    auto lease_until = static_cast<uint64_t>(sqlite3_column_int64(select.get(), 3));
    bool completed = sqlite3_column_int(select.get(), 4) != 0;

    if (completed || conflicted || count_group(*conn, key) != total ||
        (has_owner && lease_until > now_ms)) {
        txn.commit();
        return std::nullopt;
    }

    auto claim = conn->prepare(
        "UPDATE telemetry_chunk_groups SET claim_owner = ?3, lease_until_ms = ?4 "
        "WHERE tenant_id = ?1 AND correlation_id = ?2");
    conn->bind_text(claim.get(), 1, key.tenant_id);
    conn->bind_text(claim.get(), 2, key.correlation_id);
    conn->bind_text(claim.get(), 3, owner);
    conn->bind_int64(claim.get(), 4, static_cast<int64_t>(now_ms + lease_ms));
    conn->step_done(claim.get());

    auto records = read_group(*conn, key);
    txn.commit();
    return records;
}

bool SqliteChunkStore::release_claim(const chunk::GroupKey& key, const std::string& owner) {
    auto conn = pool_->acquire();
    auto stmt = conn->prepare(
        "UPDATE telemetry_chunk_groups SET claim_owner = NULL, lease_until_ms = 0 "
        "WHERE tenant_id = ?1 AND correlation_id = ?2 AND claim_owner = ?3");
    conn->bind_text(stmt.get(), 1, key.tenant_id);
    conn->bind_text(stmt.get(), 2, key.correlation_id);
    conn->bind_text(stmt.get(), 3, owner);
    conn->step_done(stmt.get());
    return conn->changes() > 0;
}

size_t SqliteChunkStore::delete_group(const chunk::GroupKey& key) {
    auto conn = pool_->acquire();
    detail::Transaction txn(*conn);
    size_t deleted = remove_group(*conn, key);
    txn.commit();
    return deleted;
}

size_t SqliteChunkStore::complete_group(const chunk::GroupKey& key, uint64_t retain_until_ms) {
    auto conn = pool_->acquire();
    detail::Transaction txn(*conn);

    auto chunks = conn->prepare(
        "DELETE FROM telemetry_chunks WHERE tenant_id = ?1 AND correlation_id = ?2");
    conn->bind_text(chunks.get(), 1, key.tenant_id);
    conn->bind_text(chunks.get(), 2, key.correlation_id);
    conn->step_done(chunks.get());
    auto deleted = static_cast<size_t>(conn->changes());

    auto mark = conn->prepare(
        "UPDATE telemetry_chunk_groups SET completed = 1, claim_owner = NULL, "
        "lease_until_ms = 0, expires_at_ms = ?3 "
        "WHERE tenant_id = ?1 AND correlation_id = ?2");
    conn->bind_text(mark.get(), 1, key.tenant_id);
    conn->bind_text(mark.get(), 2, key.correlation_id);
    conn->bind_int64(mark.get(), 3, static_cast<int64_t>(retain_until_ms));
    conn->step_done(mark.get());

    txn.commit();
    return deleted;
}

std::vector<ExpiredGroup> SqliteChunkStore::take_expired(uint64_t now_ms) {
    auto conn = pool_->acquire();
    detail::Transaction txn(*conn);

    auto markers = conn->prepare(
        "DELETE FROM telemetry_chunk_groups WHERE completed = 1 AND expires_at_ms <= ?1");
    conn->bind_int64(markers.get(), 1, static_cast<int64_t>(now_ms));
    conn->step_done(markers.get());

    auto select = conn->prepare(
        "SELECT g.tenant_id, g.correlation_id, g.device_id, g.total_chunks, g.conflicted, "
        "(SELECT COUNT(*) FROM telemetry_chunks c "
        " WHERE c.tenant_id = g.tenant_id AND c.correlation_id = g.correlation_id) "
        "FROM telemetry_chunk_groups g "
        "WHERE g.completed = 0 AND g.expires_at_ms <= ?1 "
        "AND (g.claim_owner IS NULL OR g.lease_until_ms <= ?1)");
    conn->bind_int64(select.get(), 1, static_cast<int64_t>(now_ms));

    std::vector<ExpiredGroup> expired;
    while (conn->step_row(select.get())) {
        ExpiredGroup entry;
        entry.key.tenant_id = detail::column_text(select.get(), 0);
        entry.key.correlation_id = detail::column_text(select.get(), 1);
        entry.device_id = detail::column_text(select.get(), 2);
        entry.total_chunks = static_cast<uint32_t>(sqlite3_column_int64(select.get(), 3));
        entry.conflicted = sqlite3_column_int(select.get(), 4) != 0;
        entry.chunks_present = static_cast<uint32_t>(sqlite3_column_int64(select.get(), 5));
        expired.push_back(std::move(entry));
    }

    for (const auto& entry : expired) {
        remove_group(*conn, entry.key);
    }

    txn.commit();
    return expired;
}

std::vector<PendingGroup> SqliteChunkStore::pending_groups(const std::string& tenant_id) {
    auto conn = pool_->acquire();
    auto stmt = conn->prepare(
        "SELECT g.tenant_id, g.correlation_id, g.device_id, g.total_chunks, g.conflicted, "
        "g.claim_owner IS NOT NULL, g.first_received_at_ms, g.expires_at_ms, "
        "(SELECT COUNT(*) FROM telemetry_chunks c "
        " WHERE c.tenant_id = g.tenant_id AND c.correlation_id = g.correlation_id) "
        "FROM telemetry_chunk_groups g "
        "WHERE g.completed = 0 AND (?1 = '' OR g.tenant_id = ?1) "
        "ORDER BY g.tenant_id, g.correlation_id");
    conn->bind_text(stmt.get(), 1, tenant_id);

    std::vector<PendingGroup> pending;
    while (conn->step_row(stmt.get())) {
        PendingGroup entry;
        entry.key.tenant_id = detail::column_text(stmt.get(), 0);
        entry.key.correlation_id = detail::column_text(stmt.get(), 1);
        entry.device_id = detail::column_text(stmt.get(), 2);
        entry.total_chunks = static_cast<uint32_t>(sqlite3_column_int64(stmt.get(), 3));
        entry.conflicted = sqlite3_column_int(stmt.get(), 4) != 0;
        entry.claimed = sqlite3_column_int(stmt.get(), 5) != 0;
        entry.first_received_at_ms = static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 6));
        entry.expires_at_ms = static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 7));
        entry.chunks_present = static_cast<uint32_t>(sqlite3_column_int64(stmt.get(), 8));
        pending.push_back(std::move(entry));
    }
    return pending;
}

}  // namespace telemux::store
