#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <sqlite3.h>

#include "telemux/audit/raw_audit_log.hpp"
#include "telemux/crypto/crypto.hpp"
#include "test_helpers.hpp"

namespace telemux::audit {
namespace {

using telemux::testing::START_MS;
using telemux::testing::TempDatabase;
using telemux::testing::bytes;

chunk::ReassembledMessage message(const std::string& correlation, const std::string& payload,
                                  uint64_t received_at_ms = START_MS) {
    chunk::ReassembledMessage msg;
    msg.tenant_id = "acme";
    msg.device_id = "sensor-1";
    msg.correlation_id = correlation;
    msg.payload = bytes(payload);
    msg.chunk_count = 3;
    msg.first_received_at_ms = received_at_ms;
    msg.completed_at_ms = received_at_ms + 20;
    msg.source = chunk::IngestionSource::HTTP;
    msg.topic = "acme/sensor-1";
    msg.client_id = "gw-7";
    return msg;
}

class RawAuditLogTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(crypto::init());
        store::SqliteStoreConfig config;
        config.path = db_.path();
        log_ = std::make_unique<SqliteRawAuditLog>(config);
    }

    TempDatabase db_;
    std::unique_ptr<SqliteRawAuditLog> log_;
};

TEST_F(RawAuditLogTest, AppendStoresMessageWithMetadata) {
    log_->append(message("c-42", "ABC"), START_MS + 30);

    auto entries = log_->find_by_correlation({"acme", "c-42"});
    ASSERT_EQ(entries.size(), 1u);
    const auto& entry = entries[0];
    EXPECT_EQ(entry.message.payload, bytes("ABC"));
    EXPECT_EQ(entry.payload_size_bytes, 3u);
    EXPECT_EQ(entry.message.chunk_count, 3u);
    EXPECT_EQ(entry.message.first_received_at_ms, START_MS);
    EXPECT_EQ(entry.message.completed_at_ms, START_MS + 20);
    EXPECT_EQ(entry.message.source, chunk::IngestionSource::HTTP);
    EXPECT_EQ(entry.message.topic, "acme/sensor-1");
    EXPECT_EQ(entry.message.client_id, "gw-7");
    EXPECT_EQ(entry.created_at_ms, START_MS + 30);
    EXPECT_FALSE(entry.message.partial);
}

TEST_F(RawAuditLogTest, DigestIsBlake2bOfPayload) {
    log_->append(message("c-1", "payload"), START_MS);

    auto entries = log_->find_by_correlation({"acme", "c-1"});
    ASSERT_EQ(entries.size(), 1u);
    auto expected = crypto::to_hex(crypto::payload_digest(bytes("payload")));
    EXPECT_EQ(entries[0].payload_digest, expected);
    EXPECT_EQ(entries[0].payload_digest.size(), crypto::DIGEST_SIZE * 2);
}

TEST_F(RawAuditLogTest, UnfragmentedMessageHasNoCorrelation) {
    auto msg = message("", "solo");
    msg.chunk_count = 1;
    log_->append(msg, START_MS);

    auto recent = log_->recent_for_device("sensor-1", 10);
    ASSERT_EQ(recent.size(), 1u);
    EXPECT_TRUE(recent[0].message.correlation_id.empty());
    EXPECT_EQ(recent[0].message.chunk_count, 1u);
}

TEST_F(RawAuditLogTest, RecentForDeviceIsNewestFirst) {
    log_->append(message("c-1", "a", START_MS), START_MS);
    log_->append(message("c-2", "b", START_MS + 10), START_MS);
    log_->append(message("c-3", "c", START_MS + 5), START_MS);

    auto recent = log_->recent_for_device("sensor-1", 2);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].message.correlation_id, "c-2");
    EXPECT_EQ(recent[1].message.correlation_id, "c-3");
}

TEST_F(RawAuditLogTest, CountByTenant) {
    log_->append(message("c-1", "a"), START_MS);
    auto other = message("c-1", "b");
    other.tenant_id = "globex";
    log_->append(other, START_MS);

    EXPECT_EQ(log_->count("acme"), 1u);
    EXPECT_EQ(log_->count("globex"), 1u);
    EXPECT_EQ(log_->count(""), 2u);
}

TEST_F(RawAuditLogTest, RowsCannotBeUpdated) {
    log_->append(message("c-1", "a"), START_MS);

    sqlite3* db = nullptr;
    ASSERT_EQ(sqlite3_open(db_.path().c_str(), &db), SQLITE_OK);
    sqlite3_busy_timeout(db, 5000);
    int rc = sqlite3_exec(db, "UPDATE telemetry_raw SET device_id = 'forged'",
                          nullptr, nullptr, nullptr);
    EXPECT_NE(rc, SQLITE_OK);
    EXPECT_THAT(sqlite3_errmsg(db), ::testing::HasSubstr("append-only"));
    sqlite3_close(db);

    auto entries = log_->find_by_correlation({"acme", "c-1"});
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message.device_id, "sensor-1");
}

}  // namespace
}  // namespace telemux::audit
