#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <stdexcept>

#include "telemux/audit/raw_audit_log.hpp"
#include "telemux/crypto/crypto.hpp"
#include "telemux/ingest/telemetry_demux.hpp"
#include "telemux/store/memory_chunk_store.hpp"
#include "telemux/store/sqlite_chunk_store.hpp"
#include "test_helpers.hpp"

namespace telemux::ingest {
namespace {

using telemux::testing::FakeClock;
using telemux::testing::START_MS;
using telemux::testing::TempDatabase;
using telemux::testing::bytes;
using telemux::testing::make_chunk;
using ::testing::_;
using ::testing::AllOf;
using ::testing::Field;
using ::testing::InSequence;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

class MockSink : public DownstreamSink {
public:
    MOCK_METHOD(bool, deliver, (const chunk::ReassembledMessage&), (override));
};

class MockAuditLog : public audit::RawAuditLog {
public:
    MOCK_METHOD(void, append, (const chunk::ReassembledMessage&, uint64_t), (override));
};

DemuxConfig fast_config() {
    DemuxConfig config;
    config.audit_retry_backoff_ms = 0;
    return config;
}

class TelemetryDemuxTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(crypto::init());
        demux_ = std::make_unique<TelemetryDemux>(store_, audit_, sink_, fast_config(),
                                                  clock_.clock());
    }

    FakeClock clock_;
    store::MemoryChunkStore store_;
    NiceMock<MockAuditLog> audit_;
    NiceMock<MockSink> sink_;
    std::unique_ptr<TelemetryDemux> demux_;
};

TEST_F(TelemetryDemuxTest, ReassembledMessageIsDeliveredThenAudited) {
    {
        InSequence seq;
        EXPECT_CALL(sink_, deliver(AllOf(
                               Field(&chunk::ReassembledMessage::payload, bytes("ABC")),
                               Field(&chunk::ReassembledMessage::correlation_id, "c-42"),
                               Field(&chunk::ReassembledMessage::chunk_count, 3u))))
            .WillOnce(Return(true));
        EXPECT_CALL(audit_, append(Field(&chunk::ReassembledMessage::payload, bytes("ABC")),
                                   clock_.now()));
    }

    EXPECT_EQ(demux_->submit(make_chunk("acme", "c-42", 0, 3, "A")).outcome,
              IngestOutcome::INCOMPLETE);
    EXPECT_EQ(demux_->submit(make_chunk("acme", "c-42", 2, 3, "C")).outcome,
              IngestOutcome::INCOMPLETE);
    EXPECT_EQ(demux_->submit(make_chunk("acme", "c-42", 1, 3, "B")).outcome,
              IngestOutcome::REASSEMBLED);

    auto late = demux_->submit(make_chunk("acme", "c-42", 1, 3, "B"));
    EXPECT_EQ(late.outcome, IngestOutcome::ALREADY_HANDLED);
    EXPECT_TRUE(late.duplicate);

    auto stats = demux_->stats();
    EXPECT_EQ(stats.chunks_received, 4u);
    EXPECT_EQ(stats.reassembled, 1u);
    EXPECT_EQ(stats.duplicates, 1u);
    EXPECT_EQ(store_.record_count(), 0u);
}

TEST_F(TelemetryDemuxTest, UnfragmentedMessageBypassesStore) {
    EXPECT_CALL(audit_, append(Field(&chunk::ReassembledMessage::chunk_count, 1u), _));
    EXPECT_CALL(sink_, deliver(Field(&chunk::ReassembledMessage::payload, bytes("solo"))))
        .WillOnce(Return(true));

    auto result = demux_->submit(make_chunk("acme", "", 0, 1, "solo"));

    EXPECT_EQ(result.outcome, IngestOutcome::REASSEMBLED);
    ASSERT_TRUE(result.message);
    EXPECT_EQ(result.message->first_received_at_ms, START_MS);
    EXPECT_FALSE(result.message->partial);
    EXPECT_TRUE(store_.pending_groups("").empty());
    EXPECT_EQ(demux_->stats().unfragmented_delivered, 1u);
}

TEST_F(TelemetryDemuxTest, UnfragmentedMessageWithoutReceiveTimeIsStamped) {
    clock_.advance(5000);
    EXPECT_CALL(audit_, append(_, _));
    EXPECT_CALL(sink_, deliver(_)).WillOnce(Return(true));

    auto result = demux_->submit(make_chunk("acme", "", 0, 1, "solo", 0));

    ASSERT_TRUE(result.message);
    EXPECT_EQ(result.message->first_received_at_ms, clock_.now());
}

TEST_F(TelemetryDemuxTest, UnfragmentedMessageIsStillValidated) {
    EXPECT_CALL(sink_, deliver(_)).Times(0);

    auto result = demux_->submit(make_chunk("acme", "", 0, 1, "x", START_MS, ""));
    EXPECT_EQ(result.error, IngestError::INVALID_CHUNK);
    EXPECT_EQ(demux_->stats().rejected, 1u);
}

TEST_F(TelemetryDemuxTest, AuditFailureDoesNotBlockDelivery) {
    EXPECT_CALL(audit_, append(_, _))
        .Times(3)
        .WillRepeatedly(Throw(store::StoreError("database is locked")));
    EXPECT_CALL(sink_, deliver(_)).WillOnce(Return(true));

    demux_->submit(make_chunk("acme", "c-1", 0, 2, "A"));
    auto result = demux_->submit(make_chunk("acme", "c-1", 1, 2, "B"));

    EXPECT_EQ(result.outcome, IngestOutcome::REASSEMBLED);
    EXPECT_EQ(demux_->stats().audit_failures, 1u);
}

TEST_F(TelemetryDemuxTest, AuditRetrySucceedsOnSecondAttempt) {
    EXPECT_CALL(audit_, append(_, _))
        .WillOnce(Throw(store::StoreError("busy")))
        .WillOnce(Return());
    EXPECT_CALL(sink_, deliver(_)).WillOnce(Return(true));

    demux_->submit(make_chunk("acme", "", 0, 1, "solo"));
    EXPECT_EQ(demux_->stats().audit_failures, 0u);
}

TEST_F(TelemetryDemuxTest, SinkRefusalKeepsChunksForRedelivery) {
    EXPECT_CALL(sink_, deliver(_))
        .WillOnce(Return(false))
        .WillOnce(Return(true));

    demux_->submit(make_chunk("acme", "c-1", 0, 2, "A"));
    auto refused = demux_->submit(make_chunk("acme", "c-1", 1, 2, "B"));
    EXPECT_EQ(refused.error, IngestError::SINK_UNAVAILABLE);
    EXPECT_FALSE(refused.message);
    EXPECT_EQ(store_.record_count(), 2u);

    // Claim was released: the broker redelivers and the group completes
    auto retried = demux_->submit(make_chunk("acme", "c-1", 1, 2, "B"));
    EXPECT_EQ(retried.outcome, IngestOutcome::REASSEMBLED);
    EXPECT_EQ(store_.record_count(), 0u);
    EXPECT_EQ(demux_->stats().sink_failures, 1u);
}

TEST_F(TelemetryDemuxTest, RefusedMessageIsNotAudited) {
    EXPECT_CALL(sink_, deliver(_)).WillOnce(Return(false));
    EXPECT_CALL(audit_, append(_, _)).Times(0);

    auto result = demux_->submit(make_chunk("acme", "", 0, 1, "solo"));
    EXPECT_EQ(result.error, IngestError::SINK_UNAVAILABLE);
}

TEST_F(TelemetryDemuxTest, SinkExceptionIsTreatedAsRefusal) {
    EXPECT_CALL(sink_, deliver(_)).WillOnce(Throw(std::runtime_error("rule engine down")));
    EXPECT_CALL(audit_, append(_, _)).Times(0);

    demux_->submit(make_chunk("acme", "c-1", 0, 2, "A"));
    auto result = demux_->submit(make_chunk("acme", "c-1", 1, 2, "B"));
    EXPECT_EQ(result.error, IngestError::SINK_UNAVAILABLE);
}

TEST_F(TelemetryDemuxTest, ConflictCallbackAndCounter) {
    int conflicts = 0;
    demux_->set_conflict_callback([&](const chunk::CorrelationConflictEvent&) { ++conflicts; });

    demux_->submit(make_chunk("acme", "c-1", 0, 2, "A"));
    auto result = demux_->submit(make_chunk("acme", "c-1", 1, 3, "B"));

    EXPECT_EQ(result.error, IngestError::CORRELATION_CONFLICT);
    EXPECT_EQ(conflicts, 1);
    EXPECT_EQ(demux_->stats().conflicts, 1u);
}

TEST_F(TelemetryDemuxTest, AbandonedGroupIsNotAudited) {
    EXPECT_CALL(audit_, append(_, _)).Times(0);
    EXPECT_CALL(sink_, deliver(_)).Times(0);

    std::vector<chunk::AbandonedGroupEvent> events;
    demux_->set_abandon_callback(
        [&](const chunk::AbandonedGroupEvent& event) { events.push_back(event); });

    demux_->submit(make_chunk("acme", "D2", 0, 5, "first"));
    EXPECT_EQ(demux_->sweep_once(START_MS + 60000), 1u);

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].chunks_present, 1u);
    EXPECT_EQ(demux_->stats().groups_abandoned, 1u);
    EXPECT_EQ(demux_->stats().chunks_swept, 1u);
}

TEST_F(TelemetryDemuxTest, InstanceIdIsRandomHex) {
    EXPECT_EQ(demux_->instance_id().size(), crypto::OWNER_TOKEN_SIZE * 2);

    TelemetryDemux other(store_, audit_, sink_, fast_config(), clock_.clock());
    EXPECT_NE(other.instance_id(), demux_->instance_id());
}

// Full pipeline on one SQLite file with the real audit log
TEST(TelemetryDemuxSqliteTest, EndToEndWithDurableStore) {
    ASSERT_TRUE(crypto::init());
    TempDatabase db;
    store::SqliteStoreConfig config;
    config.path = db.path();

    store::SqliteChunkStore store(config);
    audit::SqliteRawAuditLog audit(config);
    NiceMock<MockSink> sink;
    ON_CALL(sink, deliver(_)).WillByDefault(Return(true));
    FakeClock clock;

    TelemetryDemux demux(store, audit, sink, fast_config(), clock.clock());
    demux.submit(make_chunk("acme", "c-42", 0, 3, "A"));
    demux.submit(make_chunk("acme", "c-42", 2, 3, "C"));
    demux.submit(make_chunk("acme", "c-42", 1, 3, "B"));
    demux.submit(make_chunk("acme", "c-42", 1, 3, "B"));

    auto entries = audit.find_by_correlation({"acme", "c-42"});
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message.payload, bytes("ABC"));
    EXPECT_TRUE(store.pending_groups("acme").empty());
}

TEST(TelemetryDemuxSqliteTest, SinkRetryRecordsMessageOnce) {
    ASSERT_TRUE(crypto::init());
    TempDatabase db;
    store::SqliteStoreConfig config;
    config.path = db.path();

    store::MemoryChunkStore store;
    audit::SqliteRawAuditLog audit(config);
    MockSink sink;
    EXPECT_CALL(sink, deliver(_))
        .WillOnce(Return(false))
        .WillOnce(Return(true));
    FakeClock clock;

    TelemetryDemux demux(store, audit, sink, fast_config(), clock.clock());
    demux.submit(make_chunk("acme", "c-9", 0, 2, "A"));
    auto refused = demux.submit(make_chunk("acme", "c-9", 1, 2, "B"));
    auto redelivered = demux.submit(make_chunk("acme", "c-9", 1, 2, "B"));

    EXPECT_EQ(refused.error, IngestError::SINK_UNAVAILABLE);
    EXPECT_EQ(redelivered.outcome, IngestOutcome::REASSEMBLED);
    auto entries = audit.find_by_correlation({"acme", "c-9"});
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message.payload, bytes("AB"));
}

}  // namespace
}  // namespace telemux::ingest
