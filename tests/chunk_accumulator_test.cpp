#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <algorithm>
#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include "telemux/ingest/chunk_accumulator.hpp"
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
using ::testing::Return;
using ::testing::Throw;

class MockChunkStore : public store::ChunkStore {
public:
    MOCK_METHOD(store::InsertResult, insert, (const chunk::ChunkRecord&), (override));
    MOCK_METHOD(uint32_t, count_distinct, (const chunk::GroupKey&), (override));
    MOCK_METHOD(std::vector<chunk::ChunkRecord>, fetch_group, (const chunk::GroupKey&),
                (override));
    MOCK_METHOD(std::optional<std::vector<chunk::ChunkRecord>>, try_claim,
                (const chunk::GroupKey&, const std::string&, uint64_t, uint64_t), (override));
    MOCK_METHOD(bool, release_claim, (const chunk::GroupKey&, const std::string&), (override));
    MOCK_METHOD(size_t, delete_group, (const chunk::GroupKey&), (override));
    MOCK_METHOD(size_t, complete_group, (const chunk::GroupKey&, uint64_t), (override));
    MOCK_METHOD(std::vector<store::ExpiredGroup>, take_expired, (uint64_t), (override));
    MOCK_METHOD(std::vector<store::PendingGroup>, pending_groups, (const std::string&),
                (override));
};

class ChunkAccumulatorTest : public ::testing::Test {
protected:
    FakeClock clock_;
    store::MemoryChunkStore store_;
    ReassemblyMerger merger_;
    ChunkAccumulator accumulator_{store_, merger_, AccumulatorConfig{}, "owner-a",
                                  clock_.clock()};
};

TEST_F(ChunkAccumulatorTest, DefaultsMatchDocumentedValues) {
    AccumulatorConfig config;
    EXPECT_EQ(config.ttl_ms, 60000u);
    EXPECT_EQ(config.claim_lease_ms, 30000u);
    EXPECT_EQ(config.max_fragment_bytes, 256u * 1024);
}

// c-42: chunks 0, 2, 1, 1 arrive; the second copy of 1 is a duplicate
TEST_F(ChunkAccumulatorTest, DuplicatedChunkAfterReassemblyIsAbsorbed) {
    auto r0 = accumulator_.ingest(make_chunk("acme", "c-42", 0, 3, "A"));
    EXPECT_EQ(r0.outcome, IngestOutcome::INCOMPLETE);
    EXPECT_TRUE(r0.ok());

    auto r2 = accumulator_.ingest(make_chunk("acme", "c-42", 2, 3, "C"));
    EXPECT_EQ(r2.outcome, IngestOutcome::INCOMPLETE);

    auto r1 = accumulator_.ingest(make_chunk("acme", "c-42", 1, 3, "B"));
    ASSERT_EQ(r1.outcome, IngestOutcome::REASSEMBLED);
    ASSERT_TRUE(r1.message);
    EXPECT_EQ(r1.message->payload, bytes("ABC"));
    EXPECT_EQ(r1.message->chunk_count, 3u);
    EXPECT_EQ(r1.message->correlation_id, "c-42");
    EXPECT_EQ(r1.message->device_id, "sensor-1");
    EXPECT_FALSE(r1.message->partial);
    ASSERT_TRUE(accumulator_.complete({"acme", "c-42"}));

    auto again = accumulator_.ingest(make_chunk("acme", "c-42", 1, 3, "B"));
    EXPECT_EQ(again.outcome, IngestOutcome::ALREADY_HANDLED);
    EXPECT_TRUE(again.duplicate);
    EXPECT_FALSE(again.message);
    EXPECT_EQ(store_.record_count(), 0u);
}

TEST_F(ChunkAccumulatorTest, DuplicateBeforeCompletionIsFlagged) {
    accumulator_.ingest(make_chunk("acme", "c-1", 0, 3, "A"));
    auto again = accumulator_.ingest(make_chunk("acme", "c-1", 0, 3, "A"));

    EXPECT_EQ(again.outcome, IngestOutcome::INCOMPLETE);
    EXPECT_TRUE(again.duplicate);
    EXPECT_EQ(store_.count_distinct({"acme", "c-1"}), 1u);
}

TEST_F(ChunkAccumulatorTest, EveryArrivalOrderProducesSamePayload) {
    std::vector<uint32_t> order = {0, 1, 2, 3};
    int run = 0;
    do {
        std::string correlation = "perm-" + std::to_string(run++);
        std::optional<chunk::ReassembledMessage> message;
        for (auto seq : order) {
            auto result = accumulator_.ingest(
                make_chunk("acme", correlation, seq, 4, std::string(1, static_cast<char>('a' + seq))));
            if (result.message) {
                EXPECT_FALSE(message) << "reassembled twice";
                message = std::move(result.message);
            }
        }
        ASSERT_TRUE(message);
        EXPECT_EQ(message->payload, bytes("abcd"));
    } while (std::next_permutation(order.begin(), order.end()));
}

TEST_F(ChunkAccumulatorTest, ConflictingTotalIsReportedAndPoisons) {
    std::vector<chunk::CorrelationConflictEvent> events;
    accumulator_.set_conflict_callback(
        [&](const chunk::CorrelationConflictEvent& event) { events.push_back(event); });

    accumulator_.ingest(make_chunk("acme", "c-7", 0, 2, "A"));
    auto conflict = accumulator_.ingest(make_chunk("acme", "c-7", 1, 3, "B"));

    EXPECT_EQ(conflict.error, IngestError::CORRELATION_CONFLICT);
    EXPECT_EQ(conflict.outcome, IngestOutcome::REJECTED);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].declared_total, 3u);
    EXPECT_EQ(events[0].existing_total, 2u);
    EXPECT_EQ(events[0].detected_at_ms, clock_.now());

    // The group never completes, even with the right total
    auto late = accumulator_.ingest(make_chunk("acme", "c-7", 1, 2, "B"));
    EXPECT_EQ(late.error, IngestError::CORRELATION_CONFLICT);
    EXPECT_FALSE(late.message);
}

TEST_F(ChunkAccumulatorTest, ConflictAfterReassemblyIsReported) {
    std::vector<chunk::CorrelationConflictEvent> events;
    accumulator_.set_conflict_callback(
        [&](const chunk::CorrelationConflictEvent& event) { events.push_back(event); });

    accumulator_.ingest(make_chunk("acme", "c-5", 0, 2, "A"));
    auto done = accumulator_.ingest(make_chunk("acme", "c-5", 1, 2, "B"));
    ASSERT_EQ(done.outcome, IngestOutcome::REASSEMBLED);
    ASSERT_TRUE(accumulator_.complete({"acme", "c-5"}));

    auto late = accumulator_.ingest(make_chunk("acme", "c-5", 3, 5, "D"));
    EXPECT_EQ(late.error, IngestError::CORRELATION_CONFLICT);
    EXPECT_EQ(late.outcome, IngestOutcome::REJECTED);
    EXPECT_FALSE(late.duplicate);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].declared_total, 5u);
    EXPECT_EQ(events[0].existing_total, 2u);
    EXPECT_EQ(store_.record_count(), 0u);
}

TEST_F(ChunkAccumulatorTest, MissingReceiveTimeIsStampedWithClock) {
    clock_.set(START_MS + 100000);
    auto result = accumulator_.ingest(make_chunk("acme", "c-8", 0, 2, "A", 0));
    ASSERT_TRUE(result.ok());

    auto pending = store_.pending_groups("acme");
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].first_received_at_ms, clock_.now());
    EXPECT_EQ(pending[0].expires_at_ms, clock_.now() + 60000);
    EXPECT_TRUE(store_.take_expired(clock_.now()).empty());
}

TEST_F(ChunkAccumulatorTest, TenantsAreIsolated) {
    accumulator_.ingest(make_chunk("acme", "shared", 0, 2, "A"));
    auto other = accumulator_.ingest(make_chunk("globex", "shared", 1, 2, "B"));

    EXPECT_EQ(other.outcome, IngestOutcome::INCOMPLETE);
    EXPECT_EQ(store_.count_distinct({"acme", "shared"}), 1u);
    EXPECT_EQ(store_.count_distinct({"globex", "shared"}), 1u);
}

TEST_F(ChunkAccumulatorTest, OutOfRangeSequenceIsNotStored) {
    auto result = accumulator_.ingest(make_chunk("acme", "c-1", 3, 3, "X"));

    EXPECT_EQ(result.error, IngestError::OUT_OF_RANGE_SEQUENCE);
    EXPECT_EQ(result.outcome, IngestOutcome::REJECTED);
    EXPECT_EQ(store_.record_count(), 0u);
}

TEST_F(ChunkAccumulatorTest, OversizedFragmentIsNotStored) {
    std::string big(256 * 1024 + 1, 'x');
    auto result = accumulator_.ingest(make_chunk("acme", "c-1", 0, 2, big));

    EXPECT_EQ(result.error, IngestError::PAYLOAD_TOO_LARGE);
    EXPECT_EQ(store_.record_count(), 0u);

    std::string limit(256 * 1024, 'x');
    EXPECT_TRUE(accumulator_.ingest(make_chunk("acme", "c-1", 0, 2, limit)).ok());
}

TEST_F(ChunkAccumulatorTest, MissingAttributionIsInvalid) {
    EXPECT_EQ(accumulator_.ingest(make_chunk("", "c-1", 0, 2, "A")).error,
              IngestError::INVALID_CHUNK);
    EXPECT_EQ(accumulator_.ingest(make_chunk("acme", "c-1", 0, 2, "A", START_MS, "")).error,
              IngestError::INVALID_CHUNK);
    EXPECT_EQ(accumulator_.ingest(make_chunk("acme", "", 0, 2, "A")).error,
              IngestError::INVALID_CHUNK);
    EXPECT_EQ(accumulator_.ingest(make_chunk("acme", "c-1", 0, 0, "A")).error,
              IngestError::INVALID_CHUNK);
    EXPECT_EQ(accumulator_.ingest(make_chunk("acme", "c-1", 0, 5000, "A")).error,
              IngestError::INVALID_CHUNK);
}

TEST_F(ChunkAccumulatorTest, ClaimHeldElsewhereYieldsAlreadyHandled) {
    accumulator_.ingest(make_chunk("acme", "c-1", 0, 2, "A"));
    accumulator_.ingest(make_chunk("acme", "c-1", 1, 2, "B"));

    // Owner crashed: rows and lease remain. A redelivered chunk within the
    // lease is told the group is being handled.
    auto retry = accumulator_.ingest(make_chunk("acme", "c-1", 1, 2, "B"));
    EXPECT_EQ(retry.outcome, IngestOutcome::ALREADY_HANDLED);
    EXPECT_TRUE(retry.duplicate);

    // Once the lease lapses the redelivery reassembles again
    clock_.advance(30000);
    auto recovered = accumulator_.ingest(make_chunk("acme", "c-1", 1, 2, "B"));
    EXPECT_EQ(recovered.outcome, IngestOutcome::REASSEMBLED);
}

TEST_F(ChunkAccumulatorTest, ReleaseAllowsImmediateReclaim) {
    accumulator_.ingest(make_chunk("acme", "c-1", 0, 2, "A"));
    auto first = accumulator_.ingest(make_chunk("acme", "c-1", 1, 2, "B"));
    ASSERT_EQ(first.outcome, IngestOutcome::REASSEMBLED);

    EXPECT_TRUE(accumulator_.release({"acme", "c-1"}));
    auto second = accumulator_.ingest(make_chunk("acme", "c-1", 0, 2, "A"));
    EXPECT_EQ(second.outcome, IngestOutcome::REASSEMBLED);
    EXPECT_EQ(second.message->payload, bytes("AB"));
}

TEST_F(ChunkAccumulatorTest, StoreFailureIsRetryable) {
    MockChunkStore store;
    ChunkAccumulator accumulator(store, merger_, AccumulatorConfig{}, "owner-a", clock_.clock());

    EXPECT_CALL(store, insert(_)).WillOnce(Throw(store::StoreError("database is locked")));

    auto result = accumulator.ingest(make_chunk("acme", "c-1", 0, 2, "A"));
    EXPECT_EQ(result.error, IngestError::STORE_UNAVAILABLE);
    EXPECT_EQ(result.outcome, IngestOutcome::REJECTED);
}

TEST_F(ChunkAccumulatorTest, ClaimFailureIsRetryable) {
    MockChunkStore store;
    ChunkAccumulator accumulator(store, merger_, AccumulatorConfig{}, "owner-a", clock_.clock());

    EXPECT_CALL(store, insert(_))
        .WillOnce(Return(store::InsertResult{store::InsertStatus::INSERTED, 2, 2}));
    EXPECT_CALL(store, try_claim(_, "owner-a", clock_.now(), 30000u))
        .WillOnce(Throw(store::StoreError("disk I/O error")));

    auto result = accumulator.ingest(make_chunk("acme", "c-1", 1, 2, "B"));
    EXPECT_EQ(result.error, IngestError::STORE_UNAVAILABLE);
}

TEST_F(ChunkAccumulatorTest, CompleteKeepsMarkerForOneTtl) {
    MockChunkStore store;
    ChunkAccumulator accumulator(store, merger_, AccumulatorConfig{}, "owner-a", clock_.clock());

    EXPECT_CALL(store, complete_group(chunk::GroupKey{"acme", "c-1"}, clock_.now() + 60000))
        .WillOnce(Return(2));
    EXPECT_TRUE(accumulator.complete({"acme", "c-1"}));

    EXPECT_CALL(store, complete_group(_, _)).WillOnce(Throw(store::StoreError("gone")));
    EXPECT_FALSE(accumulator.complete({"acme", "c-1"}));
}

// N workers deliver the final chunk at once; exactly one reassembles
class ChunkAccumulatorConcurrencyTest : public ::testing::TestWithParam<bool> {
protected:
    void SetUp() override {
        if (GetParam()) {
            store::SqliteStoreConfig config;
            config.path = db_.path();
            store_ = std::make_unique<store::SqliteChunkStore>(config);
        } else {
            store_ = std::make_unique<store::MemoryChunkStore>();
        }
    }

    TempDatabase db_;
    FakeClock clock_;
    std::unique_ptr<store::ChunkStore> store_;
    ReassemblyMerger merger_;
};

TEST_P(ChunkAccumulatorConcurrencyTest, FinalChunkRaceHasOneWinner) {
    constexpr int WORKERS = 8;
    constexpr uint32_t TOTAL = 5;

    // Separate accumulators stand in for separate engine instances
    std::vector<std::unique_ptr<ChunkAccumulator>> accumulators;
    for (int i = 0; i < WORKERS; ++i) {
        accumulators.push_back(std::make_unique<ChunkAccumulator>(
            *store_, merger_, AccumulatorConfig{}, "owner-" + std::to_string(i), clock_.clock()));
    }

    for (uint32_t seq = 0; seq + 1 < TOTAL; ++seq) {
        accumulators[0]->ingest(make_chunk("acme", "race", seq, TOTAL, "x"));
    }

    std::atomic<int> reassembled{0};
    std::atomic<int> handled{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < WORKERS; ++i) {
        threads.emplace_back([&, i] {
            auto result = accumulators[i]->ingest(make_chunk("acme", "race", TOTAL - 1, TOTAL, "y"));
            if (result.outcome == IngestOutcome::REASSEMBLED) {
                ++reassembled;
            } else if (result.outcome == IngestOutcome::ALREADY_HANDLED) {
                ++handled;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(reassembled, 1);
    EXPECT_EQ(handled, WORKERS - 1);
}

TEST_P(ChunkAccumulatorConcurrencyTest, InterleavedGroupsEachReassembleOnce) {
    constexpr int GROUPS = 16;
    constexpr uint32_t TOTAL = 4;
    ChunkAccumulator accumulator(*store_, merger_, AccumulatorConfig{}, "owner", clock_.clock());

    std::atomic<int> reassembled{0};
    std::vector<std::thread> threads;
    for (uint32_t seq = 0; seq < TOTAL; ++seq) {
        threads.emplace_back([&, seq] {
            for (int g = 0; g < GROUPS; ++g) {
                auto result = accumulator.ingest(
                    make_chunk("acme", "g-" + std::to_string(g), seq, TOTAL, "p"));
                if (result.outcome == IngestOutcome::REASSEMBLED) {
                    ++reassembled;
                    accumulator.complete({"acme", "g-" + std::to_string(g)});
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(reassembled, GROUPS);
}

INSTANTIATE_TEST_SUITE_P(Backends, ChunkAccumulatorConcurrencyTest, ::testing::Bool(),
                         [](const ::testing::TestParamInfo<bool>& info) {
                             return info.param ? "Sqlite" : "Memory";
                         });

}  // namespace
}  // namespace telemux::ingest
