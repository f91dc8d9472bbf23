#include "MeasurementStore.hpp"
#include "TestSupport.hpp"

#include <gtest/gtest.h>

using namespace mv;
using mv::test::FakeSink;

namespace {

MeasurementRecord value(double v, int64_t context = 100) {
    MeasurementRecord r;
    r.value      = v;
    r.context_id = context;
    r.raw_text   = "test";
    return r;
}

std::vector<int64_t> rows_of(const std::vector<MeasurementRecord>& records) {
    std::vector<int64_t> out;
    for (const auto& r : records) out.push_back(r.row_id);
    return out;
}

std::vector<int64_t> ids_of(const std::vector<MeasurementRecord>& records) {
    std::vector<int64_t> out;
    for (const auto& r : records) out.push_back(r.voice_entry_id);
    return out;
}

} // namespace

TEST(MeasurementStoreTest, AppendAssignsIdsInOrder) {
    MeasurementStore store;
    EXPECT_EQ(store.append(value(1.0)), 1);
    EXPECT_EQ(store.append(value(2.0)), 2);
    EXPECT_EQ(store.append(value(3.0)), 3);

    auto records = store.active_records();
    EXPECT_EQ(ids_of(records), (std::vector<int64_t>{1, 2, 3}));
    EXPECT_EQ(rows_of(records), (std::vector<int64_t>{1, 2, 3}));
    EXPECT_GT(records[0].timestamp, 0);
}

TEST(MeasurementStoreTest, RemoveIsLogical) {
    MeasurementStore store;
    store.append(value(1.0));
    store.append(value(2.0));

    EXPECT_TRUE(store.remove(1));
    EXPECT_FALSE(store.remove(1));
    EXPECT_FALSE(store.remove(42));

    auto r = store.lookup(1);
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r->deleted);
    EXPECT_EQ(store.size(), 2u);
    EXPECT_EQ(store.active_count(), 1u);
}

TEST(MeasurementStoreTest, IdsAreNeverReused) {
    MeasurementStore store;
    store.append(value(1.0));
    store.append(value(2.0));
    store.append(value(3.0));
    store.remove(3);
    store.remove(2);

    EXPECT_EQ(store.append(value(4.0)), 4);
    EXPECT_EQ(store.next_voice_entry_id(), 5);
}

TEST(MeasurementStoreTest, DeleteLeavesHoleUntilRenumber) {
    MeasurementStore store;
    store.append(value(1.0));
    store.append(value(2.0));
    store.append(value(3.0));
    store.remove(2);

    EXPECT_EQ(rows_of(store.active_records()), (std::vector<int64_t>{1, 3}));
    EXPECT_EQ(store.lookup(store.append(value(4.0)))->row_id, 4);

    store.renumber();
    auto records = store.active_records();
    EXPECT_EQ(ids_of(records), (std::vector<int64_t>{1, 3, 4}));
    EXPECT_EQ(rows_of(records), (std::vector<int64_t>{1, 2, 3}));
}

TEST(MeasurementStoreTest, RenumberIsIdempotent) {
    MeasurementStore store;
    for (int i = 0; i < 5; ++i) store.append(value(i));
    store.remove(2);
    store.remove(4);

    store.renumber();
    const auto first = store.records();
    store.renumber();
    const auto second = store.records();

    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].voice_entry_id, second[i].voice_entry_id);
        EXPECT_EQ(first[i].row_id, second[i].row_id);
        EXPECT_EQ(first[i].deleted, second[i].deleted);
    }
}

TEST(MeasurementStoreTest, MirrorsToSink) {
    FakeSink sink;
    MeasurementStore store(&sink);
    store.append(value(1.5, 200));
    store.append(value(2.5, 200));
    store.remove(1);
    store.renumber();

    ASSERT_EQ(sink.rows.size(), 2u);
    EXPECT_TRUE(sink.rows[1].deleted);
    EXPECT_EQ(sink.rows[2].row_id, 1);
    EXPECT_EQ(sink.rows[2].context_id, 200);
    EXPECT_EQ(sink.renumber_calls, 1);
}

TEST(MeasurementStoreTest, FailedWriteIsRetriedOnceThenQueued) {
    FakeSink sink;
    MeasurementStore store(&sink);
    std::vector<ErrorCode> reported;
    store.set_error_callback([&](ErrorCode code, const std::string&) {
        reported.push_back(code);
    });

    sink.set_failing(true);
    const int64_t id = store.append(value(7.0));
    EXPECT_EQ(sink.append_calls, 2);
    EXPECT_EQ(store.pending_count(), 1u);
    ASSERT_EQ(reported.size(), 1u);
    EXPECT_EQ(reported[0], ErrorCode::persist_failed);

    // Still visible while pending.
    ASSERT_TRUE(store.lookup(id).has_value());
    EXPECT_EQ(store.lookup(id)->value, 7.0);

    sink.set_failing(false);
    EXPECT_EQ(store.flush_pending(), 0u);
    EXPECT_EQ(sink.rows.count(id), 1u);
}

TEST(MeasurementStoreTest, PendingWritesKeepOrder) {
    FakeSink sink;
    MeasurementStore store(&sink);

    sink.set_failing(true);
    store.append(value(1.0));
    store.append(value(2.0));
    EXPECT_EQ(store.pending_count(), 2u);

    // The next append drains the queue first.
    sink.set_failing(false);
    store.append(value(3.0));
    EXPECT_EQ(store.pending_count(), 0u);
    EXPECT_EQ(sink.rows.size(), 3u);
}

TEST(MeasurementStoreTest, RestoreContinuesNumbering) {
    std::vector<MeasurementRecord> persisted;
    for (int64_t id : {5, 7}) {
        MeasurementRecord r = value(static_cast<double>(id));
        r.voice_entry_id = id;
        r.row_id = id == 5 ? 1 : 2;
        persisted.push_back(r);
    }

    MeasurementStore store;
    EXPECT_EQ(store.restore(persisted), 2u);
    EXPECT_EQ(store.append(value(9.0)), 8);
    EXPECT_EQ(store.lookup(8)->row_id, 3);
}
