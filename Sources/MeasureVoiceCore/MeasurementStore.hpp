#pragma once

#include "Errors.hpp"
#include "PersistenceSink.hpp"
#include "Types.hpp"

#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mv {

/// Measurement history with two ids per record.
///
/// `voice_entry_id` is handed out once, in order, and never reused, not
/// even after a delete.  `row_id` is the record's current position; a
/// delete frees the row and leaves a hole until renumber() closes it.
///
/// Every change is mirrored to the optional PersistenceSink.  A failed
/// write is retried once; after that it is queued, reported as
/// PersistFailed and retried on the next append, renumber or
/// flush_pending().  The in-memory history stays authoritative meanwhile.
class MeasurementStore {
public:
    explicit MeasurementStore(PersistenceSink* sink = nullptr);

    MeasurementStore(const MeasurementStore&) = delete;
    MeasurementStore& operator=(const MeasurementStore&) = delete;

    void set_error_callback(ErrorCallback cb);

    /// Seed history from previously persisted records so numbering
    /// continues after them.  Returns the number of records taken.
    size_t restore(const std::vector<MeasurementRecord>& records);

    /// Assign ids to `record` and store it.  Returns the voice_entry_id.
    int64_t append(MeasurementRecord record);

    /// Logical delete.  False if the id is unknown or already deleted.
    bool remove(int64_t voice_entry_id);

    /// Dense row ids 1..n over live records in voice_entry_id order.
    void renumber();

    std::optional<MeasurementRecord> lookup(int64_t voice_entry_id) const;
    std::vector<MeasurementRecord> records() const;
    std::vector<MeasurementRecord> active_records() const;

    /// Retry queued writes.  Returns how many are still pending.
    size_t flush_pending();
    size_t pending_count() const;

    size_t size() const;
    size_t active_count() const;
    int64_t next_voice_entry_id() const;

private:
    enum class PendingKind { append, remove, renumber };

    struct PendingWrite {
        PendingKind             kind = PendingKind::append;
        MeasurementRecord       record;         // append
        int64_t                 voice_entry_id = 0;  // remove
    };

    using Report = std::pair<ErrorCode, std::string>;

    /// Caller holds mu_.  Runs one write against the sink.
    bool write_locked(const PendingWrite& write);

    /// Caller holds mu_.  Tries the write twice, queues it on failure.
    void persist_locked(PendingWrite write, std::vector<Report>& reports);

    /// Caller holds mu_.  Returns false as soon as one queued write fails.
    bool drain_pending_locked();

    std::vector<RowAssignment> assignments_locked() const;

    void report(const std::vector<Report>& reports) const;

    PersistenceSink*                    sink_;
    ErrorCallback                       error_cb_;

    mutable std::mutex                  mu_;
    std::map<int64_t, MeasurementRecord> records_;     // by voice_entry_id
    int64_t                             next_id_ = 1;
    std::deque<PendingWrite>            pending_;
};

} // namespace mv
