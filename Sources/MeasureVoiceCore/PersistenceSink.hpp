#pragma once

#include "Types.hpp"

#include <cstdint>
#include <vector>

namespace mv {

/// New position of one live record after renumbering.
struct RowAssignment {
    int64_t voice_entry_id = 0;
    int64_t row_id         = 0;
};

/// Where MeasurementStore mirrors its history.  Every call returns false on
/// failure; the store decides whether to retry.
class PersistenceSink {
public:
    virtual ~PersistenceSink() = default;

    /// Insert or overwrite the record keyed by its voice_entry_id.
    virtual bool append(const MeasurementRecord& record) = 0;

    /// Mark the record deleted and free its row.
    virtual bool remove(int64_t voice_entry_id) = 0;

    /// Apply every assignment as one batch.
    virtual bool renumber(const std::vector<RowAssignment>& rows) = 0;

    /// Everything persisted so far, deleted records included, in
    /// voice_entry_id order.
    virtual std::vector<MeasurementRecord> load_all() = 0;
};

} // namespace mv
