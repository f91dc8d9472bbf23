#pragma once

#include "PersistenceSink.hpp"
#include "Types.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Forward-declare sqlite3 so we don't leak its header into consumers.
struct sqlite3;

namespace mv {

/// SQLite persistence for measurement history.
///
/// One `measurements` table keyed by voice_entry_id.  Deleted records stay
/// in the table with `deleted = 1` and row 0.  The database runs in WAL mode
/// and every mutation happens inside an explicit transaction.
class MeasurementDatabase : public PersistenceSink {
public:
    explicit MeasurementDatabase(const std::string& db_path);
    ~MeasurementDatabase() override;

    MeasurementDatabase(const MeasurementDatabase&) = delete;
    MeasurementDatabase& operator=(const MeasurementDatabase&) = delete;

    /// Open (or create) the database and its schema.  Returns false on
    /// failure.
    bool open();
    void close();
    bool is_open() const;

    const std::string& path() const { return db_path_; }

    // ---- PersistenceSink ----

    bool append(const MeasurementRecord& record) override;
    bool remove(int64_t voice_entry_id) override;
    bool renumber(const std::vector<RowAssignment>& rows) override;
    std::vector<MeasurementRecord> load_all() override;

    // ---- Queries ----

    std::optional<MeasurementRecord> get(int64_t voice_entry_id) const;

    /// Live records in row order.
    std::vector<MeasurementRecord> active() const;

    /// Number of rows, deleted included.
    int64_t count() const;

private:
    bool create_tables();

    std::string         db_path_;
    sqlite3*            db_ = nullptr;
    mutable std::mutex  mu_;
};

} // namespace mv
