#include "MeasurementDatabase.hpp"

#include "Logger.hpp"

#include <filesystem>
#include <system_error>

#include <sqlite3.h>

namespace mv {

namespace {

// ---------------------------------------------------------------------------
// Transaction: BEGIN IMMEDIATE on entry, ROLLBACK unless committed
// ---------------------------------------------------------------------------

class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) {
        began_ = sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr) == SQLITE_OK;
        if (!began_) {
            Logger::error(std::string("BEGIN failed: ") + sqlite3_errmsg(db_));
        }
    }
    ~Transaction() {
        if (began_ && !committed_) {
            sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        }
    }

    bool ok() const { return began_; }

    bool commit() {
        if (!began_ || committed_) return committed_;
        if (sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK) {
            Logger::error(std::string("COMMIT failed: ") + sqlite3_errmsg(db_));
            return false;
        }
        committed_ = true;
        return true;
    }

private:
    sqlite3* db_;
    bool began_     = false;
    bool committed_ = false;
};

// ---------------------------------------------------------------------------
// Statement: prepared statement owned for one scope
// ---------------------------------------------------------------------------

class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            Logger::error(std::string("prepare failed: ") + sqlite3_errmsg(db));
            stmt_ = nullptr;
        }
    }
    ~Statement() {
        if (stmt_) sqlite3_finalize(stmt_);
    }
    operator sqlite3_stmt*() const { return stmt_; }
    bool ok() const { return stmt_ != nullptr; }

private:
    sqlite3_stmt* stmt_ = nullptr;
};

const char* kSelectColumns =
    "SELECT voice_entry_id, row_id, context_id, value, raw_text, timestamp, deleted "
    "FROM measurements ";

MeasurementRecord read_record(sqlite3_stmt* stmt) {
    MeasurementRecord r;
    r.voice_entry_id = sqlite3_column_int64(stmt, 0);
    r.row_id         = sqlite3_column_int64(stmt, 1);
    r.context_id     = sqlite3_column_int64(stmt, 2);
    r.value          = sqlite3_column_double(stmt, 3);
    const char* t    = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 4));
    r.raw_text       = t ? t : "";
    r.timestamp      = sqlite3_column_int64(stmt, 5);
    r.deleted        = sqlite3_column_int(stmt, 6) != 0;
    return r;
}

std::vector<MeasurementRecord> select_all(sqlite3* db, const std::string& tail) {
    std::vector<MeasurementRecord> results;
    const std::string sql = kSelectColumns + tail;
    Statement stmt(db, sql.c_str());
    if (!stmt.ok()) return results;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        results.push_back(read_record(stmt));
    }
    return results;
}

} // namespace

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

MeasurementDatabase::MeasurementDatabase(const std::string& db_path)
    : db_path_(db_path) {}

MeasurementDatabase::~MeasurementDatabase() {
    close();
}

// ---------------------------------------------------------------------------
// open / close / is_open
// ---------------------------------------------------------------------------

bool MeasurementDatabase::open() {
    std::lock_guard<std::mutex> lock(mu_);

    if (db_) return true;
    if (db_path_.empty()) return false;

    auto parent = std::filesystem::path(db_path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            Logger::error("Cannot create " + parent.string() + ": " + ec.message());
            return false;
        }
    }

    if (sqlite3_open(db_path_.c_str(), &db_) != SQLITE_OK) {
        Logger::error("Cannot open database " + db_path_ + ": " +
                      (db_ ? sqlite3_errmsg(db_) : "out of memory"));
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return false;
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL", nullptr, nullptr, nullptr);
    sqlite3_busy_timeout(db_, 2000);

    if (!create_tables()) {
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }
    Logger::info("Opened measurement database " + db_path_);
    return true;
}

void MeasurementDatabase::close() {
    std::lock_guard<std::mutex> lock(mu_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool MeasurementDatabase::is_open() const {
    std::lock_guard<std::mutex> lock(mu_);
    return db_ != nullptr;
}

bool MeasurementDatabase::create_tables() {
    const char* sql = R"SQL(
        CREATE TABLE IF NOT EXISTS measurements (
            voice_entry_id INTEGER PRIMARY KEY,
            row_id INTEGER NOT NULL,
            context_id INTEGER NOT NULL,
            value REAL NOT NULL,
            raw_text TEXT NOT NULL,
            timestamp INTEGER NOT NULL,
            deleted INTEGER NOT NULL DEFAULT 0
        );
        CREATE INDEX IF NOT EXISTS idx_measurements_row
            ON measurements(deleted, row_id);
    )SQL";

    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        Logger::error(std::string("Schema creation failed: ") + (err ? err : "unknown"));
        if (err) sqlite3_free(err);
        return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// PersistenceSink
// ---------------------------------------------------------------------------

bool MeasurementDatabase::append(const MeasurementRecord& record) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) return false;

    Transaction txn(db_);
    if (!txn.ok()) return false;

    // Replace so a retried append after a lost commit stays idempotent.
    Statement stmt(db_,
        "INSERT OR REPLACE INTO measurements "
        "(voice_entry_id, row_id, context_id, value, raw_text, timestamp, deleted) "
        "VALUES (?, ?, ?, ?, ?, ?, ?)");
    if (!stmt.ok()) return false;

    sqlite3_bind_int64(stmt, 1, record.voice_entry_id);
    sqlite3_bind_int64(stmt, 2, record.row_id);
    sqlite3_bind_int64(stmt, 3, record.context_id);
    sqlite3_bind_double(stmt, 4, record.value);
    sqlite3_bind_text(stmt, 5, record.raw_text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 6, record.timestamp);
    sqlite3_bind_int(stmt, 7, record.deleted ? 1 : 0);

    if (sqlite3_step(stmt) != SQLITE_DONE) {
        Logger::error(std::string("insert failed: ") + sqlite3_errmsg(db_));
        return false;
    }
    return txn.commit();
}

bool MeasurementDatabase::remove(int64_t voice_entry_id) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) return false;

    Transaction txn(db_);
    if (!txn.ok()) return false;

    Statement stmt(db_,
        "UPDATE measurements SET deleted = 1, row_id = 0 WHERE voice_entry_id = ?");
    if (!stmt.ok()) return false;
    sqlite3_bind_int64(stmt, 1, voice_entry_id);

    if (sqlite3_step(stmt) != SQLITE_DONE) {
        Logger::error(std::string("delete failed: ") + sqlite3_errmsg(db_));
        return false;
    }
    if (sqlite3_changes(db_) == 0) {
        Logger::warn("No persisted measurement #" + std::to_string(voice_entry_id));
    }
    return txn.commit();
}

bool MeasurementDatabase::renumber(const std::vector<RowAssignment>& rows) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) return false;

    Transaction txn(db_);
    if (!txn.ok()) return false;

    Statement stmt(db_, "UPDATE measurements SET row_id = ? WHERE voice_entry_id = ?");
    if (!stmt.ok()) return false;

    for (const auto& row : rows) {
        sqlite3_bind_int64(stmt, 1, row.row_id);
        sqlite3_bind_int64(stmt, 2, row.voice_entry_id);
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            Logger::error(std::string("renumber failed: ") + sqlite3_errmsg(db_));
            return false;
        }
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
    }
    return txn.commit();
}

std::vector<MeasurementRecord> MeasurementDatabase::load_all() {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) return {};
    return select_all(db_, "ORDER BY voice_entry_id ASC");
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

std::optional<MeasurementRecord> MeasurementDatabase::get(int64_t voice_entry_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) return std::nullopt;

    const std::string sql = std::string(kSelectColumns) + "WHERE voice_entry_id = ?";
    Statement stmt(db_, sql.c_str());
    if (!stmt.ok()) return std::nullopt;
    sqlite3_bind_int64(stmt, 1, voice_entry_id);

    if (sqlite3_step(stmt) != SQLITE_ROW) return std::nullopt;
    return read_record(stmt);
}

std::vector<MeasurementRecord> MeasurementDatabase::active() const {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) return {};
    return select_all(db_, "WHERE deleted = 0 ORDER BY row_id ASC, voice_entry_id ASC");
}

int64_t MeasurementDatabase::count() const {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) return 0;

    Statement stmt(db_, "SELECT COUNT(*) FROM measurements");
    if (!stmt.ok() || sqlite3_step(stmt) != SQLITE_ROW) return 0;
    return sqlite3_column_int64(stmt, 0);
}

} // namespace mv
