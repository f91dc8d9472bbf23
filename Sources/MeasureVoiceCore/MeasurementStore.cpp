#include "MeasurementStore.hpp"

#include "Logger.hpp"

#include <algorithm>
#include <chrono>

namespace mv {

namespace {

int64_t now_unix_ms() {
    return static_cast<int64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());
}

} // namespace

MeasurementStore::MeasurementStore(PersistenceSink* sink)
    : sink_(sink) {}

void MeasurementStore::set_error_callback(ErrorCallback cb) {
    std::lock_guard<std::mutex> lock(mu_);
    error_cb_ = std::move(cb);
}

// ---------------------------------------------------------------------------
// restore
// ---------------------------------------------------------------------------

size_t MeasurementStore::restore(const std::vector<MeasurementRecord>& records) {
    std::lock_guard<std::mutex> lock(mu_);
    size_t taken = 0;
    for (const auto& r : records) {
        if (r.voice_entry_id <= 0 || records_.count(r.voice_entry_id)) continue;
        records_[r.voice_entry_id] = r;
        next_id_ = std::max(next_id_, r.voice_entry_id + 1);
        ++taken;
    }
    if (taken > 0) {
        Logger::info("Restored " + std::to_string(taken) + " measurements, next id " +
                     std::to_string(next_id_));
    }
    return taken;
}

// ---------------------------------------------------------------------------
// Mutations
// ---------------------------------------------------------------------------

int64_t MeasurementStore::append(MeasurementRecord record) {
    std::vector<Report> reports;
    int64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(mu_);
        drain_pending_locked();

        int64_t highest_row = 0;
        for (const auto& [_, r] : records_) {
            if (!r.deleted) highest_row = std::max(highest_row, r.row_id);
        }

        id = next_id_++;
        record.voice_entry_id = id;
        record.row_id         = highest_row + 1;
        record.deleted        = false;
        if (record.timestamp == 0) record.timestamp = now_unix_ms();
        records_[id] = record;

        Logger::info("Measurement #" + std::to_string(id) + " row " +
                     std::to_string(record.row_id) + " context " +
                     std::to_string(record.context_id) + " value " +
                     std::to_string(record.value));

        PendingWrite write;
        write.kind   = PendingKind::append;
        write.record = record;
        persist_locked(std::move(write), reports);
    }
    report(reports);
    return id;
}

bool MeasurementStore::remove(int64_t voice_entry_id) {
    std::vector<Report> reports;
    {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = records_.find(voice_entry_id);
        if (it == records_.end() || it->second.deleted) {
            Logger::warn("Cannot delete measurement #" + std::to_string(voice_entry_id) +
                         ": unknown or already deleted");
            return false;
        }
        it->second.deleted = true;
        it->second.row_id  = 0;
        Logger::info("Deleted measurement #" + std::to_string(voice_entry_id));

        PendingWrite write;
        write.kind           = PendingKind::remove;
        write.voice_entry_id = voice_entry_id;
        persist_locked(std::move(write), reports);
    }
    report(reports);
    return true;
}

void MeasurementStore::renumber() {
    std::vector<Report> reports;
    {
        std::lock_guard<std::mutex> lock(mu_);
        drain_pending_locked();

        int64_t row = 1;
        for (auto& [_, r] : records_) {
            if (!r.deleted) r.row_id = row++;
        }
        Logger::info("Renumbered " + std::to_string(row - 1) + " rows");

        PendingWrite write;
        write.kind = PendingKind::renumber;
        persist_locked(std::move(write), reports);
    }
    report(reports);
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

std::optional<MeasurementRecord> MeasurementStore::lookup(int64_t voice_entry_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = records_.find(voice_entry_id);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

std::vector<MeasurementRecord> MeasurementStore::records() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<MeasurementRecord> out;
    out.reserve(records_.size());
    for (const auto& [_, r] : records_) out.push_back(r);
    return out;
}

std::vector<MeasurementRecord> MeasurementStore::active_records() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<MeasurementRecord> out;
    for (const auto& [_, r] : records_) {
        if (!r.deleted) out.push_back(r);
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const MeasurementRecord& a, const MeasurementRecord& b) {
                         return a.row_id < b.row_id;
                     });
    return out;
}

size_t MeasurementStore::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return records_.size();
}

size_t MeasurementStore::active_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return static_cast<size_t>(std::count_if(
        records_.begin(), records_.end(),
        [](const auto& entry) { return !entry.second.deleted; }));
}

int64_t MeasurementStore::next_voice_entry_id() const {
    std::lock_guard<std::mutex> lock(mu_);
    return next_id_;
}

// ---------------------------------------------------------------------------
// Persistence
// ---------------------------------------------------------------------------

size_t MeasurementStore::flush_pending() {
    std::lock_guard<std::mutex> lock(mu_);
    drain_pending_locked();
    return pending_.size();
}

size_t MeasurementStore::pending_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return pending_.size();
}

std::vector<RowAssignment> MeasurementStore::assignments_locked() const {
    std::vector<RowAssignment> rows;
    for (const auto& [id, r] : records_) {
        if (!r.deleted) rows.push_back(RowAssignment{id, r.row_id});
    }
    return rows;
}

bool MeasurementStore::write_locked(const PendingWrite& write) {
    switch (write.kind) {
        case PendingKind::append:   return sink_->append(write.record);
        case PendingKind::remove:   return sink_->remove(write.voice_entry_id);
        case PendingKind::renumber: return sink_->renumber(assignments_locked());
    }
    return false;
}

void MeasurementStore::persist_locked(PendingWrite write, std::vector<Report>& reports) {
    if (!sink_) return;

    // Earlier writes are still stuck; keep order by queueing behind them.
    if (!pending_.empty()) {
        pending_.push_back(std::move(write));
        reports.emplace_back(ErrorCode::persist_failed,
                             "write queued behind " + std::to_string(pending_.size() - 1) +
                             " pending");
        return;
    }

    if (write_locked(write) || write_locked(write)) return;

    pending_.push_back(std::move(write));
    const std::string detail = "sink write failed twice, " +
                               std::to_string(pending_.size()) + " pending";
    Logger::error(std::string(error_code_to_string(ErrorCode::persist_failed)) + ": " + detail);
    reports.emplace_back(ErrorCode::persist_failed, detail);
}

bool MeasurementStore::drain_pending_locked() {
    if (!sink_) {
        pending_.clear();
        return true;
    }
    while (!pending_.empty()) {
        if (!write_locked(pending_.front())) {
            Logger::warn(std::to_string(pending_.size()) + " writes still pending");
            return false;
        }
        pending_.pop_front();
    }
    return true;
}

void MeasurementStore::report(const std::vector<Report>& reports) const {
    if (reports.empty()) return;
    ErrorCallback cb;
    {
        std::lock_guard<std::mutex> lock(mu_);
        cb = error_cb_;
    }
    if (!cb) return;
    for (const auto& [code, detail] : reports) cb(code, detail);
}

} // namespace mv
