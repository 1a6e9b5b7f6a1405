#include "persistence/HistoryStore.hpp"
#include "persistence/DeviceSerializer.hpp"
#include "core/Logger.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <limits>

namespace homescout {

SqliteHistoryStore::SqliteHistoryStore() = default;

SqliteHistoryStore::~SqliteHistoryStore() {
    Shutdown();
}

bool SqliteHistoryStore::Initialize(const std::string& db_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        LOG_WARN("SqliteHistoryStore: already initialized");
        return true;
    }

    // Create parent directory if needed (skip for :memory:)
    if (db_path != ":memory:") {
        try {
            std::filesystem::path p(db_path);
            if (p.has_parent_path() && !p.parent_path().empty()) {
                std::filesystem::create_directories(p.parent_path());
            }
        } catch (const std::exception& ex) {
            LOG_ERROR("SqliteHistoryStore: Failed to create directory for {}: {}", db_path, ex.what());
            return false;
        }
    }

    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        LOG_ERROR("SqliteHistoryStore: Failed to open database {}: {}", db_path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);

    if (!CreateSchema() || !PrepareStatements()) {
        FinalizeStatements();
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    LOG_INFO("SqliteHistoryStore initialized (db_path={})", db_path);
    return true;
}

void SqliteHistoryStore::Shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    FinalizeStatements();

    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_INFO("SqliteHistoryStore shutdown");
    }
}

bool SqliteHistoryStore::IsOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

bool SqliteHistoryStore::CreateSchema() {
    const char* schema = R"SQL(
        CREATE TABLE IF NOT EXISTS device_history (
            id              INTEGER PRIMARY KEY AUTOINCREMENT,
            device_key      TEXT    NOT NULL,
            recorded_at     INTEGER NOT NULL,
            recorded_iso    TEXT    NOT NULL,
            score           INTEGER NOT NULL,
            threat          TEXT    NOT NULL,
            device_json     TEXT    NOT NULL,
            assessment_json TEXT    NOT NULL
        );

        CREATE INDEX IF NOT EXISTS idx_history_key_time ON device_history(device_key, recorded_at);
        CREATE INDEX IF NOT EXISTS idx_history_time ON device_history(recorded_at);
    )SQL";

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, schema, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        LOG_ERROR("SqliteHistoryStore: Failed to create schema: {}", err_msg ? err_msg : "unknown");
        sqlite3_free(err_msg);
        return false;
    }
    return true;
}

bool SqliteHistoryStore::PrepareStatements() {
    struct StatementSpec {
        sqlite3_stmt** stmt;
        const char* sql;
    };
    const StatementSpec specs[] = {
        {&stmt_insert_,
         "INSERT INTO device_history "
         "(device_key, recorded_at, recorded_iso, score, threat, device_json, assessment_json) "
         "VALUES (?, ?, ?, ?, ?, ?, ?)"},
        {&stmt_select_by_key_,
         "SELECT recorded_at, device_json, assessment_json FROM device_history "
         "WHERE device_key = ? ORDER BY recorded_at DESC, id DESC LIMIT ?"},
        {&stmt_prune_,
         "DELETE FROM device_history WHERE recorded_at < ?"},
        {&stmt_count_,
         "SELECT COUNT(*) FROM device_history"},
    };

    for (const auto& spec : specs) {
        if (sqlite3_prepare_v2(db_, spec.sql, -1, spec.stmt, nullptr) != SQLITE_OK) {
            LOG_ERROR("SqliteHistoryStore: Failed to prepare statement: {}", sqlite3_errmsg(db_));
            return false;
        }
    }
    return true;
}

void SqliteHistoryStore::FinalizeStatements() {
    auto finalize = [](sqlite3_stmt*& stmt) {
        if (stmt) { sqlite3_finalize(stmt); stmt = nullptr; }
    };
    finalize(stmt_insert_);
    finalize(stmt_select_by_key_);
    finalize(stmt_prune_);
    finalize(stmt_count_);
}

bool SqliteHistoryStore::Put(const HistoryRecord& record) {
    std::string device_str;
    std::string assessment_str;
    try {
        device_str = DeviceToJson(record.device).dump();
        assessment_str = AssessmentToJson(record.assessment).dump();
    } catch (const nlohmann::json::exception& ex) {
        // dump() throws on invalid UTF-8 in advertised strings
        LOG_WARN("SqliteHistoryStore: cannot serialize {}: {}", record.device.key, ex.what());
        return false;
    }

    std::string iso = TimestampToISO8601(record.timestamp);
    std::string threat = ThreatLevelToString(record.assessment.threat);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_ || !stmt_insert_) return false;

    sqlite3_reset(stmt_insert_);
    sqlite3_bind_text(stmt_insert_, 1, record.device.key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt_insert_, 2, static_cast<sqlite3_int64>(record.timestamp));
    sqlite3_bind_text(stmt_insert_, 3, iso.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt_insert_, 4, static_cast<int>(record.assessment.score));
    sqlite3_bind_text(stmt_insert_, 5, threat.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_insert_, 6, device_str.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt_insert_, 7, assessment_str.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt_insert_);
    if (rc != SQLITE_DONE) {
        LOG_ERROR("SqliteHistoryStore: Failed to insert history for {}: {}",
                  record.device.key, sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<HistoryRecord> SqliteHistoryStore::Get(const std::string& device_key, size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<HistoryRecord> results;
    if (!db_ || !stmt_select_by_key_ || limit == 0) return results;

    sqlite3_int64 bounded = limit > static_cast<size_t>(std::numeric_limits<int>::max())
        ? std::numeric_limits<int>::max() : static_cast<sqlite3_int64>(limit);

    sqlite3_reset(stmt_select_by_key_);
    sqlite3_bind_text(stmt_select_by_key_, 1, device_key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt_select_by_key_, 2, bounded);

    while (sqlite3_step(stmt_select_by_key_) == SQLITE_ROW) {
        const char* device_str = reinterpret_cast<const char*>(sqlite3_column_text(stmt_select_by_key_, 1));
        const char* assessment_str = reinterpret_cast<const char*>(sqlite3_column_text(stmt_select_by_key_, 2));
        if (!device_str || !assessment_str) {
            continue;
        }

        try {
            auto device = DeviceFromJson(nlohmann::json::parse(device_str));
            auto assessment = AssessmentFromJson(nlohmann::json::parse(assessment_str));
            if (!device || !assessment) {
                continue;
            }
            HistoryRecord record;
            record.timestamp = static_cast<uint64_t>(sqlite3_column_int64(stmt_select_by_key_, 0));
            record.device = std::move(*device);
            record.assessment = std::move(*assessment);
            results.push_back(std::move(record));
        } catch (const nlohmann::json::parse_error& ex) {
            LOG_WARN("SqliteHistoryStore: skipping unreadable history row for {}: {}", device_key, ex.what());
        }
    }

    return results;
}

size_t SqliteHistoryStore::Prune(uint64_t older_than_ms, uint64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_ || !stmt_prune_) return 0;

    uint64_t cutoff = now_ms > older_than_ms ? now_ms - older_than_ms : 0;

    sqlite3_reset(stmt_prune_);
    sqlite3_bind_int64(stmt_prune_, 1, static_cast<sqlite3_int64>(cutoff));

    int rc = sqlite3_step(stmt_prune_);
    if (rc != SQLITE_DONE) {
        LOG_ERROR("SqliteHistoryStore: Failed to prune history: {}", sqlite3_errmsg(db_));
        return 0;
    }

    size_t removed = static_cast<size_t>(sqlite3_changes(db_));
    LOG_INFO("SqliteHistoryStore: pruned {} records older than {}", removed, TimestampToISO8601(cutoff));
    return removed;
}

size_t SqliteHistoryStore::GetRecordCount() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_ || !stmt_count_) return 0;

    sqlite3_reset(stmt_count_);
    if (sqlite3_step(stmt_count_) == SQLITE_ROW) {
        return static_cast<size_t>(sqlite3_column_int64(stmt_count_, 0));
    }
    return 0;
}

} // namespace homescout
