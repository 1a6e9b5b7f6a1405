#pragma once

#include "engine/DeviceTypes.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace homescout {

struct HistoryRecord {
    DiscoveredDevice device;
    ConfidenceAssessment assessment;
    uint64_t timestamp = 0;
};

// Write side of device history. The coordinator only calls Put(); Get() and
// Prune() serve callers outside the event path.
class HistorySink {
public:
    virtual ~HistorySink() = default;

    virtual bool Put(const HistoryRecord& record) = 0;

    // Newest first, at most limit records.
    virtual std::vector<HistoryRecord> Get(const std::string& device_key, size_t limit) = 0;

    // Deletes records whose timestamp is older than (now_ms - older_than_ms).
    // Returns the number of records removed.
    virtual size_t Prune(uint64_t older_than_ms, uint64_t now_ms) = 0;
};

class SqliteHistoryStore : public HistorySink {
public:
    SqliteHistoryStore();
    ~SqliteHistoryStore() override;

    SqliteHistoryStore(const SqliteHistoryStore&) = delete;
    SqliteHistoryStore& operator=(const SqliteHistoryStore&) = delete;

    bool Initialize(const std::string& db_path = "data/homescout.db");
    void Shutdown();
    bool IsOpen() const;

    bool Put(const HistoryRecord& record) override;
    std::vector<HistoryRecord> Get(const std::string& device_key, size_t limit) override;
    size_t Prune(uint64_t older_than_ms, uint64_t now_ms) override;

    size_t GetRecordCount();

private:
    bool CreateSchema();
    bool PrepareStatements();
    void FinalizeStatements();

    sqlite3* db_{nullptr};
    mutable std::mutex mutex_;

    sqlite3_stmt* stmt_insert_{nullptr};
    sqlite3_stmt* stmt_select_by_key_{nullptr};
    sqlite3_stmt* stmt_prune_{nullptr};
    sqlite3_stmt* stmt_count_{nullptr};
};

} // namespace homescout
