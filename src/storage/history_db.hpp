#pragma once

#include <cstdint>
#include <sqlite3.h>
#include <string>
#include <vector>

struct RunRecord {
    std::string input_path;
    std::string output_path;    // empty unless the run finished
    std::string model;
    std::string language;
    double audio_duration = 0.0;
    double processing_time = 0.0;
    int64_t segments = 0;
    std::string status;         // "done", "failed" or "cancelled"
    std::string error;
};

struct HistoryEntry {
    int64_t id;
    std::string timestamp;
    RunRecord run;
};

class HistoryDb {
public:
    HistoryDb();
    ~HistoryDb();

    HistoryDb(const HistoryDb&) = delete;
    HistoryDb& operator=(const HistoryDb&) = delete;

    bool open(const std::string& path);
    void close();

    bool insert(const RunRecord& run);

    // Newest first.
    std::vector<HistoryEntry> recent(int limit = 10);

private:
    bool create_tables();

    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
};
