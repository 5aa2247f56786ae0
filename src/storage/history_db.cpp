#include "storage/history_db.hpp"

#include <filesystem>
#include <print>

namespace fs = std::filesystem;

HistoryDb::HistoryDb() = default;

HistoryDb::~HistoryDb() {
    close();
}

bool HistoryDb::open(const std::string& path) {
    fs::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    if (sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: WAL mode unavailable: {}", sqlite3_errmsg(db_));
    }

    if (!create_tables()) return false;

    const char* insert_sql =
        "INSERT INTO runs (input_path, output_path, model, language, audio_duration, "
        "processing_time, segments, status, error) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)";

    const char* recent_sql =
        "SELECT id, timestamp, input_path, output_path, model, language, audio_duration, "
        "processing_time, segments, status, error "
        "FROM runs ORDER BY id DESC LIMIT ?";

    if (sqlite3_prepare_v2(db_, insert_sql, -1, &insert_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }

    if (sqlite3_prepare_v2(db_, recent_sql, -1, &recent_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare recent failed: {}", sqlite3_errmsg(db_));
        return false;
    }

    return true;
}

void HistoryDb::close() {
    if (insert_stmt_) { sqlite3_finalize(insert_stmt_); insert_stmt_ = nullptr; }
    if (recent_stmt_) { sqlite3_finalize(recent_stmt_); recent_stmt_ = nullptr; }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

bool HistoryDb::insert(const RunRecord& run) {
    if (!insert_stmt_) return false;

    sqlite3_reset(insert_stmt_);

    auto bind_nullable = [this](int idx, const std::string& val) {
        if (val.empty()) sqlite3_bind_null(insert_stmt_, idx);
        else sqlite3_bind_text(insert_stmt_, idx, val.c_str(), -1, SQLITE_TRANSIENT);
    };

    sqlite3_bind_text(insert_stmt_, 1, run.input_path.c_str(), -1, SQLITE_TRANSIENT);
    bind_nullable(2, run.output_path);
    bind_nullable(3, run.model);
    bind_nullable(4, run.language);
    sqlite3_bind_double(insert_stmt_, 5, run.audio_duration);
    sqlite3_bind_double(insert_stmt_, 6, run.processing_time);
    sqlite3_bind_int64(insert_stmt_, 7, run.segments);
    sqlite3_bind_text(insert_stmt_, 8, run.status.c_str(), -1, SQLITE_TRANSIENT);
    bind_nullable(9, run.error);

    int rc = sqlite3_step(insert_stmt_);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "db: insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<HistoryEntry> HistoryDb::recent(int limit) {
    std::vector<HistoryEntry> entries;
    if (!recent_stmt_) return entries;

    sqlite3_reset(recent_stmt_);
    sqlite3_bind_int(recent_stmt_, 1, limit);

    auto get_text = [](sqlite3_stmt* stmt, int col) -> std::string {
        auto* p = sqlite3_column_text(stmt, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    };

    while (sqlite3_step(recent_stmt_) == SQLITE_ROW) {
        HistoryEntry e;
        e.id = sqlite3_column_int64(recent_stmt_, 0);
        e.timestamp = get_text(recent_stmt_, 1);
        e.run.input_path = get_text(recent_stmt_, 2);
        e.run.output_path = get_text(recent_stmt_, 3);
        e.run.model = get_text(recent_stmt_, 4);
        e.run.language = get_text(recent_stmt_, 5);
        e.run.audio_duration = sqlite3_column_double(recent_stmt_, 6);
        e.run.processing_time = sqlite3_column_double(recent_stmt_, 7);
        e.run.segments = sqlite3_column_int64(recent_stmt_, 8);
        e.run.status = get_text(recent_stmt_, 9);
        e.run.error = get_text(recent_stmt_, 10);
        entries.push_back(std::move(e));
    }

    return entries;
}

bool HistoryDb::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS runs (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now')),
            input_path TEXT NOT NULL,
            output_path TEXT,
            model TEXT,
            language TEXT,
            audio_duration REAL,
            processing_time REAL,
            segments INTEGER,
            status TEXT NOT NULL,
            error TEXT
        );
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: create table failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}
