#pragma once

#include <cstdint>
#include <sqlite3.h>
#include <string>
#include <vector>

struct HistoryEntry {
    int64_t id = 0;
    std::string timestamp;
    std::string source;
    double audio_duration = 0.0;
    double speech_duration = 0.0;
    bool has_speech = false;
    std::string outcome;  // to_string(Outcome): validated, parse_failed, skipped, analyzed_only,
                          // engine_error, invalid_audio, read_failed
    int64_t entry_count = 0;
    int64_t rejected_count = 0;
    std::string transcript;
};

class HistoryDb {
public:
    HistoryDb();
    ~HistoryDb();

    HistoryDb(const HistoryDb&) = delete;
    HistoryDb& operator=(const HistoryDb&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    // id and timestamp of the argument are ignored.
    bool insert(const HistoryEntry& entry);

    std::vector<HistoryEntry> recent(int limit = 10);

private:
    bool create_tables();

    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
};
