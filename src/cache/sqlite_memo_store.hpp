#pragma once

#include "cache/memo_store.hpp"
#include "core/types.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>

struct sqlite3;

namespace glyphnet {

// Memory tier in front of a SQLite database. Misses in memory consult the
// database and promote hits; new values are upserted by a background writer.
// Any database failure is logged once and the store keeps working from memory.
class SqliteMemoStore : public MemoStore {
public:
    struct Config {
        std::string path = "glyphnet.db";
        MemoryMemoStore::Config memory{65535, 8, 0.5, 0x5EED};

        bool validate(std::string& error) const;
    };

    explicit SqliteMemoStore(const Config& config);
    ~SqliteMemoStore() override;

    SqliteMemoStore(const SqliteMemoStore&) = delete;
    SqliteMemoStore& operator=(const SqliteMemoStore&) = delete;

    double get_or_compute_score(const std::vector<double>& a, const std::vector<double>& b,
                                const ScoreFn& compute) override;
    std::string get_or_compute_decision(const std::vector<double>& tile, const DecisionFn& compute) override;
    void flush() override;
    size_t size() const override { return memory_.size(); }
    int precision() const override { return memory_.precision(); }
    const char* name() const override { return "sqlite"; }

    bool persistent() const { return healthy_.load(); }
    const Result& open_result() const { return open_result_; }

    // Blocks until every queued write has reached the database.
    void wait_idle();
    // Drops the memory tier only; the database is kept.
    void clear_memory() { memory_.flush(); }

private:
    struct PendingWrite {
        bool decision = false;
        std::string key;
        double score = 0.0;
        std::string glyph;
    };

    Result open();
    void close();
    bool exec(const char* sql);
    void disable(const std::string& reason);
    std::optional<double> read_score(const std::string& key);
    std::optional<std::string> read_decision(const std::string& key);
    bool write(const PendingWrite& w);
    void enqueue(PendingWrite w);
    void writer_loop();

    Config config_;
    MemoryMemoStore memory_;
    Result open_result_;

    sqlite3* db_ = nullptr;
    std::mutex db_mutex_;
    std::atomic<bool> healthy_{false};

    std::thread writer_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::deque<PendingWrite> queue_;
    bool writing_ = false;
    bool stopping_ = false;
};

}
