#include "cache/sqlite_memo_store.hpp"
#include <sqlite3.h>
#include <iostream>
#include <stdexcept>

namespace glyphnet {

namespace {

const char* const kSchema =
    "CREATE TABLE IF NOT EXISTS score_memo (memo_key TEXT PRIMARY KEY, score REAL NOT NULL);"
    "CREATE TABLE IF NOT EXISTS decision_memo (memo_key TEXT PRIMARY KEY, glyph TEXT NOT NULL);";

const char* const kUpsertScore =
    "INSERT INTO score_memo (memo_key, score) VALUES (?1, ?2) "
    "ON CONFLICT(memo_key) DO UPDATE SET score = excluded.score";

const char* const kUpsertDecision =
    "INSERT INTO decision_memo (memo_key, glyph) VALUES (?1, ?2) "
    "ON CONFLICT(memo_key) DO UPDATE SET glyph = excluded.glyph";

const char* const kSelectScore = "SELECT score FROM score_memo WHERE memo_key = ?1";
const char* const kSelectDecision = "SELECT glyph FROM decision_memo WHERE memo_key = ?1";

}  // namespace

bool SqliteMemoStore::Config::validate(std::string& error) const {
    if (path.empty()) {
        error = "cache.db_path must not be empty";
        return false;
    }
    return memory.validate(error);
}

SqliteMemoStore::SqliteMemoStore(const Config& config) : config_(config), memory_(config.memory) {
    std::string error;
    if (!config_.validate(error)) {
        throw std::invalid_argument("SqliteMemoStore: " + error);
    }

    open_result_ = open();
    if (open_result_.failure()) {
        std::cerr << "Warning: memo database unavailable, caching in memory only: " << open_result_.message << "\n";
        return;
    }
    healthy_ = true;
    writer_ = std::thread(&SqliteMemoStore::writer_loop, this);
}

SqliteMemoStore::~SqliteMemoStore() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = true;
    }
    queue_cv_.notify_all();
    if (writer_.joinable()) {
        writer_.join();
    }
    close();
}

Result SqliteMemoStore::open() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (sqlite3_open(config_.path.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return Result::fail(ErrorCode::DATABASE_ERROR, "cannot open " + config_.path + ": " + msg);
    }
    sqlite3_busy_timeout(db_, 2000);
    if (!exec(kSchema)) {
        std::string msg = sqlite3_errmsg(db_);
        sqlite3_close(db_);
        db_ = nullptr;
        return Result::fail(ErrorCode::DATABASE_ERROR, "cannot create memo tables: " + msg);
    }
    return Result::ok();
}

void SqliteMemoStore::close() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

// Caller holds db_mutex_.
bool SqliteMemoStore::exec(const char* sql) {
    char* err = nullptr;
    const int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        if (err) {
            std::cerr << "Warning: sqlite: " << err << "\n";
            sqlite3_free(err);
        }
        return false;
    }
    return true;
}

void SqliteMemoStore::disable(const std::string& reason) {
    if (healthy_.exchange(false)) {
        std::cerr << "Warning: memo database disabled, continuing in memory: " << reason << "\n";
    }
}

std::optional<double> SqliteMemoStore::read_score(const std::string& key) {
    if (!healthy_) return std::nullopt;
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return std::nullopt;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, kSelectScore, -1, &stmt, nullptr) != SQLITE_OK) {
        disable(sqlite3_errmsg(db_));
        return std::nullopt;
    }
    sqlite3_bind_text(stmt, 1, key.c_str(), static_cast<int>(key.size()), SQLITE_TRANSIENT);

    std::optional<double> out;
    const int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        out = sqlite3_column_double(stmt, 0);
    } else if (rc != SQLITE_DONE) {
        disable(sqlite3_errmsg(db_));
    }
    sqlite3_finalize(stmt);
    return out;
}

std::optional<std::string> SqliteMemoStore::read_decision(const std::string& key) {
    if (!healthy_) return std::nullopt;
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return std::nullopt;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, kSelectDecision, -1, &stmt, nullptr) != SQLITE_OK) {
        disable(sqlite3_errmsg(db_));
        return std::nullopt;
    }
    sqlite3_bind_text(stmt, 1, key.c_str(), static_cast<int>(key.size()), SQLITE_TRANSIENT);

    std::optional<std::string> out;
    const int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        const unsigned char* raw = sqlite3_column_text(stmt, 0);
        const int len = sqlite3_column_bytes(stmt, 0);
        out = raw ? std::string(reinterpret_cast<const char*>(raw), static_cast<size_t>(len)) : std::string();
    } else if (rc != SQLITE_DONE) {
        disable(sqlite3_errmsg(db_));
    }
    sqlite3_finalize(stmt);
    return out;
}

bool SqliteMemoStore::write(const PendingWrite& w) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return false;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, w.decision ? kUpsertDecision : kUpsertScore, -1, &stmt, nullptr) != SQLITE_OK) {
        disable(sqlite3_errmsg(db_));
        return false;
    }
    sqlite3_bind_text(stmt, 1, w.key.c_str(), static_cast<int>(w.key.size()), SQLITE_TRANSIENT);
    if (w.decision) {
        sqlite3_bind_text(stmt, 2, w.glyph.c_str(), static_cast<int>(w.glyph.size()), SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_double(stmt, 2, w.score);
    }
    const bool ok = sqlite3_step(stmt) == SQLITE_DONE;
    if (!ok) {
        disable(sqlite3_errmsg(db_));
    }
    sqlite3_finalize(stmt);
    return ok;
}

void SqliteMemoStore::enqueue(PendingWrite w) {
    if (!healthy_) return;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.push_back(std::move(w));
    }
    queue_cv_.notify_one();
}

void SqliteMemoStore::writer_loop() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    for (;;) {
        queue_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        if (queue_.empty()) {
            if (stopping_) break;
            continue;
        }

        std::deque<PendingWrite> batch;
        batch.swap(queue_);
        writing_ = true;
        lock.unlock();

        for (const auto& w : batch) {
            if (!healthy_) break;
            write(w);
        }

        lock.lock();
        writing_ = false;
        idle_cv_.notify_all();
    }
    idle_cv_.notify_all();
}

void SqliteMemoStore::wait_idle() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_cv_.wait(lock, [this] { return (queue_.empty() && !writing_) || !writer_.joinable(); });
}

double SqliteMemoStore::get_or_compute_score(const std::vector<double>& a, const std::vector<double>& b,
                                             const ScoreFn& compute) {
    const std::string key = memo_pair_key(a, b, memory_.precision());
    if (auto hit = memory_.find_score(key)) {
        return *hit;
    }
    if (auto stored = read_score(key)) {
        memory_.store_score(key, *stored);
        return *stored;
    }

    double value = compute();
    memory_.store_score(key, value);
    PendingWrite w;
    w.key = key;
    w.score = value;
    enqueue(std::move(w));
    return value;
}

std::string SqliteMemoStore::get_or_compute_decision(const std::vector<double>& tile, const DecisionFn& compute) {
    const std::string key = memo_key(tile, memory_.precision());
    if (auto hit = memory_.find_decision(key)) {
        return *hit;
    }
    if (auto stored = read_decision(key)) {
        memory_.store_decision(key, *stored);
        return *stored;
    }

    std::string glyph = compute();
    memory_.store_decision(key, glyph);
    PendingWrite w;
    w.decision = true;
    w.key = key;
    w.glyph = glyph;
    enqueue(std::move(w));
    return glyph;
}

void SqliteMemoStore::flush() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.clear();
    }
    wait_idle();
    memory_.flush();

    std::lock_guard<std::mutex> lock(db_mutex_);
    if (db_ && healthy_) {
        if (!exec("DELETE FROM score_memo; DELETE FROM decision_memo;")) {
            disable("flush failed");
        }
    }
}

}
