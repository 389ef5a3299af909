#pragma once

#include <string>
#include <vector>
#include <functional>
#include <optional>
#include <unordered_map>
#include <mutex>
#include <shared_mutex>
#include <random>
#include <cstdint>

namespace glyphnet {

// Canonical key of one intensity vector: values scaled by 10^precision and
// rounded to integers, comma separated. NaN is written "n".
std::string memo_key(const std::vector<double>& values, int precision);
std::string memo_pair_key(const std::vector<double>& a, const std::vector<double>& b, int precision);

class MemoStore {
public:
    using ScoreFn = std::function<double()>;
    using DecisionFn = std::function<std::string()>;

    virtual ~MemoStore() = default;

    // Similarity scores keyed by a pair of intensity vectors.
    virtual double get_or_compute_score(const std::vector<double>& a, const std::vector<double>& b,
                                        const ScoreFn& compute) = 0;
    // Chosen glyphs keyed by a single intensity vector; valid for one codebook only.
    virtual std::string get_or_compute_decision(const std::vector<double>& tile,
                                                const DecisionFn& compute) = 0;

    // Drops every entry from every tier.
    virtual void flush() = 0;
    virtual size_t size() const = 0;
    virtual int precision() const = 0;
    virtual const char* name() const = 0;
};

class NullMemoStore : public MemoStore {
public:
    double get_or_compute_score(const std::vector<double>& a, const std::vector<double>& b,
                                const ScoreFn& compute) override;
    std::string get_or_compute_decision(const std::vector<double>& tile, const DecisionFn& compute) override;
    void flush() override {}
    size_t size() const override { return 0; }
    int precision() const override { return 0; }
    const char* name() const override { return "none"; }
};

class MemoryMemoStore : public MemoStore {
public:
    struct Config {
        size_t max_entries = 32767;
        int precision = 7;
        double cull_probability = 0.5;
        uint64_t seed = 0x5EED;

        bool validate(std::string& error) const;
    };

    MemoryMemoStore();
    explicit MemoryMemoStore(const Config& config);

    double get_or_compute_score(const std::vector<double>& a, const std::vector<double>& b,
                                const ScoreFn& compute) override;
    std::string get_or_compute_decision(const std::vector<double>& tile, const DecisionFn& compute) override;
    void flush() override;
    size_t size() const override;
    int precision() const override { return config_.precision; }
    const char* name() const override { return "memory"; }

    const Config& config() const { return config_; }

    // Raw tier access by canonical key, used by stores layered on top.
    std::optional<double> find_score(const std::string& key) const;
    std::optional<std::string> find_decision(const std::string& key) const;
    void store_score(const std::string& key, double value);
    void store_decision(const std::string& key, const std::string& glyph);

    size_t score_count() const { return scores_.size(); }
    size_t decision_count() const { return decisions_.size(); }

private:
    template <typename V>
    class KeySpace {
    public:
        explicit KeySpace(uint64_t seed) : rng_(seed) {}

        std::optional<V> find(const std::string& key) const {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = map_.find(key);
            if (it == map_.end()) return std::nullopt;
            return it->second;
        }

        void insert(const std::string& key, const V& value, size_t max_entries, double cull_probability) {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            if (map_.find(key) != map_.end()) return;
            while (!map_.empty() && map_.size() + 1 > max_entries) {
                cull(cull_probability);
            }
            map_.emplace(key, value);
        }

        void clear() {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            map_.clear();
        }

        size_t size() const {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            return map_.size();
        }

    private:
        // Caller holds the exclusive lock.
        void cull(double probability) {
            std::bernoulli_distribution drop(probability);
            for (auto it = map_.begin(); it != map_.end();) {
                if (drop(rng_)) {
                    it = map_.erase(it);
                } else {
                    ++it;
                }
            }
        }

        mutable std::shared_mutex mutex_;
        std::unordered_map<std::string, V> map_;
        std::mt19937_64 rng_;
    };

    Config config_;
    KeySpace<double> scores_;
    KeySpace<std::string> decisions_;
};

}
