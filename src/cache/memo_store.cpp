#include "cache/memo_store.hpp"
#include <cmath>
#include <stdexcept>

namespace glyphnet {

namespace {

constexpr int MAX_PRECISION = 12;

}  // namespace

std::string memo_key(const std::vector<double>& values, int precision) {
    const double scale = std::pow(10.0, precision);
    std::string key;
    key.reserve(values.size() * (precision + 2));
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) key += ',';
        double v = values[i];
        if (std::isnan(v)) {
            key += 'n';
        } else {
            key += std::to_string(std::llround(v * scale));
        }
    }
    return key;
}

std::string memo_pair_key(const std::vector<double>& a, const std::vector<double>& b, int precision) {
    return memo_key(a, precision) + ";" + memo_key(b, precision);
}

double NullMemoStore::get_or_compute_score(const std::vector<double>&, const std::vector<double>&,
                                           const ScoreFn& compute) {
    return compute();
}

std::string NullMemoStore::get_or_compute_decision(const std::vector<double>&, const DecisionFn& compute) {
    return compute();
}

bool MemoryMemoStore::Config::validate(std::string& error) const {
    if (max_entries == 0) {
        error = "cache.max_entries must be at least 1";
        return false;
    }
    if (precision < 0 || precision > MAX_PRECISION) {
        error = "cache.precision must be in [0, " + std::to_string(MAX_PRECISION) + "]";
        return false;
    }
    if (!(cull_probability > 0.0) || cull_probability > 1.0) {
        error = "cache.cull_probability must be in (0, 1]";
        return false;
    }
    return true;
}

MemoryMemoStore::MemoryMemoStore() : MemoryMemoStore(Config{}) {}

MemoryMemoStore::MemoryMemoStore(const Config& config)
    : config_(config), scores_(config.seed), decisions_(config.seed ^ 0x9E3779B97F4A7C15ull) {
    std::string error;
    if (!config_.validate(error)) {
        throw std::invalid_argument("MemoryMemoStore: " + error);
    }
}

double MemoryMemoStore::get_or_compute_score(const std::vector<double>& a, const std::vector<double>& b,
                                             const ScoreFn& compute) {
    const std::string key = memo_pair_key(a, b, config_.precision);
    if (auto hit = scores_.find(key)) {
        return *hit;
    }
    double value = compute();
    scores_.insert(key, value, config_.max_entries, config_.cull_probability);
    return value;
}

std::string MemoryMemoStore::get_or_compute_decision(const std::vector<double>& tile, const DecisionFn& compute) {
    const std::string key = memo_key(tile, config_.precision);
    if (auto hit = decisions_.find(key)) {
        return *hit;
    }
    std::string glyph = compute();
    decisions_.insert(key, glyph, config_.max_entries, config_.cull_probability);
    return glyph;
}

void MemoryMemoStore::flush() {
    scores_.clear();
    decisions_.clear();
}

size_t MemoryMemoStore::size() const {
    return scores_.size() + decisions_.size();
}

std::optional<double> MemoryMemoStore::find_score(const std::string& key) const {
    return scores_.find(key);
}

std::optional<std::string> MemoryMemoStore::find_decision(const std::string& key) const {
    return decisions_.find(key);
}

void MemoryMemoStore::store_score(const std::string& key, double value) {
    scores_.insert(key, value, config_.max_entries, config_.cull_probability);
}

void MemoryMemoStore::store_decision(const std::string& key, const std::string& glyph) {
    decisions_.insert(key, glyph, config_.max_entries, config_.cull_probability);
}

}
