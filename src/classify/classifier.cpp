#include "classify/classifier.hpp"
#include <cmath>
#include <exception>
#include <iostream>
#include <limits>
#include <stdexcept>

#ifdef HAS_OPENMP
#include <omp.h>
#endif

namespace glyphnet {

size_t pick_within_tolerance(const std::vector<double>& scores, double tolerance, std::mt19937_64& rng) {
    if (scores.empty()) {
        throw std::invalid_argument("pick_within_tolerance: no scores");
    }
    size_t best = 0;
    for (size_t i = 1; i < scores.size(); ++i) {
        if (scores[i] > scores[best] || std::isnan(scores[best])) best = i;
    }
    if (!(tolerance > 0.0)) return best;

    const double peak = scores[best];
    const double band = tolerance * std::abs(peak);
    std::vector<size_t> candidates;
    for (size_t i = 0; i < scores.size(); ++i) {
        if (!std::isnan(scores[i]) && peak - scores[i] <= band) candidates.push_back(i);
    }
    if (candidates.size() <= 1) return best;
    std::uniform_int_distribution<size_t> pick(0, candidates.size() - 1);
    return candidates[pick(rng)];
}

bool SsimClassifier::Config::validate(std::string& error) const {
    if (parallelism < 1) {
        error = "parallelism must be at least 1";
        return false;
    }
    if (tolerance < 0.0 || tolerance >= 1.0) {
        error = "tolerance must be in [0, 1)";
        return false;
    }
    return true;
}

SsimClassifier::SsimClassifier(const GlyphCodebook& codebook, const SsimComparator& comparator, MemoStore& store,
                               const Config& config)
    : codebook_(codebook), comparator_(comparator), store_(store), config_(config), rng_(config.seed) {
    std::string error;
    if (!config_.validate(error)) {
        throw std::invalid_argument("SsimClassifier: " + error);
    }
    Result r = codebook_.validate();
    if (r.failure()) {
        throw std::invalid_argument("SsimClassifier: " + r.message);
    }
}

void SsimClassifier::check_tile(const Tile& tile) const {
    SsimComparator::common_size(tile.size(), codebook_.tile_size());
}

double SsimClassifier::score_glyph(const Tile& tile, const GlyphProfile* tile_profile, const Glyph& glyph) {
    auto compute = [&]() {
        if (tile_profile) return comparator_.compare_profiles(*tile_profile, glyph.profile);
        return comparator_.compare(tile, glyph.tile);
    };
    try {
        return store_.get_or_compute_score(tile.intensities(), glyph.tile.intensities(), compute);
    } catch (const std::invalid_argument&) {
        throw;
    } catch (const std::exception& e) {
        std::cerr << "Warning: memo store " << store_.name() << " failed (" << e.what() << "), computing directly\n";
        return compute();
    }
}

std::vector<double> SsimClassifier::scores(const Tile& tile) {
    check_tile(tile);

    // Precomputed glyph statistics only apply to whole-tile comparisons at the same size.
    GlyphProfile profile;
    const GlyphProfile* tile_profile = nullptr;
    if (comparator_.config().subdivisions == 0 && tile.size() == codebook_.tile_size() &&
        comparator_.config().sigma == codebook_.profile_sigma()) {
        profile = GlyphProfile::from_tile(tile, codebook_.profile_sigma());
        tile_profile = &profile;
    }

    const int n = static_cast<int>(codebook_.size());
    std::vector<double> out(codebook_.size(), 0.0);
    std::exception_ptr failure;

#ifdef HAS_OPENMP
    #pragma omp parallel for num_threads(config_.parallelism) schedule(dynamic)
#endif
    for (int i = 0; i < n; ++i) {
        try {
            out[i] = score_glyph(tile, tile_profile, codebook_.at(static_cast<size_t>(i)));
        } catch (...) {
#ifdef HAS_OPENMP
            #pragma omp critical(glyphnet_score_failure)
#endif
            {
                if (!failure) failure = std::current_exception();
            }
        }
    }

    if (failure) std::rethrow_exception(failure);
    return out;
}

Selection SsimClassifier::select(const Tile& tile) {
    std::vector<double> s = scores(tile);
    size_t index;
    {
        std::lock_guard<std::mutex> lock(rng_mutex_);
        index = pick_within_tolerance(s, config_.tolerance, rng_);
    }
    Selection sel;
    sel.index = index;
    sel.glyph = codebook_.at(index).symbol;
    sel.score = s[index];
    return sel;
}

Selection SsimClassifier::classify(const Tile& tile) {
    check_tile(tile);

    // Random picks inside the tolerance band must not be pinned by the cache.
    if (config_.tolerance > 0.0) {
        return select(tile);
    }

    Selection computed;
    bool fresh = false;
    auto decide = [&]() {
        computed = select(tile);
        fresh = true;
        return computed.glyph;
    };

    std::string glyph;
    try {
        glyph = store_.get_or_compute_decision(tile.intensities(), decide);
    } catch (const std::invalid_argument&) {
        throw;
    } catch (const std::exception& e) {
        std::cerr << "Warning: memo store " << store_.name() << " failed (" << e.what() << "), computing directly\n";
        return select(tile);
    }
    if (fresh) return computed;

    Selection sel;
    sel.glyph = glyph;
    int index = codebook_.index_of(glyph);
    if (index < 0) {
        // Stale decision from another codebook.
        std::cerr << "Warning: cached decision '" << glyph << "' is not in the codebook, recomputing\n";
        return select(tile);
    }
    sel.index = static_cast<size_t>(index);
    sel.score = std::numeric_limits<double>::quiet_NaN();
    return sel;
}

NeuralClassifier::NeuralClassifier(std::shared_ptr<const Model> model, const Config& config)
    : config_(config), rng_(config.seed) {
    if (config_.tolerance < 0.0 || config_.tolerance >= 1.0) {
        throw std::invalid_argument("NeuralClassifier: tolerance must be in [0, 1)");
    }
    set_model(std::move(model));
}

void NeuralClassifier::set_model(std::shared_ptr<const Model> model) {
    if (!model) {
        throw std::invalid_argument("NeuralClassifier: model must not be null");
    }
    std::string error;
    if (!model->validate(0, error)) {
        throw std::invalid_argument("NeuralClassifier: " + error);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    model_ = std::move(model);
}

std::shared_ptr<const Model> NeuralClassifier::model() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return model_;
}

std::vector<double> NeuralClassifier::run(const Model& model, const Tile& tile) const {
    if (tile.intensities().size() != static_cast<size_t>(model.feature_count())) {
        throw std::invalid_argument("NeuralClassifier: tile has " + std::to_string(tile.intensities().size()) +
                                    " pixels, model expects " + std::to_string(model.feature_count()));
    }
    return model.predict(standardize(tile.intensities()), config_.activation);
}

std::vector<double> NeuralClassifier::probabilities(const Tile& tile) const {
    return run(*model(), tile);
}

Selection NeuralClassifier::classify(const Tile& tile) {
    auto snapshot = model();
    std::vector<double> p = run(*snapshot, tile);
    size_t index;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        index = pick_within_tolerance(p, config_.tolerance, rng_);
    }
    Selection sel;
    sel.index = index;
    sel.glyph = snapshot->glyphs()[index];
    sel.score = p[index];
    return sel;
}

std::vector<GlyphCell> classify_tiles(TileClassifier& classifier, const std::vector<Tile>& tiles) {
    std::vector<GlyphCell> cells;
    cells.reserve(tiles.size());
    for (const auto& tile : tiles) {
        Selection sel = classifier.classify(tile);
        GlyphCell cell;
        cell.glyph = sel.glyph;
        cell.score = sel.score;
        cell.color = tile.color();
        cells.push_back(std::move(cell));
    }
    return cells;
}

bool SsimExampleSource::next(TrainingExample& out) {
    Tile tile;
    if (!tiles_.next(tile)) return false;
    out.intensities = tile.intensities();
    out.scores = classifier_.scores(tile);
    return true;
}

}
