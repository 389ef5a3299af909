#pragma once

#include "cache/memo_store.hpp"
#include "classify/codebook.hpp"
#include "neural/example_source.hpp"
#include "neural/model.hpp"
#include "similarity/ssim_comparator.hpp"
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <vector>

namespace glyphnet {

struct Selection {
    std::string glyph;
    size_t index = 0;
    double score = 0.0;  // NaN when served from the decision cache
};

class TileClassifier {
public:
    virtual ~TileClassifier() = default;
    virtual Selection classify(const Tile& tile) = 0;
    virtual const char* name() const = 0;
};

// Index of the best score, lowest index on ties. With tolerance > 0 any score
// within that relative distance of the best is eligible and one is drawn.
size_t pick_within_tolerance(const std::vector<double>& scores, double tolerance, std::mt19937_64& rng);

class SsimClassifier : public TileClassifier {
public:
    struct Config {
        int parallelism = 8;
        double tolerance = 0.0;
        uint64_t seed = 7;

        bool validate(std::string& error) const;
    };

    // Holds references: the codebook and store must outlive the classifier.
    // The store's decision cache must only ever see this codebook.
    SsimClassifier(const GlyphCodebook& codebook, const SsimComparator& comparator, MemoStore& store,
                   const Config& config);
    SsimClassifier(GlyphCodebook&& codebook, const SsimComparator& comparator, MemoStore& store,
                   const Config& config) = delete;

    Selection classify(const Tile& tile) override;
    const char* name() const override { return "ssim"; }

    // One score per codebook glyph, in codebook order.
    std::vector<double> scores(const Tile& tile);

    // Throws std::invalid_argument if the tile cannot be compared with the glyphs.
    void check_tile(const Tile& tile) const;

    const GlyphCodebook& codebook() const { return codebook_; }

private:
    double score_glyph(const Tile& tile, const GlyphProfile* tile_profile, const Glyph& glyph);
    Selection select(const Tile& tile);

    const GlyphCodebook& codebook_;
    SsimComparator comparator_;
    MemoStore& store_;
    Config config_;
    std::mt19937_64 rng_;
    std::mutex rng_mutex_;
};

class NeuralClassifier : public TileClassifier {
public:
    struct Config {
        OutputActivation activation = OutputActivation::Softmax;
        double tolerance = 0.0;
        uint64_t seed = 7;
    };

    NeuralClassifier(std::shared_ptr<const Model> model, const Config& config);

    Selection classify(const Tile& tile) override;
    const char* name() const override { return "model"; }

    std::vector<double> probabilities(const Tile& tile) const;
    void set_model(std::shared_ptr<const Model> model);
    std::shared_ptr<const Model> model() const;

private:
    std::vector<double> run(const Model& model, const Tile& tile) const;

    mutable std::mutex mutex_;
    std::shared_ptr<const Model> model_;
    Config config_;
    std::mt19937_64 rng_;
};

std::vector<GlyphCell> classify_tiles(TileClassifier& classifier, const std::vector<Tile>& tiles);

class TileSource {
public:
    virtual ~TileSource() = default;
    virtual bool next(Tile& out) = 0;
};

class VectorTileSource : public TileSource {
public:
    explicit VectorTileSource(std::vector<Tile> tiles) : tiles_(std::move(tiles)) {}

    bool next(Tile& out) override {
        if (index_ >= tiles_.size()) return false;
        out = tiles_[index_++];
        return true;
    }

private:
    std::vector<Tile> tiles_;
    size_t index_ = 0;
};

// Training examples scored live against the codebook.
class SsimExampleSource : public ExampleSource {
public:
    SsimExampleSource(TileSource& tiles, SsimClassifier& classifier) : tiles_(tiles), classifier_(classifier) {}

    bool next(TrainingExample& out) override;

private:
    TileSource& tiles_;
    SsimClassifier& classifier_;
};

}
