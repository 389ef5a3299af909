#pragma once

#include <vector>
#include <cstddef>

namespace glyphnet {

// Tile intensities plus one raw similarity score per codebook glyph.
struct TrainingExample {
    std::vector<double> intensities;
    std::vector<double> scores;
};

class ExampleSource {
public:
    virtual ~ExampleSource() = default;
    // Returns false once the sequence is exhausted.
    virtual bool next(TrainingExample& out) = 0;
};

class VectorExampleSource : public ExampleSource {
public:
    explicit VectorExampleSource(std::vector<TrainingExample> examples, bool cycle = false)
        : examples_(std::move(examples)), cycle_(cycle) {}

    bool next(TrainingExample& out) override {
        if (examples_.empty()) return false;
        if (index_ >= examples_.size()) {
            if (!cycle_) return false;
            index_ = 0;
        }
        out = examples_[index_++];
        return true;
    }

    void reset() { index_ = 0; }
    size_t position() const { return index_; }

private:
    std::vector<TrainingExample> examples_;
    bool cycle_ = false;
    size_t index_ = 0;
};

}
