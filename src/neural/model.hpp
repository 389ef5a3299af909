#pragma once

#include "core/types.hpp"
#include <string>
#include <vector>
#include <random>
#include <cstdint>

namespace glyphnet {

enum class OutputActivation {
    Softmax,  // one glyph out of many
    Sigmoid   // independent one-vs-all scores
};

OutputActivation parse_activation(const std::string& name);
const char* activation_name(OutputActivation activation);

// Weights are row-major: rows = output neurons, cols = input neurons.
struct Layer {
    int rows = 0;
    int cols = 0;
    std::vector<double> weights;
    std::vector<double> biases;

    double weight(int r, int c) const { return weights[static_cast<size_t>(r) * cols + c]; }
};

struct ForwardTrace {
    std::vector<std::vector<double>> pre;   // W * x + b
    std::vector<std::vector<double>> post;  // after activation

    const std::vector<double>& output() const { return post.back(); }
};

class Model {
public:
    Model() = default;
    Model(std::vector<std::string> glyphs, double alpha, std::vector<Layer> layers);

    // He-normal weights scaled by fan-in; biases drawn with a fixed scale.
    // Every glyph label must be a single byte.
    static Model create(int feature_count, const std::vector<int>& hidden_sizes,
                        std::vector<std::string> glyphs, double alpha, std::mt19937_64& rng,
                        double bias_scale = 0.1);

    // Throws std::invalid_argument when the input width does not match layer 0.
    ForwardTrace forward(const std::vector<double>& input, OutputActivation activation) const;
    std::vector<double> predict(const std::vector<double>& input, OutputActivation activation) const;

    // Checks the layer chain; feature_count <= 0 skips the input width check.
    bool validate(int feature_count, std::string& error) const;

    int feature_count() const { return layers_.empty() ? 0 : layers_.front().cols; }
    int output_count() const { return layers_.empty() ? 0 : layers_.back().rows; }
    size_t parameter_count() const;

    const std::vector<std::string>& glyphs() const { return glyphs_; }
    double alpha() const { return alpha_; }
    const std::vector<Layer>& layers() const { return layers_; }
    std::vector<Layer>& layers() { return layers_; }

    // Glyph labels are stored as one byte each; throws std::invalid_argument
    // for longer labels.
    std::vector<uint8_t> encode() const;
    static Result decode(const std::vector<uint8_t>& bytes, Model& out);

    // Bitwise comparison of every weight and bias.
    bool operator==(const Model& other) const;
    bool operator!=(const Model& other) const { return !(*this == other); }

private:
    std::vector<std::string> glyphs_;
    double alpha_ = 0.01;
    std::vector<Layer> layers_;
};

// Z-score of each intensity against the nominal [0,1] range (mean 0.5,
// deviation sqrt(1/12)), so tiles keep their overall brightness. Transparent
// pixels map to 0.
std::vector<double> standardize(const std::vector<double>& intensities);

size_t argmax(const std::vector<double>& values);

}
