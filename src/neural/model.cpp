#include "neural/model.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <stdexcept>

namespace glyphnet {

namespace {

void put_u32(std::vector<uint8_t>& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
    }
}

void put_i32(std::vector<uint8_t>& out, int32_t v) {
    put_u32(out, static_cast<uint32_t>(v));
}

void put_f64(std::vector<uint8_t>& out, double v) {
    uint64_t bits;
    std::memcpy(&bits, &v, sizeof(bits));
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<uint8_t>((bits >> (8 * i)) & 0xFF));
    }
}

class ByteReader {
public:
    explicit ByteReader(const std::vector<uint8_t>& bytes) : bytes_(bytes) {}

    size_t remaining() const { return bytes_.size() - pos_; }

    bool read_i32(int32_t& v) {
        if (remaining() < 4) return false;
        uint32_t u = 0;
        for (int i = 0; i < 4; ++i) {
            u |= static_cast<uint32_t>(bytes_[pos_ + i]) << (8 * i);
        }
        pos_ += 4;
        v = static_cast<int32_t>(u);
        return true;
    }

    bool read_f64(double& v) {
        if (remaining() < 8) return false;
        uint64_t bits = 0;
        for (int i = 0; i < 8; ++i) {
            bits |= static_cast<uint64_t>(bytes_[pos_ + i]) << (8 * i);
        }
        pos_ += 8;
        std::memcpy(&v, &bits, sizeof(v));
        return true;
    }

    bool read_u8(uint8_t& v) {
        if (remaining() < 1) return false;
        v = bytes_[pos_++];
        return true;
    }

private:
    const std::vector<uint8_t>& bytes_;
    size_t pos_ = 0;
};

Result malformed(const std::string& msg) {
    return Result::fail(ErrorCode::INVALID_FORMAT, "model: " + msg);
}

void leaky_relu(std::vector<double>& v, double alpha) {
    for (double& x : v) {
        if (!(x > 0.0)) x *= alpha;
    }
}

void softmax(std::vector<double>& v) {
    double peak = *std::max_element(v.begin(), v.end());
    double sum = 0.0;
    for (double& x : v) {
        x = std::exp(x - peak);
        sum += x;
    }
    for (double& x : v) x /= sum;
}

void sigmoid(std::vector<double>& v) {
    for (double& x : v) x = 1.0 / (1.0 + std::exp(-x));
}

// Mean and deviation of intensities spread uniformly over [0, 1].
const double INTENSITY_MEAN = 0.5;
const double INTENSITY_STDDEV = 0.28867513459481287;

bool same_bits(const std::vector<double>& a, const std::vector<double>& b) {
    return a.size() == b.size() &&
           (a.empty() || std::memcmp(a.data(), b.data(), a.size() * sizeof(double)) == 0);
}

}  // namespace

OutputActivation parse_activation(const std::string& name) {
    if (name == "sigmoid") return OutputActivation::Sigmoid;
    return OutputActivation::Softmax;
}

const char* activation_name(OutputActivation activation) {
    return activation == OutputActivation::Sigmoid ? "sigmoid" : "softmax";
}

Model::Model(std::vector<std::string> glyphs, double alpha, std::vector<Layer> layers)
    : glyphs_(std::move(glyphs)), alpha_(alpha), layers_(std::move(layers)) {}

Model Model::create(int feature_count, const std::vector<int>& hidden_sizes,
                    std::vector<std::string> glyphs, double alpha, std::mt19937_64& rng,
                    double bias_scale) {
    if (feature_count < 1) {
        throw std::invalid_argument("Model::create: feature count must be positive");
    }
    if (glyphs.empty()) {
        throw std::invalid_argument("Model::create: glyph codebook is empty");
    }
    for (const auto& g : glyphs) {
        if (g.size() != 1) {
            throw std::invalid_argument("Model::create: glyph '" + g + "' is not a single-byte label");
        }
    }

    std::vector<int> sizes = hidden_sizes;
    sizes.push_back(static_cast<int>(glyphs.size()));

    std::vector<Layer> layers;
    int fan_in = feature_count;
    std::normal_distribution<double> bias_dist(0.0, bias_scale);
    for (int rows : sizes) {
        if (rows < 1) {
            throw std::invalid_argument("Model::create: layer sizes must be positive");
        }
        Layer layer;
        layer.rows = rows;
        layer.cols = fan_in;
        layer.weights.resize(static_cast<size_t>(rows) * fan_in);
        layer.biases.resize(static_cast<size_t>(rows));

        std::normal_distribution<double> weight_dist(0.0, std::sqrt(2.0 / fan_in));
        for (double& w : layer.weights) w = weight_dist(rng);
        for (double& b : layer.biases) b = bias_dist(rng);

        layers.push_back(std::move(layer));
        fan_in = rows;
    }
    return Model(std::move(glyphs), alpha, std::move(layers));
}

ForwardTrace Model::forward(const std::vector<double>& input, OutputActivation activation) const {
    if (layers_.empty()) {
        throw std::invalid_argument("Model::forward: model has no layers");
    }
    if (input.size() != static_cast<size_t>(layers_.front().cols)) {
        throw std::invalid_argument("Model::forward: expected " + std::to_string(layers_.front().cols) +
                                    " features, got " + std::to_string(input.size()));
    }

    ForwardTrace trace;
    trace.pre.reserve(layers_.size());
    trace.post.reserve(layers_.size());

    const std::vector<double>* x = &input;
    for (size_t l = 0; l < layers_.size(); ++l) {
        const Layer& layer = layers_[l];
        std::vector<double> z(static_cast<size_t>(layer.rows));
        for (int r = 0; r < layer.rows; ++r) {
            const double* row = layer.weights.data() + static_cast<size_t>(r) * layer.cols;
            double sum = layer.biases[r];
            for (int c = 0; c < layer.cols; ++c) {
                sum += row[c] * (*x)[c];
            }
            z[r] = sum;
        }

        std::vector<double> a = z;
        if (l + 1 < layers_.size()) {
            leaky_relu(a, alpha_);
        } else if (activation == OutputActivation::Softmax) {
            softmax(a);
        } else {
            sigmoid(a);
        }

        trace.pre.push_back(std::move(z));
        trace.post.push_back(std::move(a));
        x = &trace.post.back();
    }
    return trace;
}

std::vector<double> Model::predict(const std::vector<double>& input, OutputActivation activation) const {
    return forward(input, activation).post.back();
}

bool Model::validate(int feature_count, std::string& error) const {
    if (glyphs_.empty()) {
        error = "model has no glyph labels";
        return false;
    }
    for (size_t g = 0; g < glyphs_.size(); ++g) {
        if (glyphs_[g].size() != 1) {
            error = "glyph " + std::to_string(g) + " '" + glyphs_[g] + "' is not a single-byte label";
            return false;
        }
    }
    if (layers_.empty()) {
        error = "model has no layers";
        return false;
    }
    for (size_t l = 0; l < layers_.size(); ++l) {
        const Layer& layer = layers_[l];
        if (layer.rows < 1 || layer.cols < 1) {
            error = "layer " + std::to_string(l) + " has invalid shape " + std::to_string(layer.rows) + "x" +
                    std::to_string(layer.cols);
            return false;
        }
        if (layer.weights.size() != static_cast<size_t>(layer.rows) * layer.cols ||
            layer.biases.size() != static_cast<size_t>(layer.rows)) {
            error = "layer " + std::to_string(l) + " storage does not match its " + std::to_string(layer.rows) +
                    "x" + std::to_string(layer.cols) + " shape";
            return false;
        }
        if (l == 0) {
            if (feature_count > 0 && layer.cols != feature_count) {
                error = "layer 0 columns " + std::to_string(layer.cols) + " do not match feature count " +
                        std::to_string(feature_count);
                return false;
            }
        } else if (layer.cols != layers_[l - 1].rows) {
            error = "layer " + std::to_string(l) + " columns " + std::to_string(layer.cols) +
                    " do not match layer " + std::to_string(l - 1) + " rows " + std::to_string(layers_[l - 1].rows);
            return false;
        }
    }
    if (static_cast<size_t>(layers_.back().rows) != glyphs_.size()) {
        error = "output rows " + std::to_string(layers_.back().rows) + " do not match glyph count " +
                std::to_string(glyphs_.size());
        return false;
    }
    return true;
}

size_t Model::parameter_count() const {
    size_t n = 0;
    for (const auto& layer : layers_) {
        n += layer.weights.size() + layer.biases.size();
    }
    return n;
}

std::vector<uint8_t> Model::encode() const {
    std::vector<uint8_t> out;
    out.reserve(16 + parameter_count() * 8);

    put_i32(out, static_cast<int32_t>(glyphs_.size()));
    for (const auto& g : glyphs_) {
        if (g.size() != 1) {
            throw std::invalid_argument("Model::encode: glyph '" + g + "' is not a single-byte label");
        }
        out.push_back(static_cast<uint8_t>(g[0]));
    }
    put_f64(out, alpha_);
    put_i32(out, static_cast<int32_t>(layers_.size()));
    for (const auto& layer : layers_) {
        put_i32(out, layer.rows);
        put_i32(out, layer.cols);
        for (double w : layer.weights) put_f64(out, w);
        for (double b : layer.biases) put_f64(out, b);
    }
    return out;
}

Result Model::decode(const std::vector<uint8_t>& bytes, Model& out) {
    ByteReader in(bytes);

    int32_t glyph_count = 0;
    if (!in.read_i32(glyph_count)) return malformed("truncated before glyph count");
    if (glyph_count < 1 || static_cast<size_t>(glyph_count) > in.remaining()) {
        return malformed("glyph count " + std::to_string(glyph_count) + " is invalid for " +
                         std::to_string(bytes.size()) + " bytes");
    }

    std::vector<std::string> glyphs;
    glyphs.reserve(static_cast<size_t>(glyph_count));
    for (int32_t i = 0; i < glyph_count; ++i) {
        uint8_t c = 0;
        if (!in.read_u8(c)) return malformed("truncated in glyph labels");
        glyphs.push_back(std::string(1, static_cast<char>(c)));
    }

    double alpha = 0.0;
    if (!in.read_f64(alpha)) return malformed("truncated before alpha");

    int32_t layer_count = 0;
    if (!in.read_i32(layer_count)) return malformed("truncated before layer count");
    if (layer_count < 1 || static_cast<size_t>(layer_count) > in.remaining() / 8) {
        return malformed("layer count " + std::to_string(layer_count) + " is invalid");
    }

    std::vector<Layer> layers;
    layers.reserve(static_cast<size_t>(layer_count));
    for (int32_t l = 0; l < layer_count; ++l) {
        Layer layer;
        if (!in.read_i32(layer.rows) || !in.read_i32(layer.cols)) {
            return malformed("truncated in layer " + std::to_string(l) + " shape");
        }
        if (layer.rows < 1 || layer.cols < 1) {
            return malformed("layer " + std::to_string(l) + " declares shape " + std::to_string(layer.rows) + "x" +
                             std::to_string(layer.cols));
        }
        if (l > 0 && layer.cols != layers.back().rows) {
            return malformed("layer " + std::to_string(l) + " columns " + std::to_string(layer.cols) +
                             " do not match layer " + std::to_string(l - 1) + " rows " +
                             std::to_string(layers.back().rows));
        }

        const uint64_t values = static_cast<uint64_t>(layer.rows) * static_cast<uint64_t>(layer.cols) +
                                static_cast<uint64_t>(layer.rows);
        if (values > in.remaining() / 8) {
            return malformed("layer " + std::to_string(l) + " declares " + std::to_string(layer.rows) + "x" +
                             std::to_string(layer.cols) + " (" + std::to_string(values * 8) + " bytes) but only " +
                             std::to_string(in.remaining()) + " bytes remain");
        }

        layer.weights.resize(static_cast<size_t>(layer.rows) * layer.cols);
        layer.biases.resize(static_cast<size_t>(layer.rows));
        for (double& w : layer.weights) in.read_f64(w);
        for (double& b : layer.biases) in.read_f64(b);
        layers.push_back(std::move(layer));
    }

    if (static_cast<size_t>(layers.back().rows) != glyphs.size()) {
        return malformed("output rows " + std::to_string(layers.back().rows) + " do not match glyph count " +
                         std::to_string(glyphs.size()));
    }
    if (in.remaining() != 0) {
        return malformed(std::to_string(in.remaining()) + " trailing bytes after last layer");
    }

    out = Model(std::move(glyphs), alpha, std::move(layers));
    return Result::ok();
}

bool Model::operator==(const Model& other) const {
    if (glyphs_ != other.glyphs_ || layers_.size() != other.layers_.size()) return false;
    if (std::memcmp(&alpha_, &other.alpha_, sizeof(double)) != 0) return false;
    for (size_t l = 0; l < layers_.size(); ++l) {
        const Layer& a = layers_[l];
        const Layer& b = other.layers_[l];
        if (a.rows != b.rows || a.cols != b.cols) return false;
        if (!same_bits(a.weights, b.weights) || !same_bits(a.biases, b.biases)) return false;
    }
    return true;
}

std::vector<double> standardize(const std::vector<double>& intensities) {
    std::vector<double> x(intensities.size());
    for (size_t i = 0; i < intensities.size(); ++i) {
        x[i] = is_transparent(intensities[i]) ? 0.0 : (intensities[i] - INTENSITY_MEAN) / INTENSITY_STDDEV;
    }
    return x;
}

size_t argmax(const std::vector<double>& values) {
    size_t best = 0;
    for (size_t i = 1; i < values.size(); ++i) {
        if (values[i] > values[best]) best = i;
    }
    return best;
}

}
