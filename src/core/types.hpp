#pragma once

#include <vector>
#include <cstdint>
#include <cmath>
#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

namespace glyphnet {

enum class ErrorCode {
    SUCCESS = 0,
    FILE_NOT_FOUND,
    INVALID_FORMAT,
    IO_ERROR,
    INVALID_ARGUMENT,
    DATABASE_ERROR
};

struct Result {
    ErrorCode error = ErrorCode::SUCCESS;
    std::string message;

    bool success() const { return error == ErrorCode::SUCCESS; }
    bool failure() const { return error != ErrorCode::SUCCESS; }

    static Result ok() { return {ErrorCode::SUCCESS, ""}; }
    static Result fail(ErrorCode code, const std::string& msg) { return {code, msg}; }
};

struct Size {
    int width = 0;
    int height = 0;

    bool operator==(const Size& other) const {
        return width == other.width && height == other.height;
    }
    bool operator!=(const Size& other) const { return !(*this == other); }
    int area() const { return width * height; }
};

constexpr uint32_t NO_COLOR = 0xFFFFFFFFu;

inline double transparent_pixel() {
    return std::numeric_limits<double>::quiet_NaN();
}

inline bool is_transparent(double v) {
    return std::isnan(v);
}

// Row-major block of normalized intensities in [0,1]. NaN marks a transparent
// or padding pixel.
class Tile {
public:
    Tile() = default;
    Tile(int w, int h, int bit_depth, std::vector<double> intensities, uint32_t color = NO_COLOR)
        : width_(w), height_(h), bit_depth_(bit_depth), intensities_(std::move(intensities)), color_(color) {
        if (w <= 0 || h <= 0) {
            throw std::invalid_argument("Tile: dimensions must be positive");
        }
        if (bit_depth < 1 || bit_depth > 16) {
            throw std::invalid_argument("Tile: bit depth must be in 1..16");
        }
        if (intensities_.size() != static_cast<size_t>(w) * h) {
            throw std::invalid_argument("Tile: intensity count " + std::to_string(intensities_.size()) +
                                        " does not match " + std::to_string(w) + "x" + std::to_string(h));
        }
    }

    // Raw samples in [0, 2^bits - 1]; negative samples are transparent.
    static Tile from_samples(int w, int h, int bit_depth, const std::vector<int>& samples,
                             uint32_t color = NO_COLOR) {
        if (bit_depth < 1 || bit_depth > 16) {
            throw std::invalid_argument("Tile: bit depth must be in 1..16");
        }
        double max_value = static_cast<double>((1 << bit_depth) - 1);
        std::vector<double> values;
        values.reserve(samples.size());
        for (int s : samples) {
            if (s < 0) {
                values.push_back(transparent_pixel());
            } else {
                values.push_back(std::min(1.0, static_cast<double>(s) / max_value));
            }
        }
        return Tile(w, h, bit_depth, std::move(values), color);
    }

    static Tile uniform(int w, int h, double value, int bit_depth = 8) {
        return Tile(w, h, bit_depth, std::vector<double>(static_cast<size_t>(w) * h, value));
    }

    int width() const { return width_; }
    int height() const { return height_; }
    Size size() const { return {width_, height_}; }
    int bit_depth() const { return bit_depth_; }
    bool empty() const { return intensities_.empty(); }
    uint32_t color() const { return color_; }
    bool has_color() const { return color_ != NO_COLOR; }

    const std::vector<double>& intensities() const { return intensities_; }
    double at(int x, int y) const { return intensities_[static_cast<size_t>(y) * width_ + x]; }

    size_t valid_count() const {
        size_t n = 0;
        for (double v : intensities_) {
            if (!is_transparent(v)) ++n;
        }
        return n;
    }

private:
    int width_ = 0;
    int height_ = 0;
    int bit_depth_ = 8;
    std::vector<double> intensities_;
    uint32_t color_ = NO_COLOR;
};

struct GlyphCell {
    std::string glyph;
    double score = 0.0;
    uint32_t color = NO_COLOR;
};

}
