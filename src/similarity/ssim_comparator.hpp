#pragma once

#include "core/types.hpp"
#include <string>
#include <vector>

namespace glyphnet {

struct SimilarityComponents {
    double luminance = 0.0;
    double contrast = 0.0;
    double structure = 0.0;
    double index = 0.0;
};

// Precomputed whole-tile statistics of a rendered glyph.
struct GlyphProfile {
    int width = 0;
    int height = 0;
    double mean = 0.0;
    double stddev = 0.0;
    double variance = 0.0;
    size_t valid_count = 0;
    std::vector<double> luminances;

    static GlyphProfile from_tile(const Tile& tile, double sigma);
};

class SsimComparator {
public:
    struct Config {
        int subdivisions = 0;
        double c1 = 0.001;
        double c2 = 0.005;
        double sigma = 1.5;
        double luminance_weight = 1.0;
        double contrast_weight = 1.0;
        double structure_weight = 1.0;

        bool validate(std::string& error) const;
    };

    SsimComparator() = default;
    explicit SsimComparator(const Config& config);

    void set_config(const Config& config);
    const Config& config() const { return config_; }

    double compare(const Tile& a, const Tile& b) const;
    SimilarityComponents compare_components(const Tile& a, const Tile& b) const;

    // Equivalent to compare() without subdivision, reusing precomputed statistics.
    // Profiles of different sizes are compared through their stretched luminances.
    double compare_profiles(const GlyphProfile& a, const GlyphProfile& b) const;

    // Throws std::invalid_argument unless both sizes divide their common extent.
    static Size common_size(Size a, Size b);

private:
    Config config_;
};

// Nearest repetition of each pixel by the integer factor between the sizes.
std::vector<double> stretch_tile(const std::vector<double>& values, Size from, Size to);

}
