#include <iostream>
#include <cassert>
#include <cmath>
#include <vector>
#include <string>
#include <stdexcept>
#include <thread>

#include "../src/core/types.hpp"
#include "../src/similarity/gaussian_kernel.hpp"
#include "../src/similarity/ssim_comparator.hpp"

using namespace glyphnet;

#define TEST(name) static void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "Running " #name "... "; \
    try { \
        test_##name(); \
        std::cout << "PASSED\n"; \
    } catch (const std::exception& e) { \
        std::cout << "FAILED: " << e.what() << "\n"; \
        failures++; \
    } catch (...) { \
        std::cout << "FAILED: unknown exception\n"; \
        failures++; \
    } \
} while(0)

int failures = 0;

static Tile checker(int w, int h, double lo, double hi) {
    std::vector<double> v(static_cast<size_t>(w) * h);
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            v[static_cast<size_t>(y) * w + x] = ((x + y) % 2 == 0) ? lo : hi;
        }
    }
    return Tile(w, h, 8, v);
}

static Tile gradient(int w, int h) {
    std::vector<double> v(static_cast<size_t>(w) * h);
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            v[static_cast<size_t>(y) * w + x] = (x + 2.0 * y) / (w + 2.0 * h);
        }
    }
    return Tile(w, h, 8, v);
}

TEST(kernel_probability_sums_to_one) {
    const int sizes[][2] = {{1, 1}, {4, 4}, {3, 7}, {8, 16}};
    for (const auto& s : sizes) {
        auto k = gaussian_kernel(s[0], s[1], 1.5, KernelNormalization::Probability);
        assert(k.size() == static_cast<size_t>(s[0] * s[1]));
        double sum = 0.0;
        for (double w : k) {
            assert(w >= 0.0);
            sum += w;
        }
        assert(std::abs(sum - 1.0) < 1e-12);
    }
}

TEST(kernel_peak_is_one_and_centred) {
    auto k = gaussian_kernel(5, 5, 1.0, KernelNormalization::Peak);
    double peak = 0.0;
    for (double w : k) peak = std::max(peak, w);
    assert(std::abs(peak - 1.0) < 1e-12);
    assert(std::abs(k[2 * 5 + 2] - 1.0) < 1e-12);
    // Symmetric about the centre.
    assert(std::abs(k[0] - k[24]) < 1e-15);
    assert(std::abs(k[4] - k[20]) < 1e-15);
    assert(k[0] < k[1]);
}

TEST(kernel_rejects_bad_dimensions) {
    int thrown = 0;
    try { gaussian_kernel(0, 4, 1.0, KernelNormalization::Probability); } catch (const std::invalid_argument&) { thrown++; }
    try { gaussian_kernel(4, -1, 1.0, KernelNormalization::Probability); } catch (const std::invalid_argument&) { thrown++; }
    try { gaussian_kernel(4, 4, 0.0, KernelNormalization::Peak); } catch (const std::invalid_argument&) { thrown++; }
    assert(thrown == 3);
}

TEST(kernel_cache_shares_instances) {
    KernelCache cache;
    auto a = cache.get(4, 4, 1.5, KernelNormalization::Probability);
    auto b = cache.get(4, 4, 1.5, KernelNormalization::Probability);
    auto c = cache.get(4, 4, 1.5, KernelNormalization::Peak);
    assert(a.get() == b.get());
    assert(a.get() != c.get());
    assert(cache.size() == 2);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&cache, t]() {
            for (int i = 1; i <= 8; ++i) cache.get(i, t + 1, 1.0, KernelNormalization::Probability);
        });
    }
    for (auto& th : threads) th.join();
    assert(cache.size() == 34);

    cache.clear();
    assert(cache.size() == 0);
}

TEST(self_similarity_is_one) {
    SsimComparator cmp;
    Tile tiles[] = {gradient(4, 4), checker(4, 4, 0.1, 0.9), Tile::uniform(4, 4, 0.5), gradient(8, 16)};
    for (const auto& t : tiles) {
        assert(cmp.compare(t, t) == 1.0);
    }

    SsimComparator::Config cfg;
    cfg.subdivisions = 2;
    SsimComparator sub(cfg);
    Tile big = gradient(8, 8);
    assert(std::abs(sub.compare(big, big) - 1.0) < 1e-12);
}

TEST(self_similarity_is_maximum) {
    SsimComparator cmp;
    Tile a = gradient(4, 4);
    Tile others[] = {checker(4, 4, 0.1, 0.9), Tile::uniform(4, 4, 0.5), checker(4, 4, 0.3, 0.4)};
    for (const auto& b : others) {
        double s = cmp.compare(a, b);
        assert(s <= cmp.compare(a, a));
        assert(s <= 1.0);
    }
}

TEST(comparison_is_symmetric) {
    SsimComparator cmp;
    Tile a = gradient(4, 4);
    Tile b = checker(4, 4, 0.2, 0.7);
    assert(cmp.compare(a, b) == cmp.compare(b, a));

    SsimComparator::Config cfg;
    cfg.subdivisions = 1;
    SsimComparator sub(cfg);
    assert(sub.compare(a, b) == sub.compare(b, a));

    Tile small = checker(2, 2, 0.0, 1.0);
    assert(cmp.compare(a, small) == cmp.compare(small, a));
}

TEST(uniform_tiles_score_by_luminance) {
    SsimComparator cmp;
    Tile gray = Tile::uniform(4, 4, 0.5);
    Tile near = Tile::uniform(4, 4, 0.55);
    Tile far = Tile::uniform(4, 4, 0.05);
    double s_near = cmp.compare(gray, near);
    double s_far = cmp.compare(gray, far);
    assert(s_near > s_far);

    // Zero variance on both sides leaves only the luminance term.
    double expected = (2.0 * 0.5 * 0.55 + 0.001) / (0.25 + 0.55 * 0.55 + 0.001);
    assert(std::abs(s_near - expected) < 1e-12);
}

TEST(components_match_index) {
    SsimComparator cmp;
    Tile a = gradient(4, 4);
    Tile b = checker(4, 4, 0.2, 0.7);
    SimilarityComponents c = cmp.compare_components(a, b);
    assert(c.luminance > 0.0 && c.luminance <= 1.0);
    assert(c.contrast > 0.0 && c.contrast <= 1.0);
    assert(std::abs(c.index - c.luminance * c.contrast * c.structure) < 1e-9);
    assert(c.index == cmp.compare(a, b));
}

TEST(component_weights_apply_as_exponents) {
    SsimComparator::Config cfg;
    cfg.luminance_weight = 2.0;
    SsimComparator weighted(cfg);
    SsimComparator plain;
    Tile a = Tile::uniform(4, 4, 0.5);
    Tile b = Tile::uniform(4, 4, 0.3);
    double l = plain.compare_components(a, b).luminance;
    assert(std::abs(weighted.compare(a, b) - l * l) < 1e-12);
}

TEST(stretch_repeats_pixels) {
    std::vector<double> v = {0.1, 0.2, 0.3, 0.4};
    auto out = stretch_tile(v, Size{2, 2}, Size{4, 4});
    assert(out.size() == 16);
    assert(out[0] == 0.1 && out[1] == 0.1 && out[2] == 0.2 && out[3] == 0.2);
    assert(out[4] == 0.1 && out[5] == 0.1);
    assert(out[8] == 0.3 && out[15] == 0.4);

    auto wide = stretch_tile(v, Size{2, 2}, Size{2, 6});
    assert(wide.size() == 12);
    assert(wide[0] == 0.1 && wide[2] == 0.1 && wide[4] == 0.1 && wide[6] == 0.3);
}

TEST(stretched_comparison_equals_prestretched) {
    SsimComparator cmp;
    Tile small = checker(2, 2, 0.1, 0.8);
    Tile big = gradient(4, 4);
    Tile stretched(4, 4, 8, stretch_tile(small.intensities(), small.size(), big.size()));
    assert(cmp.compare(small, big) == cmp.compare(stretched, big));
}

TEST(non_integer_stretch_throws) {
    SsimComparator cmp;
    Tile a = gradient(4, 4);
    Tile b = gradient(3, 3);
    bool threw = false;
    try {
        cmp.compare(a, b);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw && "3x3 cannot stretch onto 4x4");

    threw = false;
    try {
        SsimComparator::common_size(Size{4, 2}, Size{2, 4});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(!threw && "4x2 and 2x4 meet at 4x4");
}

TEST(zero_valid_pixels_score_zero) {
    SsimComparator cmp;
    Tile empty(4, 4, 8, std::vector<double>(16, transparent_pixel()));
    Tile solid = gradient(4, 4);
    assert(cmp.compare(empty, solid) == 0.0);
    assert(cmp.compare(solid, empty) == 0.0);
    assert(cmp.compare(empty, empty) == 0.0);
}

TEST(transparent_pixels_are_ignored) {
    SsimComparator cmp;
    std::vector<double> v(16, 0.5);
    v[0] = transparent_pixel();
    v[5] = transparent_pixel();
    Tile holes(4, 4, 8, v);
    Tile solid = Tile::uniform(4, 4, 0.5);
    double s = cmp.compare(holes, solid);
    assert(std::isfinite(s));
    assert(std::abs(s - 1.0) < 1e-12);
}

TEST(subdivision_localises_differences) {
    Tile a = checker(8, 8, 0.2, 0.8);
    std::vector<double> v = a.intensities();
    // Flatten one corner quadrant.
    for (int y = 0; y < 4; ++y) {
        for (int x = 0; x < 4; ++x) v[static_cast<size_t>(y) * 8 + x] = 0.5;
    }
    Tile b(8, 8, 8, v);

    SsimComparator::Config cfg;
    cfg.subdivisions = 1;
    SsimComparator sub(cfg);
    SsimComparator whole;
    double s_sub = sub.compare(a, b);
    double s_whole = whole.compare(a, b);
    assert(s_sub < 1.0 && s_whole < 1.0);
    assert(std::abs(s_sub - s_whole) > 1e-6);
    assert(sub.compare(a, b) == sub.compare(b, a));
}

TEST(subdivision_handles_small_tiles) {
    SsimComparator::Config cfg;
    cfg.subdivisions = 3;
    SsimComparator sub(cfg);
    Tile a = gradient(3, 2);
    Tile b = checker(3, 2, 0.1, 0.6);
    double s = sub.compare(a, b);
    assert(std::isfinite(s));
    assert(s <= 1.0);
    assert(std::abs(sub.compare(a, a) - 1.0) < 1e-12);
}

TEST(profile_matches_direct_comparison) {
    SsimComparator cmp;
    Tile a = gradient(4, 4);
    Tile b = checker(4, 4, 0.2, 0.7);
    GlyphProfile pa = GlyphProfile::from_tile(a, 1.5);
    GlyphProfile pb = GlyphProfile::from_tile(b, 1.5);
    assert(pa.valid_count == 16);
    assert(std::abs(pa.stddev * pa.stddev - pa.variance) < 1e-15);
    assert(std::abs(cmp.compare_profiles(pa, pb) - cmp.compare(a, b)) < 1e-12);

    Tile small = checker(2, 2, 0.1, 0.9);
    GlyphProfile ps = GlyphProfile::from_tile(small, 1.5);
    assert(std::abs(cmp.compare_profiles(ps, pa) - cmp.compare(small, a)) < 1e-12);
}

TEST(config_validation) {
    SsimComparator::Config cfg;
    std::string error;
    assert(cfg.validate(error));

    cfg.subdivisions = 7;
    assert(!cfg.validate(error));
    assert(error.find("subdivisions") != std::string::npos);

    cfg = SsimComparator::Config{};
    cfg.sigma = 0.0;
    bool threw = false;
    try {
        SsimComparator bad(cfg);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

TEST(tile_from_samples_normalises) {
    Tile t = Tile::from_samples(2, 2, 4, {0, 15, 5, -1});
    assert(t.bit_depth() == 4);
    assert(t.intensities()[0] == 0.0);
    assert(t.intensities()[1] == 1.0);
    assert(std::abs(t.intensities()[2] - 1.0 / 3.0) < 1e-12);
    assert(is_transparent(t.intensities()[3]));
    assert(t.valid_count() == 3);

    bool threw = false;
    try {
        Tile bad(2, 2, 8, {0.1, 0.2, 0.3});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

int main() {
    std::cout << "=== glyphnet Similarity Test Suite ===\n\n";

    std::cout << "--- Gaussian Kernel Tests ---\n";
    RUN_TEST(kernel_probability_sums_to_one);
    RUN_TEST(kernel_peak_is_one_and_centred);
    RUN_TEST(kernel_rejects_bad_dimensions);
    RUN_TEST(kernel_cache_shares_instances);

    std::cout << "\n--- SSIM Comparator Tests ---\n";
    RUN_TEST(self_similarity_is_one);
    RUN_TEST(self_similarity_is_maximum);
    RUN_TEST(comparison_is_symmetric);
    RUN_TEST(uniform_tiles_score_by_luminance);
    RUN_TEST(components_match_index);
    RUN_TEST(component_weights_apply_as_exponents);
    RUN_TEST(stretch_repeats_pixels);
    RUN_TEST(stretched_comparison_equals_prestretched);
    RUN_TEST(non_integer_stretch_throws);
    RUN_TEST(zero_valid_pixels_score_zero);
    RUN_TEST(transparent_pixels_are_ignored);
    RUN_TEST(subdivision_localises_differences);
    RUN_TEST(subdivision_handles_small_tiles);
    RUN_TEST(profile_matches_direct_comparison);
    RUN_TEST(config_validation);

    std::cout << "\n--- Tile Tests ---\n";
    RUN_TEST(tile_from_samples_normalises);

    std::cout << "\n=== Test Summary ===\n";
    std::cout << "Failures: " << failures << "\n";

    if (failures == 0) {
        std::cout << "\nAll tests passed!\n";
        return 0;
    } else {
        std::cout << "\nSome tests failed!\n";
        return 1;
    }
}
