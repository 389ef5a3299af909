#include "similarity/ssim_comparator.hpp"
#include "similarity/gaussian_kernel.hpp"
#include <cmath>
#include <stdexcept>
#include <algorithm>

namespace glyphnet {

namespace {

constexpr int MAX_SUBDIVISIONS = 6;

struct Rect {
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;
};

struct WindowStats {
    double mean = 0.0;
    double variance = 0.0;
    double weight = 0.0;
    size_t count = 0;
};

WindowStats window_stats(const std::vector<double>& values, int stride, const Rect& r,
                         const std::vector<double>& kernel) {
    WindowStats s;
    double weighted = 0.0;
    for (int y = 0; y < r.h; ++y) {
        for (int x = 0; x < r.w; ++x) {
            double v = values[static_cast<size_t>(r.y + y) * stride + (r.x + x)];
            if (is_transparent(v)) continue;
            double k = kernel[static_cast<size_t>(y) * r.w + x];
            weighted += k * v;
            s.weight += k;
            s.count++;
        }
    }
    if (s.count == 0 || s.weight <= 0.0) {
        s.count = 0;
        return s;
    }
    s.mean = weighted / s.weight;

    double spread = 0.0;
    for (int y = 0; y < r.h; ++y) {
        for (int x = 0; x < r.w; ++x) {
            double v = values[static_cast<size_t>(r.y + y) * stride + (r.x + x)];
            if (is_transparent(v)) continue;
            double d = v - s.mean;
            spread += kernel[static_cast<size_t>(y) * r.w + x] * (d * d);
        }
    }
    s.variance = spread / s.weight;
    return s;
}

double window_covariance(const std::vector<double>& a, const std::vector<double>& b, int stride,
                         const Rect& r, const std::vector<double>& kernel,
                         const WindowStats& sa, const WindowStats& sb) {
    if (sa.count < 2 || sb.count < 2) return 0.0;

    double sum = 0.0;
    double weight = 0.0;
    for (int y = 0; y < r.h; ++y) {
        for (int x = 0; x < r.w; ++x) {
            size_t idx = static_cast<size_t>(r.y + y) * stride + (r.x + x);
            double va = a[idx];
            double vb = b[idx];
            if (is_transparent(va) || is_transparent(vb)) continue;
            double k = kernel[static_cast<size_t>(y) * r.w + x];
            sum += k * ((va - sa.mean) * (vb - sb.mean));
            weight += k;
        }
    }
    return weight > 0.0 ? sum / weight : 0.0;
}

double signed_pow(double v, double e) {
    if (e == 1.0) return v;
    return std::copysign(std::pow(std::abs(v), e), v);
}

SimilarityComponents combine(const WindowStats& sa, const WindowStats& sb, double covar,
                             const SsimComparator::Config& cfg) {
    SimilarityComponents out;
    if (sa.count == 0 || sb.count == 0) return out;

    const double sigma_a = std::sqrt(sa.variance);
    const double sigma_b = std::sqrt(sb.variance);
    const double sigma_ab = sigma_a * sigma_b;
    const double c3 = cfg.c2 / 2.0;

    out.luminance = (2.0 * (sa.mean * sb.mean) + cfg.c1) /
                    (sa.mean * sa.mean + sb.mean * sb.mean + cfg.c1);
    out.contrast = (2.0 * sigma_ab + cfg.c2) / (sa.variance + sb.variance + cfg.c2);
    out.structure = (covar + c3) / (sigma_ab + c3);

    double lum = signed_pow(out.luminance, cfg.luminance_weight);
    if (cfg.contrast_weight == cfg.structure_weight) {
        // c * s collapses to the covariance ratio when c3 = c2 / 2
        double cs = (2.0 * covar + cfg.c2) / (sa.variance + sb.variance + cfg.c2);
        out.index = lum * signed_pow(cs, cfg.contrast_weight);
    } else {
        out.index = lum * signed_pow(out.contrast, cfg.contrast_weight) *
                    signed_pow(out.structure, cfg.structure_weight);
    }
    return out;
}

}  // namespace

GlyphProfile GlyphProfile::from_tile(const Tile& tile, double sigma) {
    GlyphProfile p;
    p.width = tile.width();
    p.height = tile.height();
    p.luminances = tile.intensities();

    auto kernel = KernelCache::shared().get(tile.width(), tile.height(), sigma, KernelNormalization::Probability);
    WindowStats s = window_stats(p.luminances, p.width, Rect{0, 0, p.width, p.height}, *kernel);
    p.mean = s.mean;
    p.variance = s.variance;
    p.stddev = std::sqrt(s.variance);
    p.valid_count = s.count;
    return p;
}

bool SsimComparator::Config::validate(std::string& error) const {
    if (subdivisions < 0 || subdivisions > MAX_SUBDIVISIONS) {
        error = "ssim.subdivisions must be in [0, " + std::to_string(MAX_SUBDIVISIONS) + "]";
        return false;
    }
    if (!(c1 > 0.0) || !(c2 > 0.0)) {
        error = "ssim stability constants c1 and c2 must be positive";
        return false;
    }
    if (!(sigma > 0.0)) {
        error = "ssim.sigma must be positive";
        return false;
    }
    if (!(luminance_weight > 0.0) || !(contrast_weight > 0.0) || !(structure_weight > 0.0)) {
        error = "ssim component weights must be positive";
        return false;
    }
    return true;
}

SsimComparator::SsimComparator(const Config& config) {
    set_config(config);
}

void SsimComparator::set_config(const Config& config) {
    std::string error;
    if (!config.validate(error)) {
        throw std::invalid_argument("SsimComparator: " + error);
    }
    config_ = config;
}

Size SsimComparator::common_size(Size a, Size b) {
    if (a.width <= 0 || a.height <= 0 || b.width <= 0 || b.height <= 0) {
        throw std::invalid_argument("SsimComparator: tile dimensions must be positive");
    }
    Size target{std::max(a.width, b.width), std::max(a.height, b.height)};
    if (target.width % a.width != 0 || target.height % a.height != 0 ||
        target.width % b.width != 0 || target.height % b.height != 0) {
        throw std::invalid_argument("SsimComparator: cannot stretch " + std::to_string(a.width) + "x" +
                                    std::to_string(a.height) + " against " + std::to_string(b.width) + "x" +
                                    std::to_string(b.height) + " (not an integer multiple)");
    }
    return target;
}

std::vector<double> stretch_tile(const std::vector<double>& values, Size from, Size to) {
    if (from == to) return values;
    if (to.width % from.width != 0 || to.height % from.height != 0) {
        throw std::invalid_argument("stretch_tile: target size is not an integer multiple of the source");
    }
    if (values.size() != static_cast<size_t>(from.area())) {
        throw std::invalid_argument("stretch_tile: value count does not match source size");
    }
    const int fx = to.width / from.width;
    const int fy = to.height / from.height;
    std::vector<double> out(static_cast<size_t>(to.area()));
    for (int y = 0; y < to.height; ++y) {
        for (int x = 0; x < to.width; ++x) {
            out[static_cast<size_t>(y) * to.width + x] = values[static_cast<size_t>(y / fy) * from.width + x / fx];
        }
    }
    return out;
}

double SsimComparator::compare(const Tile& a, const Tile& b) const {
    return compare_components(a, b).index;
}

SimilarityComponents SsimComparator::compare_components(const Tile& a, const Tile& b) const {
    const Size size = common_size(a.size(), b.size());
    if (a.valid_count() == 0 || b.valid_count() == 0) {
        return SimilarityComponents{};
    }

    const std::vector<double> va = stretch_tile(a.intensities(), a.size(), size);
    const std::vector<double> vb = stretch_tile(b.intensities(), b.size(), size);

    const int grid = 1 << config_.subdivisions;
    const int sub_w = (size.width + grid - 1) / grid;
    const int sub_h = (size.height + grid - 1) / grid;
    auto position_weights = KernelCache::shared().get(grid, grid, config_.sigma, KernelNormalization::Peak);

    SimilarityComponents total;
    double weight_sum = 0.0;
    for (int gy = 0; gy < grid; ++gy) {
        for (int gx = 0; gx < grid; ++gx) {
            Rect r{gx * sub_w, gy * sub_h, 0, 0};
            if (r.x >= size.width || r.y >= size.height) continue;
            r.w = std::min(sub_w, size.width - r.x);
            r.h = std::min(sub_h, size.height - r.y);

            auto kernel = KernelCache::shared().get(r.w, r.h, config_.sigma, KernelNormalization::Probability);
            WindowStats sa = window_stats(va, size.width, r, *kernel);
            WindowStats sb = window_stats(vb, size.width, r, *kernel);
            double covar = window_covariance(va, vb, size.width, r, *kernel, sa, sb);
            SimilarityComponents sub = combine(sa, sb, covar, config_);

            double w = (*position_weights)[static_cast<size_t>(gy) * grid + gx];
            total.luminance += w * sub.luminance;
            total.contrast += w * sub.contrast;
            total.structure += w * sub.structure;
            total.index += w * sub.index;
            weight_sum += w;
        }
    }

    if (weight_sum > 0.0) {
        total.luminance /= weight_sum;
        total.contrast /= weight_sum;
        total.structure /= weight_sum;
        total.index /= weight_sum;
    }
    return total;
}

double SsimComparator::compare_profiles(const GlyphProfile& a, const GlyphProfile& b) const {
    const Size sa_size{a.width, a.height};
    const Size sb_size{b.width, b.height};
    const Size size = common_size(sa_size, sb_size);
    if (a.valid_count == 0 || b.valid_count == 0) return 0.0;

    if (size != sa_size || size != sb_size) {
        Tile ta(a.width, a.height, 16, a.luminances);
        Tile tb(b.width, b.height, 16, b.luminances);
        Config flat = config_;
        flat.subdivisions = 0;
        return SsimComparator(flat).compare(ta, tb);
    }

    auto kernel = KernelCache::shared().get(size.width, size.height, config_.sigma, KernelNormalization::Probability);
    WindowStats sa;
    sa.mean = a.mean;
    sa.variance = a.variance;
    sa.count = a.valid_count;
    WindowStats sb;
    sb.mean = b.mean;
    sb.variance = b.variance;
    sb.count = b.valid_count;

    const Rect r{0, 0, size.width, size.height};
    double covar = window_covariance(a.luminances, b.luminances, size.width, r, *kernel, sa, sb);
    return combine(sa, sb, covar, config_).index;
}

}
