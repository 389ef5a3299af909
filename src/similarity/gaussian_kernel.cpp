#include "similarity/gaussian_kernel.hpp"
#include <cmath>
#include <stdexcept>
#include <string>
#include <mutex>
#include <algorithm>

namespace glyphnet {

std::vector<double> gaussian_kernel(int w, int h, double sigma, KernelNormalization mode) {
    if (w <= 0 || h <= 0) {
        throw std::invalid_argument("gaussian_kernel: invalid window " + std::to_string(w) + "x" + std::to_string(h));
    }
    if (!(sigma > 0.0)) {
        throw std::invalid_argument("gaussian_kernel: sigma must be positive");
    }

    const double cx = (w - 1) / 2.0;
    const double cy = (h - 1) / 2.0;
    const double denom = 2.0 * sigma * sigma;

    std::vector<double> kernel(static_cast<size_t>(w) * h);
    double sum = 0.0;
    double peak = 0.0;
    for (int j = 0; j < h; ++j) {
        for (int i = 0; i < w; ++i) {
            double dx = i - cx;
            double dy = j - cy;
            double v = std::exp(-(dx * dx + dy * dy) / denom);
            kernel[static_cast<size_t>(j) * w + i] = v;
            sum += v;
            peak = std::max(peak, v);
        }
    }

    double norm = mode == KernelNormalization::Probability ? sum : peak;
    if (norm > 0.0) {
        for (double& v : kernel) v /= norm;
    }
    return kernel;
}

KernelCache::Kernel KernelCache::get(int w, int h, double sigma, KernelNormalization mode) {
    Key key{w, h, sigma, static_cast<int>(mode)};
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = kernels_.find(key);
        if (it != kernels_.end()) return it->second;
    }

    auto kernel = std::make_shared<const std::vector<double>>(gaussian_kernel(w, h, sigma, mode));

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto inserted = kernels_.emplace(key, kernel);
    return inserted.first->second;
}

size_t KernelCache::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return kernels_.size();
}

void KernelCache::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    kernels_.clear();
}

KernelCache& KernelCache::shared() {
    static KernelCache cache;
    return cache;
}

}
