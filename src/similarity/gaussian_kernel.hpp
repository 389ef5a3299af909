#pragma once

#include <vector>
#include <map>
#include <memory>
#include <shared_mutex>
#include <tuple>

namespace glyphnet {

enum class KernelNormalization {
    Probability,  // weights sum to 1
    Peak          // largest weight is 1
};

// Flattened w*h kernel indexed [j * w + i], centred at ((w-1)/2, (h-1)/2).
std::vector<double> gaussian_kernel(int w, int h, double sigma, KernelNormalization mode);

class KernelCache {
public:
    using Kernel = std::shared_ptr<const std::vector<double>>;

    Kernel get(int w, int h, double sigma, KernelNormalization mode);
    size_t size() const;
    void clear();

    static KernelCache& shared();

private:
    using Key = std::tuple<int, int, double, int>;

    mutable std::shared_mutex mutex_;
    std::map<Key, Kernel> kernels_;
};

}
