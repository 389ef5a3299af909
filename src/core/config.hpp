#pragma once

#include "core/types.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace glyphnet {

constexpr int CONFIG_VERSION = 1;

struct ConfigSsim {
    int subdivisions = 0;
    double c1 = 0.001;
    double c2 = 0.005;
    double sigma = 1.5;
    double luminance_weight = 1.0;
    double contrast_weight = 1.0;
    double structure_weight = 1.0;
};

struct ConfigCache {
    std::string backend = "memory";
    int64_t max_entries = 32767;
    int precision = 7;
    double cull_probability = 0.5;
    uint64_t seed = 0x5EED;
    std::string db_path = "glyphnet.db";
};

struct ConfigModel {
    std::vector<int> hidden_layers{64};
    double alpha = 0.01;
    std::string activation = "softmax";
    uint64_t seed = 42;
};

struct ConfigTraining {
    int batch_size = 64;
    int max_batches = 0;
    double learning_rate = 0.01;
    double learning_rate_decay = 0.0;
    double lambda = 1e-4;
    double beta1 = 0.9;
    double beta2 = 0.999;
    double epsilon = 1e-7;
    double gradient_clip = 5.0;
    double target_falloff = 0.03;
    double coerce_to_zero = 1e-4;
    bool class_weighting = true;
    double class_weight_center = 0.5;
    double class_weight_steepness = 4.0;
    bool checkpoint_every_batch = true;
};

struct ConfigClassify {
    std::string method = "ssim";
    double tolerance = 0.0;
    uint64_t seed = 7;
};

struct ConfigPaths {
    std::string model = "model/model.nn";
    std::string training_data = "preprocessed/preprocessed.txt";
    std::string codebook;
};

struct Config {
    std::string config_path;
    int parallelism = 8;

    ConfigSsim ssim;
    ConfigCache cache;
    ConfigModel model;
    ConfigTraining training;
    ConfigClassify classify;
    ConfigPaths paths;

    bool validate(std::string& error) const;

    static Config defaults() { return Config{}; }
    static std::optional<Config> load(const std::string& path);
    static std::optional<Config> load_default();
    static std::string default_config_path();
};

struct Args;
Config apply_cli_overrides(Config config, const Args& args);

}
