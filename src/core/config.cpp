#include "core/config.hpp"
#include "cli/args.hpp"
#include <toml.hpp>

#include <filesystem>
#include <iostream>
#include <cstdlib>

#include <unistd.h>
#include <pwd.h>

namespace glyphnet {

namespace {

std::string get_home_dir() {
    const char* home = std::getenv("HOME");
    if (home) return std::string(home);
    struct passwd* pw = getpwuid(getuid());
    if (pw) return std::string(pw->pw_dir);
    return ".";
}

std::string default_config_dir() {
    const char* xdg_config = std::getenv("XDG_CONFIG_HOME");
    std::string base = xdg_config ? std::string(xdg_config) : get_home_dir() + "/.config";
    return base + "/glyphnet";
}

bool known_backend(const std::string& b) {
    return b == "none" || b == "memory" || b == "sqlite";
}

}  // namespace

std::string Config::default_config_path() {
    return default_config_dir() + "/config.toml";
}

bool Config::validate(std::string& error) const {
    if (parallelism < 1 || parallelism > 256) {
        error = "parallelism must be in [1, 256]";
        return false;
    }
    if (ssim.subdivisions < 0 || ssim.subdivisions > 6) {
        error = "ssim.subdivisions must be in [0, 6]";
        return false;
    }
    if (!(ssim.c1 > 0.0) || !(ssim.c2 > 0.0)) {
        error = "ssim.c1 and ssim.c2 must be positive";
        return false;
    }
    if (!(ssim.sigma > 0.0)) {
        error = "ssim.sigma must be positive";
        return false;
    }
    if (!(ssim.luminance_weight > 0.0) || !(ssim.contrast_weight > 0.0) || !(ssim.structure_weight > 0.0)) {
        error = "ssim weights must be positive";
        return false;
    }
    if (!known_backend(cache.backend)) {
        error = "cache.backend must be none, memory or sqlite";
        return false;
    }
    if (cache.max_entries < 1) {
        error = "cache.max_entries must be at least 1";
        return false;
    }
    if (cache.precision < 0 || cache.precision > 12) {
        error = "cache.precision must be in [0, 12]";
        return false;
    }
    if (!(cache.cull_probability > 0.0) || cache.cull_probability > 1.0) {
        error = "cache.cull_probability must be in (0, 1]";
        return false;
    }
    if (cache.backend == "sqlite" && cache.db_path.empty()) {
        error = "cache.db_path is required for the sqlite backend";
        return false;
    }
    if (model.hidden_layers.empty()) {
        error = "model.hidden_layers needs at least one layer";
        return false;
    }
    for (int n : model.hidden_layers) {
        if (n < 1) {
            error = "model.hidden_layers entries must be positive";
            return false;
        }
    }
    if (model.alpha < 0.0 || model.alpha >= 1.0) {
        error = "model.alpha must be in [0, 1)";
        return false;
    }
    if (model.activation != "softmax" && model.activation != "sigmoid") {
        error = "model.activation must be softmax or sigmoid";
        return false;
    }
    if (training.batch_size < 1) {
        error = "training.batch_size must be positive";
        return false;
    }
    if (training.max_batches < 0) {
        error = "training.max_batches must not be negative";
        return false;
    }
    if (!(training.learning_rate > 0.0)) {
        error = "training.learning_rate must be positive";
        return false;
    }
    if (training.learning_rate_decay < 0.0 || training.lambda < 0.0) {
        error = "training.learning_rate_decay and training.lambda must not be negative";
        return false;
    }
    if (training.beta1 < 0.0 || training.beta1 >= 1.0 || training.beta2 < 0.0 || training.beta2 >= 1.0) {
        error = "training.beta1 and training.beta2 must be in [0, 1)";
        return false;
    }
    if (!(training.epsilon > 0.0) || !(training.gradient_clip > 0.0) || !(training.target_falloff > 0.0)) {
        error = "training.epsilon, training.gradient_clip and training.target_falloff must be positive";
        return false;
    }
    if (classify.method != "ssim" && classify.method != "model") {
        error = "classify.method must be ssim or model";
        return false;
    }
    if (classify.tolerance < 0.0 || classify.tolerance >= 1.0) {
        error = "classify.tolerance must be in [0, 1)";
        return false;
    }
    return true;
}

std::optional<Config> Config::load(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(std::filesystem::path(path), ec) || ec) {
        return std::nullopt;
    }

    try {
        auto tbl = toml::parse_file(path);

        Config cfg = defaults();
        cfg.config_path = path;

        if (auto v = tbl["config_version"].value<int>()) {
            if (*v != CONFIG_VERSION) {
                std::cerr << "Error: unsupported config_version " << *v << " in " << path << "\n";
                return std::nullopt;
            }
        }
        if (auto v = tbl["parallelism"].value<int>()) cfg.parallelism = *v;

        if (auto ssim = tbl["ssim"]) {
            if (auto v = ssim["subdivisions"].value<int>()) cfg.ssim.subdivisions = *v;
            if (auto v = ssim["c1"].value<double>()) cfg.ssim.c1 = *v;
            if (auto v = ssim["c2"].value<double>()) cfg.ssim.c2 = *v;
            if (auto v = ssim["sigma"].value<double>()) cfg.ssim.sigma = *v;
            if (auto v = ssim["luminance_weight"].value<double>()) cfg.ssim.luminance_weight = *v;
            if (auto v = ssim["contrast_weight"].value<double>()) cfg.ssim.contrast_weight = *v;
            if (auto v = ssim["structure_weight"].value<double>()) cfg.ssim.structure_weight = *v;
        }

        if (auto cache = tbl["cache"]) {
            if (auto v = cache["backend"].value<std::string>()) cfg.cache.backend = *v;
            if (auto v = cache["max_entries"].value<int64_t>()) cfg.cache.max_entries = *v;
            if (auto v = cache["precision"].value<int>()) cfg.cache.precision = *v;
            if (auto v = cache["cull_probability"].value<double>()) cfg.cache.cull_probability = *v;
            if (auto v = cache["seed"].value<int64_t>()) cfg.cache.seed = static_cast<uint64_t>(*v);
            if (auto v = cache["db_path"].value<std::string>()) cfg.cache.db_path = *v;
        }

        if (auto model = tbl["model"]) {
            if (auto layers = model["hidden_layers"].as_array()) {
                cfg.model.hidden_layers.clear();
                for (const auto& node : *layers) {
                    if (auto n = node.value<int>()) cfg.model.hidden_layers.push_back(*n);
                }
            }
            if (auto v = model["alpha"].value<double>()) cfg.model.alpha = *v;
            if (auto v = model["activation"].value<std::string>()) cfg.model.activation = *v;
            if (auto v = model["seed"].value<int64_t>()) cfg.model.seed = static_cast<uint64_t>(*v);
        }

        if (auto training = tbl["training"]) {
            if (auto v = training["batch_size"].value<int>()) cfg.training.batch_size = *v;
            if (auto v = training["max_batches"].value<int>()) cfg.training.max_batches = *v;
            if (auto v = training["learning_rate"].value<double>()) cfg.training.learning_rate = *v;
            if (auto v = training["learning_rate_decay"].value<double>()) cfg.training.learning_rate_decay = *v;
            if (auto v = training["lambda"].value<double>()) cfg.training.lambda = *v;
            if (auto v = training["beta1"].value<double>()) cfg.training.beta1 = *v;
            if (auto v = training["beta2"].value<double>()) cfg.training.beta2 = *v;
            if (auto v = training["epsilon"].value<double>()) cfg.training.epsilon = *v;
            if (auto v = training["gradient_clip"].value<double>()) cfg.training.gradient_clip = *v;
            if (auto v = training["target_falloff"].value<double>()) cfg.training.target_falloff = *v;
            if (auto v = training["coerce_to_zero"].value<double>()) cfg.training.coerce_to_zero = *v;
            if (auto v = training["class_weighting"].value<bool>()) cfg.training.class_weighting = *v;
            if (auto v = training["class_weight_center"].value<double>()) cfg.training.class_weight_center = *v;
            if (auto v = training["class_weight_steepness"].value<double>()) cfg.training.class_weight_steepness = *v;
            if (auto v = training["checkpoint_every_batch"].value<bool>()) cfg.training.checkpoint_every_batch = *v;
        }

        if (auto classify = tbl["classify"]) {
            if (auto v = classify["method"].value<std::string>()) cfg.classify.method = *v;
            if (auto v = classify["tolerance"].value<double>()) cfg.classify.tolerance = *v;
            if (auto v = classify["seed"].value<int64_t>()) cfg.classify.seed = static_cast<uint64_t>(*v);
        }

        if (auto paths = tbl["paths"]) {
            if (auto v = paths["model"].value<std::string>()) cfg.paths.model = *v;
            if (auto v = paths["training_data"].value<std::string>()) cfg.paths.training_data = *v;
            if (auto v = paths["codebook"].value<std::string>()) cfg.paths.codebook = *v;
        }

        std::string error;
        if (!cfg.validate(error)) {
            std::cerr << "Error: " << path << ": " << error << "\n";
            return std::nullopt;
        }

        return cfg;
    } catch (const toml::parse_error& e) {
        std::cerr << "Error: " << path << ": " << e.description() << "\n";
        return std::nullopt;
    }
}

std::optional<Config> Config::load_default() {
    return load(default_config_path());
}

Config apply_cli_overrides(Config config, const Args& args) {
    if (args.parallelism > 0) config.parallelism = args.parallelism;
    if (!args.method.empty()) config.classify.method = args.method;
    if (args.tolerance >= 0.0) config.classify.tolerance = args.tolerance;
    if (!args.model_path.empty()) config.paths.model = args.model_path;
    if (!args.data_path.empty()) config.paths.training_data = args.data_path;
    if (!args.codebook_path.empty()) config.paths.codebook = args.codebook_path;
    if (!args.cache_backend.empty()) config.cache.backend = args.cache_backend;
    if (!args.db_path.empty()) config.cache.db_path = args.db_path;
    if (args.batch_size > 0) config.training.batch_size = args.batch_size;
    if (args.max_batches >= 0) config.training.max_batches = args.max_batches;
    if (args.learning_rate > 0.0) config.training.learning_rate = args.learning_rate;
    if (args.subdivisions >= 0) config.ssim.subdivisions = args.subdivisions;
    return config;
}

}
