#include "core/types.hpp"
#include "core/config.hpp"
#include "core/cancellation.hpp"
#include "cache/store_factory.hpp"
#include "cache/sqlite_memo_store.hpp"
#include "classify/classifier.hpp"
#include "classify/codebook.hpp"
#include "io/tile_io.hpp"
#include "io/training_data.hpp"
#include "neural/model_io.hpp"
#include "neural/trainer.hpp"
#include "cli/args.hpp"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <random>
#include <vector>

namespace glyphnet {
namespace {

CancellationToken g_cancel;

void handle_interrupt(int) {
    g_cancel.request();
}

SsimComparator::Config comparator_config(const Config& config) {
    SsimComparator::Config c;
    c.subdivisions = config.ssim.subdivisions;
    c.c1 = config.ssim.c1;
    c.c2 = config.ssim.c2;
    c.sigma = config.ssim.sigma;
    c.luminance_weight = config.ssim.luminance_weight;
    c.contrast_weight = config.ssim.contrast_weight;
    c.structure_weight = config.ssim.structure_weight;
    return c;
}

SsimClassifier::Config ssim_classifier_config(const Config& config) {
    SsimClassifier::Config c;
    c.parallelism = config.parallelism;
    c.tolerance = config.classify.tolerance;
    c.seed = config.classify.seed;
    return c;
}

Trainer::Config trainer_config(const Config& config) {
    Trainer::Config c;
    c.batch_size = config.training.batch_size;
    c.max_batches = config.training.max_batches;
    c.parallelism = config.parallelism;
    c.learning_rate = config.training.learning_rate;
    c.learning_rate_decay = config.training.learning_rate_decay;
    c.lambda = config.training.lambda;
    c.beta1 = config.training.beta1;
    c.beta2 = config.training.beta2;
    c.epsilon = config.training.epsilon;
    c.gradient_clip = config.training.gradient_clip;
    c.target_falloff = config.training.target_falloff;
    c.coerce_to_zero = config.training.coerce_to_zero;
    c.class_weighting = config.training.class_weighting;
    c.class_weight_center = config.training.class_weight_center;
    c.class_weight_steepness = config.training.class_weight_steepness;
    c.activation = parse_activation(config.model.activation);
    return c;
}

bool load_codebook(const Config& config, GlyphCodebook& codebook) {
    if (config.paths.codebook.empty()) {
        std::cerr << "Error: No codebook specified (--codebook or [paths] codebook)\n";
        return false;
    }
    Result r = read_codebook(config.paths.codebook, codebook);
    if (r.failure()) {
        std::cerr << "Error: " << r.message << "\n";
        return false;
    }
    return true;
}

bool load_tiles(const Args& args, std::vector<Tile>& tiles) {
    if (args.tiles_path.empty()) {
        std::cerr << "Error: No tile file specified\n";
        return false;
    }
    Result r = read_tiles(args.tiles_path, tiles);
    if (r.failure()) {
        std::cerr << "Error: " << r.message << "\n";
        return false;
    }
    return true;
}

// Loads the configured model, checking it against the codebook's labels.
std::shared_ptr<const Model> load_checked_model(const Config& config, const GlyphCodebook& codebook) {
    auto model = std::make_shared<Model>();
    Result r = load_model(config.paths.model, *model, codebook.tile_size().area());
    if (r.failure()) {
        std::cerr << "Error: " << r.message << "\n";
        return nullptr;
    }
    if (model->glyphs() != codebook.symbols()) {
        std::cerr << "Error: model " << config.paths.model << " was trained for a different codebook\n";
        return nullptr;
    }
    return model;
}

int run_preprocess(const Config& config, const Args& args) {
    GlyphCodebook codebook(config.ssim.sigma);
    if (!load_codebook(config, codebook)) return 1;
    std::vector<Tile> tiles;
    if (!load_tiles(args, tiles)) return 1;

    auto store = make_memo_store(config.cache);
    SsimClassifier classifier(codebook, SsimComparator(comparator_config(config)), *store,
                              ssim_classifier_config(config));

    std::string path = args.output.empty() ? config.paths.training_data : args.output;
    TrainingDataWriter writer;
    Result r = writer.open(path, codebook.symbols(), codebook.tile_size());
    if (r.failure()) {
        std::cerr << "Error: " << r.message << "\n";
        return 1;
    }

    auto start = std::chrono::steady_clock::now();
    for (const auto& tile : tiles) {
        if (g_cancel.requested()) {
            std::cerr << "Warning: interrupted, keeping " << writer.records() << " records\n";
            break;
        }
        TrainingExample example;
        example.intensities = tile.intensities();
        example.scores = classifier.scores(tile);
        r = writer.write(example);
        if (r.failure()) {
            std::cerr << "Error: " << r.message << "\n";
            return 1;
        }
    }
    r = writer.close();
    if (r.failure()) {
        std::cerr << "Error: " << r.message << "\n";
        return 1;
    }

    double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    std::cerr << "Wrote " << writer.records() << " records to " << path << " in " << seconds << "s ("
              << store->name() << " cache, " << store->size() << " entries)\n";
    return 0;
}

int run_train(const Config& config, const Args& args) {
    GlyphCodebook codebook(config.ssim.sigma);
    if (!load_codebook(config, codebook)) return 1;
    const int features = codebook.tile_size().area();

    std::shared_ptr<const Model> model;
    std::error_code ec;
    if (std::filesystem::exists(config.paths.model, ec)) {
        model = load_checked_model(config, codebook);
        if (!model) return 1;
        std::cerr << "[train] resuming " << config.paths.model << " (" << model->parameter_count()
                  << " parameters)\n";
    } else {
        std::mt19937_64 rng(config.model.seed);
        model = std::make_shared<Model>(Model::create(features, config.model.hidden_layers, codebook.symbols(),
                                                      config.model.alpha, rng));
        std::cerr << "[train] new model " << features;
        for (int n : config.model.hidden_layers) std::cerr << "-" << n;
        std::cerr << "-" << codebook.size() << " (" << model->parameter_count() << " parameters)\n";
    }

    // Live training scores tiles as they are read; otherwise use preprocessed records.
    std::unique_ptr<MemoStore> store;
    std::unique_ptr<SsimClassifier> classifier;
    std::unique_ptr<VectorTileSource> tile_source;
    std::unique_ptr<ExampleSource> source;
    TrainingDataReader* reader = nullptr;
    if (args.live) {
        std::vector<Tile> tiles;
        if (!load_tiles(args, tiles)) return 1;
        store = make_memo_store(config.cache);
        classifier = std::make_unique<SsimClassifier>(codebook, SsimComparator(comparator_config(config)),
                                                      *store, ssim_classifier_config(config));
        tile_source = std::make_unique<VectorTileSource>(std::move(tiles));
        source = std::make_unique<SsimExampleSource>(*tile_source, *classifier);
    } else {
        auto file = std::make_unique<TrainingDataReader>();
        Result r = file->open(config.paths.training_data, codebook.symbols());
        if (r.failure()) {
            std::cerr << "Error: " << r.message << "\n";
            return 1;
        }
        Size recorded = file->tile_size();
        if (recorded.area() > 0 && recorded != codebook.tile_size()) {
            std::cerr << "Error: " << config.paths.training_data << " holds " << recorded.width << "x"
                      << recorded.height << " tiles, codebook glyphs are " << codebook.tile_size().width << "x"
                      << codebook.tile_size().height << "\n";
            return 1;
        }
        reader = file.get();
        source = std::move(file);
    }

    Trainer trainer(model, trainer_config(config));
    Trainer::Callbacks callbacks;
    callbacks.log = [](const std::string& line) { std::cerr << line << "\n"; };
    if (config.training.checkpoint_every_batch) {
        callbacks.on_checkpoint = [&](const std::shared_ptr<const Model>& snapshot, int batch, double loss) {
            Result r = save_model(config.paths.model, *snapshot);
            if (r.failure()) {
                std::cerr << "Warning: checkpoint after batch " << batch << " (loss " << loss
                          << ") failed: " << r.message << "\n";
            }
        };
    }

    TrainOutcome outcome = trainer.train(*source, g_cancel, callbacks);
    if (reader && reader->status().failure()) {
        std::cerr << "Warning: " << reader->status().message << "\n";
    }
    if (outcome.failed()) {
        std::cerr << "Error: training failed: " << outcome.message << "\n";
        return 1;
    }

    Result r = save_model(config.paths.model, *outcome.model);
    if (r.failure()) {
        std::cerr << "Error: " << r.message << "\n";
        return 1;
    }
    std::cerr << "[train] " << (outcome.cancelled() ? "cancelled" : "done") << " after "
              << outcome.batches_completed << " batches, loss " << outcome.last_loss << ", model saved to "
              << config.paths.model << "\n";
    if (reader && reader->skipped() > 0) {
        std::cerr << "Warning: skipped " << reader->skipped() << " malformed records\n";
    }
    return outcome.cancelled() ? 130 : 0;
}

int run_classify(const Config& config, const Args& args) {
    GlyphCodebook codebook(config.ssim.sigma);
    if (!load_codebook(config, codebook)) return 1;
    std::vector<Tile> tiles;
    if (!load_tiles(args, tiles)) return 1;

    std::unique_ptr<MemoStore> store;
    std::unique_ptr<TileClassifier> classifier;
    if (config.classify.method == "model") {
        auto model = load_checked_model(config, codebook);
        if (!model) return 1;
        NeuralClassifier::Config nc;
        nc.activation = parse_activation(config.model.activation);
        nc.tolerance = config.classify.tolerance;
        nc.seed = config.classify.seed;
        classifier = std::make_unique<NeuralClassifier>(model, nc);
    } else {
        store = make_memo_store(config.cache);
        classifier = std::make_unique<SsimClassifier>(codebook, SsimComparator(comparator_config(config)), *store,
                                                      ssim_classifier_config(config));
    }

    std::vector<GlyphCell> cells = classify_tiles(*classifier, tiles);

    if (args.output.empty()) {
        write_cells(std::cout, cells);
        return std::cout ? 0 : 1;
    }
    std::ofstream out(args.output);
    if (!out) {
        std::cerr << "Error: cannot open " << args.output << " for writing\n";
        return 1;
    }
    write_cells(out, cells);
    if (!out) {
        std::cerr << "Error: short write to " << args.output << "\n";
        return 1;
    }
    return 0;
}

int run_flush_cache(const Config& config) {
    SqliteMemoStore::Config sc;
    sc.path = config.cache.db_path;
    SqliteMemoStore store(sc);
    if (!store.persistent()) {
        std::cerr << "Error: " << store.open_result().message << "\n";
        return 1;
    }
    store.flush();
    if (!store.persistent()) {
        std::cerr << "Error: flush of " << sc.path << " failed\n";
        return 1;
    }
    std::cerr << "Flushed memo database " << sc.path << "\n";
    return 0;
}

}  // namespace
}  // namespace glyphnet

int main(int argc, char* argv[]) {
    glyphnet::Args args = glyphnet::parse_args(argc, argv);

    if (args.show_help) {
        glyphnet::print_help(argv[0]);
        return 0;
    }
    if (args.command.empty()) {
        std::cerr << "Error: No command specified\n";
        glyphnet::print_help(argv[0]);
        return 1;
    }

    glyphnet::Config config = glyphnet::Config::defaults();
    if (!args.config_path.empty()) {
        auto loaded = glyphnet::Config::load(args.config_path);
        if (!loaded) {
            std::cerr << "Error: Failed to load config file: " << args.config_path << "\n";
            return 1;
        }
        config = *loaded;
    } else if (auto loaded_default = glyphnet::Config::load_default()) {
        config = *loaded_default;
    }
    config = glyphnet::apply_cli_overrides(config, args);

    std::string config_error;
    if (!config.validate(config_error)) {
        std::cerr << "Error: Invalid config: " << config_error << "\n";
        return 1;
    }

    std::signal(SIGINT, glyphnet::handle_interrupt);

    try {
        if (args.command == "preprocess") return glyphnet::run_preprocess(config, args);
        if (args.command == "train") return glyphnet::run_train(config, args);
        if (args.command == "classify") return glyphnet::run_classify(config, args);
        if (args.command == "flush-cache") return glyphnet::run_flush_cache(config);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "Error: Unknown command " << args.command << "\n";
    return 1;
}
