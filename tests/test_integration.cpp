#include <iostream>
#include <cassert>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <random>
#include <set>
#include <sstream>
#include <vector>
#include <string>
#include <stdexcept>
#include <type_traits>
#include <unistd.h>

#include "../src/core/types.hpp"
#include "../src/core/config.hpp"
#include "../src/core/cancellation.hpp"
#include "../src/cache/memo_store.hpp"
#include "../src/classify/codebook.hpp"
#include "../src/classify/classifier.hpp"
#include "../src/io/tile_io.hpp"
#include "../src/io/training_data.hpp"
#include "../src/neural/trainer.hpp"
#include "../src/cli/args.hpp"

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

static std::string temp_path(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / ("glyphnet_it_" + std::to_string(getpid()));
    std::filesystem::create_directories(dir);
    return (dir / name).string();
}

static void write_file(const std::string& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary);
    out << text;
}

static Tile checker(int w, int h, double lo, double hi) {
    std::vector<double> v(static_cast<size_t>(w) * h);
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            v[static_cast<size_t>(y) * w + x] = ((x + y) % 2 == 0) ? lo : hi;
        }
    }
    return Tile(w, h, 8, v);
}

static GlyphCodebook dot_hash_codebook() {
    GlyphCodebook codebook;
    codebook.add(".", checker(4, 4, 0.75, 0.85));
    codebook.add("#", checker(4, 4, 0.05, 0.15));
    return codebook;
}

// Fails every lookup, as a broken backing store would.
class ThrowingStore : public MemoStore {
public:
    double get_or_compute_score(const std::vector<double>&, const std::vector<double>&, const ScoreFn&) override {
        throw std::runtime_error("score table unavailable");
    }
    std::string get_or_compute_decision(const std::vector<double>&, const DecisionFn&) override {
        throw std::runtime_error("decision table unavailable");
    }
    void flush() override {}
    size_t size() const override { return 0; }
    int precision() const override { return 7; }
    const char* name() const override { return "throwing"; }
};

TEST(gray_tile_picks_light_glyph) {
    GlyphCodebook codebook = dot_hash_codebook();
    MemoryMemoStore store;
    SsimClassifier classifier(codebook, SsimComparator(), store, SsimClassifier::Config{});

    Tile gray = Tile::uniform(4, 4, 0.5);
    std::vector<double> scores = classifier.scores(gray);
    assert(scores.size() == 2);
    assert(scores[0] > scores[1]);

    // Flat tile against a checker of mean 0.8 and variance 0.0025.
    double lum = (2.0 * 0.5 * 0.8 + 0.001) / (0.25 + 0.64 + 0.001);
    double cs = 0.005 / (0.0025 + 0.005);
    assert(std::abs(scores[0] - lum * cs) < 1e-9);

    Selection first = classifier.classify(gray);
    assert(first.glyph == ".");
    assert(first.index == 0);
    assert(std::abs(first.score - scores[0]) < 1e-12);

    // Second lookup is served by the decision cache.
    Selection cached = classifier.classify(gray);
    assert(cached.glyph == ".");
    assert(cached.index == 0);
    assert(std::isnan(cached.score));
    assert(store.decision_count() == 1);
    assert(store.score_count() == 2);
}

TEST(dark_tile_picks_dark_glyph) {
    GlyphCodebook codebook = dot_hash_codebook();
    NullMemoStore store;
    SsimClassifier classifier(codebook, SsimComparator(), store, SsimClassifier::Config{});
    assert(classifier.classify(checker(4, 4, 0.1, 0.12)).glyph == "#");
}

TEST(ties_pick_lowest_index) {
    GlyphCodebook codebook;
    codebook.add("x", checker(4, 4, 0.2, 0.6));
    codebook.add("y", checker(4, 4, 0.2, 0.6));
    codebook.add("z", Tile::uniform(4, 4, 0.9));
    NullMemoStore store;
    SsimClassifier::Config cfg;
    cfg.parallelism = 3;
    SsimClassifier classifier(codebook, SsimComparator(), store, cfg);

    for (int i = 0; i < 20; ++i) {
        Selection s = classifier.classify(checker(4, 4, 0.25, 0.55));
        assert(s.glyph == "x");
        assert(s.index == 0);
    }

    std::mt19937_64 rng(1);
    assert(pick_within_tolerance({0.5, 0.9, 0.9}, 0.0, rng) == 1);
}

TEST(tolerance_band_varies_choice) {
    GlyphCodebook codebook;
    codebook.add("a", Tile::uniform(4, 4, 0.5));
    codebook.add("b", Tile::uniform(4, 4, 0.45));
    codebook.add("c", Tile::uniform(4, 4, 0.05));
    MemoryMemoStore store;
    SsimClassifier::Config cfg;
    cfg.tolerance = 0.05;
    cfg.seed = 11;
    SsimClassifier classifier(codebook, SsimComparator(), store, cfg);

    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i) {
        Selection s = classifier.classify(Tile::uniform(4, 4, 0.5));
        seen.insert(s.glyph);
        assert(!std::isnan(s.score));
    }
    assert(seen.count("a") == 1 && seen.count("b") == 1);
    assert(seen.count("c") == 0);
    assert(store.decision_count() == 0);
}

TEST(mismatched_tile_rejected_up_front) {
    GlyphCodebook codebook = dot_hash_codebook();
    MemoryMemoStore store;
    SsimClassifier classifier(codebook, SsimComparator(), store, SsimClassifier::Config{});

    bool threw = false;
    try {
        classifier.classify(Tile::uniform(3, 3, 0.5));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    assert(store.size() == 0);

    // Integer multiples are stretched.
    Selection s = classifier.classify(Tile::uniform(2, 2, 0.5));
    assert(s.glyph == ".");
}

// The classifier keeps a reference to its codebook, so temporaries are refused.
static_assert(!std::is_constructible<SsimClassifier, GlyphCodebook&&, const SsimComparator&, MemoStore&,
                                     const SsimClassifier::Config&>::value,
              "SsimClassifier must not bind a temporary codebook");
static_assert(std::is_constructible<SsimClassifier, const GlyphCodebook&, const SsimComparator&, MemoStore&,
                                    const SsimClassifier::Config&>::value,
              "SsimClassifier takes a codebook lvalue");

TEST(codebook_rules) {
    GlyphCodebook codebook;
    assert(codebook.validate().failure());
    assert(codebook.add("a", Tile::uniform(4, 4, 0.1)));
    assert(!codebook.add("a", Tile::uniform(4, 4, 0.9)));
    assert(codebook.size() == 1);
    assert(codebook.add("b", Tile::uniform(2, 2, 0.1)));
    Result r = codebook.validate();
    assert(r.failure());
    assert(r.message.find("'b'") != std::string::npos);
    assert(codebook.index_of("b") == 1);
    assert(codebook.index_of("q") == -1);

    NullMemoStore store;
    bool threw = false;
    try {
        SsimClassifier bad(codebook, SsimComparator(), store, SsimClassifier::Config{});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

TEST(profile_path_matches_comparator) {
    GlyphCodebook codebook = dot_hash_codebook();
    NullMemoStore store;
    SsimComparator cmp;
    SsimClassifier classifier(codebook, cmp, store, SsimClassifier::Config{});

    Tile t = checker(4, 4, 0.3, 0.7);
    std::vector<double> s = classifier.scores(t);
    for (size_t i = 0; i < codebook.size(); ++i) {
        assert(std::abs(s[i] - cmp.compare(t, codebook.at(i).tile)) < 1e-12);
    }

    SsimComparator::Config sub;
    sub.subdivisions = 1;
    SsimComparator sub_cmp(sub);
    SsimClassifier sub_classifier(codebook, sub_cmp, store, SsimClassifier::Config{});
    std::vector<double> ss = sub_classifier.scores(t);
    for (size_t i = 0; i < codebook.size(); ++i) {
        assert(ss[i] == sub_cmp.compare(t, codebook.at(i).tile));
    }
}

TEST(store_failures_fall_back_to_direct) {
    GlyphCodebook codebook = dot_hash_codebook();
    ThrowingStore store;
    SsimClassifier classifier(codebook, SsimComparator(), store, SsimClassifier::Config{});
    Selection s = classifier.classify(Tile::uniform(4, 4, 0.5));
    assert(s.glyph == ".");
    assert(!std::isnan(s.score));
}

TEST(neural_classifier_argmax) {
    std::mt19937_64 rng(3);
    auto model = std::make_shared<const Model>(Model::create(16, {8}, {".", "#"}, 0.01, rng));
    NeuralClassifier classifier(model, NeuralClassifier::Config{});

    Tile t = checker(4, 4, 0.2, 0.9);
    std::vector<double> p = classifier.probabilities(t);
    assert(p.size() == 2);
    assert(std::abs(p[0] + p[1] - 1.0) < 1e-12);
    Selection s = classifier.classify(t);
    assert(s.index == argmax(p));
    assert(s.glyph == model->glyphs()[s.index]);
    assert(s.score == p[s.index]);

    bool threw = false;
    try {
        classifier.classify(Tile::uniform(2, 2, 0.5));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        classifier.set_model(nullptr);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    assert(classifier.model() == model);
}

TEST(classify_tiles_passes_color) {
    GlyphCodebook codebook = dot_hash_codebook();
    NullMemoStore store;
    SsimClassifier classifier(codebook, SsimComparator(), store, SsimClassifier::Config{});

    std::vector<Tile> tiles;
    tiles.push_back(Tile(4, 4, 8, std::vector<double>(16, 0.8), 0x336699));
    tiles.push_back(Tile(4, 4, 8, std::vector<double>(16, 0.1)));
    std::vector<GlyphCell> cells = classify_tiles(classifier, tiles);
    assert(cells.size() == 2);
    assert(cells[0].glyph == "." && cells[0].color == 0x336699);
    assert(cells[1].glyph == "#" && cells[1].color == NO_COLOR);

    std::ostringstream os;
    write_cells(os, cells);
    std::string text = os.str();
    assert(text.find("0\t.\t") == 0);
    assert(text.find("\t#336699\n") != std::string::npos);
    assert(text.find("1\t#\t") != std::string::npos);
}

TEST(ssim_example_source_scores_live) {
    GlyphCodebook codebook = dot_hash_codebook();
    MemoryMemoStore store;
    SsimClassifier classifier(codebook, SsimComparator(), store, SsimClassifier::Config{});
    VectorTileSource tiles({Tile::uniform(4, 4, 0.5), checker(4, 4, 0.0, 0.2)});
    SsimExampleSource source(tiles, classifier);

    TrainingExample ex;
    assert(source.next(ex));
    assert(ex.intensities.size() == 16);
    assert(ex.scores == classifier.scores(Tile::uniform(4, 4, 0.5)));
    assert(source.next(ex));
    assert(ex.scores[1] > ex.scores[0]);
    assert(!source.next(ex));
}

TEST(training_record_format) {
    TrainingExample ex;
    ex.intensities = {0.1, transparent_pixel(), 0.123456789, 1.0};
    ex.scores = {0.5, 0.25, 0.125, 1.0};
    std::vector<std::string> glyphs = {"a,b", ";", "\\", " "};
    std::string line = format_record(ex, glyphs);
    assert(line == "0.1,n,0.123457,1;a\\,b,0.5;\\;,0.25;\\\\,0.125; ,1");

    std::unordered_map<std::string, size_t> index = {{" ", 0}, {"\\", 1}, {";", 2}, {"a,b", 3}, {"extra", 4}};
    TrainingExample back;
    std::vector<std::string> unknown;
    std::string error;
    assert(parse_record(line, index, back, unknown, error));
    assert(unknown.empty());
    assert(back.intensities.size() == 4);
    assert(std::isnan(back.intensities[1]));
    assert(std::abs(back.intensities[2] - 0.123457) < 1e-12);
    assert((back.scores == std::vector<double>{1.0, 0.125, 0.25, 0.5, 0.0}));

    std::unordered_map<std::string, size_t> partial = {{" ", 0}};
    assert(parse_record(line, partial, back, unknown, error));
    assert(unknown.size() == 3);

    assert(!parse_record("0.1,0.2", index, back, unknown, error));
    assert(!parse_record("0.1,0.2;a,zz", index, back, unknown, error));
    assert(error.find("zz") != std::string::npos);
    assert(!parse_record("x;a,0.5", index, back, unknown, error));
}

static void round_trip_training_file(const std::string& path) {
    std::vector<std::string> glyphs = {".", "#", ",;"};
    std::mt19937_64 rng(5);
    std::uniform_real_distribution<double> u(0.0, 1.0);
    std::vector<TrainingExample> written;

    TrainingDataWriter writer;
    Result r = writer.open(path, glyphs, Size{2, 2});
    assert(r.success());
    for (int i = 0; i < 300; ++i) {
        TrainingExample ex;
        for (int k = 0; k < 4; ++k) ex.intensities.push_back(std::round(u(rng) * 1e6) / 1e6);
        for (size_t g = 0; g < glyphs.size(); ++g) ex.scores.push_back(u(rng));
        assert(writer.write(ex).success());
        written.push_back(ex);
    }
    TrainingExample bad;
    bad.intensities = {0.1, 0.2, 0.3, 0.4};
    bad.scores = {0.5};
    assert(writer.write(bad).failure());
    assert(writer.records() == 300);
    assert(writer.close().success());

    TrainingDataReader reader;
    r = reader.open(path, {",;", ".", "#"});
    assert(r.success());
    assert(reader.tile_size() == (Size{2, 2}));

    TrainingExample ex;
    size_t n = 0;
    while (reader.next(ex)) {
        const TrainingExample& w = written[n];
        for (size_t k = 0; k < 4; ++k) assert(std::abs(ex.intensities[k] - w.intensities[k]) < 1e-12);
        assert(std::abs(ex.scores[0] - w.scores[2]) < 1e-8);
        assert(std::abs(ex.scores[1] - w.scores[0]) < 1e-8);
        assert(std::abs(ex.scores[2] - w.scores[1]) < 1e-8);
        n++;
    }
    assert(n == 300);
    assert(reader.records() == 300);
    assert(reader.skipped() == 0);
    assert(reader.status().success());
}

TEST(training_data_plain_round_trip) {
    std::string path = temp_path("data.txt");
    round_trip_training_file(path);

    std::ifstream in(path);
    std::string header;
    std::getline(in, header);
    assert(header == "#glyphnet-training 2 2");
}

TEST(training_data_zstd_round_trip) {
    std::string path = temp_path("data.txt.zst");
    round_trip_training_file(path);

    std::ifstream in(path, std::ios::binary);
    unsigned char magic[4] = {0, 0, 0, 0};
    in.read(reinterpret_cast<char*>(magic), 4);
    assert(magic[0] == 0x28 && magic[1] == 0xB5 && magic[2] == 0x2F && magic[3] == 0xFD);
}

TEST(training_data_truncated_zstd_reported) {
    std::string path = temp_path("truncated.zst");
    std::vector<std::string> glyphs = {"a", "b"};
    TrainingDataWriter writer;
    assert(writer.open(path, glyphs, Size{4, 4}).success());
    std::mt19937_64 rng(9);
    std::uniform_real_distribution<double> u(0.0, 1.0);
    for (int i = 0; i < 400; ++i) {
        TrainingExample ex;
        for (int k = 0; k < 16; ++k) ex.intensities.push_back(u(rng));
        ex.scores = {u(rng), u(rng)};
        assert(writer.write(ex).success());
    }
    assert(writer.close().success());

    auto size = std::filesystem::file_size(path);
    std::filesystem::resize_file(path, size / 2);

    TrainingDataReader reader;
    Result r = reader.open(path, glyphs);
    if (r.success()) {
        TrainingExample ex;
        while (reader.next(ex)) {
        }
        r = reader.status();
    }
    assert(r.failure());
}

TEST(training_data_skips_bad_lines) {
    std::string path = temp_path("messy.txt");
    write_file(path,
               "#glyphnet-training 2 2\n"
               "0.1,0.2,0.3,0.4;a,0.5;ghost,0.7\n"
               "garbage\n"
               "0.1,0.2,0.3,0.4;a,notanumber\n"
               "0.1,0.2,0.3;a,0.4\n"
               "\n"
               "0.5,0.5,0.5,0.5;b,0.9;ghost,0.1");

    TrainingDataReader reader;
    assert(reader.open(path, {"a", "b"}).success());
    TrainingExample ex;
    assert(reader.next(ex));
    assert((ex.scores == std::vector<double>{0.5, 0.0}));
    assert(reader.next(ex));
    assert((ex.scores == std::vector<double>{0.0, 0.9}));
    assert(!reader.next(ex));
    assert(reader.records() == 2);
    assert(reader.skipped() == 3);

    TrainingDataReader missing;
    assert(missing.open(temp_path("nope.txt"), {"a"}).error == ErrorCode::FILE_NOT_FOUND);
}

static Tile noisy_tile(std::mt19937_64& rng, bool bright) {
    std::uniform_real_distribution<double> u(0.0, 1.0);
    double base = bright ? 0.7 : 0.05;
    std::vector<double> v;
    for (int k = 0; k < 16; ++k) v.push_back(base + 0.2 * u(rng));
    return Tile(4, 4, 8, v);
}

TEST(preprocess_then_train) {
    GlyphCodebook codebook = dot_hash_codebook();
    MemoryMemoStore store;
    SsimClassifier classifier(codebook, SsimComparator(), store, SsimClassifier::Config{});

    std::string path = temp_path("pipeline.txt.zst");
    TrainingDataWriter writer;
    assert(writer.open(path, codebook.symbols(), codebook.tile_size()).success());
    std::mt19937_64 rng(21);
    for (int i = 0; i < 512; ++i) {
        Tile tile = noisy_tile(rng, i % 2 == 0);
        TrainingExample ex;
        ex.intensities = tile.intensities();
        ex.scores = classifier.scores(tile);
        assert(writer.write(ex).success());
    }
    assert(writer.close().success());

    TrainingDataReader reader;
    assert(reader.open(path, codebook.symbols()).success());
    std::mt19937_64 init(4);
    auto model = std::make_shared<const Model>(Model::create(16, {8}, codebook.symbols(), 0.01, init));
    Trainer::Config cfg;
    cfg.batch_size = 16;
    cfg.learning_rate = 0.02;
    Trainer trainer(model, cfg);
    CancellationToken token;
    int checkpoints = 0;
    Trainer::Callbacks callbacks;
    callbacks.on_checkpoint = [&](const std::shared_ptr<const Model>&, int, double) { checkpoints++; };
    TrainOutcome out = trainer.train(reader, token, callbacks);
    assert(out.completed());
    assert(out.batches_completed == 32);
    assert(checkpoints == 32);

    // Bright tiles score closest to '.', dark ones to '#'.
    NeuralClassifier neural(out.model, NeuralClassifier::Config{});
    std::mt19937_64 eval_rng(8);
    int correct = 0;
    const int total = 40;
    for (int i = 0; i < total; ++i) {
        bool bright = i % 2 == 0;
        Selection s = neural.classify(noisy_tile(eval_rng, bright));
        if (s.glyph == (bright ? "." : "#")) correct++;
    }
    assert(correct >= total * 9 / 10);
}

TEST(short_records_do_not_stop_training) {
    std::string path = temp_path("short.txt");
    std::ostringstream text;
    text << "#glyphnet-training 2 2\n";
    for (int i = 0; i < 6; ++i) {
        text << (i % 2 == 0 ? "0.9,0.8,0.9,0.8;a,1;b,0" : "0.1,0.2,0.1,0.2;a,0;b,1") << "\n";
        if (i == 2) text << "0.5,0.5,0.5;a,1;b,0\n";
        if (i == 4) text << "0.5,0.5,0.5,0.5,0.5;a,0;b,1\n";
    }
    write_file(path, text.str());

    TrainingDataReader reader;
    assert(reader.open(path, {"a", "b"}).success());
    std::mt19937_64 init(2);
    auto model = std::make_shared<const Model>(Model::create(4, {4}, {"a", "b"}, 0.01, init));
    Trainer::Config cfg;
    cfg.batch_size = 4;
    Trainer trainer(model, cfg);
    CancellationToken token;
    TrainOutcome out = trainer.train(reader, token);
    assert(out.completed());
    assert(out.batches_completed == 2);
    assert(reader.records() == 6);
    assert(reader.skipped() == 2);

    // Without a header there is no tile size to check against.
    write_file(path, "0.5,0.5,0.5;a,1;b,0\n0.5,0.5;a,1;b,0\n");
    TrainingDataReader bare;
    assert(bare.open(path, {"a", "b"}).success());
    TrainingExample ex;
    assert(bare.next(ex) && ex.intensities.size() == 3);
    assert(bare.next(ex) && ex.intensities.size() == 2);
}

TEST(tile_lines) {
    Tile t;
    Result r = parse_tile_line("2 2 8 #FF8800 : 0,0.5,1,n", t);
    assert(r.success());
    assert(t.color() == 0xFF8800);
    assert(t.valid_count() == 3);
    assert(t.bit_depth() == 8);

    assert(parse_tile_line("2 2 8 : 0,0.5,1", t).failure());
    assert(parse_tile_line("2 2 : 0,0.5,1,1", t).failure());
    assert(parse_tile_line("2 2 8 0,0.5,1,1", t).failure());
    assert(parse_tile_line("2 2 8 #GG0000 : 0,0,0,0", t).failure());

    std::string label;
    Tile glyph;
    r = parse_codebook_line("a : b : 2 1 8 : 0.1,0.2", label, glyph);
    assert(r.success());
    assert(label == "a : b");
    assert(glyph.width() == 2 && glyph.height() == 1);

    std::vector<double> values;
    assert(parse_intensities(" 0.25 , n ,1", values));
    assert(values.size() == 3 && values[0] == 0.25 && std::isnan(values[1]));
    assert(format_intensities({0.5, transparent_pixel(), 0.0, 1.0 / 3.0}, 4) == "0.5,n,0,0.3333");
}

TEST(codebook_file) {
    std::string path = temp_path("codebook.txt");
    write_file(path,
               "// two glyphs\n"
               ". : 2 2 8 : 0.8,0.7,0.7,0.8\n"
               "# : 2 2 8 : 0.1,0.2,0.2,0.1\n"
               ". : 2 2 8 : 0,0,0,0\n");
    GlyphCodebook codebook;
    Result r = read_codebook(path, codebook);
    assert(r.success());
    assert((codebook.symbols() == std::vector<std::string>{".", "#"}));
    assert(codebook.at(0).tile.intensities()[0] == 0.8);

    std::string bad = temp_path("bad_codebook.txt");
    write_file(bad, ". : 2 2 8 : 0.8,0.7,0.7,0.8\n# : 3 3 8 : 0,0,0,0,0,0,0,0,0\n");
    GlyphCodebook mixed;
    assert(read_codebook(bad, mixed).failure());

    std::string tiles_path = temp_path("tiles.txt");
    write_file(tiles_path, "2 2 8 : 0.5,0.5,0.5,0.5\n\n2 2 8 #000000 : 0,n,0,0\n");
    std::vector<Tile> tiles;
    assert(read_tiles(tiles_path, tiles).success());
    assert(tiles.size() == 2);
    assert(tiles[1].color() == 0 && tiles[1].has_color());

    write_file(tiles_path, "2 2 8 : 0.5,0.5\n");
    tiles.clear();
    r = read_tiles(tiles_path, tiles);
    assert(r.failure());
    assert(r.message.find(":1:") != std::string::npos);
}

TEST(config_load_and_override) {
    std::string path = temp_path("config.toml");
    write_file(path,
               "config_version = 1\n"
               "parallelism = 4\n"
               "[ssim]\n"
               "subdivisions = 2\n"
               "sigma = 1.0\n"
               "[cache]\n"
               "backend = \"sqlite\"\n"
               "db_path = \"memo.db\"\n"
               "[model]\n"
               "hidden_layers = [32, 16]\n"
               "activation = \"sigmoid\"\n"
               "[training]\n"
               "learning_rate = 0.005\n"
               "class_weighting = false\n"
               "[classify]\n"
               "method = \"model\"\n"
               "tolerance = 0.1\n"
               "[paths]\n"
               "codebook = \"glyphs.txt\"\n");

    auto loaded = Config::load(path);
    assert(loaded.has_value());
    Config cfg = *loaded;
    assert(cfg.parallelism == 4);
    assert(cfg.ssim.subdivisions == 2);
    assert(cfg.ssim.sigma == 1.0);
    assert(cfg.cache.backend == "sqlite" && cfg.cache.db_path == "memo.db");
    assert((cfg.model.hidden_layers == std::vector<int>{32, 16}));
    assert(cfg.model.activation == "sigmoid");
    assert(cfg.training.learning_rate == 0.005);
    assert(!cfg.training.class_weighting);
    assert(cfg.training.batch_size == 64);
    assert(cfg.classify.method == "model");
    assert(cfg.paths.codebook == "glyphs.txt");
    assert(cfg.paths.model == "model/model.nn");

    Args args;
    args.method = "ssim";
    args.tolerance = 0.0;
    args.max_batches = 0;
    args.subdivisions = 0;
    args.batch_size = 8;
    Config merged = apply_cli_overrides(cfg, args);
    assert(merged.classify.method == "ssim");
    assert(merged.classify.tolerance == 0.0);
    assert(merged.ssim.subdivisions == 0);
    assert(merged.training.batch_size == 8);
    assert(merged.parallelism == 4);

    // Tile size comes from the codebook; stale size keys are ignored.
    write_file(path, "[ssim]\ntile_width = 0\ntile_height = -3\n");
    assert(Config::load(path).has_value());

    write_file(path, "[ssim]\nsubdivisions = 9\n");
    assert(!Config::load(path).has_value());
    write_file(path, "parallelism = = 3\n");
    assert(!Config::load(path).has_value());
    write_file(path, "config_version = 2\n");
    assert(!Config::load(path).has_value());
    assert(!Config::load(temp_path("absent.toml")).has_value());

    std::string error;
    Config defaults = Config::defaults();
    assert(defaults.validate(error));
    defaults.classify.method = "oracle";
    assert(!defaults.validate(error));
    assert(error.find("classify.method") != std::string::npos);
}

TEST(cli_arguments) {
    const char* argv[] = {"glyphnet", "classify", "tiles.txt", "--codebook", "glyphs.txt", "--method", "model",
                          "-j", "4", "--tolerance", "0.2", "--cache", "sqlite", "--max-batches", "0"};
    Args args = parse_args(15, const_cast<char**>(argv));
    assert(args.command == "classify");
    assert(args.tiles_path == "tiles.txt");
    assert(args.codebook_path == "glyphs.txt");
    assert(args.method == "model");
    assert(args.parallelism == 4);
    assert(std::abs(args.tolerance - 0.2) < 1e-12);
    assert(args.cache_backend == "sqlite");
    assert(args.max_batches == 0);

    const char* bad[] = {"glyphnet", "train", "--method", "magic", "-j", "9999"};
    Args b = parse_args(6, const_cast<char**>(bad));
    assert(b.command == "train");
    assert(b.method.empty());
    assert(b.parallelism == 0);

    const char* help[] = {"glyphnet", "--help"};
    assert(parse_args(2, const_cast<char**>(help)).show_help);
}

int main() {
    std::cout << "=== glyphnet Integration Test Suite ===\n\n";

    std::cout << "--- SSIM Classifier Tests ---\n";
    RUN_TEST(gray_tile_picks_light_glyph);
    RUN_TEST(dark_tile_picks_dark_glyph);
    RUN_TEST(ties_pick_lowest_index);
    RUN_TEST(tolerance_band_varies_choice);
    RUN_TEST(mismatched_tile_rejected_up_front);
    RUN_TEST(codebook_rules);
    RUN_TEST(profile_path_matches_comparator);
    RUN_TEST(store_failures_fall_back_to_direct);

    std::cout << "\n--- Neural Classifier Tests ---\n";
    RUN_TEST(neural_classifier_argmax);
    RUN_TEST(classify_tiles_passes_color);
    RUN_TEST(ssim_example_source_scores_live);

    std::cout << "\n--- Training Data Tests ---\n";
    RUN_TEST(training_record_format);
    RUN_TEST(training_data_plain_round_trip);
    RUN_TEST(training_data_zstd_round_trip);
    RUN_TEST(training_data_truncated_zstd_reported);
    RUN_TEST(training_data_skips_bad_lines);
    RUN_TEST(preprocess_then_train);
    RUN_TEST(short_records_do_not_stop_training);

    std::cout << "\n--- File Format Tests ---\n";
    RUN_TEST(tile_lines);
    RUN_TEST(codebook_file);

    std::cout << "\n--- Config and CLI Tests ---\n";
    RUN_TEST(config_load_and_override);
    RUN_TEST(cli_arguments);

    std::filesystem::remove_all(std::filesystem::temp_directory_path() / ("glyphnet_it_" + std::to_string(getpid())));

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
