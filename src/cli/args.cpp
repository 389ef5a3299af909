#include "args.hpp"
#include <cstring>
#include <cstdlib>
#include <cstdio>

namespace glyphnet {

static int clamp_int(int val, int min_val, int max_val, int default_val) {
    if (val < min_val || val > max_val) return default_val;
    return val;
}

static double clamp_double(double val, double min_val, double max_val, double default_val) {
    if (val < min_val || val > max_val) return default_val;
    return val;
}

static bool validate_path(const std::string& path) {
    if (path.empty()) return false;
    if (path.find('\0') != std::string::npos) return false;
    return true;
}

static bool is_command(const char* arg) {
    return strcmp(arg, "preprocess") == 0 || strcmp(arg, "train") == 0 ||
           strcmp(arg, "classify") == 0 || strcmp(arg, "flush-cache") == 0;
}

static void take_path(int& i, int argc, char* argv[], std::string& out) {
    if (i + 1 < argc) {
        out = argv[++i];
        if (!validate_path(out)) {
            out.clear();
        }
    }
}

Args parse_args(int argc, char* argv[]) {
    Args args;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            args.show_help = true;
            return args;
        }

        if (strcmp(arg, "-o") == 0 || strcmp(arg, "--output") == 0) {
            take_path(i, argc, argv, args.output);
        }
        else if (strcmp(arg, "--config") == 0) {
            take_path(i, argc, argv, args.config_path);
        }
        else if (strcmp(arg, "--codebook") == 0) {
            take_path(i, argc, argv, args.codebook_path);
        }
        else if (strcmp(arg, "--model") == 0) {
            take_path(i, argc, argv, args.model_path);
        }
        else if (strcmp(arg, "--data") == 0) {
            take_path(i, argc, argv, args.data_path);
        }
        else if (strcmp(arg, "--db") == 0) {
            take_path(i, argc, argv, args.db_path);
        }
        else if (strcmp(arg, "--method") == 0) {
            if (i + 1 < argc) {
                std::string m = argv[++i];
                if (m == "ssim" || m == "model") {
                    args.method = m;
                }
            }
        }
        else if (strcmp(arg, "--cache") == 0) {
            if (i + 1 < argc) {
                std::string b = argv[++i];
                if (b == "none" || b == "memory" || b == "sqlite") {
                    args.cache_backend = b;
                }
            }
        }
        else if (strcmp(arg, "-j") == 0 || strcmp(arg, "--parallelism") == 0) {
            if (i + 1 < argc) args.parallelism = clamp_int(std::atoi(argv[++i]), 1, 256, 0);
        }
        else if (strcmp(arg, "--tolerance") == 0) {
            if (i + 1 < argc) args.tolerance = clamp_double(std::atof(argv[++i]), 0.0, 0.999, -1.0);
        }
        else if (strcmp(arg, "--subdivisions") == 0) {
            if (i + 1 < argc) args.subdivisions = clamp_int(std::atoi(argv[++i]), 0, 6, -1);
        }
        else if (strcmp(arg, "--batch-size") == 0) {
            if (i + 1 < argc) args.batch_size = clamp_int(std::atoi(argv[++i]), 1, 1 << 20, 0);
        }
        else if (strcmp(arg, "--max-batches") == 0) {
            if (i + 1 < argc) args.max_batches = clamp_int(std::atoi(argv[++i]), 0, 1 << 30, -1);
        }
        else if (strcmp(arg, "--learning-rate") == 0) {
            if (i + 1 < argc) args.learning_rate = clamp_double(std::atof(argv[++i]), 1e-9, 10.0, 0.0);
        }
        else if (strcmp(arg, "--live") == 0) {
            args.live = true;
        }
        else if (arg[0] != '-') {
            if (args.command.empty() && is_command(arg)) {
                args.command = arg;
            } else {
                args.tiles_path = arg;
                if (!validate_path(args.tiles_path)) {
                    args.tiles_path.clear();
                }
            }
        }
        else {
            fprintf(stderr, "Warning: ignoring unknown option %s\n", arg);
        }
    }

    return args;
}

void print_help(const char* prog) {
    printf("Usage: %s <COMMAND> [OPTIONS] [TILES]\n\n", prog);
    printf("COMMANDS:\n");
    printf("  preprocess <TILES>      Score tiles against the codebook and write training data\n");
    printf("  train [TILES]           Train the model from training data (or live from TILES with --live)\n");
    printf("  classify <TILES>        Pick a glyph for every tile\n");
    printf("  flush-cache             Drop every entry from the memo database\n\n");
    printf("OPTIONS:\n");
    printf("  -o, --output <FILE>     Output file (default: stdout for classify)\n");
    printf("      --config <FILE>     Config file path (default: $XDG_CONFIG_HOME/glyphnet/config.toml)\n");
    printf("      --codebook <FILE>   Glyph codebook (\"label : w h bits : values\" per line)\n");
    printf("      --model <FILE>      Model file (default: model/model.nn)\n");
    printf("      --data <FILE>       Training data, .zst for compressed (default: preprocessed/preprocessed.txt)\n");
    printf("      --method <NAME>     Classifier: ssim, model\n");
    printf("      --cache <NAME>      Memo store: none, memory, sqlite\n");
    printf("      --db <FILE>         Memo database for the sqlite store (default: glyphnet.db)\n");
    printf("  -j, --parallelism <N>   Worker threads (range: 1-256)\n");
    printf("      --tolerance <N>     Relative score band for random picks (0 = best only)\n");
    printf("      --subdivisions <N>  SSIM sub-tile levels (range: 0-6)\n");
    printf("      --batch-size <N>    Training batch size\n");
    printf("      --max-batches <N>   Stop after N batches (0 = until data runs out)\n");
    printf("      --learning-rate <N> Adam learning rate\n");
    printf("      --live              Train on SSIM scores computed from TILES\n");
    printf("  -h, --help              Show this help\n");
    printf("\nTILE FILE:\n");
    printf("  One tile per line: \"w h bits [#RRGGBB] : v,v,...\" with values in [0,1], n for transparent\n");
}

}
