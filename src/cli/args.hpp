#pragma once

#include <string>

namespace glyphnet {

struct Args {
    std::string command;  // preprocess, train, classify, flush-cache
    std::string config_path;
    std::string tiles_path;
    std::string output;

    std::string method;
    std::string model_path;
    std::string data_path;
    std::string codebook_path;
    std::string cache_backend;
    std::string db_path;

    int parallelism = 0;
    int batch_size = 0;
    int max_batches = -1;
    int subdivisions = -1;
    double tolerance = -1.0;
    double learning_rate = 0.0;

    bool live = false;
    bool show_help = false;
};

Args parse_args(int argc, char* argv[]);
void print_help(const char* prog);

}
