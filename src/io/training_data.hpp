#pragma once

#include "core/types.hpp"
#include "neural/example_source.hpp"
#include <cstdio>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

struct ZSTD_CCtx_s;
struct ZSTD_DCtx_s;

namespace glyphnet {

constexpr int TRAINING_INTENSITY_DECIMALS = 6;

// "i1,i2,...;glyph,score;glyph,score". Glyph labels escape '\', ',' and ';'.
std::string format_record(const TrainingExample& example, const std::vector<std::string>& glyphs);

// Scores land at the index of their glyph; glyphs missing from the record score
// 0 and unknown labels are reported through `unknown`.
bool parse_record(const std::string& line, const std::unordered_map<std::string, size_t>& glyph_index,
                  TrainingExample& out, std::vector<std::string>& unknown, std::string& error);

bool is_compressed_path(const std::string& path);

// Line writer for preprocessed training data; ".zst" paths are zstd streams.
class TrainingDataWriter {
public:
    TrainingDataWriter();
    ~TrainingDataWriter();

    TrainingDataWriter(const TrainingDataWriter&) = delete;
    TrainingDataWriter& operator=(const TrainingDataWriter&) = delete;

    Result open(const std::string& path, const std::vector<std::string>& glyphs, Size tile_size);
    Result write(const TrainingExample& example);
    Result close();

    bool is_open() const { return file_ != nullptr; }
    size_t records() const { return records_; }

private:
    Result write_bytes(const std::string& bytes);
    Result finish_stream();

    FILE* file_ = nullptr;
    ZSTD_CCtx_s* cctx_ = nullptr;
    std::vector<char> out_buffer_;
    std::vector<std::string> glyphs_;
    std::string path_;
    size_t records_ = 0;
};

class TrainingDataReader : public ExampleSource {
public:
    TrainingDataReader();
    ~TrainingDataReader() override;

    TrainingDataReader(const TrainingDataReader&) = delete;
    TrainingDataReader& operator=(const TrainingDataReader&) = delete;

    Result open(const std::string& path, const std::vector<std::string>& codebook_symbols);
    void close();

    // Malformed lines, and records whose intensity count differs from the
    // header's tile size, are skipped with a warning; read errors end the
    // stream and are reported by status().
    bool next(TrainingExample& out) override;

    const Result& status() const { return status_; }
    Size tile_size() const { return tile_size_; }
    size_t records() const { return records_; }
    size_t skipped() const { return skipped_; }

private:
    bool read_line(std::string& line);
    bool fill();

    FILE* file_ = nullptr;
    ZSTD_DCtx_s* dctx_ = nullptr;
    std::vector<char> in_buffer_;
    std::vector<char> out_buffer_;
    size_t in_pos_ = 0;
    size_t in_size_ = 0;
    size_t frame_remaining_ = 0;
    std::string pending_;
    size_t pending_pos_ = 0;
    bool eof_ = false;
    std::string lookahead_;
    bool has_lookahead_ = false;

    std::string path_;
    std::unordered_map<std::string, size_t> glyph_index_;
    std::set<std::string> warned_;
    Size tile_size_;
    Result status_;
    size_t line_no_ = 0;
    size_t records_ = 0;
    size_t skipped_ = 0;
};

}
