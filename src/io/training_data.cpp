#include "io/training_data.hpp"
#include "io/tile_io.hpp"
#include <zstd.h>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>

namespace glyphnet {

namespace {

constexpr size_t READ_BUFFER_SIZE = 64 * 1024;
constexpr int ZSTD_COMPRESSION_LEVEL = 3;
const char* const HEADER_TAG = "#glyphnet-training";

std::string escape_label(const std::string& label) {
    std::string out;
    out.reserve(label.size());
    for (char c : label) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case ',': out += "\\,"; break;
            case ';': out += "\\;"; break;
            case '\n': out += "\\n"; break;
            default: out += c; break;
        }
    }
    return out;
}

bool unescape_label(const std::string& text, std::string& out) {
    out.clear();
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c != '\\') {
            out += c;
            continue;
        }
        if (++i >= text.size()) return false;
        out += text[i] == 'n' ? '\n' : text[i];
    }
    return true;
}

// Splits on `sep` outside backslash escapes; fields keep their escapes.
std::vector<std::string> split_unescaped(const std::string& text, char sep) {
    std::vector<std::string> fields;
    std::string current;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\\' && i + 1 < text.size()) {
            current += c;
            current += text[++i];
        } else if (c == sep) {
            fields.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    fields.push_back(current);
    return fields;
}

size_t last_unescaped(const std::string& text, char c) {
    size_t found = std::string::npos;
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\\') {
            ++i;
        } else if (text[i] == c) {
            found = i;
        }
    }
    return found;
}

bool parse_header_line(const std::string& line, Size& size) {
    std::istringstream ss(line);
    std::string tag;
    int w = 0, h = 0;
    if (!(ss >> tag >> w >> h) || tag != HEADER_TAG || w < 1 || h < 1) return false;
    size = Size{w, h};
    return true;
}

}  // namespace

bool is_compressed_path(const std::string& path) {
    return path.size() > 4 && path.compare(path.size() - 4, 4, ".zst") == 0;
}

std::string format_record(const TrainingExample& example, const std::vector<std::string>& glyphs) {
    std::string line = format_intensities(example.intensities, TRAINING_INTENSITY_DECIMALS);
    char buf[64];
    for (size_t g = 0; g < glyphs.size() && g < example.scores.size(); ++g) {
        std::snprintf(buf, sizeof(buf), "%.9g", example.scores[g]);
        line += ';';
        line += escape_label(glyphs[g]);
        line += ',';
        line += buf;
    }
    return line;
}

bool parse_record(const std::string& line, const std::unordered_map<std::string, size_t>& glyph_index,
                  TrainingExample& out, std::vector<std::string>& unknown, std::string& error) {
    std::vector<std::string> fields = split_unescaped(line, ';');
    if (fields.size() < 2) {
        error = "record has no glyph scores";
        return false;
    }
    if (!parse_intensities(fields[0], out.intensities)) {
        error = "bad intensity list";
        return false;
    }

    out.scores.assign(glyph_index.size(), 0.0);
    for (size_t i = 1; i < fields.size(); ++i) {
        const std::string& pair = fields[i];
        size_t comma = last_unescaped(pair, ',');
        if (comma == std::string::npos) {
            error = "score pair " + std::to_string(i) + " has no ','";
            return false;
        }
        std::string label;
        if (!unescape_label(pair.substr(0, comma), label)) {
            error = "score pair " + std::to_string(i) + " has a dangling escape";
            return false;
        }

        std::string score_text = pair.substr(comma + 1);
        errno = 0;
        char* end = nullptr;
        double score = std::strtod(score_text.c_str(), &end);
        while (end && (*end == ' ' || *end == '\r')) ++end;
        if (score_text.empty() || *end != '\0' || errno != 0) {
            error = "bad score '" + score_text + "' for glyph '" + label + "'";
            return false;
        }

        auto it = glyph_index.find(label);
        if (it == glyph_index.end()) {
            unknown.push_back(label);
            continue;
        }
        out.scores[it->second] = score;
    }
    return true;
}

TrainingDataWriter::TrainingDataWriter() = default;

TrainingDataWriter::~TrainingDataWriter() {
    if (file_) {
        Result r = close();
        if (r.failure()) {
            std::cerr << "Warning: " << r.message << "\n";
        }
    }
}

Result TrainingDataWriter::open(const std::string& path, const std::vector<std::string>& glyphs, Size tile_size) {
    if (file_) {
        Result r = close();
        if (r.failure()) return r;
    }
    if (glyphs.empty()) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "training data needs a non-empty codebook");
    }

    std::error_code ec;
    std::filesystem::path target(path);
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), ec);
    }

    file_ = fopen(path.c_str(), "wb");
    if (!file_) {
        return Result::fail(ErrorCode::IO_ERROR, "cannot open " + path + " for writing");
    }
    path_ = path;
    glyphs_ = glyphs;
    records_ = 0;

    if (is_compressed_path(path)) {
        cctx_ = ZSTD_createCCtx();
        if (!cctx_) {
            fclose(file_);
            file_ = nullptr;
            return Result::fail(ErrorCode::IO_ERROR, "cannot create zstd context");
        }
        ZSTD_CCtx_setParameter(cctx_, ZSTD_c_compressionLevel, ZSTD_COMPRESSION_LEVEL);
        out_buffer_.resize(ZSTD_CStreamOutSize());
    }

    std::ostringstream header;
    header << HEADER_TAG << ' ' << tile_size.width << ' ' << tile_size.height << '\n';
    return write_bytes(header.str());
}

Result TrainingDataWriter::write_bytes(const std::string& bytes) {
    if (!file_) {
        return Result::fail(ErrorCode::IO_ERROR, "training data writer is not open");
    }
    if (!cctx_) {
        if (fwrite(bytes.data(), 1, bytes.size(), file_) != bytes.size()) {
            return Result::fail(ErrorCode::IO_ERROR, "short write to " + path_);
        }
        return Result::ok();
    }

    ZSTD_inBuffer input{bytes.data(), bytes.size(), 0};
    while (input.pos < input.size) {
        ZSTD_outBuffer output{out_buffer_.data(), out_buffer_.size(), 0};
        size_t ret = ZSTD_compressStream2(cctx_, &output, &input, ZSTD_e_continue);
        if (ZSTD_isError(ret)) {
            return Result::fail(ErrorCode::IO_ERROR, std::string("zstd: ") + ZSTD_getErrorName(ret));
        }
        if (output.pos > 0 && fwrite(out_buffer_.data(), 1, output.pos, file_) != output.pos) {
            return Result::fail(ErrorCode::IO_ERROR, "short write to " + path_);
        }
    }
    return Result::ok();
}

Result TrainingDataWriter::finish_stream() {
    ZSTD_inBuffer input{nullptr, 0, 0};
    size_t remaining = 0;
    do {
        ZSTD_outBuffer output{out_buffer_.data(), out_buffer_.size(), 0};
        remaining = ZSTD_compressStream2(cctx_, &output, &input, ZSTD_e_end);
        if (ZSTD_isError(remaining)) {
            return Result::fail(ErrorCode::IO_ERROR, std::string("zstd: ") + ZSTD_getErrorName(remaining));
        }
        if (output.pos > 0 && fwrite(out_buffer_.data(), 1, output.pos, file_) != output.pos) {
            return Result::fail(ErrorCode::IO_ERROR, "short write to " + path_);
        }
    } while (remaining != 0);
    return Result::ok();
}

Result TrainingDataWriter::write(const TrainingExample& example) {
    if (example.scores.size() != glyphs_.size()) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "example has " + std::to_string(example.scores.size()) +
                            " scores, codebook has " + std::to_string(glyphs_.size()));
    }
    Result r = write_bytes(format_record(example, glyphs_) + "\n");
    if (r.success()) records_++;
    return r;
}

Result TrainingDataWriter::close() {
    if (!file_) return Result::ok();

    Result r = Result::ok();
    if (cctx_) {
        r = finish_stream();
        ZSTD_freeCCtx(cctx_);
        cctx_ = nullptr;
    }
    if (fclose(file_) != 0 && r.success()) {
        r = Result::fail(ErrorCode::IO_ERROR, "error closing " + path_);
    }
    file_ = nullptr;
    return r;
}

TrainingDataReader::TrainingDataReader() = default;

TrainingDataReader::~TrainingDataReader() {
    close();
}

void TrainingDataReader::close() {
    if (dctx_) {
        ZSTD_freeDCtx(dctx_);
        dctx_ = nullptr;
    }
    if (file_) {
        fclose(file_);
        file_ = nullptr;
    }
}

Result TrainingDataReader::open(const std::string& path, const std::vector<std::string>& codebook_symbols) {
    close();
    if (codebook_symbols.empty()) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "training data needs a non-empty codebook");
    }

    file_ = fopen(path.c_str(), "rb");
    if (!file_) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "cannot open training data " + path);
    }
    path_ = path;
    glyph_index_.clear();
    for (size_t i = 0; i < codebook_symbols.size(); ++i) {
        glyph_index_.emplace(codebook_symbols[i], i);
    }
    warned_.clear();
    in_buffer_.resize(READ_BUFFER_SIZE);
    in_pos_ = in_size_ = 0;
    frame_remaining_ = 0;
    pending_.clear();
    pending_pos_ = 0;
    eof_ = false;
    has_lookahead_ = false;
    tile_size_ = Size{};
    status_ = Result::ok();
    line_no_ = records_ = skipped_ = 0;

    if (is_compressed_path(path)) {
        dctx_ = ZSTD_createDCtx();
        if (!dctx_) {
            close();
            return Result::fail(ErrorCode::IO_ERROR, "cannot create zstd context");
        }
        out_buffer_.resize(ZSTD_DStreamOutSize());
    }

    std::string first;
    if (read_line(first)) {
        if (!parse_header_line(first, tile_size_)) {
            lookahead_ = first;
            has_lookahead_ = true;
        }
    }
    return status_;
}

bool TrainingDataReader::fill() {
    if (eof_ || !file_) return false;
    if (pending_pos_ > 0) {
        pending_.erase(0, pending_pos_);
        pending_pos_ = 0;
    }

    if (!dctx_) {
        size_t n = fread(in_buffer_.data(), 1, in_buffer_.size(), file_);
        if (n == 0) {
            if (ferror(file_)) status_ = Result::fail(ErrorCode::IO_ERROR, "read error on " + path_);
            eof_ = true;
            return false;
        }
        pending_.append(in_buffer_.data(), n);
        return true;
    }

    for (;;) {
        if (in_pos_ >= in_size_) {
            in_size_ = fread(in_buffer_.data(), 1, in_buffer_.size(), file_);
            in_pos_ = 0;
            if (in_size_ == 0) {
                if (ferror(file_)) {
                    status_ = Result::fail(ErrorCode::IO_ERROR, "read error on " + path_);
                } else if (frame_remaining_ != 0) {
                    status_ = Result::fail(ErrorCode::INVALID_FORMAT, path_ + ": truncated zstd stream");
                }
                eof_ = true;
                return false;
            }
        }

        ZSTD_inBuffer input{in_buffer_.data(), in_size_, in_pos_};
        ZSTD_outBuffer output{out_buffer_.data(), out_buffer_.size(), 0};
        size_t ret = ZSTD_decompressStream(dctx_, &output, &input);
        in_pos_ = input.pos;
        if (ZSTD_isError(ret)) {
            status_ = Result::fail(ErrorCode::INVALID_FORMAT, path_ + ": zstd: " + ZSTD_getErrorName(ret));
            eof_ = true;
            return false;
        }
        frame_remaining_ = ret;
        if (output.pos > 0) {
            pending_.append(out_buffer_.data(), output.pos);
            return true;
        }
    }
}

bool TrainingDataReader::read_line(std::string& line) {
    if (has_lookahead_) {
        line = std::move(lookahead_);
        has_lookahead_ = false;
        return true;
    }
    for (;;) {
        size_t nl = pending_.find('\n', pending_pos_);
        if (nl != std::string::npos) {
            line.assign(pending_, pending_pos_, nl - pending_pos_);
            pending_pos_ = nl + 1;
            ++line_no_;
            return true;
        }
        if (!fill()) {
            if (pending_pos_ < pending_.size()) {
                line.assign(pending_, pending_pos_, std::string::npos);
                pending_pos_ = pending_.size();
                ++line_no_;
                return true;
            }
            return false;
        }
    }
}

bool TrainingDataReader::next(TrainingExample& out) {
    std::string line;
    while (read_line(line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;

        std::vector<std::string> unknown;
        std::string error;
        if (!parse_record(line, glyph_index_, out, unknown, error)) {
            std::cerr << "Warning: " << path_ << ":" << line_no_ << ": " << error << ", skipping\n";
            skipped_++;
            continue;
        }
        const size_t expected = static_cast<size_t>(tile_size_.area());
        if (expected > 0 && out.intensities.size() != expected) {
            std::cerr << "Warning: " << path_ << ":" << line_no_ << ": record has " << out.intensities.size()
                      << " intensities, expected " << expected << ", skipping\n";
            skipped_++;
            continue;
        }
        for (const auto& label : unknown) {
            if (warned_.insert(label).second) {
                std::cerr << "Warning: " << path_ << ": glyph '" << label << "' is not in the codebook, ignoring\n";
            }
        }
        records_++;
        return true;
    }
    return false;
}

}
