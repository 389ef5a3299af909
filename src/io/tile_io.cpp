#include "io/tile_io.hpp"
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace glyphnet {

namespace {

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

bool skippable(const std::string& line) {
    std::string t = trim(line);
    return t.empty() || t.compare(0, 2, "//") == 0;
}

bool parse_header(const std::string& text, int& w, int& h, int& bits, uint32_t& color) {
    std::istringstream ss(text);
    if (!(ss >> w >> h >> bits)) return false;
    std::string extra;
    color = NO_COLOR;
    if (ss >> extra) {
        if (extra.size() != 7 || extra[0] != '#') return false;
        char* end = nullptr;
        unsigned long v = std::strtoul(extra.c_str() + 1, &end, 16);
        if (*end != '\0') return false;
        color = static_cast<uint32_t>(v);
    }
    return !(ss >> extra);
}

Result build_tile(int w, int h, int bits, std::vector<double> values, uint32_t color, Tile& out) {
    if (w <= 0 || h <= 0 || bits < 1 || bits > 16) {
        return Result::fail(ErrorCode::INVALID_FORMAT, "invalid tile header " + std::to_string(w) + " " +
                            std::to_string(h) + " " + std::to_string(bits));
    }
    if (values.size() != static_cast<size_t>(w) * h) {
        return Result::fail(ErrorCode::INVALID_FORMAT, "expected " + std::to_string(w * h) + " values, got " +
                            std::to_string(values.size()));
    }
    out = Tile(w, h, bits, std::move(values), color);
    return Result::ok();
}

}  // namespace

bool parse_intensities(const std::string& text, std::vector<double>& out) {
    out.clear();
    std::string t = trim(text);
    if (t.empty()) return false;

    size_t pos = 0;
    while (pos <= t.size()) {
        size_t comma = t.find(',', pos);
        std::string field = trim(t.substr(pos, comma == std::string::npos ? std::string::npos : comma - pos));
        if (field == "n") {
            out.push_back(transparent_pixel());
        } else {
            errno = 0;
            char* end = nullptr;
            double v = std::strtod(field.c_str(), &end);
            if (field.empty() || *end != '\0' || errno != 0 || !std::isfinite(v)) return false;
            out.push_back(v);
        }
        if (comma == std::string::npos) break;
        pos = comma + 1;
    }
    return true;
}

std::string format_intensities(const std::vector<double>& values, int decimals) {
    std::string out;
    char buf[64];
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ',';
        if (is_transparent(values[i])) {
            out += 'n';
            continue;
        }
        std::snprintf(buf, sizeof(buf), "%.*f", decimals, values[i]);
        std::string s(buf);
        if (s.find('.') != std::string::npos) {
            while (!s.empty() && s.back() == '0') s.pop_back();
            if (!s.empty() && s.back() == '.') s.pop_back();
        }
        if (s == "-0") s = "0";
        out += s;
    }
    return out;
}

Result parse_tile_line(const std::string& line, Tile& out) {
    size_t colon = line.find(':');
    if (colon == std::string::npos) {
        return Result::fail(ErrorCode::INVALID_FORMAT, "missing ':' separator");
    }
    int w = 0, h = 0, bits = 0;
    uint32_t color = NO_COLOR;
    if (!parse_header(line.substr(0, colon), w, h, bits, color)) {
        return Result::fail(ErrorCode::INVALID_FORMAT, "bad tile header '" + trim(line.substr(0, colon)) + "'");
    }
    std::vector<double> values;
    if (!parse_intensities(line.substr(colon + 1), values)) {
        return Result::fail(ErrorCode::INVALID_FORMAT, "bad intensity list");
    }
    return build_tile(w, h, bits, std::move(values), color, out);
}

Result read_tiles(const std::string& path, std::vector<Tile>& out) {
    std::ifstream in(path);
    if (!in) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "cannot open tiles " + path);
    }
    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (skippable(line)) continue;
        Tile tile;
        Result r = parse_tile_line(line, tile);
        if (r.failure()) {
            return Result::fail(r.error, path + ":" + std::to_string(line_no) + ": " + r.message);
        }
        out.push_back(std::move(tile));
    }
    return Result::ok();
}

Result parse_codebook_line(const std::string& line, std::string& label, Tile& tile) {
    // Split from the right so labels may contain " : ".
    size_t values_sep = line.rfind(" : ");
    if (values_sep == std::string::npos || values_sep == 0) {
        return Result::fail(ErrorCode::INVALID_FORMAT, "expected 'label : w h bits : values'");
    }
    size_t header_sep = line.rfind(" : ", values_sep - 1);
    if (header_sep == std::string::npos) {
        return Result::fail(ErrorCode::INVALID_FORMAT, "expected 'label : w h bits : values'");
    }

    label = line.substr(0, header_sep);
    if (label.empty()) {
        return Result::fail(ErrorCode::INVALID_FORMAT, "empty glyph label");
    }
    int w = 0, h = 0, bits = 0;
    uint32_t color = NO_COLOR;
    std::string header = line.substr(header_sep + 3, values_sep - header_sep - 3);
    if (!parse_header(header, w, h, bits, color)) {
        return Result::fail(ErrorCode::INVALID_FORMAT, "bad glyph header '" + trim(header) + "'");
    }
    std::vector<double> values;
    if (!parse_intensities(line.substr(values_sep + 3), values)) {
        return Result::fail(ErrorCode::INVALID_FORMAT, "bad intensity list for glyph '" + label + "'");
    }
    return build_tile(w, h, bits, std::move(values), NO_COLOR, tile);
}

Result read_codebook(const std::string& path, GlyphCodebook& out) {
    std::ifstream in(path);
    if (!in) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "cannot open codebook " + path);
    }
    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (skippable(line)) continue;
        std::string label;
        Tile tile;
        Result r = parse_codebook_line(line, label, tile);
        if (r.failure()) {
            return Result::fail(r.error, path + ":" + std::to_string(line_no) + ": " + r.message);
        }
        if (!out.add(label, tile)) {
            std::cerr << "Warning: " << path << ":" << line_no << ": duplicate glyph '" << label << "' ignored\n";
        }
    }
    return out.validate();
}

void write_cells(std::ostream& os, const std::vector<GlyphCell>& cells) {
    for (size_t i = 0; i < cells.size(); ++i) {
        const GlyphCell& c = cells[i];
        os << i << '\t' << c.glyph << '\t';
        if (std::isnan(c.score)) {
            os << '-';
        } else {
            os << std::setprecision(6) << c.score;
        }
        if (c.color != NO_COLOR) {
            os << "\t#" << std::hex << std::setw(6) << std::setfill('0') << (c.color & 0xFFFFFF) << std::dec
               << std::setfill(' ');
        }
        os << '\n';
    }
}

}
