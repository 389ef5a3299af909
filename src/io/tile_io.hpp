#pragma once

#include "classify/codebook.hpp"
#include "core/types.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace glyphnet {

// "v,v,v" with values in [0,1]; "n" marks a transparent pixel.
bool parse_intensities(const std::string& text, std::vector<double>& out);
std::string format_intensities(const std::vector<double>& values, int decimals);

// One tile per line: "w h bits [#RRGGBB] : v,v,...". Blank lines and lines
// starting with "//" are ignored in both tile and codebook files.
Result read_tiles(const std::string& path, std::vector<Tile>& out);
Result parse_tile_line(const std::string& line, Tile& out);

// One glyph per line: "label : w h bits : v,v,...".
Result read_codebook(const std::string& path, GlyphCodebook& out);
Result parse_codebook_line(const std::string& line, std::string& label, Tile& tile);

// "index<TAB>glyph<TAB>score[<TAB>#RRGGBB]" per tile.
void write_cells(std::ostream& os, const std::vector<GlyphCell>& cells);

}
