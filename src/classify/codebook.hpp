#pragma once

#include "core/types.hpp"
#include "similarity/ssim_comparator.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace glyphnet {

struct Glyph {
    std::string symbol;
    Tile tile;
    GlyphProfile profile;
};

// Ordered, de-duplicated glyph alphabet with the rendered tile of each symbol.
// Index order is the tie-break order for classification.
class GlyphCodebook {
public:
    explicit GlyphCodebook(double profile_sigma = 1.5) : profile_sigma_(profile_sigma) {}

    // Returns false when the symbol is already present.
    bool add(const std::string& symbol, const Tile& tile);

    size_t size() const { return glyphs_.size(); }
    bool empty() const { return glyphs_.empty(); }
    const Glyph& at(size_t i) const { return glyphs_.at(i); }
    const std::vector<Glyph>& glyphs() const { return glyphs_; }
    std::vector<std::string> symbols() const;
    int index_of(const std::string& symbol) const;
    double profile_sigma() const { return profile_sigma_; }

    // Every rendered tile must share one size.
    Result validate() const;
    Size tile_size() const { return glyphs_.empty() ? Size{} : glyphs_.front().tile.size(); }

private:
    double profile_sigma_;
    std::vector<Glyph> glyphs_;
    std::unordered_map<std::string, size_t> index_;
};

}
