#include "classify/codebook.hpp"

namespace glyphnet {

bool GlyphCodebook::add(const std::string& symbol, const Tile& tile) {
    if (index_.count(symbol)) return false;
    Glyph g;
    g.symbol = symbol;
    g.tile = tile;
    g.profile = GlyphProfile::from_tile(tile, profile_sigma_);
    index_.emplace(symbol, glyphs_.size());
    glyphs_.push_back(std::move(g));
    return true;
}

std::vector<std::string> GlyphCodebook::symbols() const {
    std::vector<std::string> out;
    out.reserve(glyphs_.size());
    for (const auto& g : glyphs_) out.push_back(g.symbol);
    return out;
}

int GlyphCodebook::index_of(const std::string& symbol) const {
    auto it = index_.find(symbol);
    return it == index_.end() ? -1 : static_cast<int>(it->second);
}

Result GlyphCodebook::validate() const {
    if (glyphs_.empty()) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "glyph codebook is empty");
    }
    const Size size = tile_size();
    for (const auto& g : glyphs_) {
        if (g.tile.size() != size) {
            return Result::fail(ErrorCode::INVALID_ARGUMENT,
                                "glyph '" + g.symbol + "' is " + std::to_string(g.tile.width()) + "x" +
                                std::to_string(g.tile.height()) + ", expected " + std::to_string(size.width) +
                                "x" + std::to_string(size.height));
        }
    }
    return Result::ok();
}

}
