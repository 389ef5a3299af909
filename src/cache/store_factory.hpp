#pragma once

#include "cache/memo_store.hpp"
#include "core/config.hpp"
#include <memory>

namespace glyphnet {

// Builds the store named by cache.backend ("none", "memory" or "sqlite").
// Throws std::invalid_argument for an unknown backend or invalid limits.
std::unique_ptr<MemoStore> make_memo_store(const ConfigCache& cache);

}
