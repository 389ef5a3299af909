#pragma once

#include "neural/model.hpp"
#include <string>

namespace glyphnet {

// Writes to "<path>.tmp" and renames over the target, so readers never see a
// partially written model.
Result save_model(const std::string& path, const Model& model);

// feature_count > 0 additionally checks the input width.
Result load_model(const std::string& path, Model& out, int feature_count = 0);

}
