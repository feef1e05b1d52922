#pragma once

#include "patch/patch.hpp"

#include <string>
#include <vector>

namespace patchy {

// Render a patch as unified diff lines. Each entry is one line including its '\n'.
std::vector<std::string>
unified_patch_render(const Patch& patch);

// The rendered lines concatenated.
std::string
unified_patch_text(const Patch& patch);

}  // namespace patchy
