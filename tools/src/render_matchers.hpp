// Typed argument matcher rendering.
#pragma once

#include "model.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace mockforge::codegen {

// - directory: where matcher headers are written
// - namespace_name: namespace of the generated functions ("matchers" by default)
// - include_dirs: roots used to spell destinations, so a header never includes itself
struct MatcherRenderOptions {
    std::filesystem::path              directory;
    std::string                        namespace_name = "matchers";
    std::vector<std::filesystem::path> include_dirs;
};

// One header per distinct non-builtin parameter type referenced by `artifacts`,
// sorted by file name. Throws GenerationError if two types would share a file.
std::vector<MatcherArtifact> render_matchers(const std::vector<GeneratedArtifact> &artifacts, const MatcherRenderOptions &options);

// "PtrToShopWidget" -> "ptr_to_shop_widget"
std::string snake_case(const std::string &stem);

} // namespace mockforge::codegen
