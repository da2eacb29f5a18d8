// Mock class rendering.
#pragma once

#include "model.hpp"
#include "type_ref.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace mockforge::codegen {

// - namespace_name: namespace the mock class is declared in ("" for global)
// - self_namespace: namespace whose types are spelled unqualified
// - destination_path: where the artifact will be written; never included by itself
// - include_dirs: roots used to spell the destination for that check
struct MockRenderOptions {
    std::string                        namespace_name;
    std::string                        self_namespace;
    std::filesystem::path              destination_path;
    std::vector<std::filesystem::path> include_dirs;
};

// Render the mock for `model`. Deterministic: equal inputs give byte-identical text.
// Throws GenerationError when a referenced type cannot be included.
GeneratedArtifact render_mock(const InterfaceModel &model, const MockRenderOptions &options);

// Spelling of a method's return type (void, the single result, or the aggregate).
std::string render_return_type(const MethodSignature &method, const RenderContext &context);

} // namespace mockforge::codegen
