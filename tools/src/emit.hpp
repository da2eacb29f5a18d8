// A complete generation run: extract, validate, render, write.
#pragma once

#include "destination.hpp"
#include "extractor.hpp"
#include "model.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace mockforge::codegen {

// Everything `mockforge generate` needs.
// - working_dir: base for relative destinations and the default namespace;
//   empty uses the process working directory
struct GenerateRequest {
    SourceSpec            source;
    ExtractorKind         backend = ExtractorKind::Reflective;
    ExtractorConfig       extractor;
    DestinationOptions    destination;
    std::string           self_namespace;
    bool                  generate_matchers  = false;
    std::string           matchers_namespace = "matchers";
    std::filesystem::path working_dir;
};

struct PendingFile {
    std::filesystem::path path;
    std::string           content;
};

struct GenerateResult {
    std::vector<std::filesystem::path> written;
    std::vector<std::filesystem::path> unchanged;
};

// Run with the backend named by `request.backend`.
GenerateResult run_generate(const GenerateRequest &request);

// Run with a caller-provided backend.
GenerateResult run_generate(const GenerateRequest &request, InterfaceExtractor &extractor);

// Render mocks (and matchers when requested) for already extracted models.
// Nothing touches the filesystem.
std::vector<PendingFile> render_all(const std::vector<InterfaceModel> &models, const GenerateRequest &request);

// Stage every file next to its destination, then rename the staged files into
// place. Files whose content is already current are left untouched. On failure
// the staged files are removed and FileError is thrown.
void write_files(const std::vector<PendingFile> &files, GenerateResult &result);

} // namespace mockforge::codegen
