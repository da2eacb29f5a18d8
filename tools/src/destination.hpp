// Where generated mocks and matchers go, and which namespace they use.
#pragma once

#include "model.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace mockforge::codegen {

// Values of the destination flags; empty means "not given".
// - output: explicit mock file, only valid for a single interface
// - output_dir: directory for `mock_<interface>.h` files
// - namespace_name / matchers_dir: explicit overrides
struct DestinationOptions {
    std::filesystem::path output;
    std::filesystem::path output_dir;
    std::string           namespace_name;
    std::filesystem::path matchers_dir;
};

struct DestinationPlan {
    std::string                        namespace_name;
    std::vector<std::filesystem::path> mock_paths; // parallel to the models
    std::filesystem::path              matchers_dir;
};

// Resolve destinations for `models`. Throws UsageError when --output and
// --output-dir are combined or --output is given for several interfaces.
DestinationPlan plan_destinations(const DestinationOptions &options, const std::vector<InterfaceModel> &models,
                                  const std::filesystem::path &working_dir);

// "Display" -> "mock_display.h"
std::string default_mock_file_name(const std::string &interface_name);

} // namespace mockforge::codegen
