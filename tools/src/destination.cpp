#include "destination.hpp"

#include "errors.hpp"
#include "path_utils.hpp"

#include <cctype>
#include <fmt/core.h>
#include <map>
#include <string>

namespace mockforge::codegen {
namespace {

std::string directory_basename(const fs::path &dir) {
    fs::path normalized = normalize_path(dir);
    if (!normalized.has_filename()) {
        normalized = normalized.parent_path();
    }
    return normalized.filename().string();
}

// Directory names may contain characters that are not valid in an identifier.
std::string as_identifier(std::string name) {
    for (auto &c : name) {
        if (std::isalnum(static_cast<unsigned char>(c)) == 0 && c != '_') {
            c = '_';
        }
    }
    if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front())) != 0) {
        name.insert(name.begin(), '_');
    }
    return name;
}

} // namespace

std::string default_mock_file_name(const std::string &interface_name) { return "mock_" + ascii_lower_copy(interface_name) + ".h"; }

DestinationPlan plan_destinations(const DestinationOptions &options, const std::vector<InterfaceModel> &models, const fs::path &working_dir) {
    if (!options.output.empty() && !options.output_dir.empty()) {
        throw UsageError("cannot use --output and --output-dir together");
    }
    if (!options.output.empty() && models.size() > 1) {
        throw UsageError(fmt::format("--output names one file but {} interfaces were requested; use --output-dir", models.size()));
    }

    DestinationPlan plan;
    const fs::path  mock_dir = options.output_dir.empty() ? working_dir : normalize_path(options.output_dir);

    if (!options.namespace_name.empty()) {
        plan.namespace_name = options.namespace_name;
    } else if (!options.output_dir.empty()) {
        plan.namespace_name = as_identifier(directory_basename(options.output_dir));
    } else {
        plan.namespace_name = as_identifier(directory_basename(working_dir) + "_test");
    }

    std::map<std::string, const InterfaceModel *> owners;
    for (const auto &model : models) {
        if (!options.output.empty()) {
            plan.mock_paths.push_back(options.output.is_absolute() ? options.output : working_dir / options.output);
        } else {
            plan.mock_paths.push_back(mock_dir / default_mock_file_name(model.interface_name));
        }
        const auto [it, inserted] = owners.emplace(plan.mock_paths.back().lexically_normal().generic_string(), &model);
        if (!inserted) {
            throw UsageError(fmt::format("{}::{} and {}::{} would both be written to {}; generate them into different directories",
                                         it->second->scope, it->second->interface_name, model.scope, model.interface_name,
                                         plan.mock_paths.back().string()));
        }
    }

    if (!options.matchers_dir.empty()) {
        plan.matchers_dir = options.matchers_dir.is_absolute() ? options.matchers_dir : working_dir / options.matchers_dir;
    } else if (!plan.mock_paths.empty()) {
        plan.matchers_dir = plan.mock_paths.front().parent_path() / "matchers";
    } else {
        plan.matchers_dir = mock_dir / "matchers";
    }
    return plan;
}

} // namespace mockforge::codegen
