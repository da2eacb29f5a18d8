// clang-tooling setup shared by the reflective backend.
#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <clang/Tooling/ArgumentsAdjusters.h>
#include <clang/Tooling/CompilationDatabase.h>

namespace mockforge::codegen {

// Directories directly below `root`, sorted. Unreadable or missing roots give none.
std::vector<std::filesystem::path> subdirectories(const std::filesystem::path &root);

// Newest version-named subdirectory of `root` ("/usr/include/c++/12").
std::optional<std::filesystem::path> latest_version_dir(const std::filesystem::path &root);

// Host C++ standard library include directories, appended via `-isystem` so a
// header parses even when no compilation database describes it. May be empty.
auto detect_platform_include_dirs() -> std::vector<std::string>;

bool contains_isystem_entry(const clang::tooling::CommandLineArguments &args, const std::string &dir);

// Walk up from `start` looking for compile_commands.json; returns its directory.
std::optional<std::filesystem::path> find_nearest_compdb(const std::filesystem::path &start);

// Load `explicit_dir` when given (throws ExtractionError on failure), else the nearest
// database above the working directory, else a fixed database. Loaded databases
// infer commands for headers they do not list.
std::unique_ptr<clang::tooling::CompilationDatabase> load_compilation_database(const std::optional<std::filesystem::path> &explicit_dir);

// Rewrites each command for header parsing: drops outputs and module flags, forces
// C++20, then adds `-I` for `include_dirs`, the user's extra args and the platform
// system includes.
clang::tooling::ArgumentsAdjuster make_arguments_adjuster(std::vector<std::string> extra_args, std::vector<std::string> include_dirs);

} // namespace mockforge::codegen
