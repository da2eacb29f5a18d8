// Removal of previously generated files.
#pragma once

#include <filesystem>
#include <functional>
#include <iosfwd>
#include <system_error>
#include <vector>

namespace mockforge::codegen {

// - root: directory to scan
// - recursive: descend into sub-directories
// - interactive: confirm every file on `in`
// - dry_run: report what would be deleted, delete nothing
// - silent: write nothing to `out`
struct RemoveOptions {
    std::filesystem::path root;
    bool                  recursive   = false;
    bool                  interactive = true;
    bool                  dry_run     = false;
    bool                  silent      = false;
};

using RemoveFn = std::function<std::error_code(const std::filesystem::path &)>;

// Headers under `options.root` whose first line is the generated-file marker, sorted.
std::vector<std::filesystem::path> find_generated_files(const std::filesystem::path &root, bool recursive);

// Delete generated files. Returns the files deleted (or, for a dry run, the files
// that would be). Throws FileError when `remove_fn` reports a failure.
std::vector<std::filesystem::path> remove_mocks(const RemoveOptions &options, std::ostream &out, std::istream &in, const RemoveFn &remove_fn = {});

} // namespace mockforge::codegen
