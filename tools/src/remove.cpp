#include "remove.hpp"

#include "errors.hpp"
#include "model.hpp"
#include "path_utils.hpp"

#include <algorithm>
#include <fmt/core.h>
#include <fstream>
#include <istream>
#include <ostream>
#include <string>

namespace mockforge::codegen {
namespace {

bool is_header(const fs::path &path) {
    const std::string ext = path.extension().string();
    return ext == ".h" || ext == ".hpp" || ext == ".hh" || ext == ".hxx";
}

bool starts_with_marker(const fs::path &path) {
    std::ifstream in(path, std::ios::binary);
    std::string   first_line;
    if (!in || !std::getline(in, first_line)) {
        return false;
    }
    if (!first_line.empty() && first_line.back() == '\r') {
        first_line.pop_back();
    }
    return first_line == kGeneratedMarker;
}

bool confirmed(std::ostream &out, std::istream &in, const fs::path &path) {
    out << fmt::format("Delete {}? [y/N] ", path.string());
    out.flush();
    std::string answer;
    if (!std::getline(in, answer)) {
        return false;
    }
    answer = ascii_lower_copy(answer);
    return answer == "y" || answer == "yes";
}

} // namespace

std::vector<fs::path> find_generated_files(const fs::path &root, bool recursive) {
    std::vector<fs::path> found;
    std::error_code       ec;
    const auto            consider = [&](const fs::directory_entry &entry) {
        std::error_code entry_ec;
        if (entry.is_regular_file(entry_ec) && is_header(entry.path()) && starts_with_marker(entry.path())) {
            found.push_back(entry.path());
        }
    };
    if (recursive) {
        for (fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec), end; !ec && it != end;
             it.increment(ec)) {
            consider(*it);
        }
    } else {
        for (fs::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
            consider(*it);
        }
    }
    if (ec) {
        throw FileError(root, fmt::format("cannot scan directory: {}", ec.message()));
    }
    std::sort(found.begin(), found.end());
    return found;
}

std::vector<fs::path> remove_mocks(const RemoveOptions &options, std::ostream &out, std::istream &in, const RemoveFn &remove_fn) {
    const std::vector<fs::path> candidates = find_generated_files(options.root, options.recursive);
    if (candidates.empty()) {
        if (!options.silent) {
            out << "No generated mocks found.\n";
        }
        return {};
    }
    if (!options.silent) {
        out << "Generated mocks:\n";
        for (const auto &path : candidates) {
            out << "  " << path.string() << '\n';
        }
    }

    std::vector<fs::path> affected;
    for (const auto &path : candidates) {
        if (options.interactive && !confirmed(out, in, path)) {
            continue;
        }
        if (options.dry_run) {
            if (!options.silent) {
                out << fmt::format("Would delete {}\n", path.string());
            }
            affected.push_back(path);
            continue;
        }
        std::error_code ec;
        if (remove_fn) {
            ec = remove_fn(path);
        } else {
            fs::remove(path, ec);
        }
        if (ec) {
            throw FileError(path, fmt::format("failed to delete: {}", ec.message()));
        }
        if (!options.silent) {
            out << fmt::format("Deleted {}\n", path.string());
        }
        affected.push_back(path);
    }
    return affected;
}

} // namespace mockforge::codegen
