#include "tooling_support.hpp"

#include "errors.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <fmt/core.h>
#include <string_view>
#include <utility>

namespace mockforge::codegen {

namespace fs = std::filesystem;
using clang::tooling::CommandLineArguments;

namespace {

std::vector<int> parse_version_components(std::string_view text) {
    std::vector<int> components;
    std::size_t      pos = 0;
    while (pos < text.size()) {
        if (!std::isdigit(static_cast<unsigned char>(text[pos]))) {
            return {};
        }
        std::size_t end = pos;
        while (end < text.size() && std::isdigit(static_cast<unsigned char>(text[end])) != 0) {
            ++end;
        }
        if (end - pos > 6) {
            return {};
        }
        components.push_back(std::stoi(std::string(text.substr(pos, end - pos))));
        if (end >= text.size()) {
            break;
        }
        if (text[end] != '.') {
            return {};
        }
        pos = end + 1;
    }
    return components;
}

bool is_module_flag(std::string_view a) {
    return a == "-fmodules" || a == "-fmodules-ts" || a == "-fmodule-header" || a.rfind("-fmodule-mapper=", 0) == 0 ||
           a.rfind("-fmodule-file=", 0) == 0 || a.rfind("-fprebuilt-module-path=", 0) == 0 || a.rfind("-fmodules-cache-path=", 0) == 0 ||
           a.rfind("-fdeps-format=", 0) == 0;
}

} // namespace

std::vector<fs::path> subdirectories(const fs::path &root) {
    std::vector<fs::path> out;
    std::error_code       ec;
    for (fs::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (it->is_directory(entry_ec)) {
            out.push_back(it->path());
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::optional<fs::path> latest_version_dir(const fs::path &root) {
    std::optional<fs::path> best;
    std::vector<int>        best_version;
    for (const auto &dir : subdirectories(root)) {
        auto version = parse_version_components(dir.filename().string());
        if (version.empty()) {
            continue;
        }
        if (!best || std::ranges::lexicographical_compare(best_version, version)) {
            best         = dir;
            best_version = std::move(version);
        }
    }
    return best;
}

auto detect_platform_include_dirs() -> std::vector<std::string> {
    std::vector<std::string> dirs;

    auto append_unique = [&dirs](const fs::path &candidate) {
        std::error_code ec;
        if (!fs::is_directory(candidate, ec)) {
            return;
        }
        auto normalized = candidate.lexically_normal().string();
        if (std::ranges::find(dirs, normalized) == dirs.end()) {
            dirs.push_back(std::move(normalized));
        }
    };

#if defined(__APPLE__)
    for (const fs::path sdk : {fs::path("/Library/Developer/CommandLineTools/SDKs/MacOSX.sdk"),
                               fs::path("/Applications/Xcode.app/Contents/Developer/Platforms/MacOSX.platform/Developer/SDKs/MacOSX.sdk")}) {
        std::error_code ec;
        if (fs::is_directory(sdk, ec)) {
            append_unique(sdk / "usr/include/c++/v1");
            append_unique(sdk / "usr/include");
            break;
        }
    }
    if (dirs.empty()) {
        log_debug("macOS SDK not found, system headers may not be available");
    }
#elif defined(__linux__)
    if (auto cxx_root = latest_version_dir("/usr/include/c++")) {
        append_unique(*cxx_root);
        for (const auto &dir : subdirectories(*cxx_root)) {
            const auto name = dir.filename().string();
            if (name.find("-linux") != std::string::npos || name.find("-gnu") != std::string::npos) {
                append_unique(dir);
                break;
            }
        }
        append_unique(*cxx_root / "backward");
        // Target specific libstdc++ headers live under /usr/include/<triple>/c++/<version>.
        for (const auto &dir : subdirectories("/usr/include")) {
            if (dir.filename().string().find("-linux") != std::string::npos) {
                append_unique(dir / "c++" / cxx_root->filename());
                append_unique(dir);
            }
        }
    }

    for (const fs::path gcc_root : {fs::path("/usr/lib/gcc"), fs::path("/usr/lib64/gcc")}) {
        for (const auto &triple_dir : subdirectories(gcc_root)) {
            if (auto version_dir = latest_version_dir(triple_dir)) {
                append_unique(*version_dir / "include");
            }
        }
    }

    append_unique(fs::path("/usr/include"));
#endif
    return dirs;
}

bool contains_isystem_entry(const CommandLineArguments &args, const std::string &dir) {
    for (std::size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == "-isystem" && args[i + 1] == dir) {
            return true;
        }
    }
    return false;
}

std::optional<fs::path> find_nearest_compdb(const fs::path &start) {
    std::error_code ec;
    auto            dir = fs::absolute(start, ec);
    if (ec) {
        return std::nullopt;
    }
    while (true) {
        if (fs::exists(dir / "compile_commands.json", ec)) {
            return dir;
        }
        if (!dir.has_parent_path() || dir.parent_path() == dir) {
            break;
        }
        dir = dir.parent_path();
    }
    return std::nullopt;
}

std::unique_ptr<clang::tooling::CompilationDatabase> load_compilation_database(const std::optional<fs::path> &explicit_dir) {
    std::string error;
    if (explicit_dir) {
        auto database = clang::tooling::CompilationDatabase::loadFromDirectory(explicit_dir->string(), error);
        if (!database) {
            throw ExtractionError(fmt::format("failed to load compilation database at '{}': {}", explicit_dir->string(), error));
        }
        return clang::tooling::inferMissingCompileCommands(std::move(database));
    }
    if (auto nearest = find_nearest_compdb(fs::current_path())) {
        if (auto database = clang::tooling::CompilationDatabase::loadFromDirectory(nearest->string(), error)) {
            log_debug("using compilation database in {}", nearest->string());
            return clang::tooling::inferMissingCompileCommands(std::move(database));
        }
        log_debug("ignoring compilation database in {}: {}", nearest->string(), error);
    }
    return std::make_unique<clang::tooling::FixedCompilationDatabase>(".", std::vector<std::string>{});
}

clang::tooling::ArgumentsAdjuster make_arguments_adjuster(std::vector<std::string> extra_args, std::vector<std::string> include_dirs) {
    const auto platform_dirs = detect_platform_include_dirs();
    return [extra_args = std::move(extra_args), include_dirs = std::move(include_dirs),
            platform_dirs](const CommandLineArguments &command_line, llvm::StringRef filename) {
        CommandLineArguments adjusted;
#if defined(_WIN32)
        adjusted.emplace_back(command_line.empty() ? std::string("clang-cl") : command_line.front());
#else
        adjusted.emplace_back(command_line.empty() ? std::string("clang++") : command_line.front());
#endif
        bool has_std = false;
        for (std::size_t i = 1; i < command_line.size(); ++i) {
            const auto &arg = command_line[i];
            if (arg == filename) {
                continue;
            }
            if (arg == "-o" && i + 1 < command_line.size()) {
                ++i;
                continue;
            }
            if (is_module_flag(arg)) {
                continue;
            }
            if (arg == "-Xclang" && i + 1 < command_line.size() && is_module_flag(command_line[i + 1])) {
                ++i;
                continue;
            }
            if (arg.rfind("-std=", 0) == 0) {
                has_std = true;
            }
            adjusted.push_back(arg);
        }
        if (!has_std) {
            adjusted.emplace_back("-std=c++20");
        }
        for (const auto &dir : include_dirs) {
            adjusted.push_back("-I" + dir);
        }
        adjusted.insert(adjusted.end(), extra_args.begin(), extra_args.end());
        for (const auto &dir : platform_dirs) {
            if (!contains_isystem_entry(adjusted, dir)) {
                adjusted.emplace_back("-isystem");
                adjusted.push_back(dir);
            }
        }
        adjusted.emplace_back("-Wno-pragma-once-outside-header");
        adjusted.emplace_back("-xc++");
        adjusted.push_back(filename.str());
        return adjusted;
    };
}

} // namespace mockforge::codegen
