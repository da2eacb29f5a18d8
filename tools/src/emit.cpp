#include "emit.hpp"

#include "errors.hpp"
#include "log.hpp"
#include "path_utils.hpp"
#include "render_matchers.hpp"
#include "render_mocks.hpp"
#include "validate.hpp"

#include <fmt/core.h>
#include <fstream>
#include <iterator>
#include <optional>
#include <set>
#include <string>
#include <system_error>
#include <utility>

namespace mockforge::codegen {
namespace fs = std::filesystem;

namespace {

fs::path working_dir_of(const GenerateRequest &request) {
    if (!request.working_dir.empty()) {
        return request.working_dir;
    }
    std::error_code ec;
    fs::path        cwd = fs::current_path(ec);
    if (ec) {
        throw FileError(".", fmt::format("cannot determine working directory: {}", ec.message()));
    }
    return cwd;
}

std::optional<std::string> read_existing(const fs::path &path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

fs::path staging_path_for(const fs::path &path) {
    fs::path staged = path;
    staged += ".mockforge.tmp";
    return staged;
}

void discard_staged(const std::vector<fs::path> &staged) {
    for (const auto &path : staged) {
        std::error_code ec;
        fs::remove(path, ec);
        if (ec) {
            log_err("failed to remove staging file '{}': {}", path.string(), ec.message());
        }
    }
}

void stage(const PendingFile &file, const fs::path &staged) {
    if (file.path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(file.path.parent_path(), ec);
        if (ec) {
            throw FileError(file.path.parent_path(), fmt::format("failed to create directory: {}", ec.message()));
        }
    }
    std::ofstream out(staged, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw FileError(staged, "failed to open for writing");
    }
    out << file.content;
    out.close();
    if (!out) {
        throw FileError(staged, "failed to write");
    }
}

} // namespace

std::vector<PendingFile> render_all(const std::vector<InterfaceModel> &models, const GenerateRequest &request) {
    const DestinationPlan plan = plan_destinations(request.destination, models, working_dir_of(request));

    std::vector<GeneratedArtifact> artifacts;
    artifacts.reserve(models.size());
    for (std::size_t i = 0; i < models.size(); ++i) {
        MockRenderOptions options;
        options.namespace_name    = plan.namespace_name;
        options.self_namespace    = request.self_namespace;
        options.destination_path  = plan.mock_paths[i];
        options.include_dirs      = request.source.include_dirs;
        artifacts.push_back(render_mock(models[i], options));
    }

    std::vector<PendingFile> files;
    for (const auto &artifact : artifacts) {
        files.push_back({artifact.destination_path, artifact.source_text});
    }
    if (request.generate_matchers) {
        MatcherRenderOptions options;
        options.directory      = plan.matchers_dir;
        options.namespace_name = request.matchers_namespace;
        options.include_dirs   = request.source.include_dirs;
        for (auto &matcher : render_matchers(artifacts, options)) {
            files.push_back({std::move(matcher.destination_path), std::move(matcher.source_text)});
        }
    }
    return files;
}

void write_files(const std::vector<PendingFile> &files, GenerateResult &result) {
    std::set<std::string> destinations;
    for (const auto &file : files) {
        if (!destinations.insert(normalize_path(file.path).generic_string()).second) {
            throw GenerationError(fmt::format("{}: generated twice in one run", file.path.string()));
        }
    }

    std::vector<const PendingFile *> changed;
    for (const auto &file : files) {
        const auto existing = read_existing(file.path);
        if (existing && *existing == file.content) {
            result.unchanged.push_back(file.path);
        } else {
            changed.push_back(&file);
        }
    }

    std::vector<fs::path> staged;
    try {
        for (const auto *file : changed) {
            staged.push_back(staging_path_for(file->path));
            stage(*file, staged.back());
        }
    } catch (const FileError &) {
        discard_staged(staged);
        throw;
    }

    for (std::size_t i = 0; i < changed.size(); ++i) {
        std::error_code ec;
        fs::rename(staged[i], changed[i]->path, ec);
        if (ec) {
            discard_staged(std::vector<fs::path>(staged.begin() + static_cast<std::ptrdiff_t>(i), staged.end()));
            throw FileError(changed[i]->path, fmt::format("failed to replace: {}", ec.message()));
        }
        result.written.push_back(changed[i]->path);
    }
}

GenerateResult run_generate(const GenerateRequest &request, InterfaceExtractor &extractor) {
    const std::vector<InterfaceModel> models = extractor.extract(request.source);
    for (const auto &model : models) {
        validate_model(model);
        log_debug("extracted model:\n{}", describe_model(model));
    }

    const std::vector<PendingFile> files = render_all(models, request);

    GenerateResult result;
    write_files(files, result);
    for (const auto &path : result.written) {
        log_debug("wrote {}", path.string());
    }
    return result;
}

GenerateResult run_generate(const GenerateRequest &request) {
    auto extractor = make_extractor(request.backend, request.extractor);
    return run_generate(request, *extractor);
}

} // namespace mockforge::codegen
