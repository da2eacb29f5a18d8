#include "render_matchers.hpp"

#include "errors.hpp"
#include "path_utils.hpp"
#include "type_ref.hpp"

#include <algorithm>
#include <cctype>
#include <fmt/core.h>
#include <map>
#include <set>
#include <utility>

namespace mockforge::codegen {
namespace {

std::string render_matcher_header(const TypeRef &type, const std::string &stem, const MatcherRenderOptions &options,
                                  const std::filesystem::path &destination) {
    const RenderContext context{options.namespace_name, {}};
    const std::string   spelled = render_type(type, context);
    const std::string   typed   = fmt::format("::mockforge::match::Typed<{}>", spelled);

    std::set<std::string> project_includes;
    std::set<std::string> standard_includes{"<functional>", "<utility>"};
    collect_includes(type, project_includes, standard_includes);
    project_includes.erase(include_spelling(destination, options.include_dirs, {}));

    std::string out;
    out += kGeneratedMarker;
    out += '\n';
    out += fmt::format("// Matchers for {}\n", identity_key(type));
    out += "#pragma once\n\n";
    for (const auto &include : project_includes) {
        out += fmt::format("#include \"{}\"\n", include);
    }
    if (!project_includes.empty()) {
        out += '\n';
    }
    out += "#include <mockforge/matchers.h>\n\n";
    for (const auto &include : standard_includes) {
        out += fmt::format("#include {}\n", include);
    }
    out += '\n';

    if (!options.namespace_name.empty()) {
        out += fmt::format("namespace {} {{\n\n", options.namespace_name);
    }
    out += fmt::format("inline {} Any{}() {{ return ::mockforge::match::typed<{}>(::mockforge::match::Any()); }}\n\n", typed, stem, spelled);
    // Templates so that types without operator== only fail when Eq/NotEq is used.
    out += fmt::format("template <typename Value = {}> {} Eq{}(Value value) {{\n", spelled, typed, stem);
    out += fmt::format("    return ::mockforge::match::typed<{}>(::mockforge::match::Eq(::std::move(value)));\n}}\n\n", spelled);
    out += fmt::format("template <typename Value = {}> {} NotEq{}(Value value) {{\n", spelled, typed, stem);
    out += fmt::format("    return ::mockforge::match::typed<{}>(::mockforge::match::NotEq(::std::move(value)));\n}}\n\n", spelled);
    out += fmt::format("inline {} {}That(::std::function<bool(const {} &)> predicate) {{\n", typed, stem, spelled);
    out += fmt::format("    return ::mockforge::match::typed<{}>(::std::move(predicate));\n}}\n", spelled);
    if (!options.namespace_name.empty()) {
        out += fmt::format("\n}} // namespace {}\n", options.namespace_name);
    }
    return out;
}

} // namespace

std::string snake_case(const std::string &stem) {
    std::string out;
    for (std::size_t i = 0; i < stem.size(); ++i) {
        const auto c = static_cast<unsigned char>(stem[i]);
        if (std::isupper(c) != 0) {
            const bool after_lower = i > 0 && (std::islower(static_cast<unsigned char>(stem[i - 1])) != 0 || std::isdigit(static_cast<unsigned char>(stem[i - 1])) != 0);
            const bool before_lower = i > 0 && i + 1 < stem.size() && std::isupper(static_cast<unsigned char>(stem[i - 1])) != 0 &&
                                      std::islower(static_cast<unsigned char>(stem[i + 1])) != 0;
            if (after_lower || before_lower) {
                out.push_back('_');
            }
            out.push_back(static_cast<char>(std::tolower(c)));
        } else {
            out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

std::vector<MatcherArtifact> render_matchers(const std::vector<GeneratedArtifact> &artifacts, const MatcherRenderOptions &options) {
    std::map<std::string, TypeRef> by_key;
    for (const auto &artifact : artifacts) {
        for (const auto &type : artifact.referenced_types) {
            TypeRef decayed = decay(type);
            if (is_builtin(decayed)) {
                continue;
            }
            by_key.emplace(identity_key(decayed), std::move(decayed));
        }
    }

    std::map<std::string, std::string> owner_of_file;
    std::vector<MatcherArtifact>       out;
    for (auto &[key, type] : by_key) {
        const std::string stem      = matcher_stem(type);
        const std::string file_name = snake_case(stem) + ".h";
        if (const auto [it, inserted] = owner_of_file.emplace(file_name, key); !inserted) {
            throw GenerationError(fmt::format("matcher file {} would be shared by '{}' and '{}'", file_name, it->second, key));
        }
        MatcherArtifact artifact;
        artifact.destination_path = options.directory / file_name;
        artifact.source_text      = render_matcher_header(type, stem, options, artifact.destination_path);
        artifact.type             = std::move(type);
        out.push_back(std::move(artifact));
    }
    std::sort(out.begin(), out.end(),
              [](const MatcherArtifact &lhs, const MatcherArtifact &rhs) { return lhs.destination_path < rhs.destination_path; });
    return out;
}

} // namespace mockforge::codegen
