// Interface model extraction: one contract, two interchangeable backends.
#pragma once

#include "model.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mockforge::codegen {

enum class ExtractorKind {
    Reflective, // clang libtooling over the compiled AST; several interfaces per run
    Syntactic,  // direct header parsing; keeps parameter names; one interface per run
};

// Backend configuration.
// - compilation_database: directory containing compile_commands.json (reflective only)
// - extra_args: additional compiler arguments (reflective only)
struct ExtractorConfig {
    std::optional<std::filesystem::path> compilation_database;
    std::vector<std::string>             extra_args;
};

class InterfaceExtractor {
  public:
    virtual ~InterfaceExtractor() = default;

    // Produce one model per requested interface (or per interface declared in the
    // header when none are named). Throws ExtractionError.
    virtual std::vector<InterfaceModel> extract(const SourceSpec &spec) = 0;
};

std::unique_ptr<InterfaceExtractor> make_extractor(ExtractorKind kind, ExtractorConfig config = {});

// Accumulates the flattened method set of an interface: base class methods first,
// then the class's own. A redeclaration with an identical signature replaces the
// earlier entry in place; any other reuse of a name is a collision.
class MethodSetBuilder {
  public:
    explicit MethodSetBuilder(std::string interface_name);

    // `origin` names the class declaring `method`, for diagnostics.
    void add(MethodSignature method, std::string_view origin);

    std::vector<MethodSignature> take();

  private:
    std::string                  interface_name_;
    std::vector<MethodSignature> methods_;
    std::vector<std::string>     origins_;
};

// Record `returned` as the method's results. A by-value std::tuple or std::pair is
// expanded into one result per element; void leaves the results empty.
void assign_results(MethodSignature &method, TypeRef returned);

// Match a requested interface name against a qualified class name.
// "Display" and "shop::Display" both match "shop::Display"; a leading "::" is ignored.
bool interface_name_matches(std::string_view requested, std::string_view qualified);

} // namespace mockforge::codegen
