// Type reference helpers: spelling, identity, classification and includes.
#pragma once

#include "model.hpp"

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace mockforge::codegen {

// Namespaces whose types are spelled unqualified in the rendered output.
// - namespace_name: namespace the generated code is placed in
// - self_namespace: namespace the generated file is considered part of
struct RenderContext {
    std::string namespace_name;
    std::string self_namespace;
};

// Spell `type` as C++ source. Types outside the context namespaces are fully
// qualified with a leading `::`.
std::string render_type(const TypeRef &type, const RenderContext &context = {});

// Strip top-level references and const; a variadic initializer list becomes the
// std::vector it is recorded as.
TypeRef decay(const TypeRef &type);

// Stable key used for deduplication: the fully qualified spelling of decay(type).
std::string identity_key(const TypeRef &type);

// Fundamental types, std::string(_view), fixed-width/size typedefs and wrappers
// whose leaves are all built-in.
bool is_builtin(const TypeRef &type);

bool is_fundamental_name(std::string_view name);

// Canonical spelling for a sequence of fundamental keywords
// ("unsigned", "long", "int" -> "unsigned long"). nullopt if not fundamental.
std::optional<std::string> normalize_fundamental(const std::vector<std::string> &words);

// Header that declares a standard library name, if known ("<vector>").
std::optional<std::string> std_header_for(std::string_view scope, std::string_view name);

// CamelCase stem naming a type in generated matcher functions ("PtrToShopWidget").
std::string matcher_stem(const TypeRef &type);

// Collect project includes (quoted spellings) and standard includes reachable from `type`.
void collect_includes(const TypeRef &type, std::set<std::string> &project, std::set<std::string> &standard);

// Walk `type` and every nested type, calling `visit` on each.
template <typename Visitor> void for_each_type(const TypeRef &type, Visitor &&visit) {
    visit(type);
    for (const auto &arg : type.args)
        for_each_type(arg, visit);
    for (const auto &result : type.results)
        for_each_type(result, visit);
}

// Shape a standard library template instance. Containers, owners and
// std::function (whose single argument must be a Function type) map onto their
// dedicated kinds; std::basic_string<char> becomes std::string; anything else
// stays a Template.
TypeRef std_template_type(std::string scope, std::string name, std::vector<TypeRef> args);

// Small constructors used by the backends and tests.
TypeRef named_type(std::string name, std::string scope = {}, std::string header = {});
TypeRef wrap(TypeKind kind, TypeRef inner);

} // namespace mockforge::codegen
