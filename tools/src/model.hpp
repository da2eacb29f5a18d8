// Shared model types for mockforge codegen
//
// These types are passed among the extraction backends, validation, the mock
// and matcher renderers and the file emitter.
#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace mockforge::codegen {

// Shape of a referenced type. `Channel` of other languages has no C++
// counterpart; owners and generic template instances do.
enum class TypeKind {
    Named,     // int, std::string, shop::Widget
    Pointer,   // T *
    LValueRef, // T &
    RValueRef, // T &&
    Slice,     // std::vector<T>, or std::initializer_list<T> when variadic
    Array,     // std::array<T, N>
    Map,       // std::map<K, V> / std::unordered_map<K, V>
    Function,  // std::function<R(Args...)>
    Owner,     // std::unique_ptr<T> / std::shared_ptr<T>
    Template,  // any other scope::name<Args...>
};

// Description of one parameter or result type.
// - name/scope: identifier and enclosing namespace path for Named and Template
//   kinds ("Widget", "shop"); builtins have an empty scope
// - header: include spelling of the declaring header for project types
// - args: pointee/element (one), key and value (two), template or function
//   parameter types (any)
// - results: function result (Function kind only)
// - ordered: std::map vs std::unordered_map; std::unique_ptr vs std::shared_ptr
struct TypeRef {
    TypeKind             kind = TypeKind::Named;
    std::string          name;
    std::string          scope;
    std::string          header;
    bool                 is_const     = false;
    bool                 is_variadic  = false;
    bool                 ordered      = true;
    std::size_t          array_length = 0;
    std::vector<TypeRef> args;
    std::vector<TypeRef> results;

    friend bool operator==(const TypeRef &, const TypeRef &) = default;
};

struct Parameter {
    std::string name;
    TypeRef     type;

    friend bool operator==(const Parameter &, const Parameter &) = default;
};

// How several results are aggregated in the C++ return type.
enum class ResultAggregate { None, Tuple, Pair };

struct MethodSignature {
    std::string            name;
    std::vector<Parameter> params;
    std::vector<TypeRef>   results; // empty: void
    ResultAggregate        aggregate = ResultAggregate::None;
    bool                   is_const    = false;
    bool                   is_noexcept = false;
    std::string            ref_qualifier; // "", "&" or "&&"

    friend bool operator==(const MethodSignature &, const MethodSignature &) = default;
};

// Canonical, backend-agnostic method set of one interface.
// - interface_name: unqualified class name
// - scope: enclosing namespace path
// - header: include spelling of the header that declares the interface
struct InterfaceModel {
    std::string                  interface_name;
    std::string                  scope;
    std::string                  header;
    std::vector<MethodSignature> methods;
};

// What to extract.
// - header: path of the header to read
// - interfaces: names to extract; empty selects every interface the header declares
// - include_dirs: roots used to resolve and spell includes
struct SourceSpec {
    std::filesystem::path              header;
    std::vector<std::string>           interfaces;
    std::vector<std::filesystem::path> include_dirs;
};

struct GeneratedArtifact {
    std::filesystem::path destination_path;
    std::string           namespace_name;
    std::string           source_text;
    std::vector<TypeRef>  referenced_types;
};

struct MatcherArtifact {
    TypeRef               type;
    std::filesystem::path destination_path;
    std::string           source_text;
};

// Marker on the first line of every generated file. `mockforge remove` relies on it.
inline constexpr const char *kGeneratedMarker = "// Code generated by mockforge. DO NOT EDIT.";

} // namespace mockforge::codegen
