#include "type_ref.hpp"

#include <algorithm>
#include <iterator>
#include <cctype>
#include <fmt/core.h>
#include <string>
#include <utility>

namespace mockforge::codegen {
namespace {

constexpr std::string_view kFundamentalNames[] = {
    "void",          "bool",           "char",      "signed char", "unsigned char",      "wchar_t", "char8_t",
    "char16_t",      "char32_t",       "short",     "unsigned short", "int",             "unsigned int", "long",
    "unsigned long", "long long",      "unsigned long long", "float", "double",    "long double",
};

struct StdName {
    std::string_view scope;
    std::string_view name;
    std::string_view header;
    bool             builtin;
};

constexpr StdName kStdNames[] = {
    {"std", "string", "<string>", true},
    {"std", "wstring", "<string>", true},
    {"std", "u8string", "<string>", true},
    {"std", "string_view", "<string_view>", true},
    {"std", "size_t", "<cstddef>", true},
    {"std", "ptrdiff_t", "<cstddef>", true},
    {"std", "nullptr_t", "<cstddef>", true},
    {"std", "byte", "<cstddef>", true},
    {"std", "int8_t", "<cstdint>", true},
    {"std", "int16_t", "<cstdint>", true},
    {"std", "int32_t", "<cstdint>", true},
    {"std", "int64_t", "<cstdint>", true},
    {"std", "uint8_t", "<cstdint>", true},
    {"std", "uint16_t", "<cstdint>", true},
    {"std", "uint32_t", "<cstdint>", true},
    {"std", "uint64_t", "<cstdint>", true},
    {"std", "intptr_t", "<cstdint>", true},
    {"std", "uintptr_t", "<cstdint>", true},
    {"std", "vector", "<vector>", false},
    {"std", "initializer_list", "<initializer_list>", false},
    {"std", "array", "<array>", false},
    {"std", "map", "<map>", false},
    {"std", "multimap", "<map>", false},
    {"std", "unordered_map", "<unordered_map>", false},
    {"std", "set", "<set>", false},
    {"std", "unordered_set", "<unordered_set>", false},
    {"std", "list", "<list>", false},
    {"std", "deque", "<deque>", false},
    {"std", "function", "<functional>", false},
    {"std", "unique_ptr", "<memory>", false},
    {"std", "shared_ptr", "<memory>", false},
    {"std", "weak_ptr", "<memory>", false},
    {"std", "optional", "<optional>", false},
    {"std", "variant", "<variant>", false},
    {"std", "any", "<any>", false},
    {"std", "tuple", "<tuple>", false},
    {"std", "pair", "<utility>", false},
    {"std", "span", "<span>", false},
    {"std", "bitset", "<bitset>", false},
    {"std", "complex", "<complex>", false},
    {"std", "error_code", "<system_error>", false},
    {"std", "error_condition", "<system_error>", false},
    {"std", "exception_ptr", "<exception>", false},
    {"std", "type_index", "<typeindex>", false},
    {"std", "thread", "<thread>", false},
    {"std", "mutex", "<mutex>", false},
    {"std::filesystem", "path", "<filesystem>", false},
    {"std::chrono", "duration", "<chrono>", false},
    {"std::chrono", "milliseconds", "<chrono>", false},
    {"std::chrono", "seconds", "<chrono>", false},
};

const StdName *find_std(std::string_view scope, std::string_view name) {
    for (const auto &entry : kStdNames) {
        if (entry.scope == scope && entry.name == name) {
            return &entry;
        }
    }
    return nullptr;
}

bool is_std_scope(std::string_view scope) { return scope == "std" || scope.rfind("std::", 0) == 0; }

bool is_literal(std::string_view name) {
    return !name.empty() && std::all_of(name.begin(), name.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::string qualify(const TypeRef &type, const RenderContext &context) {
    if (type.scope.empty()) {
        return type.name;
    }
    if (!context.namespace_name.empty() && type.scope == context.namespace_name) {
        return type.name;
    }
    if (!context.self_namespace.empty() && type.scope == context.self_namespace) {
        return type.name;
    }
    return fmt::format("::{}::{}", type.scope, type.name);
}

std::string join_rendered(const std::vector<TypeRef> &types, const RenderContext &context) {
    std::string out;
    for (std::size_t i = 0; i < types.size(); ++i) {
        if (i != 0)
            out += ", ";
        out += render_type(types[i], context);
    }
    return out;
}

std::string camel(std::string_view text) {
    std::string out;
    bool        upper_next = true;
    for (const char ch : text) {
        const auto uc = static_cast<unsigned char>(ch);
        if (std::isalnum(uc) == 0) {
            upper_next = true;
            continue;
        }
        out.push_back(upper_next ? static_cast<char>(std::toupper(uc)) : ch);
        upper_next = false;
    }
    return out;
}

std::string last_scope_component(std::string_view scope) {
    const auto pos = scope.rfind("::");
    return std::string(pos == std::string_view::npos ? scope : scope.substr(pos + 2));
}

} // namespace

std::string render_type(const TypeRef &type, const RenderContext &context) {
    const std::string cv = type.is_const ? "const " : "";
    switch (type.kind) {
    case TypeKind::Named: return cv + qualify(type, context);
    case TypeKind::Pointer: return render_type(type.args.at(0), context) + (type.is_const ? " *const" : " *");
    case TypeKind::LValueRef: return render_type(type.args.at(0), context) + " &";
    case TypeKind::RValueRef: return render_type(type.args.at(0), context) + " &&";
    case TypeKind::Slice:
        return fmt::format("{}::std::{}<{}>", cv, type.is_variadic ? "initializer_list" : "vector", render_type(type.args.at(0), context));
    case TypeKind::Array: return fmt::format("{}::std::array<{}, {}>", cv, render_type(type.args.at(0), context), type.array_length);
    case TypeKind::Map:
        return fmt::format("{}::std::{}<{}, {}>", cv, type.ordered ? "map" : "unordered_map", render_type(type.args.at(0), context),
                           render_type(type.args.at(1), context));
    case TypeKind::Function:
        return fmt::format("{}::std::function<{}({})>", cv, type.results.empty() ? std::string("void") : render_type(type.results.front(), context),
                           join_rendered(type.args, context));
    case TypeKind::Owner:
        return fmt::format("{}::std::{}<{}>", cv, type.ordered ? "unique_ptr" : "shared_ptr", render_type(type.args.at(0), context));
    case TypeKind::Template: return fmt::format("{}{}<{}>", cv, qualify(type, context), join_rendered(type.args, context));
    }
    return type.name;
}

TypeRef decay(const TypeRef &type) {
    TypeRef out = type;
    while ((out.kind == TypeKind::LValueRef || out.kind == TypeKind::RValueRef) && !out.args.empty()) {
        TypeRef inner = out.args.front();
        out           = std::move(inner);
    }
    out.is_const = false;
    if (out.kind == TypeKind::Slice && out.is_variadic) {
        out.is_variadic = false;
    }
    return out;
}

std::string identity_key(const TypeRef &type) { return render_type(decay(type)); }

bool is_fundamental_name(std::string_view name) {
    return std::find(std::begin(kFundamentalNames), std::end(kFundamentalNames), name) != std::end(kFundamentalNames);
}

bool is_builtin(const TypeRef &type) {
    const auto all_builtin = [](const std::vector<TypeRef> &types) {
        return std::all_of(types.begin(), types.end(), [](const TypeRef &t) { return is_builtin(t); });
    };
    switch (type.kind) {
    case TypeKind::Named:
        if (type.scope.empty()) {
            return is_fundamental_name(type.name) || is_literal(type.name);
        }
        if (const auto *entry = find_std(type.scope, type.name)) {
            return entry->builtin;
        }
        return false;
    case TypeKind::Template:
        if (!is_std_scope(type.scope)) {
            return false;
        }
        return all_builtin(type.args);
    case TypeKind::Function: return all_builtin(type.args) && all_builtin(type.results);
    default: return all_builtin(type.args);
    }
}

std::optional<std::string> normalize_fundamental(const std::vector<std::string> &words) {
    if (words.empty()) {
        return std::nullopt;
    }
    int         longs       = 0;
    bool        is_unsigned = false;
    bool        is_signed   = false;
    bool        saw_int     = false;
    bool        saw_short   = false;
    std::string base;
    for (const auto &word : words) {
        if (word == "long") {
            ++longs;
        } else if (word == "unsigned") {
            is_unsigned = true;
        } else if (word == "signed") {
            is_signed = true;
        } else if (word == "int") {
            saw_int = true;
        } else if (word == "short") {
            saw_short = true;
        } else if (word == "char" || word == "double" || word == "float" || word == "bool" || word == "void" || word == "wchar_t" ||
                   word == "char8_t" || word == "char16_t" || word == "char32_t") {
            if (!base.empty()) {
                return std::nullopt;
            }
            base = word;
        } else {
            return std::nullopt;
        }
    }
    if (is_signed && is_unsigned) {
        return std::nullopt;
    }
    const bool int_modifiers = saw_int || saw_short;
    if (base == "double") {
        if (int_modifiers || is_signed || is_unsigned || longs > 1) {
            return std::nullopt;
        }
        return longs == 1 ? std::string("long double") : std::string("double");
    }
    if (base == "char") {
        if (int_modifiers || longs != 0) {
            return std::nullopt;
        }
        return is_unsigned ? std::string("unsigned char") : is_signed ? std::string("signed char") : std::string("char");
    }
    if (!base.empty()) {
        if (int_modifiers || longs != 0 || is_signed || is_unsigned) {
            return std::nullopt;
        }
        return base;
    }
    const std::string prefix = is_unsigned ? "unsigned " : "";
    if (saw_short) {
        return longs == 0 ? std::optional<std::string>(prefix + "short") : std::nullopt;
    }
    if (longs > 2) {
        return std::nullopt;
    }
    if (longs == 2) {
        return prefix + "long long";
    }
    if (longs == 1) {
        return prefix + "long";
    }
    return prefix + "int";
}

std::optional<std::string> std_header_for(std::string_view scope, std::string_view name) {
    if (const auto *entry = find_std(scope, name)) {
        return std::string(entry->header);
    }
    return std::nullopt;
}

std::string matcher_stem(const TypeRef &type) {
    const std::string cv = type.is_const ? "Const" : "";
    switch (type.kind) {
    case TypeKind::Named: {
        std::string prefix;
        if (!type.scope.empty() && !is_std_scope(type.scope)) {
            prefix = camel(last_scope_component(type.scope));
        }
        return cv + prefix + camel(type.name);
    }
    case TypeKind::Pointer: return "PtrTo" + matcher_stem(type.args.at(0));
    case TypeKind::LValueRef:
    case TypeKind::RValueRef: return "RefTo" + matcher_stem(type.args.at(0));
    case TypeKind::Slice: return cv + "SliceOf" + matcher_stem(type.args.at(0));
    case TypeKind::Array: return fmt::format("{}ArrayOf{}{}", cv, type.array_length, matcher_stem(type.args.at(0)));
    case TypeKind::Map:
        return fmt::format("{}{}MapOf{}To{}", cv, type.ordered ? "" : "Unordered", matcher_stem(type.args.at(0)),
                           matcher_stem(type.args.at(1)));
    case TypeKind::Function: {
        std::string out = cv + "Func";
        for (const auto &arg : type.args) {
            out += matcher_stem(arg);
        }
        if (!type.results.empty()) {
            out += "Returning" + matcher_stem(type.results.front());
        }
        return out;
    }
    case TypeKind::Owner: return fmt::format("{}{}To{}", cv, type.ordered ? "UniquePtr" : "SharedPtr", matcher_stem(type.args.at(0)));
    case TypeKind::Template: {
        TypeRef base = type;
        base.kind    = TypeKind::Named;
        base.args.clear();
        std::string out = matcher_stem(base) + "Of";
        for (std::size_t i = 0; i < type.args.size(); ++i) {
            if (i != 0)
                out += "And";
            out += matcher_stem(type.args[i]);
        }
        return out;
    }
    }
    return camel(type.name);
}

void collect_includes(const TypeRef &type, std::set<std::string> &project, std::set<std::string> &standard) {
    for_each_type(type, [&](const TypeRef &t) {
        switch (t.kind) {
        case TypeKind::Named:
        case TypeKind::Template:
            if (is_std_scope(t.scope)) {
                if (auto header = std_header_for(t.scope, t.name)) {
                    standard.insert(*header);
                }
            } else if (!t.header.empty()) {
                project.insert(t.header);
            }
            break;
        case TypeKind::Slice: standard.insert(t.is_variadic ? "<initializer_list>" : "<vector>"); break;
        case TypeKind::Array: standard.insert("<array>"); break;
        case TypeKind::Map: standard.insert(t.ordered ? "<map>" : "<unordered_map>"); break;
        case TypeKind::Function: standard.insert("<functional>"); break;
        case TypeKind::Owner: standard.insert("<memory>"); break;
        default: break;
        }
    });
}

TypeRef std_template_type(std::string scope, std::string name, std::vector<TypeRef> args) {
    if (scope == "std") {
        if ((name == "vector" || name == "initializer_list") && args.size() == 1) {
            TypeRef out     = wrap(TypeKind::Slice, std::move(args.front()));
            out.is_variadic = name == "initializer_list";
            return out;
        }
        if (name == "array" && args.size() == 2 && args[1].kind == TypeKind::Named && is_literal(args[1].name)) {
            TypeRef out      = wrap(TypeKind::Array, std::move(args.front()));
            out.array_length = static_cast<std::size_t>(std::stoull(args[1].name));
            return out;
        }
        if ((name == "map" || name == "unordered_map") && args.size() == 2) {
            TypeRef out;
            out.kind    = TypeKind::Map;
            out.ordered = name == "map";
            out.args    = std::move(args);
            return out;
        }
        if ((name == "unique_ptr" || name == "shared_ptr") && args.size() == 1) {
            TypeRef out = wrap(TypeKind::Owner, std::move(args.front()));
            out.ordered = name == "unique_ptr";
            return out;
        }
        if (name == "function" && args.size() == 1 && args.front().kind == TypeKind::Function) {
            return std::move(args.front());
        }
        const bool char_arg = args.size() == 1 && args.front().kind == TypeKind::Named && args.front().scope.empty() && !args.front().is_const;
        if (name == "basic_string" && char_arg && (args.front().name == "char" || args.front().name == "wchar_t")) {
            return named_type(args.front().name == "char" ? "string" : "wstring", "std");
        }
        if (name == "basic_string_view" && char_arg && args.front().name == "char") {
            return named_type("string_view", "std");
        }
    }
    TypeRef out;
    out.kind  = TypeKind::Template;
    out.name  = std::move(name);
    out.scope = std::move(scope);
    out.args  = std::move(args);
    return out;
}

TypeRef named_type(std::string name, std::string scope, std::string header) {
    TypeRef t;
    t.kind   = TypeKind::Named;
    t.name   = std::move(name);
    t.scope  = std::move(scope);
    t.header = std::move(header);
    return t;
}

TypeRef wrap(TypeKind kind, TypeRef inner) {
    TypeRef t;
    t.kind = kind;
    t.args.push_back(std::move(inner));
    return t;
}

} // namespace mockforge::codegen
