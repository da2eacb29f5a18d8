#include "syntactic_extractor.hpp"

#include "errors.hpp"
#include "log.hpp"
#include "path_utils.hpp"
#include "source_parser.hpp"
#include "type_ref.hpp"

#include <fmt/core.h>
#include <set>
#include <utility>

namespace mockforge::codegen {
namespace {

constexpr int kMaxAliasDepth = 32;

class ModelBuilder {
  public:
    ModelBuilder(const SymbolTable &table, const SourceSpec &spec)
        : table_(table), spec_(spec), header_dir_(normalize_path(spec.header).parent_path()) {}

    InterfaceModel build(const ParsedClass &cls) {
        InterfaceModel model;
        model.interface_name = cls.name;
        model.scope          = checked_scope(cls.scope, cls.qualified_name());
        model.header         = spelling_for(cls.file);

        MethodSetBuilder      builder{cls.qualified_name()};
        std::set<std::string> visited;
        collect(cls, builder, visited);
        model.methods = builder.take();
        return model;
    }

  private:
    void collect(const ParsedClass &cls, MethodSetBuilder &builder, std::set<std::string> &visited) {
        if (!visited.insert(cls.qualified_name()).second) {
            return;
        }
        for (const auto &base : cls.bases) {
            if (!base.name.empty() && base.name.front() == "std") {
                continue;
            }
            const ParsedClass *definition = resolve_class(base, cls.scope, 0);
            if (definition == nullptr) {
                throw ExtractionError(
                    fmt::format("{}:{}: base '{}' of {} is not a known class", cls.file.string(), cls.line, base.spelling(), cls.name));
            }
            collect(*definition, builder, visited);
        }
        const std::string scope = cls.qualified_name();
        for (const auto &method : cls.methods) {
            builder.add(convert(method, scope, cls), scope);
        }
    }

    const ParsedClass *resolve_class(const TypeExpr &expr, const std::string &scope, int depth) {
        const Symbol *symbol = table_.lookup(expr.name, expr.global, scope);
        if (symbol == nullptr || depth > kMaxAliasDepth) {
            return nullptr;
        }
        if (symbol->kind == SymbolKind::Alias && symbol->alias_error.empty()) {
            return resolve_class(symbol->aliased, symbol->scope, depth + 1);
        }
        if (symbol->kind != SymbolKind::Class || symbol->is_template) {
            return nullptr;
        }
        return symbol->definition;
    }

    MethodSignature convert(const ParsedMethod &method, const std::string &scope, const ParsedClass &cls) {
        const auto where = [&] { return fmt::format("{}:{}: {}::{}", cls.file.string(), method.line, cls.qualified_name(), method.name); };
        if (method.c_variadic) {
            throw SignatureConstraintError(fmt::format("{}: C-style variadic methods cannot be mocked", where()));
        }
        MethodSignature signature;
        signature.name = method.name;
        try {
            for (std::size_t i = 0; i < method.params.size(); ++i) {
                const auto &param = method.params[i];
                TypeRef     type  = resolve(param.type, scope, 0);
                type.is_const     = false; // top-level const is not part of the signature
                signature.params.push_back(Parameter{param.name.empty() ? fmt::format("p{}", i) : param.name, std::move(type)});
            }
            assign_results(signature, resolve(method.return_type, scope, 0));
        } catch (const ExtractionError &e) {
            throw ExtractionError(fmt::format("{}: {}", where(), e.what()));
        }
        signature.is_const      = method.is_const;
        signature.is_noexcept   = method.is_noexcept;
        signature.ref_qualifier = method.ref_qualifier;
        return signature;
    }

    TypeRef resolve(const TypeExpr &expr, const std::string &scope, int depth) {
        TypeRef type = resolve_base(expr, scope, depth);
        for (const auto &decl : expr.declarators) {
            switch (decl.kind) {
            case Declarator::Kind::Pointer:
                type          = wrap(TypeKind::Pointer, std::move(type));
                type.is_const = decl.is_const;
                break;
            case Declarator::Kind::LValueRef: type = wrap(TypeKind::LValueRef, std::move(type)); break;
            case Declarator::Kind::RValueRef: type = wrap(TypeKind::RValueRef, std::move(type)); break;
            }
        }
        return type;
    }

    TypeRef resolve_base(const TypeExpr &expr, const std::string &scope, int depth) {
        if (depth > kMaxAliasDepth) {
            throw ExtractionError(fmt::format("alias cycle while resolving '{}'", expr.spelling()));
        }
        TypeRef type;
        if (expr.is_function) {
            type.kind = TypeKind::Function;
            for (const auto &param : expr.fn_params) {
                TypeRef arg  = resolve(param, scope, depth);
                arg.is_const = false;
                type.args.push_back(std::move(arg));
            }
            if (!expr.fn_result.empty()) {
                TypeRef result = resolve(expr.fn_result.front(), scope, depth);
                if (!(result.kind == TypeKind::Named && result.scope.empty() && result.name == "void")) {
                    type.results.push_back(std::move(result));
                }
            }
            return type;
        }
        if (!expr.literal.empty()) {
            return named_type(expr.literal);
        }
        if (!expr.fundamental.empty()) {
            type          = named_type(expr.fundamental);
            type.is_const = expr.is_const;
            return type;
        }

        std::vector<TypeRef> args;
        for (const auto &arg : expr.args) {
            args.push_back(resolve(arg, scope, depth));
        }

        if (expr.name.front() == "std") {
            type          = resolve_std(expr, std::move(args));
            type.is_const = expr.is_const;
            return type;
        }

        const Symbol *symbol = table_.lookup(expr.name, expr.global, scope);
        if (symbol == nullptr) {
            if (expr.name.size() == 1 && args.empty() && is_builtin(named_type(expr.name.front(), "std"))) {
                type          = named_type(expr.name.front(), "std");
                type.is_const = expr.is_const;
                return type;
            }
            throw ExtractionError(fmt::format("unresolved type '{}'", expr.spelling()));
        }

        if (symbol->kind == SymbolKind::Alias) {
            if (!symbol->alias_error.empty()) {
                throw ExtractionError(symbol->alias_error);
            }
            type = resolve(symbol->aliased, symbol->scope, depth + 1);
            if (expr.is_const && type.kind != TypeKind::LValueRef && type.kind != TypeKind::RValueRef) {
                type.is_const = true;
            }
            return type;
        }

        const std::string qualified = symbol->scope.empty() ? symbol->name : symbol->scope + "::" + symbol->name;
        if (symbol->is_template || !args.empty()) {
            if (!symbol->is_template || args.empty()) {
                throw ExtractionError(fmt::format("'{}' does not match the template declaration of {}", expr.spelling(), qualified));
            }
            type.kind = TypeKind::Template;
            type.name = symbol->name;
            type.args = std::move(args);
        } else {
            type = named_type(symbol->name);
        }
        type.scope    = checked_scope(symbol->scope, qualified);
        type.header   = spelling_for(symbol->file);
        type.is_const = expr.is_const;
        return type;
    }

    static TypeRef resolve_std(const TypeExpr &expr, std::vector<TypeRef> args) {
        if (expr.name.size() < 2) {
            throw ExtractionError(fmt::format("unresolved type '{}'", expr.spelling()));
        }
        std::string scope = "std";
        for (std::size_t i = 1; i + 1 < expr.name.size(); ++i) {
            scope += "::" + expr.name[i];
        }
        const std::string &name = expr.name.back();
        if (args.empty()) {
            return named_type(name, scope);
        }
        return std_template_type(scope, name, std::move(args));
    }

    std::string checked_scope(const std::string &scope, const std::string &qualified) const {
        if (scope.find("(anonymous)") != std::string::npos) {
            throw ExtractionError(fmt::format("{} is declared in an anonymous namespace and cannot be referenced from a generated mock", qualified));
        }
        return scope;
    }

    std::string spelling_for(const fs::path &file) const { return include_spelling(file, spec_.include_dirs, header_dir_); }

    const SymbolTable &table_;
    const SourceSpec  &spec_;
    fs::path           header_dir_;
};

} // namespace

std::vector<InterfaceModel> SyntacticExtractor::extract(const SourceSpec &spec) {
    if (spec.interfaces.size() > 1) {
        throw ExtractionError(fmt::format("syntactic extraction handles one interface per run, {} were requested", spec.interfaces.size()));
    }
    const fs::path  header = normalize_path(spec.header);
    std::error_code ec;
    if (!fs::is_regular_file(header, ec)) {
        throw ExtractionError(fmt::format("{}: header not found", spec.header.string()));
    }

    const SymbolTable table = SymbolTable::load(header, spec.include_dirs);

    std::vector<const ParsedClass *> matches;
    for (const auto &cls : table.classes()) {
        if (cls.is_template) {
            continue;
        }
        if (spec.interfaces.empty()) {
            if (cls.file == header && cls.declares_pure_method()) {
                matches.push_back(&cls);
            }
        } else if (interface_name_matches(spec.interfaces.front(), cls.qualified_name())) {
            matches.push_back(&cls);
        }
    }

    const std::string what = spec.interfaces.empty() ? std::string("interfaces") : fmt::format("interface '{}'", spec.interfaces.front());
    if (matches.empty()) {
        throw ExtractionError(fmt::format("{}: no {} declared", spec.header.string(), what));
    }
    if (matches.size() > 1) {
        std::string names;
        for (const auto *cls : matches) {
            names += names.empty() ? cls->qualified_name() : ", " + cls->qualified_name();
        }
        throw ExtractionError(fmt::format("{}: {} is ambiguous ({}); name exactly one interface", spec.header.string(), what, names));
    }

    log_debug("extracting {} from {}", matches.front()->qualified_name(), header.string());
    ModelBuilder builder{table, spec};
    return {builder.build(*matches.front())};
}

} // namespace mockforge::codegen
