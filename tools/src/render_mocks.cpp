#include "render_mocks.hpp"

#include "errors.hpp"
#include "path_utils.hpp"

#include <fmt/core.h>
#include <set>
#include <string>
#include <utility>

namespace mockforge::codegen {
namespace {

std::string qualifiers_for(const MethodSignature &method) {
    std::string q;
    if (method.is_const)
        q += " const";
    if (!method.ref_qualifier.empty()) {
        q += ' ';
        q += method.ref_qualifier;
    }
    if (method.is_noexcept)
        q += " noexcept";
    return q;
}

// "T *" + "name" -> "T *name"; "T" + "name" -> "T name".
std::string declare(const std::string &type, const std::string &name) {
    if (!type.empty() && (type.back() == '*' || type.back() == '&')) {
        return type + name;
    }
    return type + ' ' + name;
}

std::string join_parameter_list(const MethodSignature &method, const RenderContext &context) {
    std::string out;
    for (std::size_t i = 0; i < method.params.size(); ++i) {
        if (i != 0)
            out += ", ";
        out += declare(render_type(method.params[i].type, context), method.params[i].name);
    }
    return out;
}

// Stored argument types: decayed, a variadic initializer list recorded as std::vector.
std::string stored_type_list(const MethodSignature &method, const RenderContext &context) {
    std::string out;
    for (std::size_t i = 0; i < method.params.size(); ++i) {
        if (i != 0)
            out += ", ";
        out += render_type(decay(method.params[i].type), context);
    }
    return out;
}

std::string argument_expr(const Parameter &param, const RenderContext &context) {
    const auto &type = param.type;
    if (type.kind == TypeKind::Slice && type.is_variadic) {
        return fmt::format("::std::vector<{}>({}.begin(), {}.end())", render_type(type.args.at(0), context), param.name, param.name);
    }
    if (type.kind == TypeKind::LValueRef) {
        return param.name;
    }
    return fmt::format("::std::move({})", param.name);
}

std::string argument_list(const MethodSignature &method, const RenderContext &context) {
    std::string out;
    for (std::size_t i = 0; i < method.params.size(); ++i) {
        if (i != 0)
            out += ", ";
        out += argument_expr(method.params[i], context);
    }
    return out;
}

bool is_std_scope(const std::string &scope) { return scope == "std" || scope.rfind("std::", 0) == 0; }

// Every named type must be reachable through an include unless it is builtin,
// standard or declared in one of the namespaces the output lives in.
void check_includable(const TypeRef &type, const std::string &owner, const RenderContext &context) {
    for_each_type(type, [&](const TypeRef &t) {
        if (t.kind != TypeKind::Named && t.kind != TypeKind::Template) {
            return;
        }
        if (is_std_scope(t.scope) || !t.header.empty()) {
            return;
        }
        if (t.scope.empty()) {
            if (t.kind == TypeKind::Named && is_builtin(t)) {
                return;
            }
            throw GenerationError(fmt::format("{}: no header known for type '{}'", owner, t.name));
        }
        if (t.scope == context.namespace_name || t.scope == context.self_namespace) {
            return;
        }
        throw GenerationError(fmt::format("{}: no header known for type '{}::{}'", owner, t.scope, t.name));
    });
}

std::string field_name(const MethodSignature &method) { return "mock_" + method.name + "_"; }

} // namespace

std::string render_return_type(const MethodSignature &method, const RenderContext &context) {
    if (method.results.empty()) {
        return "void";
    }
    switch (method.aggregate) {
    case ResultAggregate::None: return render_type(method.results.front(), context);
    case ResultAggregate::Tuple:
    case ResultAggregate::Pair: {
        std::string out = method.aggregate == ResultAggregate::Tuple ? "::std::tuple<" : "::std::pair<";
        for (std::size_t i = 0; i < method.results.size(); ++i) {
            if (i != 0)
                out += ", ";
            out += render_type(method.results[i], context);
        }
        return out + ">";
    }
    }
    return "void";
}

GeneratedArtifact render_mock(const InterfaceModel &model, const MockRenderOptions &options) {
    const RenderContext context{options.namespace_name, options.self_namespace};
    const std::string   qualified  = model.scope.empty() ? model.interface_name : model.scope + "::" + model.interface_name;
    const std::string   mock_class = "Mock" + model.interface_name;

    GeneratedArtifact artifact;
    artifact.destination_path = options.destination_path;
    artifact.namespace_name   = options.namespace_name;

    std::set<std::string> project_includes;
    std::set<std::string> standard_includes{"<utility>"};
    std::set<std::string> seen_types;
    if (!model.header.empty()) {
        project_includes.insert(model.header);
    }
    for (const auto &method : model.methods) {
        const std::string owner = qualified + "::" + method.name;
        for (const auto &param : method.params) {
            check_includable(param.type, owner, context);
            collect_includes(param.type, project_includes, standard_includes);
            if (param.type.kind == TypeKind::Slice && param.type.is_variadic) {
                standard_includes.insert("<vector>");
            }
            TypeRef decayed = decay(param.type);
            if (seen_types.insert(identity_key(decayed)).second) {
                artifact.referenced_types.push_back(std::move(decayed));
            }
        }
        for (const auto &result : method.results) {
            check_includable(result, owner, context);
            collect_includes(result, project_includes, standard_includes);
        }
        if (method.aggregate == ResultAggregate::Tuple) {
            standard_includes.insert("<tuple>");
        }
    }
    project_includes.erase(include_spelling(options.destination_path, options.include_dirs, {}));

    const TypeRef base = named_type(model.interface_name, model.scope, model.header);

    std::string out;
    out += kGeneratedMarker;
    out += '\n';
    out += fmt::format("// Source: {} ({})\n", model.header, qualified);
    out += "#pragma once\n\n";
    for (const auto &include : project_includes) {
        out += fmt::format("#include \"{}\"\n", include);
    }
    if (!project_includes.empty()) {
        out += '\n';
    }
    out += "#include <mockforge/mock.h>\n\n";
    for (const auto &include : standard_includes) {
        out += fmt::format("#include {}\n", include);
    }
    out += '\n';

    if (!options.namespace_name.empty()) {
        out += fmt::format("namespace {} {{\n\n", options.namespace_name);
    }
    out += fmt::format("class {} final : public {} {{\n", mock_class, render_type(base, context));
    out += "  public:\n";
    out += fmt::format("    {}() = default;\n", mock_class);
    out += fmt::format("    explicit {}(::mockforge::MockOptions options) : state_(::std::move(options)) {{}}\n", mock_class);

    for (const auto &method : model.methods) {
        const std::string ret  = render_return_type(method, context);
        const std::string call = fmt::format("{}.invoke({})", field_name(method), argument_list(method, context));
        out += '\n';
        out += fmt::format("    {}({}){} override {{\n", declare(ret, method.name), join_parameter_list(method, context), qualifiers_for(method));
        out += method.results.empty() ? fmt::format("        {};\n", call) : fmt::format("        return {};\n", call);
        out += "    }\n";
    }

    out += '\n';
    for (const auto &method : model.methods) {
        out += fmt::format("    auto &mock_{}() {{ return {}; }}\n", method.name, field_name(method));
    }

    out += "\n  private:\n";
    out += "    ::mockforge::MockState state_;\n";
    for (const auto &method : model.methods) {
        out += fmt::format("    mutable ::mockforge::MethodMock<{}({})> {}{{state_, \"{}::{}\"}};\n", render_return_type(method, context),
                           stored_type_list(method, context), field_name(method), qualified, method.name);
    }
    out += "};\n";
    if (!options.namespace_name.empty()) {
        out += fmt::format("\n}} // namespace {}\n", options.namespace_name);
    }

    artifact.source_text = std::move(out);
    return artifact;
}

} // namespace mockforge::codegen
