#include "validate.hpp"

#include "errors.hpp"
#include "type_ref.hpp"

#include <cctype>
#include <fmt/core.h>
#include <set>
#include <string>
#include <string_view>

namespace mockforge::codegen {
namespace {

bool is_identifier(std::string_view name) {
    if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front())) != 0) {
        return false;
    }
    for (const char ch : name) {
        if (std::isalnum(static_cast<unsigned char>(ch)) == 0 && ch != '_') {
            return false;
        }
    }
    return true;
}

std::string qualified_interface(const InterfaceModel &model) {
    return model.scope.empty() ? model.interface_name : fmt::format("{}::{}", model.scope, model.interface_name);
}

} // namespace

void validate_model(const InterfaceModel &model) {
    const std::string     iface = qualified_interface(model);
    std::set<std::string> seen;
    for (const auto &method : model.methods) {
        if (!is_identifier(method.name)) {
            throw ExtractionError(fmt::format("{}: cannot mock '{}'; only named member functions are supported", iface, method.name));
        }
        if (!seen.insert(method.name).second) {
            throw ExtractionError(fmt::format("{}: method name '{}' is declared more than once", iface, method.name));
        }
        for (std::size_t i = 0; i < method.params.size(); ++i) {
            if (method.params[i].type.is_variadic && i + 1 != method.params.size()) {
                throw SignatureConstraintError(
                    fmt::format("{}::{}: variadic parameter '{}' must be the last parameter", iface, method.name, method.params[i].name));
            }
        }
        if (method.aggregate == ResultAggregate::None && method.results.size() > 1) {
            throw SignatureConstraintError(fmt::format("{}::{}: several results need a tuple or pair return type", iface, method.name));
        }
        if (method.aggregate == ResultAggregate::Pair && method.results.size() != 2) {
            throw SignatureConstraintError(fmt::format("{}::{}: a pair result needs exactly two types", iface, method.name));
        }
    }
}

bool models_equivalent(const InterfaceModel &lhs, const InterfaceModel &rhs) {
    if (lhs.interface_name != rhs.interface_name || lhs.scope != rhs.scope || lhs.header != rhs.header) {
        return false;
    }
    if (lhs.methods.size() != rhs.methods.size()) {
        return false;
    }
    for (std::size_t m = 0; m < lhs.methods.size(); ++m) {
        const auto &a = lhs.methods[m];
        const auto &b = rhs.methods[m];
        if (a.name != b.name || a.results != b.results || a.aggregate != b.aggregate || a.is_const != b.is_const ||
            a.is_noexcept != b.is_noexcept || a.ref_qualifier != b.ref_qualifier || a.params.size() != b.params.size()) {
            return false;
        }
        for (std::size_t p = 0; p < a.params.size(); ++p) {
            if (!(a.params[p].type == b.params[p].type)) {
                return false;
            }
        }
    }
    return true;
}

std::string describe_model(const InterfaceModel &model) {
    std::string out = fmt::format("interface {} ({})\n", qualified_interface(model), model.header);
    for (const auto &method : model.methods) {
        std::string params;
        for (std::size_t i = 0; i < method.params.size(); ++i) {
            if (i != 0)
                params += ", ";
            params += fmt::format("{}: {}{}", method.params[i].name, render_type(method.params[i].type),
                                  method.params[i].type.is_variadic ? " (variadic)" : "");
        }
        std::string results;
        if (method.results.empty()) {
            results = "void";
        }
        for (std::size_t i = 0; i < method.results.size(); ++i) {
            if (i != 0)
                results += ", ";
            results += render_type(method.results[i]);
        }
        out += fmt::format("  {}({}) -> {}{}\n", method.name, params, results, method.is_const ? " const" : "");
    }
    return out;
}

} // namespace mockforge::codegen
