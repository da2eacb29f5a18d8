#include "extractor.hpp"

#include "errors.hpp"
#include "reflective_extractor.hpp"
#include "syntactic_extractor.hpp"

#include <cctype>
#include <fmt/core.h>
#include <string>
#include <utility>

namespace mockforge::codegen {
namespace {

bool same_shape(const MethodSignature &a, const MethodSignature &b) {
    if (a.params.size() != b.params.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.params.size(); ++i) {
        if (!(a.params[i].type == b.params[i].type)) {
            return false;
        }
    }
    return a.results == b.results && a.aggregate == b.aggregate && a.is_const == b.is_const && a.ref_qualifier == b.ref_qualifier;
}

// "operator()", "operator==", "operator bool" but not "operatorName".
bool is_operator_name(const std::string &name) {
    if (name.rfind("operator", 0) != 0) {
        return false;
    }
    if (name.size() == 8) {
        return true;
    }
    const unsigned char next = static_cast<unsigned char>(name[8]);
    return !(std::isalnum(next) || next == '_');
}

} // namespace

std::unique_ptr<InterfaceExtractor> make_extractor(ExtractorKind kind, ExtractorConfig config) {
    switch (kind) {
    case ExtractorKind::Reflective: return std::make_unique<ReflectiveExtractor>(std::move(config));
    case ExtractorKind::Syntactic: return std::make_unique<SyntacticExtractor>();
    }
    return nullptr;
}

MethodSetBuilder::MethodSetBuilder(std::string interface_name) : interface_name_(std::move(interface_name)) {}

void MethodSetBuilder::add(MethodSignature method, std::string_view origin) {
    if (is_operator_name(method.name)) {
        throw ExtractionError(fmt::format("{}: operator member '{}' declared in {} cannot be mocked", interface_name_, method.name, origin));
    }
    for (std::size_t i = 0; i < methods_.size(); ++i) {
        if (methods_[i].name != method.name) {
            continue;
        }
        if (origins_[i] == origin || !same_shape(methods_[i], method)) {
            throw ExtractionError(fmt::format("{}: method '{}' declared in {} collides with '{}' declared in {}", interface_name_,
                                              method.name, origin, methods_[i].name, origins_[i]));
        }
        methods_[i] = std::move(method);
        origins_[i] = std::string(origin);
        return;
    }
    methods_.push_back(std::move(method));
    origins_.emplace_back(origin);
}

std::vector<MethodSignature> MethodSetBuilder::take() {
    origins_.clear();
    return std::move(methods_);
}

void assign_results(MethodSignature &method, TypeRef returned) {
    method.results.clear();
    method.aggregate = ResultAggregate::None;
    if (returned.kind == TypeKind::Named && returned.scope.empty() && returned.name == "void" && !returned.is_const) {
        return;
    }
    if (returned.kind == TypeKind::Template && returned.scope == "std" && !returned.is_const &&
        (returned.name == "tuple" || returned.name == "pair")) {
        method.aggregate = returned.name == "tuple" ? ResultAggregate::Tuple : ResultAggregate::Pair;
        method.results   = std::move(returned.args);
        return;
    }
    method.results.push_back(std::move(returned));
}

bool interface_name_matches(std::string_view requested, std::string_view qualified) {
    if (requested.rfind("::", 0) == 0) {
        requested.remove_prefix(2);
    }
    if (requested == qualified) {
        return true;
    }
    if (qualified.size() > requested.size() + 2) {
        const auto tail = qualified.substr(qualified.size() - requested.size());
        const auto sep  = qualified.substr(qualified.size() - requested.size() - 2, 2);
        return tail == requested && sep == "::";
    }
    return false;
}

} // namespace mockforge::codegen
