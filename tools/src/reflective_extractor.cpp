#include "reflective_extractor.hpp"

#include "errors.hpp"
#include "log.hpp"
#include "path_utils.hpp"
#include "tooling_support.hpp"
#include "type_ref.hpp"

#include <algorithm>
#include <clang/AST/ASTContext.h>
#include <clang/AST/Decl.h>
#include <clang/AST/DeclCXX.h>
#include <clang/AST/DeclTemplate.h>
#include <clang/AST/PrettyPrinter.h>
#include <clang/AST/Type.h>
#include <clang/ASTMatchers/ASTMatchFinder.h>
#include <clang/ASTMatchers/ASTMatchers.h>
#include <clang/Basic/SourceManager.h>
#include <clang/Tooling/Tooling.h>
#include <exception>
#include <fmt/core.h>
#include <llvm/ADT/DenseSet.h>
#include <llvm/Support/raw_ostream.h>
#include <string>
#include <utility>

using namespace clang;
using namespace clang::ast_matchers;

namespace mockforge::codegen {
namespace {

[[nodiscard]] std::string print_type(QualType qt, const ASTContext &ctx) {
    auto policy = PrintingPolicy(ctx.getLangOpts());
    policy.adjustForCPlusPlus();
    policy.FullyQualifiedName = true;
    std::string              result;
    llvm::raw_string_ostream os(result);
    qt.print(os, policy);
    os.flush();
    return result;
}

[[nodiscard]] std::string ref_qualifier_string(RefQualifierKind kind) {
    switch (kind) {
    case RQ_LValue: return "&";
    case RQ_RValue: return "&&";
    case RQ_None: break;
    }
    return {};
}

// Converts clang types into TypeRef. Aliases are resolved except the standard
// library ones mockforge treats as builtin (std::string, std::size_t, ...).
class TypeConverter {
  public:
    TypeConverter(ASTContext &ctx, const SourceSpec &spec) : ctx_(ctx), spec_(spec), policy_(ctx.getLangOpts()) {
        policy_.adjustForCPlusPlus();
    }

    TypeRef convert(QualType qt) const {
        const bool is_const = qt.getCanonicalType().isConstQualified();
        if (auto alias = std_alias(qt)) {
            alias->is_const = is_const;
            return *alias;
        }
        TypeRef out;
        if (const auto *ptr = qt->getAs<PointerType>()) {
            if (ptr->getPointeeType()->isFunctionType()) {
                unsupported(qt, "function pointers are not supported; use std::function");
            }
            out = wrap(TypeKind::Pointer, convert(ptr->getPointeeType()));
        } else if (const auto *lref = qt->getAs<LValueReferenceType>()) {
            return wrap(TypeKind::LValueRef, convert(lref->getPointeeType()));
        } else if (const auto *rref = qt->getAs<RValueReferenceType>()) {
            return wrap(TypeKind::RValueRef, convert(rref->getPointeeType()));
        } else if (const auto *proto = qt->getAs<FunctionProtoType>()) {
            if (proto->isVariadic()) {
                unsupported(qt, "C-style variadic function types cannot be mocked");
            }
            out.kind = TypeKind::Function;
            for (const auto &param : proto->getParamTypes()) {
                out.args.push_back(convert(param.getUnqualifiedType()));
            }
            if (!proto->getReturnType()->isVoidType()) {
                out.results.push_back(convert(proto->getReturnType()));
            }
            return out;
        } else if (const auto *tst = qt->getAs<TemplateSpecializationType>()) {
            if (tst->isTypeAlias()) {
                out = convert(tst->getAliasedType());
            } else {
                out = convert_specialization(qt, tst->template_arguments());
            }
        } else {
            out = convert_canonical(qt);
        }
        out.is_const = is_const;
        return out;
    }

    std::string header_for(const Decl &decl) const {
        const SourceManager &sm   = ctx_.getSourceManager();
        const auto           loc  = sm.getExpansionLoc(decl.getLocation());
        const auto           file = sm.getFilename(loc);
        if (file.empty()) {
            return {};
        }
        return include_spelling(fs::path(file.str()), spec_.include_dirs, normalize_path(spec_.header).parent_path());
    }

    // Namespace and enclosing class path of `dc`, skipping inline namespaces.
    std::string scope_of(const DeclContext *dc) const {
        std::vector<std::string> parts;
        for (; dc != nullptr; dc = dc->getParent()) {
            if (const auto *ns = dyn_cast<NamespaceDecl>(dc)) {
                if (ns->isInline()) {
                    continue;
                }
                if (ns->isAnonymousNamespace()) {
                    throw ExtractionError("types in anonymous namespaces cannot be referenced from a generated mock");
                }
                parts.push_back(ns->getName().str());
            } else if (const auto *record = dyn_cast<RecordDecl>(dc)) {
                if (record->getName().empty()) {
                    throw ExtractionError("types nested in anonymous classes cannot be referenced from a generated mock");
                }
                parts.push_back(record->getName().str());
            } else if (isa<FunctionDecl>(dc)) {
                throw ExtractionError("local types cannot be referenced from a generated mock");
            } else if (isa<TranslationUnitDecl>(dc)) {
                break;
            }
        }
        std::string out;
        for (auto it = parts.rbegin(); it != parts.rend(); ++it) {
            if (!out.empty())
                out += "::";
            out += *it;
        }
        return out;
    }

  private:
    [[noreturn]] void unsupported(QualType qt, std::string_view why) const {
        throw ExtractionError(fmt::format("unsupported type '{}': {}", print_type(qt, ctx_), why));
    }

    // A typedef in the sugar chain naming a builtin standard alias. Global
    // aliases (`size_t`) count only when a system header declares them.
    std::optional<TypeRef> std_alias(QualType qt) const {
        const SourceManager &sm      = ctx_.getSourceManager();
        QualType             current = qt;
        while (true) {
            if (const auto *typedef_type = dyn_cast<TypedefType>(current.getTypePtr())) {
                const auto *decl = typedef_type->getDecl();
                const auto *dc   = decl->getDeclContext()->getRedeclContext();
                const bool  std_context =
                    decl->isInStdNamespace() || (dc->isTranslationUnit() && sm.isInSystemHeader(sm.getExpansionLoc(decl->getLocation())));
                const auto  name        = decl->getName().str();
                if (std_context && std_header_for("std", name) && is_builtin(named_type(name, "std"))) {
                    return named_type(name, "std");
                }
            }
            const QualType next = current.getSingleStepDesugaredType(ctx_);
            if (next == current) {
                return std::nullopt;
            }
            current = next;
        }
    }

    TypeRef convert_argument(const TemplateArgument &arg, QualType owner) const {
        switch (arg.getKind()) {
        case TemplateArgument::Type: return convert(arg.getAsType());
        case TemplateArgument::Integral: return named_type(llvm::toString(arg.getAsIntegral(), 10));
        case TemplateArgument::Expression: {
            const auto value = arg.getAsExpr()->getIntegerConstantExpr(ctx_);
            if (!value) {
                unsupported(owner, "non-constant template argument");
            }
            return named_type(llvm::toString(*value, 10));
        }
        default: unsupported(owner, "unsupported template argument kind");
        }
    }

    std::vector<TypeRef> convert_arguments(llvm::ArrayRef<TemplateArgument> args, QualType owner) const {
        std::vector<TypeRef> out;
        for (const auto &arg : args) {
            if (arg.getKind() == TemplateArgument::Pack) {
                auto expanded = convert_arguments(arg.pack_elements(), owner);
                out.insert(out.end(), expanded.begin(), expanded.end());
            } else {
                out.push_back(convert_argument(arg, owner));
            }
        }
        return out;
    }

    // Canonical specialization arguments without the trailing defaulted ones
    // (std::set<int> rather than std::set<int, std::less<int>, std::allocator<int>>).
    std::vector<TemplateArgument> explicit_arguments(const ClassTemplateSpecializationDecl &spec) const {
        const auto                    &list = spec.getTemplateArgs();
        std::vector<TemplateArgument>  args(list.asArray().begin(), list.asArray().end());
        const auto                    *params = spec.getSpecializedTemplate()->getTemplateParameters();
        while (!args.empty() && args.size() <= params->size()) {
            const auto index = args.size() - 1;
            if (!isSubstitutedDefaultArgument(ctx_, args[index], params->getParam(index), list.asArray(), params->getDepth())) {
                break;
            }
            args.pop_back();
        }
        return args;
    }

    TypeRef convert_canonical(QualType qt) const {
        const QualType canonical = qt.getCanonicalType();
        if (const auto *builtin = dyn_cast<BuiltinType>(canonical.getTypePtr())) {
            if (builtin->getKind() == BuiltinType::NullPtr) {
                return named_type("nullptr_t", "std");
            }
            return named_type(builtin->getName(policy_).str());
        }
        const auto *tag = canonical->getAsTagDecl();
        if (tag == nullptr) {
            unsupported(qt, "only builtin, class, enum, pointer and reference types can be mocked");
        }
        if (const auto *spec = dyn_cast<ClassTemplateSpecializationDecl>(tag)) {
            const auto args = explicit_arguments(*spec);
            return convert_specialization(qt, args);
        }
        if (tag->getName().empty()) {
            unsupported(qt, "anonymous types cannot be named in a generated mock");
        }
        return named_type(tag->getName().str(), scope_of(tag->getDeclContext()), tag->isInStdNamespace() ? std::string{} : header_for(*tag));
    }

    TypeRef convert_specialization(QualType qt, llvm::ArrayRef<TemplateArgument> written) const {
        const auto *record = qt.getCanonicalType()->getAsCXXRecordDecl();
        const auto *spec   = dyn_cast_or_null<ClassTemplateSpecializationDecl>(record);
        if (spec == nullptr) {
            unsupported(qt, "dependent template types cannot be mocked");
        }
        const auto *primary = spec->getSpecializedTemplate();
        const auto  name    = primary->getName().str();
        auto        args    = convert_arguments(written, qt);

        if (!spec->isInStdNamespace()) {
            TypeRef out;
            out.kind   = TypeKind::Template;
            out.name   = name;
            out.scope  = scope_of(primary->getDeclContext());
            out.header = header_for(*primary);
            out.args   = std::move(args);
            return out;
        }
        return std_template_type(scope_of(primary->getDeclContext()), name, std::move(args));
    }

    ASTContext        &ctx_;
    const SourceSpec  &spec_;
    PrintingPolicy     policy_;
};

struct Candidate {
    std::string        qualified_name;
    InterfaceModel     model;
    std::exception_ptr error;
};

class InterfaceCollector : public MatchFinder::MatchCallback {
  public:
    explicit InterfaceCollector(const SourceSpec &spec) : spec_(spec) {}

    void run(const MatchFinder::MatchResult &result) override {
        const auto *record = result.Nodes.getNodeAs<CXXRecordDecl>("mockforge.record");
        if (record == nullptr || !record->isThisDeclarationADefinition()) {
            return;
        }
        if (record->isLambda() || record->isLocalClass() || record->getDescribedClassTemplate() != nullptr ||
            isa<ClassTemplateSpecializationDecl>(record) || record->getName().empty()) {
            return;
        }
        if (!seen_.insert(record->getCanonicalDecl()).second) {
            return;
        }

        const std::string qualified = record->getQualifiedNameAsString();
        if (spec_.interfaces.empty()) {
            const auto &sm = *result.SourceManager;
            if (!sm.isInMainFile(sm.getExpansionLoc(record->getLocation())) || !declares_pure_method(*record)) {
                return;
            }
        } else {
            const bool requested = std::any_of(spec_.interfaces.begin(), spec_.interfaces.end(),
                                               [&](const std::string &name) { return interface_name_matches(name, qualified); });
            if (!requested) {
                return;
            }
        }

        Candidate candidate;
        candidate.qualified_name = qualified;
        try {
            TypeConverter converter{*result.Context, spec_};
            candidate.model = build_model(*record, converter);
        } catch (const Error &) {
            candidate.error = std::current_exception();
        }
        log_debug("found interface {}", qualified);
        candidates_.push_back(std::move(candidate));
    }

    std::vector<InterfaceModel> finish() {
        std::vector<InterfaceModel> out;
        if (spec_.interfaces.empty()) {
            if (candidates_.empty()) {
                throw ExtractionError(fmt::format("{}: no interfaces declared", spec_.header.string()));
            }
            for (auto &candidate : candidates_) {
                if (candidate.error) {
                    std::rethrow_exception(candidate.error);
                }
                out.push_back(std::move(candidate.model));
            }
            return out;
        }

        for (const auto &name : spec_.interfaces) {
            std::vector<Candidate *> matches;
            for (auto &candidate : candidates_) {
                if (interface_name_matches(name, candidate.qualified_name)) {
                    matches.push_back(&candidate);
                }
            }
            if (matches.empty()) {
                throw ExtractionError(fmt::format("{}: interface '{}' not found", spec_.header.string(), name));
            }
            if (matches.size() > 1) {
                std::string names;
                for (const auto *match : matches) {
                    names += names.empty() ? match->qualified_name : ", " + match->qualified_name;
                }
                throw ExtractionError(fmt::format("{}: interface '{}' is ambiguous ({})", spec_.header.string(), name, names));
            }
            if (matches.front()->error) {
                std::rethrow_exception(matches.front()->error);
            }
            out.push_back(matches.front()->model);
        }
        return out;
    }

  private:
    static bool declares_pure_method(const CXXRecordDecl &record) {
        return std::any_of(record.method_begin(), record.method_end(), [](const CXXMethodDecl *m) { return m->isPureVirtual(); });
    }

    static MethodSignature convert_method(const CXXMethodDecl &method, const TypeConverter &converter) {
        MethodSignature signature;
        signature.name    = method.getNameAsString();
        const auto *proto = method.getType()->getAs<FunctionProtoType>();
        if (proto != nullptr && proto->isVariadic()) {
            throw SignatureConstraintError(fmt::format("{}: C-style variadic methods cannot be mocked", method.getQualifiedNameAsString()));
        }
        unsigned index = 0;
        for (const auto *param : method.parameters()) {
            signature.params.push_back(Parameter{fmt::format("p{}", index++), converter.convert(param->getType().getUnqualifiedType())});
        }
        assign_results(signature, converter.convert(method.getReturnType()));
        signature.is_const      = method.isConst();
        signature.is_noexcept   = proto != nullptr && proto->isNothrow();
        signature.ref_qualifier = ref_qualifier_string(method.getRefQualifier());
        return signature;
    }

    static void collect_methods(const CXXRecordDecl &record, const TypeConverter &converter, MethodSetBuilder &builder,
                                llvm::DenseSet<const CXXRecordDecl *> &visited) {
        if (!visited.insert(record.getCanonicalDecl()).second) {
            return;
        }
        for (const auto &base : record.bases()) {
            const auto *base_record = base.getType()->getAsCXXRecordDecl();
            if (base_record == nullptr || base_record->getDefinition() == nullptr) {
                throw ExtractionError(fmt::format("{}: base '{}' is not a complete class", record.getQualifiedNameAsString(),
                                                  base.getType().getAsString()));
            }
            collect_methods(*base_record->getDefinition(), converter, builder, visited);
        }
        const std::string origin = record.getQualifiedNameAsString();
        for (const auto *method : record.methods()) {
            if (method->isImplicit() || !method->isVirtual() || isa<CXXDestructorDecl>(method)) {
                continue;
            }
            builder.add(convert_method(*method, converter), origin);
        }
    }

    static InterfaceModel build_model(const CXXRecordDecl &record, const TypeConverter &converter) {
        InterfaceModel model;
        model.interface_name = record.getName().str();
        model.scope          = converter.scope_of(record.getDeclContext());
        model.header         = converter.header_for(record);

        MethodSetBuilder                      builder{record.getQualifiedNameAsString()};
        llvm::DenseSet<const CXXRecordDecl *> visited;
        collect_methods(record, converter, builder, visited);
        model.methods = builder.take();
        return model;
    }

    const SourceSpec                             &spec_;
    std::vector<Candidate>                        candidates_;
    llvm::DenseSet<const CXXRecordDecl *>         seen_;
};

} // namespace

ReflectiveExtractor::ReflectiveExtractor(ExtractorConfig config) : config_(std::move(config)) {}

std::vector<InterfaceModel> ReflectiveExtractor::extract(const SourceSpec &spec) {
    const fs::path  header = normalize_path(spec.header);
    std::error_code ec;
    if (!fs::is_regular_file(header, ec)) {
        throw ExtractionError(fmt::format("{}: header not found", spec.header.string()));
    }

    auto database = load_compilation_database(config_.compilation_database);

    std::vector<std::string> include_dirs;
    for (const auto &dir : spec.include_dirs) {
        include_dirs.push_back(normalize_path(dir).string());
    }

    clang::tooling::ClangTool tool{*database, {header.string()}};
    tool.appendArgumentsAdjuster(clang::tooling::getClangSyntaxOnlyAdjuster());
    tool.appendArgumentsAdjuster(make_arguments_adjuster(config_.extra_args, std::move(include_dirs)));

    InterfaceCollector collector{spec};
    MatchFinder        finder;
    finder.addMatcher(cxxRecordDecl(isDefinition()).bind("mockforge.record"), &collector);

    log_debug("parsing {} with clang", header.string());
    const int status = tool.run(clang::tooling::newFrontendActionFactory(&finder).get());
    if (status != 0) {
        throw ExtractionError(fmt::format("{}: clang failed to parse the header", header.string()));
    }
    return collector.finish();
}

} // namespace mockforge::codegen
