// Header parser for the syntactic backend: declarations as written plus the
// symbol table needed to resolve the names they use.
#pragma once

#include <deque>
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace mockforge::codegen {

struct Declarator {
    enum class Kind { Pointer, LValueRef, RValueRef };
    Kind kind     = Kind::Pointer;
    bool is_const = false; // `T *const`
};

// A type as written, before name lookup.
struct TypeExpr {
    std::vector<std::string> name; // qualified name components; empty for keywords and literals
    bool                     global = false;
    std::string              fundamental; // normalized keyword spelling ("unsigned long")
    std::string              literal;     // non-type template argument ("3")
    std::vector<TypeExpr>    args;        // template arguments of the last name component
    bool                     is_const = false;
    std::vector<Declarator>  declarators; // innermost first
    bool                     is_function = false; // R(Args...) inside a template argument list
    std::vector<TypeExpr>    fn_params;
    std::vector<TypeExpr>    fn_result;

    std::string spelling() const;
};

struct ParsedParam {
    std::string name; // empty when unnamed
    TypeExpr    type;
};

struct ParsedMethod {
    std::string              name;
    TypeExpr                 return_type;
    std::vector<ParsedParam> params;
    bool                     is_pure     = false;
    bool                     is_const    = false;
    bool                     is_noexcept = false;
    bool                     c_variadic  = false;
    std::string              ref_qualifier;
    int                      line = 0;
};

// A class definition. Only virtual methods are kept.
struct ParsedClass {
    std::string               name;
    std::string               scope;
    std::filesystem::path     file;
    int                       line        = 0;
    bool                      is_template = false;
    std::vector<TypeExpr>     bases;
    std::vector<ParsedMethod> methods;

    std::string qualified_name() const { return scope.empty() ? name : scope + "::" + name; }
    bool        declares_pure_method() const;
};

enum class SymbolKind { Class, Enum, Alias };

struct Symbol {
    SymbolKind            kind = SymbolKind::Class;
    std::string           name;
    std::string           scope;
    std::filesystem::path file;
    bool                  is_template = false;
    const ParsedClass    *definition  = nullptr; // Class only, when defined
    TypeExpr              aliased;               // Alias only
    std::string           alias_error;           // set when the alias target cannot be used
};

class SymbolTable {
  public:
    // Parse `header` and, recursively, every header it includes that can be found
    // next to the including file (quoted form) or under `include_dirs`. Throws
    // ExtractionError on parse errors and unresolved quoted includes.
    static SymbolTable load(const std::filesystem::path &header, const std::vector<std::filesystem::path> &include_dirs);

    const Symbol *find(const std::string &qualified) const;

    // Resolve `parts` the way an unqualified (or `::`-anchored) name is looked up
    // from `scope`: innermost enclosing scope first, then using-directives.
    const Symbol *lookup(const std::vector<std::string> &parts, bool global, const std::string &scope) const;

    // Class definitions in declaration order.
    const std::deque<ParsedClass> &classes() const { return classes_; }

  private:
    friend class HeaderParser;

    std::map<std::string, Symbol>                   symbols_;
    std::deque<ParsedClass>                         classes_;
    std::set<std::string>                           namespaces_;
    std::map<std::string, std::vector<std::string>> using_directives_;
    std::set<std::string>                           loaded_files_;
};

} // namespace mockforge::codegen
