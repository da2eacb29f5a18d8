#include "source_parser.hpp"

#include "errors.hpp"
#include "log.hpp"
#include "path_utils.hpp"
#include "source_lexer.hpp"
#include "type_ref.hpp"

#include <algorithm>
#include <cctype>
#include <fmt/core.h>
#include <fstream>
#include <sstream>
#include <string_view>
#include <utility>

namespace mockforge::codegen {
namespace {

constexpr std::string_view kFundamentalWords[] = {"unsigned", "signed",  "short",   "long",    "int",      "char",    "double",
                                                  "float",    "bool",    "void",    "wchar_t", "char8_t",  "char16_t", "char32_t"};

bool is_fundamental_word(std::string_view word) {
    return std::find(std::begin(kFundamentalWords), std::end(kFundamentalWords), word) != std::end(kFundamentalWords);
}

bool is_text(const Token &token, std::string_view text) {
    return (token.kind == TokenKind::Identifier || token.kind == TokenKind::Punct) && token.text == text;
}

std::string join_scope(const std::string &scope, const std::string &name) { return scope.empty() ? name : scope + "::" + name; }

std::string parent_scope(const std::string &scope) {
    const auto pos = scope.rfind("::");
    return pos == std::string::npos ? std::string{} : scope.substr(0, pos);
}

std::string join_parts(const std::vector<std::string> &parts) {
    std::string out;
    for (const auto &part : parts) {
        out = out.empty() ? part : out + "::" + part;
    }
    return out;
}

// Parses type expressions out of a token run that ends with an End token.
class TypeParser {
  public:
    TypeParser(std::vector<Token> tokens, std::string_view file) : tokens_(std::move(tokens)), file_(file) {
        const int line = tokens_.empty() ? 0 : tokens_.back().line;
        tokens_.push_back(Token{TokenKind::End, {}, line});
    }

    const Token &peek(std::size_t k = 0) const { return tokens_[std::min(pos_ + k, tokens_.size() - 1)]; }
    bool         at(std::string_view text, std::size_t k = 0) const { return is_text(peek(k), text); }
    bool         at_end() const { return peek().kind == TokenKind::End; }
    Token        next() { return pos_ + 1 < tokens_.size() ? tokens_[pos_++] : tokens_.back(); }

    [[noreturn]] void fail(std::string_view what) const { throw ExtractionError(fmt::format("{}:{}: {}", file_, peek().line, what)); }

    TypeExpr parse_type() {
        TypeExpr                 type;
        std::vector<std::string> words;
        bool                     saw_name = false;
        while (!at_end()) {
            const Token &tok = peek();
            if (at("const")) {
                type.is_const = true;
                next();
            } else if (at("volatile")) {
                next();
            } else if (!saw_name && words.empty() && (at("typename") || at("class") || at("struct") || at("enum") || at("union"))) {
                next();
            } else if (!saw_name && tok.kind == TokenKind::Identifier && is_fundamental_word(tok.text)) {
                words.push_back(next().text);
            } else if (!saw_name && words.empty() && (tok.kind == TokenKind::Identifier || at("::"))) {
                parse_qualified_name(type);
                saw_name = true;
            } else {
                break;
            }
        }
        if (!words.empty()) {
            auto normalized = normalize_fundamental(words);
            if (!normalized) {
                fail(fmt::format("invalid type keywords '{}'", join_parts(words)));
            }
            type.fundamental = std::move(*normalized);
        } else if (!saw_name) {
            fail(fmt::format("expected a type, found '{}'", peek().text));
        }
        parse_declarators(type);
        return type;
    }

  private:
    void parse_declarators(TypeExpr &type) {
        while (true) {
            if (at("*")) {
                next();
                Declarator decl;
                while (at("const") || at("volatile")) {
                    decl.is_const = decl.is_const || peek().text == "const";
                    next();
                }
                type.declarators.push_back(decl);
            } else if (at("&")) {
                next();
                type.declarators.push_back(Declarator{Declarator::Kind::LValueRef, false});
            } else if (at("&&")) {
                next();
                type.declarators.push_back(Declarator{Declarator::Kind::RValueRef, false});
            } else {
                return;
            }
        }
    }

    void parse_qualified_name(TypeExpr &type) {
        if (at("::")) {
            type.global = true;
            next();
        }
        while (true) {
            if (peek().kind != TokenKind::Identifier) {
                fail(fmt::format("expected a name, found '{}'", peek().text));
            }
            type.name.push_back(next().text);
            if (at("<")) {
                next();
                parse_template_args(type.args);
                if (at("::")) {
                    fail("members of template specializations are not supported");
                }
            }
            if (at("::") && peek(1).kind == TokenKind::Identifier) {
                next();
                continue;
            }
            return;
        }
    }

    void parse_template_args(std::vector<TypeExpr> &args) {
        if (at(">")) {
            next();
            return;
        }
        while (true) {
            TypeExpr arg;
            if (peek().kind == TokenKind::Number) {
                const auto &text = next().text;
                std::size_t digits = 0;
                while (digits < text.size() && std::isdigit(static_cast<unsigned char>(text[digits])) != 0) {
                    ++digits;
                }
                arg.literal = text.substr(0, digits);
            } else {
                arg = parse_type();
                if (at("(")) {
                    arg = parse_function_type(std::move(arg));
                }
            }
            if (at("...")) {
                fail("pack expansions are not supported");
            }
            args.push_back(std::move(arg));
            if (at(",")) {
                next();
                continue;
            }
            if (!at(">")) {
                fail(fmt::format("expected '>' in template argument list, found '{}'", peek().text));
            }
            next();
            return;
        }
    }

    TypeExpr parse_function_type(TypeExpr result) {
        TypeExpr fn;
        fn.is_function = true;
        fn.fn_result.push_back(std::move(result));
        next(); // (
        if (at("void") && at(")", 1)) {
            next();
        }
        while (!at(")")) {
            if (at_end()) {
                fail("unterminated function type");
            }
            fn.fn_params.push_back(parse_type());
            if (peek().kind == TokenKind::Identifier) {
                next();
            }
            if (at(",")) {
                next();
            } else if (!at(")")) {
                fail(fmt::format("unexpected '{}' in function type", peek().text));
            }
        }
        next(); // )
        return fn;
    }

    std::vector<Token> tokens_;
    std::string_view   file_;
    std::size_t        pos_ = 0;
};

// Split `tokens` at top-level commas.
std::vector<std::vector<Token>> split_top_level(const std::vector<Token> &tokens) {
    std::vector<std::vector<Token>> chunks;
    std::vector<Token>              current;
    int                             depth = 0;
    for (const auto &tok : tokens) {
        if (tok.kind == TokenKind::Punct) {
            if (tok.text == "(" || tok.text == "[" || tok.text == "{" || tok.text == "<") {
                ++depth;
            } else if ((tok.text == ")" || tok.text == "]" || tok.text == "}" || tok.text == ">") && depth > 0) {
                --depth;
            } else if (tok.text == "," && depth == 0) {
                chunks.push_back(std::move(current));
                current.clear();
                continue;
            }
        }
        current.push_back(tok);
    }
    if (!current.empty() || !chunks.empty()) {
        chunks.push_back(std::move(current));
    }
    return chunks;
}

} // namespace

std::string TypeExpr::spelling() const {
    std::string out = is_const ? "const " : "";
    if (is_function) {
        out += fn_result.empty() ? std::string("void") : fn_result.front().spelling();
        out += "(";
        for (std::size_t i = 0; i < fn_params.size(); ++i) {
            out += (i == 0 ? "" : ", ") + fn_params[i].spelling();
        }
        out += ")";
    } else if (!literal.empty()) {
        out += literal;
    } else if (!fundamental.empty()) {
        out += fundamental;
    } else {
        out += (global ? "::" : "") + join_parts(name);
        if (!args.empty()) {
            out += "<";
            for (std::size_t i = 0; i < args.size(); ++i) {
                out += (i == 0 ? "" : ", ") + args[i].spelling();
            }
            out += ">";
        }
    }
    for (const auto &decl : declarators) {
        switch (decl.kind) {
        case Declarator::Kind::Pointer: out += decl.is_const ? " *const" : " *"; break;
        case Declarator::Kind::LValueRef: out += " &"; break;
        case Declarator::Kind::RValueRef: out += " &&"; break;
        }
    }
    return out;
}

bool ParsedClass::declares_pure_method() const {
    return std::any_of(methods.begin(), methods.end(), [](const ParsedMethod &m) { return m.is_pure; });
}

class HeaderParser {
  public:
    HeaderParser(SymbolTable &table, const std::vector<fs::path> &include_dirs, fs::path file, std::vector<Token> tokens)
        : table_(table), include_dirs_(include_dirs), file_(std::move(file)), file_name_(file_.string()), tokens_(std::move(tokens)) {}

    static void load(SymbolTable &table, const fs::path &file, const std::vector<fs::path> &include_dirs) {
        const fs::path normalized = normalize_path(file);
        if (!table.loaded_files_.insert(normalized.string()).second) {
            return;
        }
        std::ifstream in(normalized, std::ios::binary);
        if (!in) {
            throw ExtractionError(fmt::format("{}: cannot open header", normalized.string()));
        }
        std::ostringstream buffer;
        buffer << in.rdbuf();
        const std::string content = buffer.str();
        log_debug("parsing {}", normalized.string());

        HeaderParser parser{table, include_dirs, normalized, lex_source(content, normalized.string())};
        parser.parse_scope_body("", false);
    }

  private:
    struct Declaration {
        std::vector<Token> tokens;
        bool               has_body = false;
    };

    const Token &peek(std::size_t k = 0) const { return tokens_[std::min(pos_ + k, tokens_.size() - 1)]; }
    bool         at(std::string_view text, std::size_t k = 0) const { return is_text(peek(k), text); }
    bool         at_end() const { return peek().kind == TokenKind::End; }
    Token        next() { return pos_ + 1 < tokens_.size() ? tokens_[pos_++] : tokens_.back(); }

    [[noreturn]] void fail(int line, std::string_view what) const { throw ExtractionError(fmt::format("{}:{}: {}", file_name_, line, what)); }

    void expect(std::string_view text) {
        if (!at(text)) {
            fail(peek().line, fmt::format("expected '{}', found '{}'", text, peek().text));
        }
        next();
    }

    // Body of a namespace (or the file): declarations until `}` or end of file.
    void parse_scope_body(const std::string &scope, bool braced) {
        while (true) {
            if (at_end()) {
                if (braced) {
                    fail(peek().line, "missing '}' at end of file");
                }
                return;
            }
            if (at("}")) {
                if (!braced) {
                    fail(peek().line, "unmatched '}'");
                }
                next();
                return;
            }
            const Token &tok = peek();
            if (tok.kind == TokenKind::Directive) {
                handle_directive(next());
            } else if (at(";")) {
                next();
            } else if (at("namespace")) {
                parse_namespace(scope);
            } else if (at("inline") && at("namespace", 1)) {
                next();
                parse_namespace(scope, true);
            } else if (at("extern") && peek(1).kind == TokenKind::String && at("{", 2)) {
                next();
                next();
                next();
                parse_scope_body(scope, true);
            } else if (at("template")) {
                parse_template(scope);
            } else if (at("class") || at("struct") || at("union")) {
                parse_class(scope, false);
            } else if (at("enum")) {
                parse_enum(scope);
            } else if (at("using")) {
                parse_using(scope, false);
            } else if (at("typedef")) {
                parse_typedef(scope);
            } else if (skip_attributes()) {
                continue;
            } else {
                collect_declaration();
            }
        }
    }

    // Inline namespaces are transparent: their members are recorded in the
    // enclosing namespace.
    void parse_namespace(const std::string &scope, bool is_inline = false) {
        expect("namespace");
        skip_attributes();
        std::string inner = scope;
        bool        named = is_inline;
        while (peek().kind == TokenKind::Identifier) {
            if (at("inline")) {
                next();
                next();
                if (at("::")) {
                    next();
                }
                continue;
            }
            if (is_inline) {
                next();
                continue;
            }
            inner = join_scope(inner, next().text);
            named = true;
            table_.namespaces_.insert(inner);
            if (at("::")) {
                next();
            }
        }
        if (at("=")) {
            collect_declaration();
            return;
        }
        if (!named) {
            inner = join_scope(scope, "(anonymous)");
            table_.using_directives_[scope].push_back(inner);
        }
        expect("{");
        parse_scope_body(inner, true);
    }

    void parse_template(const std::string &scope) {
        expect("template");
        if (at("<")) {
            skip_angles();
        }
        if (at("class") || at("struct") || at("union")) {
            parse_class(scope, true);
        } else if (at("using") && peek(1).kind == TokenKind::Identifier) {
            next();
            Symbol symbol;
            symbol.kind        = SymbolKind::Alias;
            symbol.name        = next().text;
            symbol.scope       = scope;
            symbol.file        = file_;
            symbol.is_template = true;
            symbol.alias_error = "alias templates are not supported";
            add_symbol(std::move(symbol));
            collect_declaration();
        } else {
            collect_declaration();
        }
    }

    void parse_class(const std::string &scope, bool is_template) {
        const int line = next().line; // class / struct / union
        skip_attributes();
        std::string name;
        while (peek().kind == TokenKind::Identifier && !at("final")) {
            name = next().text;
            skip_attributes();
            if (at("::")) {
                name.clear(); // out-of-line definition of a nested class
                next();
            }
        }
        if (at("<")) {
            // explicit or partial specialization
            skip_angles();
            is_template = true;
        }
        if (at("final")) {
            next();
        }
        if (name.empty() || (!at(";") && !at(":") && !at("{"))) {
            collect_declaration();
            return;
        }
        if (at(";")) {
            next();
            Symbol symbol;
            symbol.kind        = SymbolKind::Class;
            symbol.name        = name;
            symbol.scope       = scope;
            symbol.file        = file_;
            symbol.is_template = is_template;
            add_symbol(std::move(symbol));
            return;
        }

        ParsedClass parsed;
        parsed.name        = name;
        parsed.scope       = scope;
        parsed.file        = file_;
        parsed.line        = line;
        parsed.is_template = is_template;
        if (at(":")) {
            next();
            parse_bases(parsed);
        }
        expect("{");

        table_.classes_.push_back(std::move(parsed));
        ParsedClass &cls = table_.classes_.back();

        Symbol symbol;
        symbol.kind        = SymbolKind::Class;
        symbol.name        = name;
        symbol.scope       = scope;
        symbol.file        = file_;
        symbol.is_template = is_template;
        symbol.definition  = &cls;
        add_symbol(std::move(symbol));

        if (is_template) {
            --pos_;
            skip_balanced("{", "}");
        } else {
            parse_class_body(cls);
        }
        // Declarators after the closing brace: `} instance;`
        collect_declaration();
    }

    void parse_bases(ParsedClass &cls) {
        std::vector<Token> tokens;
        int                depth = 0;
        while (!at_end() && !(depth == 0 && at("{"))) {
            if (at("<") || at("(")) {
                ++depth;
            } else if ((at(">") || at(")")) && depth > 0) {
                --depth;
            }
            tokens.push_back(next());
        }
        for (auto &chunk : split_top_level(tokens)) {
            std::vector<Token> filtered;
            for (auto &tok : chunk) {
                if (is_text(tok, "public") || is_text(tok, "protected") || is_text(tok, "private") || is_text(tok, "virtual")) {
                    continue;
                }
                filtered.push_back(std::move(tok));
            }
            TypeParser parser{std::move(filtered), file_name_};
            cls.bases.push_back(parser.parse_type());
            if (!parser.at_end()) {
                parser.fail(fmt::format("cannot parse base class of {}", cls.name));
            }
        }
    }

    void parse_class_body(ParsedClass &cls) {
        const std::string class_scope = cls.qualified_name();
        while (true) {
            if (at_end()) {
                fail(peek().line, fmt::format("missing '}}' closing class {}", cls.name));
            }
            if (at("}")) {
                next();
                return;
            }
            const Token &tok = peek();
            if (tok.kind == TokenKind::Directive) {
                handle_directive(next());
            } else if (at(";")) {
                next();
            } else if ((at("public") || at("protected") || at("private")) && at(":", 1)) {
                next();
                next();
            } else if (at("class") || at("struct") || at("union")) {
                parse_class(class_scope, false);
            } else if (at("enum")) {
                parse_enum(class_scope);
            } else if (at("using")) {
                parse_using(class_scope, true);
            } else if (at("typedef")) {
                parse_typedef(class_scope);
            } else if (at("template")) {
                parse_template(class_scope);
            } else if (at("friend") || at("static_assert")) {
                collect_declaration();
            } else if (skip_attributes()) {
                continue;
            } else {
                parse_member(cls);
            }
        }
    }

    void parse_enum(const std::string &scope) {
        expect("enum");
        if (at("class") || at("struct")) {
            next();
        }
        skip_attributes();
        if (peek().kind != TokenKind::Identifier) {
            collect_declaration();
            return;
        }
        Symbol symbol;
        symbol.kind  = SymbolKind::Enum;
        symbol.name  = next().text;
        symbol.scope = scope;
        symbol.file  = file_;
        add_symbol(std::move(symbol));
        collect_declaration();
    }

    void parse_using(const std::string &scope, bool in_class) {
        const int line = next().line; // using
        if (at("namespace")) {
            next();
            auto decl = collect_declaration();
            std::vector<std::string> parts;
            for (const auto &tok : decl.tokens) {
                if (tok.kind == TokenKind::Identifier) {
                    parts.push_back(tok.text);
                }
            }
            const std::string nominated = join_parts(parts);
            std::string       resolved  = nominated;
            for (std::string s = scope;; s = parent_scope(s)) {
                if (table_.namespaces_.count(join_scope(s, nominated)) != 0) {
                    resolved = join_scope(s, nominated);
                    break;
                }
                if (s.empty()) {
                    break;
                }
            }
            table_.using_directives_[scope].push_back(resolved);
            return;
        }
        if (peek().kind == TokenKind::Identifier && at("=", 1)) {
            Symbol symbol;
            symbol.kind  = SymbolKind::Alias;
            symbol.name  = next().text;
            symbol.scope = scope;
            symbol.file  = file_;
            next(); // =
            auto decl = collect_declaration();
            try {
                TypeParser parser{std::move(decl.tokens), file_name_};
                symbol.aliased = parser.parse_type();
                if (!parser.at_end()) {
                    symbol.alias_error = fmt::format("{}:{}: alias '{}' names an unsupported type", file_name_, line, symbol.name);
                }
            } catch (const ExtractionError &e) {
                symbol.alias_error = e.what();
            }
            add_symbol(std::move(symbol));
            return;
        }
        auto decl = collect_declaration();
        if (in_class || decl.tokens.empty() || at_typename(decl.tokens)) {
            return;
        }
        // using-declaration: `using other::Name;`
        Symbol symbol;
        symbol.kind  = SymbolKind::Alias;
        symbol.scope = scope;
        symbol.file  = file_;
        try {
            TypeParser parser{decl.tokens, file_name_};
            symbol.aliased = parser.parse_type();
        } catch (const ExtractionError &) {
            return;
        }
        if (symbol.aliased.name.empty()) {
            return;
        }
        symbol.name           = symbol.aliased.name.back();
        add_symbol(std::move(symbol));
    }

    static bool at_typename(const std::vector<Token> &tokens) { return is_text(tokens.front(), "typename"); }

    void parse_typedef(const std::string &scope) {
        const int line = next().line; // typedef
        auto      decl = collect_declaration();
        auto     &toks = decl.tokens;
        if (toks.empty() || toks.back().kind != TokenKind::Identifier) {
            return;
        }
        Symbol symbol;
        symbol.kind  = SymbolKind::Alias;
        symbol.name  = toks.back().text;
        symbol.scope = scope;
        symbol.file  = file_;
        toks.pop_back();
        const bool has_parens = std::any_of(toks.begin(), toks.end(), [](const Token &t) { return is_text(t, "(") || is_text(t, "{}"); });
        if (has_parens) {
            symbol.alias_error = fmt::format("{}:{}: typedef '{}' names an unsupported type", file_name_, line, symbol.name);
        } else {
            try {
                TypeParser parser{std::move(toks), file_name_};
                symbol.aliased = parser.parse_type();
                if (!parser.at_end()) {
                    symbol.alias_error = fmt::format("{}:{}: typedef '{}' names an unsupported type", file_name_, line, symbol.name);
                }
            } catch (const ExtractionError &e) {
                symbol.alias_error = e.what();
            }
        }
        add_symbol(std::move(symbol));
    }

    // A member declaration; virtual methods are recorded on `cls`.
    void parse_member(ParsedClass &cls) {
        const auto  decl = collect_declaration();
        const auto &toks = decl.tokens;

        std::size_t open = toks.size();
        int         angle = 0;
        for (std::size_t i = 0; i < toks.size(); ++i) {
            if (is_text(toks[i], "<")) {
                ++angle;
            } else if (is_text(toks[i], ">") && angle > 0) {
                --angle;
            } else if (is_text(toks[i], "(") && angle == 0) {
                open = i;
                break;
            }
        }
        if (open == toks.size() || open == 0) {
            return; // data member
        }

        std::string name;
        std::size_t name_begin = open - 1;
        const auto  op = std::find_if(toks.begin(), toks.begin() + static_cast<std::ptrdiff_t>(open), [](const Token &t) { return is_text(t, "operator"); });
        if (op != toks.begin() + static_cast<std::ptrdiff_t>(open)) {
            name_begin = static_cast<std::size_t>(op - toks.begin());
            if (name_begin + 1 == open && open + 2 < toks.size() && is_text(toks[open + 1], ")") && is_text(toks[open + 2], "(")) {
                open += 2;
            }
            for (std::size_t i = name_begin; i < open; ++i) {
                if (!name.empty() && toks[i].kind == TokenKind::Identifier) {
                    name += ' '; // conversion operators: "operator bool"
                }
                name += toks[i].text;
            }
        } else {
            const Token &name_tok = toks[name_begin];
            if (name_tok.kind != TokenKind::Identifier || is_fundamental_word(name_tok.text)) {
                return;
            }
            if (name_begin > 0 && is_text(toks[name_begin - 1], "~")) {
                return; // destructor
            }
            if (name_tok.text == cls.name || (name_begin > 0 && is_text(toks[name_begin - 1], "::"))) {
                return; // constructor or qualified name
            }
            name = name_tok.text;
        }

        const std::size_t close = matching_paren(toks, open);
        if (close == toks.size()) {
            fail(toks[open].line, fmt::format("unbalanced parentheses in declaration of {}", name));
        }
        if (close + 1 < toks.size() && is_text(toks[close + 1], "(")) {
            return; // function pointer member
        }

        bool               is_virtual = false;
        bool               is_static  = false;
        std::vector<Token> return_tokens;
        for (std::size_t i = 0; i < name_begin; ++i) {
            const auto &tok = toks[i];
            if (is_text(tok, "[") && i + 1 < name_begin && is_text(toks[i + 1], "[")) {
                i = skip_attribute_tokens(toks, i);
                continue;
            }
            if (is_text(tok, "virtual")) {
                is_virtual = true;
            } else if (is_text(tok, "static") || is_text(tok, "friend")) {
                is_static = true;
            } else if (!(is_text(tok, "inline") || is_text(tok, "constexpr") || is_text(tok, "explicit") || is_text(tok, "consteval"))) {
                return_tokens.push_back(tok);
            }
        }

        ParsedMethod method;
        method.name = name;
        method.line = toks[name_begin].line;

        std::vector<Token> trailing_return;
        bool               overrides = false;
        for (std::size_t i = close + 1; i < toks.size(); ++i) {
            const auto &tok = toks[i];
            if (is_text(tok, "const")) {
                method.is_const = true;
            } else if (is_text(tok, "&")) {
                method.ref_qualifier = "&";
            } else if (is_text(tok, "&&")) {
                method.ref_qualifier = "&&";
            } else if (is_text(tok, "noexcept")) {
                method.is_noexcept = true;
                if (i + 1 < toks.size() && is_text(toks[i + 1], "(")) {
                    const std::size_t end = matching_paren(toks, i + 1);
                    if (end == i + 3 && is_text(toks[i + 2], "false")) {
                        method.is_noexcept = false;
                    }
                    i = end;
                }
            } else if (is_text(tok, "throw") && i + 1 < toks.size() && is_text(toks[i + 1], "(")) {
                i = matching_paren(toks, i + 1);
            } else if (is_text(tok, "override") || is_text(tok, "final")) {
                overrides = true;
            } else if (is_text(tok, "=") && i + 1 < toks.size()) {
                method.is_pure = toks[i + 1].text == "0";
                ++i;
            } else if (is_text(tok, "->")) {
                int depth = 0;
                for (++i; i < toks.size(); ++i) {
                    if (is_text(toks[i], "<") || is_text(toks[i], "(")) {
                        ++depth;
                    } else if ((is_text(toks[i], ">") || is_text(toks[i], ")")) && depth > 0) {
                        --depth;
                    } else if (depth == 0 && (is_text(toks[i], "override") || is_text(toks[i], "final") || is_text(toks[i], "="))) {
                        --i;
                        break;
                    }
                    trailing_return.push_back(toks[i]);
                }
            } else if (is_text(tok, "[") && i + 1 < toks.size() && is_text(toks[i + 1], "[")) {
                i = skip_attribute_tokens(toks, i);
            }
        }
        if (is_static || !(is_virtual || overrides || method.is_pure)) {
            return;
        }
        if (!trailing_return.empty() && return_tokens.size() == 1 && is_text(return_tokens.front(), "auto")) {
            return_tokens = std::move(trailing_return);
        }

        TypeParser return_parser{std::move(return_tokens), file_name_};
        method.return_type = return_parser.parse_type();
        if (!return_parser.at_end()) {
            return_parser.fail(fmt::format("cannot parse return type of {}", name));
        }
        parse_params(method, std::vector<Token>(toks.begin() + static_cast<std::ptrdiff_t>(open) + 1, toks.begin() + static_cast<std::ptrdiff_t>(close)));
        cls.methods.push_back(std::move(method));
    }

    void parse_params(ParsedMethod &method, const std::vector<Token> &tokens) {
        auto chunks = split_top_level(tokens);
        if (chunks.size() == 1 && chunks.front().size() == 1 && is_text(chunks.front().front(), "void")) {
            return;
        }
        for (auto &chunk : chunks) {
            int depth = 0;
            for (std::size_t i = 0; i < chunk.size(); ++i) {
                if (is_text(chunk[i], "(") || is_text(chunk[i], "<") || is_text(chunk[i], "{") || is_text(chunk[i], "[")) {
                    ++depth;
                } else if ((is_text(chunk[i], ")") || is_text(chunk[i], ">") || is_text(chunk[i], "}") || is_text(chunk[i], "]")) && depth > 0) {
                    --depth;
                } else if (depth == 0 && is_text(chunk[i], "=")) {
                    chunk.resize(i); // default argument
                    break;
                }
            }
            if (chunk.size() == 1 && is_text(chunk.front(), "...")) {
                method.c_variadic = true;
                continue;
            }
            if (chunk.empty()) {
                fail(method.line, fmt::format("empty parameter in {}", method.name));
            }
            TypeParser  parser{std::move(chunk), file_name_};
            ParsedParam param;
            param.type = parser.parse_type();
            if (parser.at("...")) {
                parser.fail(fmt::format("parameter packs in {} cannot be mocked", method.name));
            }
            if (parser.peek().kind == TokenKind::Identifier) {
                param.name = parser.next().text;
            }
            if (parser.at("[")) {
                parser.fail(fmt::format("array parameters in {} are not supported; use std::array", method.name));
            }
            if (!parser.at_end()) {
                parser.fail(fmt::format("cannot parse parameter of {}", method.name));
            }
            method.params.push_back(std::move(param));
        }
    }

    static std::size_t matching_paren(const std::vector<Token> &toks, std::size_t open) {
        int depth = 0;
        for (std::size_t i = open; i < toks.size(); ++i) {
            if (is_text(toks[i], "(")) {
                ++depth;
            } else if (is_text(toks[i], ")") && --depth == 0) {
                return i;
            }
        }
        return toks.size();
    }

    // Index of the second `]` closing the attribute that starts at `start`.
    static std::size_t skip_attribute_tokens(const std::vector<Token> &toks, std::size_t start) {
        int depth = 0;
        for (std::size_t i = start; i < toks.size(); ++i) {
            if (is_text(toks[i], "[")) {
                ++depth;
            } else if (is_text(toks[i], "]") && --depth == 0) {
                return i;
            }
        }
        return toks.size();
    }

    // Consume one declaration up to its `;` or function body. Nested braces of
    // initializers are folded into a single `{}` token.
    Declaration collect_declaration() {
        Declaration decl;
        int         paren       = 0;
        int         angle       = 0;
        bool        open_at_top = false;
        bool        saw_params  = false;
        while (true) {
            const Token &tok = peek();
            if (tok.kind == TokenKind::End) {
                fail(tok.line, "unexpected end of file inside a declaration");
            }
            if (tok.kind == TokenKind::Directive) {
                handle_directive(next());
                continue;
            }
            if (tok.kind == TokenKind::Punct) {
                const std::string &t = tok.text;
                if (t == "(" || t == "[") {
                    if (paren == 0 && angle == 0 && t == "(") {
                        open_at_top = true;
                    }
                    ++paren;
                } else if ((t == ")" || t == "]") && paren > 0) {
                    --paren;
                    if (paren == 0 && open_at_top) {
                        saw_params  = true;
                        open_at_top = false;
                    }
                } else if (paren == 0) {
                    if (t == ";") {
                        next();
                        return decl;
                    }
                    if (t == "}") {
                        return decl;
                    }
                    if (t == "{") {
                        const int line = tok.line;
                        skip_balanced("{", "}");
                        if (saw_params && angle == 0) {
                            decl.has_body = true;
                            if (at(";")) {
                                next();
                            }
                            return decl;
                        }
                        decl.tokens.push_back(Token{TokenKind::Punct, "{}", line});
                        continue;
                    }
                    if (t == ":" && saw_params && angle == 0) {
                        next();
                        skip_member_initializers();
                        if (at("{")) {
                            skip_balanced("{", "}");
                        }
                        decl.has_body = true;
                        return decl;
                    }
                    if (t == "<") {
                        ++angle;
                    } else if (t == ">" && angle > 0) {
                        --angle;
                    }
                }
            }
            decl.tokens.push_back(next());
        }
    }

    void skip_member_initializers() {
        while (!at_end()) {
            while (!at_end() && !at("(") && !at("{")) {
                next();
            }
            if (at("(")) {
                skip_balanced("(", ")");
            } else if (at("{")) {
                skip_balanced("{", "}");
            }
            if (!at(",")) {
                return;
            }
            next();
        }
    }

    void skip_balanced(std::string_view open, std::string_view close) {
        const int line  = peek().line;
        int       depth = 0;
        while (!at_end()) {
            if (at(open)) {
                ++depth;
            } else if (at(close) && --depth == 0) {
                next();
                return;
            }
            next();
        }
        fail(line, fmt::format("missing '{}'", close));
    }

    void skip_angles() {
        const int line  = peek().line;
        int       depth = 0;
        int       paren = 0;
        while (!at_end()) {
            if (at("(")) {
                ++paren;
            } else if (at(")")) {
                --paren;
            } else if (paren == 0 && at("<")) {
                ++depth;
            } else if (paren == 0 && at(">") && --depth == 0) {
                next();
                return;
            }
            next();
        }
        fail(line, "missing '>'");
    }

    // Attributes and compiler specific decorations. Returns true if any were skipped.
    bool skip_attributes() {
        bool skipped = false;
        while (true) {
            if (at("[") && at("[", 1)) {
                skip_balanced("[", "]");
            } else if ((at("alignas") || at("__attribute__") || at("__declspec")) && at("(", 1)) {
                next();
                skip_balanced("(", ")");
            } else {
                return skipped;
            }
            skipped = true;
        }
    }

    void handle_directive(const Token &directive) {
        std::string_view text = directive.text;
        text.remove_prefix(1); // #
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
            text.remove_prefix(1);
        }
        if (text.rfind("include", 0) != 0 || text.rfind("include_next", 0) == 0) {
            return;
        }
        text.remove_prefix(7);
        const auto open = text.find_first_of("\"<");
        if (open == std::string_view::npos) {
            return;
        }
        const bool quoted = text[open] == '"';
        const auto close  = text.find(quoted ? '"' : '>', open + 1);
        if (close == std::string_view::npos) {
            fail(directive.line, "malformed #include");
        }
        const fs::path target{std::string(text.substr(open + 1, close - open - 1))};

        std::vector<fs::path> candidates;
        if (quoted) {
            candidates.push_back(file_.parent_path() / target);
        }
        for (const auto &dir : include_dirs_) {
            candidates.push_back(dir / target);
        }
        for (const auto &candidate : candidates) {
            std::error_code ec;
            if (fs::is_regular_file(candidate, ec)) {
                load(table_, candidate, include_dirs_);
                return;
            }
        }
        if (quoted) {
            fail(directive.line, fmt::format("cannot resolve #include \"{}\"", target.generic_string()));
        }
        log_debug("{}:{}: skipping system header <{}>", file_name_, directive.line, target.generic_string());
    }

    void add_symbol(Symbol symbol) {
        const std::string key = join_scope(symbol.scope, symbol.name);
        auto              it  = table_.symbols_.find(key);
        if (it == table_.symbols_.end()) {
            table_.symbols_.emplace(key, std::move(symbol));
            return;
        }
        if (it->second.kind == SymbolKind::Class && symbol.kind == SymbolKind::Class && it->second.definition == nullptr) {
            it->second.definition = symbol.definition;
            it->second.file       = symbol.file;
        }
    }

    SymbolTable                 &table_;
    const std::vector<fs::path> &include_dirs_;
    fs::path                     file_;
    std::string                  file_name_;
    std::vector<Token>           tokens_;
    std::size_t                  pos_ = 0;
};

SymbolTable SymbolTable::load(const fs::path &header, const std::vector<fs::path> &include_dirs) {
    SymbolTable           table;
    std::vector<fs::path> dirs;
    for (const auto &dir : include_dirs) {
        dirs.push_back(normalize_path(dir));
    }
    HeaderParser::load(table, header, dirs);
    return table;
}

const Symbol *SymbolTable::find(const std::string &qualified) const {
    const auto it = symbols_.find(qualified);
    return it == symbols_.end() ? nullptr : &it->second;
}

const Symbol *SymbolTable::lookup(const std::vector<std::string> &parts, bool global, const std::string &scope) const {
    const std::string tail = join_parts(parts);
    if (global) {
        return find(tail);
    }
    std::string current = scope;
    while (true) {
        if (const auto *symbol = find(join_scope(current, tail))) {
            return symbol;
        }
        if (const auto it = using_directives_.find(current); it != using_directives_.end()) {
            for (const auto &ns : it->second) {
                if (const auto *symbol = find(join_scope(ns, tail))) {
                    return symbol;
                }
            }
        }
        if (current.empty()) {
            return nullptr;
        }
        current = parent_scope(current);
    }
}

} // namespace mockforge::codegen
