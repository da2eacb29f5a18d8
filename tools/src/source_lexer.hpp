// Tokenizer for C++ headers read by the syntactic backend.
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace mockforge::codegen {

enum class TokenKind {
    Identifier,
    Number,
    String,    // "..." including raw strings, quotes kept
    Character, // '...'
    Punct,     // single character, or one of :: && -> ...
    Directive, // a whole preprocessor line, continuations joined
    End,
};

struct Token {
    TokenKind   kind = TokenKind::End;
    std::string text;
    int         line = 0;
};

// Comments are dropped. `>>` is always lexed as two `>` tokens so template
// argument lists close naturally. The last token is always End.
// Throws ExtractionError on an unterminated comment or literal.
std::vector<Token> lex_source(std::string_view source, std::string_view filename);

} // namespace mockforge::codegen
