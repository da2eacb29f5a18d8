#include "source_lexer.hpp"

#include "errors.hpp"

#include <cctype>
#include <fmt/core.h>

namespace mockforge::codegen {
namespace {

bool is_ident_start(char c) { return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_'; }
bool is_ident_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_'; }

class Lexer {
  public:
    Lexer(std::string_view source, std::string_view filename) : src_(source), filename_(filename) {}

    std::vector<Token> run() {
        bool line_start = true;
        while (pos_ < src_.size()) {
            const char c = src_[pos_];
            if (c == '\n') {
                ++line_;
                ++pos_;
                line_start = true;
                continue;
            }
            if (std::isspace(static_cast<unsigned char>(c)) != 0) {
                ++pos_;
                continue;
            }
            if (c == '/' && peek(1) == '/') {
                skip_line_comment();
                continue;
            }
            if (c == '/' && peek(1) == '*') {
                skip_block_comment();
                continue;
            }
            if (c == '#' && line_start) {
                lex_directive();
                continue;
            }
            line_start = false;
            if (c == 'R' && peek(1) == '"') {
                lex_raw_string(1);
            } else if ((c == 'u' || c == 'U' || c == 'L') && (peek(1) == '"' || peek(1) == '\'')) {
                lex_quoted(1);
            } else if (c == 'u' && peek(1) == '8' && (peek(2) == '"' || peek(2) == '\'')) {
                lex_quoted(2);
            } else if (is_ident_start(c)) {
                lex_identifier();
            } else if (std::isdigit(static_cast<unsigned char>(c)) != 0 || (c == '.' && std::isdigit(static_cast<unsigned char>(peek(1))) != 0)) {
                lex_number();
            } else if (c == '"' || c == '\'') {
                lex_quoted(0);
            } else {
                lex_punct();
            }
        }
        tokens_.push_back(Token{TokenKind::End, {}, line_});
        return std::move(tokens_);
    }

  private:
    char peek(std::size_t offset) const { return pos_ + offset < src_.size() ? src_[pos_ + offset] : '\0'; }

    [[noreturn]] void fail(int line, std::string_view what) const {
        throw ExtractionError(fmt::format("{}:{}: {}", filename_, line, what));
    }

    void skip_line_comment() {
        while (pos_ < src_.size() && src_[pos_] != '\n') {
            ++pos_;
        }
    }

    void skip_block_comment() {
        const int start = line_;
        pos_ += 2;
        while (pos_ + 1 < src_.size() && !(src_[pos_] == '*' && src_[pos_ + 1] == '/')) {
            if (src_[pos_] == '\n')
                ++line_;
            ++pos_;
        }
        if (pos_ + 1 >= src_.size()) {
            fail(start, "unterminated comment");
        }
        pos_ += 2;
    }

    void lex_directive() {
        const int   start = line_;
        std::string text;
        while (pos_ < src_.size() && src_[pos_] != '\n') {
            if (src_[pos_] == '\\' && peek(1) == '\n') {
                pos_ += 2;
                ++line_;
                text.push_back(' ');
                continue;
            }
            if (src_[pos_] == '/' && peek(1) == '/') {
                skip_line_comment();
                break;
            }
            if (src_[pos_] == '/' && peek(1) == '*') {
                skip_block_comment();
                text.push_back(' ');
                continue;
            }
            text.push_back(src_[pos_++]);
        }
        tokens_.push_back(Token{TokenKind::Directive, std::move(text), start});
    }

    void lex_identifier() {
        const std::size_t begin = pos_;
        while (pos_ < src_.size() && is_ident_char(src_[pos_])) {
            ++pos_;
        }
        tokens_.push_back(Token{TokenKind::Identifier, std::string(src_.substr(begin, pos_ - begin)), line_});
    }

    void lex_number() {
        const std::size_t begin = pos_;
        while (pos_ < src_.size() && (is_ident_char(src_[pos_]) || src_[pos_] == '.' || src_[pos_] == '\'')) {
            ++pos_;
        }
        tokens_.push_back(Token{TokenKind::Number, std::string(src_.substr(begin, pos_ - begin)), line_});
    }

    void lex_quoted(std::size_t prefix) {
        const int         start = line_;
        const std::size_t begin = pos_;
        pos_ += prefix;
        const char quote = src_[pos_++];
        while (pos_ < src_.size() && src_[pos_] != quote) {
            if (src_[pos_] == '\\') {
                ++pos_;
            }
            if (pos_ < src_.size() && src_[pos_] == '\n') {
                fail(start, "unterminated literal");
            }
            ++pos_;
        }
        if (pos_ >= src_.size()) {
            fail(start, "unterminated literal");
        }
        ++pos_;
        tokens_.push_back(Token{quote == '"' ? TokenKind::String : TokenKind::Character, std::string(src_.substr(begin, pos_ - begin)), start});
    }

    void lex_raw_string(std::size_t prefix) {
        const int         start = line_;
        const std::size_t begin = pos_;
        pos_ += prefix + 1;
        const auto open = src_.find('(', pos_);
        if (open == std::string_view::npos) {
            fail(start, "malformed raw string literal");
        }
        const std::string terminator = ")" + std::string(src_.substr(pos_, open - pos_)) + "\"";
        const auto        close      = src_.find(terminator, open + 1);
        if (close == std::string_view::npos) {
            fail(start, "unterminated raw string literal");
        }
        for (std::size_t i = pos_; i < close; ++i) {
            if (src_[i] == '\n')
                ++line_;
        }
        pos_ = close + terminator.size();
        tokens_.push_back(Token{TokenKind::String, std::string(src_.substr(begin, pos_ - begin)), start});
    }

    void lex_punct() {
        static constexpr std::string_view kMulti[] = {"...", "::", "&&", "->"};
        for (const auto op : kMulti) {
            if (src_.substr(pos_, op.size()) == op) {
                tokens_.push_back(Token{TokenKind::Punct, std::string(op), line_});
                pos_ += op.size();
                return;
            }
        }
        tokens_.push_back(Token{TokenKind::Punct, std::string(1, src_[pos_]), line_});
        ++pos_;
    }

    std::string_view   src_;
    std::string_view   filename_;
    std::size_t        pos_  = 0;
    int                line_ = 1;
    std::vector<Token> tokens_;
};

} // namespace

std::vector<Token> lex_source(std::string_view source, std::string_view filename) { return Lexer{source, filename}.run(); }

} // namespace mockforge::codegen
