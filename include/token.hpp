#pragma once

#include <string>

#include "SourceManager.hpp"

// Token types produced by the Lexer and consumed by the Parser
enum class TokenType {
    // -----------------------
    // Declarations / statements
    // -----------------------
    LET,
    FN,
    RETURN,
    PRINT,
    INPUT,

    // -----------------------
    // Control-flow
    // -----------------------
    IF,
    ELSE,
    WHILE,

    // -----------------------
    // Literals & identifiers
    // -----------------------
    IDENTIFIER,
    INTEGER,
    FLOAT,
    STRING,
    BOOLEAN,

    // -----------------------
    // Punctuation
    // -----------------------
    SEMICOLON,
    COMMA,
    OPENPARENTHESIS,
    CLOSEPARENTHESIS,
    OPENBRACE,
    CLOSEBRACE,

    // -----------------------
    // Assignment / file end
    // -----------------------
    ASSIGN,
    EOF_TOKEN,

    // -----------------------
    // Arithmetic
    // -----------------------
    PLUS,
    MINUS,
    STAR,
    SLASH,
    PERCENT,

    // -----------------------
    // Logical
    // -----------------------
    AND,
    OR,
    NOT,

    // -----------------------
    // Comparison
    // -----------------------
    GREATERTHAN,
    GREATEROREQUALTHAN,
    LESSTHAN,
    LESSOREQUALTHAN,
    EQUALITY,
    NOTEQUAL,

    UNKNOWN
};

std::string token_type_name(TokenType type);

// Small struct for token location / span in source
struct TokenLocation {
   public:
    std::string filename;  // source filename (or "<input>")
    int line = 1;          // 1-based
    int col = 1;           // 1-based column of token start
    int length = 0;        // token length in characters

    const SourceManager* src_mgr = nullptr;

    TokenLocation() = default;
    TokenLocation(const std::string& fn, int ln, int c, int len = 0, const SourceManager* mgr = nullptr)
        : filename(fn), line(ln), col(c), length(len), src_mgr(mgr) {}

    std::string to_string() const {
        return filename + ":" + std::to_string(line) + ":" + std::to_string(col);
    }
    std::string get_line_trace() const;
};

// Represents a single token with location
struct Token {
    TokenType type = TokenType::UNKNOWN;
    std::string value;  // raw text / normalized lexeme
    TokenLocation loc;  // file:line:col and length/span

    Token() = default;
    Token(TokenType t, const std::string& v, const TokenLocation& l)
        : type(t), value(v), loc(l) {}

    std::string debug_string() const {
        return loc.to_string() + " " + token_type_name(type) + " [" + value + "]";
    }
};

inline std::string TokenLocation::get_line_trace() const {
    if (!src_mgr) {
        return "(source context unavailable)";
    }
    return src_mgr->format_error_context(line, col, length);
}
