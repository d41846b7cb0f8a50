// src/parser/parser.cpp
#include "parser.hpp"

#include "GrimError.hpp"

Parser::Parser(const std::vector<Token>& tokens) : tokens(tokens) {}

// Return current token or EOF token
Token Parser::peek() const {
    if (position < tokens.size()) return tokens[position];
    if (!tokens.empty()) return tokens.back();
    return Token{
        TokenType::EOF_TOKEN,
        "",
        TokenLocation("<eof>", 0, 0, 0)};
}

Token Parser::peek_next(size_t offset) const {
    if (position + offset < tokens.size()) {
        return tokens[position + offset];
    }
    if (!tokens.empty()) return tokens.back();
    return Token{
        TokenType::EOF_TOKEN,
        "",
        TokenLocation("<eof>", 0, 0, 0)};
}

// Consume and return the next token; EOF is sticky
Token Parser::consume() {
    Token t = peek();
    if (position < tokens.size() && t.type != TokenType::EOF_TOKEN) position++;
    return t;
}

bool Parser::match(TokenType t) {
    if (peek().type == t) {
        consume();
        return true;
    }
    return false;
}

Token Parser::expect(TokenType t, const std::string& errMsg) {
    if (peek().type != t) {
        error_at(peek(), errMsg);
    }
    return consume();
}

void Parser::error_at(const Token& tok, const std::string& message) const {
    std::string found;
    if (tok.type == TokenType::EOF_TOKEN) {
        found = "end of input";
    } else if (tok.type == TokenType::UNKNOWN) {
        found = "unexpected character '" + tok.value + "'";
    } else {
        found = "'" + tok.value + "'";
    }
    throw GrimError(ErrorKind::SyntaxError, message + " (found " + found + ").", tok.loc);
}

void Parser::expect_statement_end(const std::string& what) {
    expect(TokenType::SEMICOLON, "Expected ';' after " + what);
}

std::unique_ptr<ProgramNode> Parser::parse() {
    auto program = std::make_unique<ProgramNode>();
    if (!tokens.empty()) program->token = tokens.front();
    while (peek().type != TokenType::EOF_TOKEN) {
        // skip stray separators at top-level
        if (peek().type == TokenType::SEMICOLON) {
            consume();
            continue;
        }
        if (peek().type == TokenType::CLOSEBRACE) {
            error_at(peek(), "Unmatched '}'");
        }
        program->body.push_back(parse_statement());
    }
    return program;
}
