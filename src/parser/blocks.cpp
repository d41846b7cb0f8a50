// src/parser/blocks.cpp
#include "parser.hpp"

// ---------- helper: parse block ----------
std::vector<std::unique_ptr<StatementNode>> Parser::parse_block() {
    std::vector<std::unique_ptr<StatementNode>> body;

    expect(TokenType::OPENBRACE, "Expected '{' to begin block");
    // loop until closing brace
    while (peek().type != TokenType::CLOSEBRACE && peek().type != TokenType::EOF_TOKEN) {
        // skip empty statements
        if (peek().type == TokenType::SEMICOLON) {
            consume();
            continue;
        }
        body.push_back(parse_statement());
    }
    expect(TokenType::CLOSEBRACE, "Expected '}' to close block");

    return body;
}
