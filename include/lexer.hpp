#pragma once

#include <string>
#include <vector>

#include "SourceManager.hpp"
#include "token.hpp"

class Lexer {
   public:
    Lexer(const std::string& source, const std::string& filename = "", const SourceManager* mgr = nullptr);
    std::vector<Token> tokenize();

   private:
    const std::string src;
    const std::string filename;
    size_t i = 0;
    int line = 1;
    int col = 1;

    const SourceManager* src_mgr = nullptr;

    // helpers
    bool eof() const;
    char peek(size_t offset = 0) const;
    char peek_next() const;
    char advance();

    // Add token: optional explicit length (if -1, length is value.size()).
    void add_token(std::vector<Token>& out, TokenType type, const std::string& value, int tok_line, int tok_col, int tok_length = -1);
    void add_operator(std::vector<Token>& out, TokenType type, int width);

    void scan_token(std::vector<Token>& out);
    void scan_number(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index);
    void scan_identifier_or_keyword(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index);

    // double-quoted string with \n \t \r \\ \" escapes
    void scan_quoted_string(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index);

    void skip_line_comment();
    void skip_block_comment(int tok_line, int tok_col);

    [[noreturn]] void fail(const std::string& message, int tok_line, int tok_col, int tok_length = 1) const;
};
