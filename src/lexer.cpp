#include "lexer.hpp"

#include <cctype>
#include <unordered_map>

#include "GrimError.hpp"

std::string token_type_name(TokenType type) {
    switch (type) {
        case TokenType::LET: return "LET";
        case TokenType::FN: return "FN";
        case TokenType::RETURN: return "RETURN";
        case TokenType::PRINT: return "PRINT";
        case TokenType::INPUT: return "INPUT";
        case TokenType::IF: return "IF";
        case TokenType::ELSE: return "ELSE";
        case TokenType::WHILE: return "WHILE";
        case TokenType::IDENTIFIER: return "IDENTIFIER";
        case TokenType::INTEGER: return "INTEGER";
        case TokenType::FLOAT: return "FLOAT";
        case TokenType::STRING: return "STRING";
        case TokenType::BOOLEAN: return "BOOLEAN";
        case TokenType::SEMICOLON: return "SEMICOLON";
        case TokenType::COMMA: return "COMMA";
        case TokenType::OPENPARENTHESIS: return "OPENPARENTHESIS";
        case TokenType::CLOSEPARENTHESIS: return "CLOSEPARENTHESIS";
        case TokenType::OPENBRACE: return "OPENBRACE";
        case TokenType::CLOSEBRACE: return "CLOSEBRACE";
        case TokenType::ASSIGN: return "ASSIGN";
        case TokenType::EOF_TOKEN: return "EOF";
        case TokenType::PLUS: return "PLUS";
        case TokenType::MINUS: return "MINUS";
        case TokenType::STAR: return "STAR";
        case TokenType::SLASH: return "SLASH";
        case TokenType::PERCENT: return "PERCENT";
        case TokenType::AND: return "AND";
        case TokenType::OR: return "OR";
        case TokenType::NOT: return "NOT";
        case TokenType::GREATERTHAN: return "GREATERTHAN";
        case TokenType::GREATEROREQUALTHAN: return "GREATEROREQUALTHAN";
        case TokenType::LESSTHAN: return "LESSTHAN";
        case TokenType::LESSOREQUALTHAN: return "LESSOREQUALTHAN";
        case TokenType::EQUALITY: return "EQUALITY";
        case TokenType::NOTEQUAL: return "NOTEQUAL";
        case TokenType::UNKNOWN: return "UNKNOWN";
    }
    return "UNKNOWN";
}

// Constructor
Lexer::Lexer(const std::string& source, const std::string& filename, const SourceManager* mgr)
    : src(source), filename(filename), i(0), line(1), col(1), src_mgr(mgr) {}

bool Lexer::eof() const {
    return i >= src.size();
}
char Lexer::peek(size_t offset) const {
    size_t idx = i + offset;
    if (idx >= src.size()) return '\0';
    return src[idx];
}
char Lexer::peek_next() const {
    return peek(1);
}

char Lexer::advance() {
    if (eof()) return '\0';
    char c = src[i++];
    if (c == '\n') {
        line++;
        col = 1;
    } else {
        col++;
    }
    return c;
}

void Lexer::add_token(std::vector<Token>& out, TokenType type, const std::string& value, int tok_line, int tok_col, int tok_length) {
    int len = tok_length >= 0 ? tok_length : static_cast<int>(value.size());
    TokenLocation loc(filename.empty() ? "<input>" : filename, tok_line, tok_col, len, src_mgr);
    Token t{type, value, loc};
    out.push_back(std::move(t));
}

// Emits a fixed-width operator/punctuation token starting at the current position
void Lexer::add_operator(std::vector<Token>& out, TokenType type, int width) {
    add_token(out, type, src.substr(i, static_cast<size_t>(width)), line, col, width);
    for (int k = 0; k < width; ++k) advance();
}

void Lexer::fail(const std::string& message, int tok_line, int tok_col, int tok_length) const {
    TokenLocation loc(filename.empty() ? "<input>" : filename, tok_line, tok_col, tok_length, src_mgr);
    throw GrimError(ErrorKind::SyntaxError, message, loc);
}

void Lexer::skip_line_comment() {
    while (!eof() && peek() != '\n') advance();
}

void Lexer::skip_block_comment(int tok_line, int tok_col) {
    advance();
    advance();
    while (!eof()) {
        if (peek() == '*' && peek_next() == '/') {
            advance();
            advance();
            return;
        }
        advance();
    }
    fail("Unterminated block comment.", tok_line, tok_col, 2);
}

// start_index points to the opening quote position in src
void Lexer::scan_quoted_string(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index) {
    // skip opening quote
    advance();
    std::string val;

    while (true) {
        if (eof()) {
            fail("Unterminated string literal.", tok_line, tok_col);
        }
        char c = peek();
        if (c == '"') {
            advance();
            break;
        }
        if (c == '\n') {
            fail("Unterminated string literal (newline before closing quote).", tok_line, tok_col);
        }

        if (c == '\\') {
            int esc_line = line;
            int esc_col = col;
            advance();  // consume backslash
            char nxt = peek();
            if (nxt == 'n') {
                val.push_back('\n');
            } else if (nxt == 't') {
                val.push_back('\t');
            } else if (nxt == 'r') {
                val.push_back('\r');
            } else if (nxt == '"') {
                val.push_back('"');
            } else if (nxt == '\\') {
                val.push_back('\\');
            } else {
                fail(std::string("Unknown escape sequence '\\") + (nxt ? std::string(1, nxt) : std::string()) + "' in string literal.",
                    esc_line, esc_col, 2);
            }
            advance();
            continue;
        }

        val.push_back(advance());
    }

    int tok_length = static_cast<int>(i - start_index);
    add_token(out, TokenType::STRING, val, tok_line, tok_col, tok_length);
}

// Integer: digits. Float: digits '.' digits, with an optional exponent.
// Range checks happen in the parser when the text is converted.
void Lexer::scan_number(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index) {
    std::string val;
    bool is_float = false;

    while (!eof() && std::isdigit((unsigned char)peek())) {
        val.push_back(advance());
    }

    // decimal point (must be followed by a digit)
    if (peek() == '.' && std::isdigit((unsigned char)peek_next())) {
        is_float = true;
        val.push_back(advance());
        while (!eof() && std::isdigit((unsigned char)peek())) {
            val.push_back(advance());
        }
    }

    // exponent part, only after a fractional part: 1.5e3
    if (is_float && (peek() == 'e' || peek() == 'E')) {
        size_t ahead = 1;
        if (peek(ahead) == '+' || peek(ahead) == '-') ahead++;
        if (std::isdigit((unsigned char)peek(ahead))) {
            val.push_back(advance());
            if (peek() == '+' || peek() == '-') val.push_back(advance());
            while (!eof() && std::isdigit((unsigned char)peek())) {
                val.push_back(advance());
            }
        }
    }

    if (std::isalpha((unsigned char)peek()) || peek() == '_') {
        fail("Invalid numeric literal '" + val + std::string(1, peek()) + "'.", tok_line, tok_col, static_cast<int>(i - start_index) + 1);
    }

    int tok_length = static_cast<int>(i - start_index);
    add_token(out, is_float ? TokenType::FLOAT : TokenType::INTEGER, val, tok_line, tok_col, tok_length);
}

void Lexer::scan_identifier_or_keyword(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index) {
    std::string id;
    while (!eof()) {
        char c = peek();
        if (std::isalnum((unsigned char)c) || c == '_')
            id.push_back(advance());
        else
            break;
    }

    static const std::unordered_map<std::string, TokenType> keywords = {
        {"let", TokenType::LET},
        {"fn", TokenType::FN},
        {"return", TokenType::RETURN},
        {"print", TokenType::PRINT},
        {"input", TokenType::INPUT},

        // control-flow keywords
        {"if", TokenType::IF},
        {"else", TokenType::ELSE},
        {"while", TokenType::WHILE},

        {"true", TokenType::BOOLEAN},
        {"false", TokenType::BOOLEAN},

        // word forms of the logical operators
        {"and", TokenType::AND},
        {"or", TokenType::OR},
        {"not", TokenType::NOT},
    };

    auto it = keywords.find(id);
    int tok_length = static_cast<int>(i - start_index);
    if (it != keywords.end()) {
        add_token(out, it->second, id, tok_line, tok_col, tok_length);
    } else {
        add_token(out, TokenType::IDENTIFIER, id, tok_line, tok_col, tok_length);
    }
}

void Lexer::scan_token(std::vector<Token>& out) {
    char c = peek();
    // whitespace (newlines are insignificant)
    if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
        advance();
        return;
    }

    // comments: '#', '//' and '/* */'
    if (c == '#') {
        skip_line_comment();
        return;
    }
    if (c == '/' && peek_next() == '/') {
        advance();
        advance();
        skip_line_comment();
        return;
    }
    if (c == '/' && peek_next() == '*') {
        skip_block_comment(line, col);
        return;
    }

    // two-character operators
    if (c == '=' && peek_next() == '=') {
        add_operator(out, TokenType::EQUALITY, 2);
        return;
    }
    if (c == '!' && peek_next() == '=') {
        add_operator(out, TokenType::NOTEQUAL, 2);
        return;
    }
    if (c == '<' && peek_next() == '=') {
        add_operator(out, TokenType::LESSOREQUALTHAN, 2);
        return;
    }
    if (c == '>' && peek_next() == '=') {
        add_operator(out, TokenType::GREATEROREQUALTHAN, 2);
        return;
    }
    if (c == '&' && peek_next() == '&') {
        add_operator(out, TokenType::AND, 2);
        return;
    }
    if (c == '|' && peek_next() == '|') {
        add_operator(out, TokenType::OR, 2);
        return;
    }

    switch (c) {
        case ';':
            add_operator(out, TokenType::SEMICOLON, 1);
            return;
        case ',':
            add_operator(out, TokenType::COMMA, 1);
            return;
        case '(':
            add_operator(out, TokenType::OPENPARENTHESIS, 1);
            return;
        case ')':
            add_operator(out, TokenType::CLOSEPARENTHESIS, 1);
            return;
        case '{':
            add_operator(out, TokenType::OPENBRACE, 1);
            return;
        case '}':
            add_operator(out, TokenType::CLOSEBRACE, 1);
            return;
        case '=':
            add_operator(out, TokenType::ASSIGN, 1);
            return;
        case '+':
            add_operator(out, TokenType::PLUS, 1);
            return;
        case '-':
            add_operator(out, TokenType::MINUS, 1);
            return;
        case '*':
            add_operator(out, TokenType::STAR, 1);
            return;
        case '/':
            add_operator(out, TokenType::SLASH, 1);
            return;
        case '%':
            add_operator(out, TokenType::PERCENT, 1);
            return;
        case '>':
            add_operator(out, TokenType::GREATERTHAN, 1);
            return;
        case '<':
            add_operator(out, TokenType::LESSTHAN, 1);
            return;
        case '!':
            add_operator(out, TokenType::NOT, 1);
            return;
        case '"': {
            size_t start_index = i;
            scan_quoted_string(out, line, col, start_index);
            return;
        }
        default:
            break;
    }

    if (std::isdigit((unsigned char)c)) {
        size_t start_index = i;
        scan_number(out, line, col, start_index);
        return;
    }

    // identifier or keyword
    if (std::isalpha((unsigned char)c) || c == '_') {
        size_t start_index = i;
        scan_identifier_or_keyword(out, line, col, start_index);
        return;
    }

    // unknown char: the parser reports it with full context
    {
        std::string s(1, c);
        add_token(out, TokenType::UNKNOWN, s, line, col, 1);
        advance();
        return;
    }
}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> out;

    // skip UTF-8 BOM if present
    if (src.size() >= 3 && (unsigned char)src[0] == 0xEF && (unsigned char)src[1] == 0xBB && (unsigned char)src[2] == 0xBF) {
        i = 3;
        col = 4;
    }

    while (!eof()) scan_token(out);

    // final EOF token
    add_token(out, TokenType::EOF_TOKEN, "", line, col, 0);

    return out;
}
