#include <gtest/gtest.h>

#include "GrimError.hpp"
#include "lexer.hpp"
#include "token.hpp"

// Helper to get token types from source
static std::vector<TokenType> getTokenTypes(const std::string& source) {
    Lexer lexer(source, "<test>");
    auto tokens = lexer.tokenize();
    std::vector<TokenType> types;
    for (const auto& tok : tokens) {
        types.push_back(tok.type);
    }
    return types;
}

// Basic tokenization
TEST(LexerTest, TokenizesIntegers) {
    Lexer lexer("123", "<test>");
    auto tokens = lexer.tokenize();

    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].type, TokenType::INTEGER);
    EXPECT_EQ(tokens[0].value, "123");
    EXPECT_EQ(tokens[1].type, TokenType::EOF_TOKEN);
}

TEST(LexerTest, TokenizesFloats) {
    Lexer lexer("3.14 2.5e3", "<test>");
    auto tokens = lexer.tokenize();

    ASSERT_GE(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].type, TokenType::FLOAT);
    EXPECT_EQ(tokens[0].value, "3.14");
    EXPECT_EQ(tokens[1].type, TokenType::FLOAT);
    EXPECT_EQ(tokens[1].value, "2.5e3");
}

TEST(LexerTest, DotWithoutFractionIsNotAFloat) {
    // "7." is an integer followed by an unknown '.'
    auto types = getTokenTypes("7.");
    ASSERT_GE(types.size(), 2u);
    EXPECT_EQ(types[0], TokenType::INTEGER);
    EXPECT_EQ(types[1], TokenType::UNKNOWN);
}

TEST(LexerTest, TokenizesKeywords) {
    auto types = getTokenTypes("let fn return print input if else while");
    std::vector<TokenType> expected = {
        TokenType::LET, TokenType::FN, TokenType::RETURN, TokenType::PRINT,
        TokenType::INPUT, TokenType::IF, TokenType::ELSE, TokenType::WHILE,
        TokenType::EOF_TOKEN};
    EXPECT_EQ(types, expected);
}

TEST(LexerTest, TokenizesBooleansAndWordOperators) {
    Lexer lexer("true false and or not", "<test>");
    auto tokens = lexer.tokenize();

    ASSERT_EQ(tokens.size(), 6u);
    EXPECT_EQ(tokens[0].type, TokenType::BOOLEAN);
    EXPECT_EQ(tokens[0].value, "true");
    EXPECT_EQ(tokens[1].type, TokenType::BOOLEAN);
    EXPECT_EQ(tokens[1].value, "false");
    EXPECT_EQ(tokens[2].type, TokenType::AND);
    EXPECT_EQ(tokens[3].type, TokenType::OR);
    EXPECT_EQ(tokens[4].type, TokenType::NOT);
}

TEST(LexerTest, TokenizesIdentifiers) {
    Lexer lexer("variable _tmp x2", "<test>");
    auto tokens = lexer.tokenize();

    ASSERT_EQ(tokens.size(), 4u);
    for (int i = 0; i < 3; ++i) EXPECT_EQ(tokens[i].type, TokenType::IDENTIFIER);
    EXPECT_EQ(tokens[0].value, "variable");
    EXPECT_EQ(tokens[1].value, "_tmp");
    EXPECT_EQ(tokens[2].value, "x2");
}

TEST(LexerTest, TokenizesOperators) {
    auto types = getTokenTypes("+ - * / % == != < <= > >= && || ! =");
    std::vector<TokenType> expected = {
        TokenType::PLUS, TokenType::MINUS, TokenType::STAR, TokenType::SLASH,
        TokenType::PERCENT, TokenType::EQUALITY, TokenType::NOTEQUAL,
        TokenType::LESSTHAN, TokenType::LESSOREQUALTHAN, TokenType::GREATERTHAN,
        TokenType::GREATEROREQUALTHAN, TokenType::AND, TokenType::OR, TokenType::NOT,
        TokenType::ASSIGN, TokenType::EOF_TOKEN};
    EXPECT_EQ(types, expected);
}

TEST(LexerTest, TokenizesPunctuation) {
    auto types = getTokenTypes("( ) { } , ;");
    std::vector<TokenType> expected = {
        TokenType::OPENPARENTHESIS, TokenType::CLOSEPARENTHESIS,
        TokenType::OPENBRACE, TokenType::CLOSEBRACE,
        TokenType::COMMA, TokenType::SEMICOLON, TokenType::EOF_TOKEN};
    EXPECT_EQ(types, expected);
}

TEST(LexerTest, TokenizesStringsWithEscapes) {
    Lexer lexer(R"("a\tb\n\"q\"\\")", "<test>");
    auto tokens = lexer.tokenize();

    ASSERT_GE(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].type, TokenType::STRING);
    EXPECT_EQ(tokens[0].value, "a\tb\n\"q\"\\");
}

TEST(LexerTest, SkipsAllCommentStyles) {
    auto types = getTokenTypes("// line\n# hash\n/* block\n comment */ let");
    std::vector<TokenType> expected = {TokenType::LET, TokenType::EOF_TOKEN};
    EXPECT_EQ(types, expected);
}

TEST(LexerTest, TracksLineAndColumn) {
    Lexer lexer("let x = 1;\n  print x;", "<test>");
    auto tokens = lexer.tokenize();

    ASSERT_GE(tokens.size(), 7u);
    EXPECT_EQ(tokens[0].loc.line, 1);
    EXPECT_EQ(tokens[0].loc.col, 1);
    EXPECT_EQ(tokens[0].loc.length, 3);
    EXPECT_EQ(tokens[5].type, TokenType::PRINT);
    EXPECT_EQ(tokens[5].loc.line, 2);
    EXPECT_EQ(tokens[5].loc.col, 3);
    EXPECT_EQ(tokens[5].loc.filename, "<test>");
}

TEST(LexerTest, UnknownCharactersBecomeUnknownTokens) {
    auto types = getTokenTypes("a & b");
    ASSERT_EQ(types.size(), 4u);
    EXPECT_EQ(types[1], TokenType::UNKNOWN);
}

TEST(LexerErrorTest, UnterminatedStringIsSyntaxError) {
    Lexer lexer("print \"oops;", "<test>");
    try {
        lexer.tokenize();
        FAIL() << "expected a SyntaxError";
    } catch (const GrimError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::SyntaxError);
        EXPECT_EQ(e.location().line, 1);
        EXPECT_EQ(e.location().col, 7);
    }
}

TEST(LexerErrorTest, UnknownEscapeIsSyntaxError) {
    Lexer lexer(R"("bad \q")", "<test>");
    EXPECT_THROW(lexer.tokenize(), GrimError);
}

TEST(LexerErrorTest, UnterminatedBlockCommentIsSyntaxError) {
    Lexer lexer("let x = 1; /* never closed", "<test>");
    EXPECT_THROW(lexer.tokenize(), GrimError);
}

TEST(LexerErrorTest, NumberRunningIntoLettersIsSyntaxError) {
    Lexer lexer("let x = 12abc;", "<test>");
    EXPECT_THROW(lexer.tokenize(), GrimError);
}

TEST(LexerErrorTest, DiagnosticQuotesSourceLine) {
    std::string src = "let s = \"abc;\n";
    SourceManager mgr("<test>", src);
    Lexer lexer(src, "<test>", &mgr);
    try {
        lexer.tokenize();
        FAIL() << "expected a SyntaxError";
    } catch (const GrimError& e) {
        std::string what = e.what();
        EXPECT_NE(what.find("SyntaxError at <test>:1:9"), std::string::npos) << what;
        EXPECT_NE(what.find(" * 1 | let s = \"abc;"), std::string::npos) << what;
        EXPECT_NE(what.find("^"), std::string::npos) << what;
    }
}

TEST(LexerTest, DebugStringNamesPositionKindAndText) {
    Lexer lexer("let x", "<test>");
    auto tokens = lexer.tokenize();

    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].debug_string(), "<test>:1:1 LET [let]");
    EXPECT_EQ(tokens[1].debug_string(), "<test>:1:5 IDENTIFIER [x]");
    EXPECT_EQ(token_type_name(tokens[2].type), "EOF");
}
