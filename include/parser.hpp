#pragma once
#include <vector>
#include <memory>
#include <string>
#include "token.hpp"
#include "ast.hpp"

class Parser {
   public:
   Parser(const std::vector < Token>& tokens);
   std::unique_ptr < ProgramNode > parse();

   private:
   std::vector < Token > tokens;
   size_t position = 0;

   Token peek() const;
   Token peek_next(size_t offset = 1) const;

   Token consume();
   bool match(TokenType t);
   Token expect(TokenType t, const std::string& errMsg);

   [[noreturn]] void error_at(const Token& tok, const std::string& message) const;

   // expression parsing (precedence chain)
   std::unique_ptr < ExpressionNode > parse_expression();
   std::unique_ptr < ExpressionNode > parse_logical_or();
   std::unique_ptr < ExpressionNode > parse_logical_and();
   std::unique_ptr < ExpressionNode > parse_equality();
   std::unique_ptr < ExpressionNode > parse_comparison();
   std::unique_ptr < ExpressionNode > parse_additive();
   std::unique_ptr < ExpressionNode > parse_multiplicative();
   std::unique_ptr < ExpressionNode > parse_unary();
   std::unique_ptr < ExpressionNode > parse_primary();
   std::unique_ptr < ExpressionNode > parse_call(const Token& nameTok);

   // statements
   std::unique_ptr < StatementNode > parse_statement();
   std::unique_ptr < StatementNode > parse_variable_declaration();
   std::unique_ptr < StatementNode > parse_assignment();
   std::unique_ptr < StatementNode > parse_print_statement();
   std::unique_ptr < StatementNode > parse_input_statement();
   std::unique_ptr < StatementNode > parse_expression_statement();

   // function parsing
   std::unique_ptr < StatementNode > parse_function_declaration();
   std::unique_ptr < StatementNode > parse_return_statement();

   // control-flow parsing
   std::unique_ptr < StatementNode > parse_if_statement();
   std::unique_ptr < StatementNode > parse_while_statement();

   // `{ statements }`
   std::vector < std::unique_ptr < StatementNode>> parse_block();

   void expect_statement_end(const std::string& what);
};
