// src/parser/control_flow.cpp
#include "parser.hpp"

// if <cond> { ... } [else if <cond> { ... }]* [else { ... }]
std::unique_ptr < StatementNode > Parser::parse_if_statement() {
   consume(); // consume 'if'
   Token ifTok = tokens[position - 1];

   // parse condition expression; `if (x > 3)` is just a parenthesized expression
   auto cond = parse_expression();

   auto ifNode = std::make_unique < IfStatementNode > ();
   ifNode->token = ifTok;
   ifNode->condition = std::move(cond);
   ifNode->then_body = parse_block();

   // optional else
   if (peek().type == TokenType::ELSE) {
      consume();
      ifNode->has_else = true;

      // "else if ..." parses as a nested if, the single statement of the else body
      if (peek().type == TokenType::IF) {
         auto nestedIf = parse_if_statement(); // consumes the 'if' and builds the nested If
         ifNode->else_body.clear();
         ifNode->else_body.push_back(std::move(nestedIf));
      } else {
         ifNode->else_body = parse_block();
      }
   }
   return ifNode;
}

// while <cond> { ... }
std::unique_ptr < StatementNode > Parser::parse_while_statement() {
   consume(); // consume 'while'
   Token whileTok = tokens[position - 1];

   auto node = std::make_unique < WhileStatementNode > ();
   node->token = whileTok;
   node->condition = parse_expression();
   node->body = parse_block();
   return node;
}
