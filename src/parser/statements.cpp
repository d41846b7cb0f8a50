// src/parser/statements.cpp
#include "parser.hpp"

// ---------- statements ----------
std::unique_ptr < StatementNode > Parser::parse_statement() {
  Token t = peek();

  switch (t.type) {
    case TokenType::LET:
      return parse_variable_declaration();
    case TokenType::FN:
      return parse_function_declaration();
    case TokenType::IF:
      return parse_if_statement();
    case TokenType::WHILE:
      return parse_while_statement();
    case TokenType::RETURN:
      return parse_return_statement();
    case TokenType::PRINT:
      return parse_print_statement();
    case TokenType::INPUT:
      return parse_input_statement();
    case TokenType::ELSE:
      error_at(t, "'else' without a matching 'if'");
    case TokenType::EOF_TOKEN:
      error_at(t, "Expected a statement");
    default:
      break;
  }

  if (t.type == TokenType::IDENTIFIER && peek_next().type == TokenType::ASSIGN) {
    return parse_assignment();
  }

  return parse_expression_statement();
}

// let <name> = <expr>;
std::unique_ptr < StatementNode > Parser::parse_variable_declaration() {
  consume();  // 'let'
  Token idTok = expect(TokenType::IDENTIFIER, "Expected identifier after 'let'");
  expect(TokenType::ASSIGN, "Expected '=' after variable name '" + idTok.value + "'");

  auto node = std::make_unique < VariableDeclarationNode > ();
  node->token = idTok;
  node->identifier = idTok.value;
  node->value = parse_expression();

  expect_statement_end("variable declaration");
  return node;
}

// <name> = <expr>;
std::unique_ptr < StatementNode > Parser::parse_assignment() {
  Token idTok = consume();
  consume();  // '='

  auto node = std::make_unique < AssignmentNode > ();
  node->token = idTok;
  node->name = idTok.value;
  node->value = parse_expression();

  expect_statement_end("assignment");
  return node;
}

// print <expr>;   (print(<expr>); parses the same way through the parenthesized primary)
std::unique_ptr < StatementNode > Parser::parse_print_statement() {
  Token kwTok = consume();

  auto node = std::make_unique < PrintStatementNode > ();
  node->token = kwTok;
  node->expression = parse_expression();

  expect_statement_end("print statement");
  return node;
}

// input <name>;  or  input(<name>);
std::unique_ptr < StatementNode > Parser::parse_input_statement() {
  Token kwTok = consume();

  bool parenthesized = match(TokenType::OPENPARENTHESIS);
  Token idTok = expect(TokenType::IDENTIFIER, "Expected variable name after 'input'");
  if (parenthesized) {
    expect(TokenType::CLOSEPARENTHESIS, "Expected ')' after input target");
  }

  auto node = std::make_unique < InputStatementNode > ();
  node->token = kwTok;
  node->name = idTok.value;

  expect_statement_end("input statement");
  return node;
}

std::unique_ptr < StatementNode > Parser::parse_expression_statement() {
  Token first = peek();

  auto node = std::make_unique < ExpressionStatementNode > ();
  node->token = first;
  node->expression = parse_expression();

  expect_statement_end("expression");
  return node;
}

// fn <name>(<params>) { <body> }
std::unique_ptr < StatementNode > Parser::parse_function_declaration() {
  consume();  // 'fn'
  Token nameTok = expect(TokenType::IDENTIFIER, "Expected function name after 'fn'");

  auto funcNode = std::make_unique < FunctionDeclarationNode > ();
  funcNode->token = nameTok;
  funcNode->name = nameTok.value;

  expect(TokenType::OPENPARENTHESIS, "Expected '(' after function name '" + nameTok.value + "'");

  if (peek().type != TokenType::CLOSEPARENTHESIS) {
    do {
      Token pTok = expect(TokenType::IDENTIFIER, "Expected parameter name");
      auto param = std::make_unique < ParameterNode > ();
      param->token = pTok;
      param->name = pTok.value;
      funcNode->parameters.push_back(std::move(param));
    } while (match(TokenType::COMMA));
  }

  expect(TokenType::CLOSEPARENTHESIS, "Expected ')' after parameter list");

  funcNode->body = parse_block();
  return funcNode;
}

std::unique_ptr < StatementNode > Parser::parse_return_statement() {
  Token kwTok = consume();

  auto retNode = std::make_unique < ReturnStatementNode > ();
  retNode->token = kwTok;

  // `return;` yields the default Integer(0)
  if (peek().type != TokenType::SEMICOLON) {
    retNode->value = parse_expression();
  }

  expect_statement_end("return statement");
  return retNode;
}
