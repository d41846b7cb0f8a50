// src/parser/expressions.cpp
#include <charconv>
#include <cstdlib>

#include "GrimError.hpp"
#include "parser.hpp"

namespace {
   BinaryOperator binary_operator_for(TokenType t) {
      switch (t) {
         case TokenType::PLUS: return BinaryOperator::Add;
         case TokenType::MINUS: return BinaryOperator::Sub;
         case TokenType::STAR: return BinaryOperator::Mul;
         case TokenType::SLASH: return BinaryOperator::Div;
         case TokenType::PERCENT: return BinaryOperator::Mod;
         case TokenType::AND: return BinaryOperator::And;
         case TokenType::OR: return BinaryOperator::Or;
         case TokenType::LESSTHAN: return BinaryOperator::Less;
         case TokenType::GREATERTHAN: return BinaryOperator::Greater;
         case TokenType::LESSOREQUALTHAN: return BinaryOperator::LessEq;
         case TokenType::GREATEROREQUALTHAN: return BinaryOperator::GreaterEq;
         case TokenType::EQUALITY: return BinaryOperator::CompareEq;
         case TokenType::NOTEQUAL: return BinaryOperator::CompareNeq;
         default: break;
      }
      return BinaryOperator::Add;
   }

   std::unique_ptr < ExpressionNode > make_binary(const Token& op,
      std::unique_ptr < ExpressionNode > left,
      std::unique_ptr < ExpressionNode > right) {
      auto node = std::make_unique < BinaryExpressionNode > ();
      node->op = binary_operator_for(op.type);
      node->left = std::move(left);
      node->right = std::move(right);
      node->token = op;
      return node;
   }
}  // namespace

std::unique_ptr < ExpressionNode > Parser::parse_expression() {
   return parse_logical_or();
}

std::unique_ptr < ExpressionNode > Parser::parse_logical_or() {
   auto left = parse_logical_and();
   while (peek().type == TokenType::OR) {
      Token op = consume();
      auto right = parse_logical_and();
      left = make_binary(op, std::move(left), std::move(right));
   }
   return left;
}

std::unique_ptr < ExpressionNode > Parser::parse_logical_and() {
   auto left = parse_equality();
   while (peek().type == TokenType::AND) {
      Token op = consume();
      auto right = parse_equality();
      left = make_binary(op, std::move(left), std::move(right));
   }
   return left;
}

std::unique_ptr < ExpressionNode > Parser::parse_equality() {
   auto left = parse_comparison();
   while (peek().type == TokenType::EQUALITY ||
          peek().type == TokenType::NOTEQUAL) {
      Token op = consume();
      auto right = parse_comparison();
      left = make_binary(op, std::move(left), std::move(right));
   }
   return left;
}

std::unique_ptr < ExpressionNode > Parser::parse_comparison() {
   auto left = parse_additive();
   while (peek().type == TokenType::GREATERTHAN ||
          peek().type == TokenType::GREATEROREQUALTHAN ||
          peek().type == TokenType::LESSTHAN ||
          peek().type == TokenType::LESSOREQUALTHAN) {
      Token op = consume();
      auto right = parse_additive();
      left = make_binary(op, std::move(left), std::move(right));
   }
   return left;
}

std::unique_ptr < ExpressionNode > Parser::parse_additive() {
   auto left = parse_multiplicative();
   while (peek().type == TokenType::PLUS || peek().type == TokenType::MINUS) {
      Token op = consume();
      auto right = parse_multiplicative();
      left = make_binary(op, std::move(left), std::move(right));
   }
   return left;
}

std::unique_ptr < ExpressionNode > Parser::parse_multiplicative() {
   auto left = parse_unary();
   while (peek().type == TokenType::STAR ||
          peek().type == TokenType::SLASH ||
          peek().type == TokenType::PERCENT) {
      Token op = consume();
      auto right = parse_unary();
      left = make_binary(op, std::move(left), std::move(right));
   }
   return left;
}

std::unique_ptr < ExpressionNode > Parser::parse_unary() {
   if (peek().type == TokenType::NOT || peek().type == TokenType::MINUS) {
      Token op = consume();
      auto operand = parse_unary();
      auto node = std::make_unique < UnaryExpressionNode > ();
      node->op = op.type == TokenType::NOT ? UnaryOperator::Not : UnaryOperator::Minus;
      node->operand = std::move(operand);
      node->token = op;
      return node;
   }
   return parse_primary();
}

// name '(' args ')' ; the name token is already consumed
std::unique_ptr < ExpressionNode > Parser::parse_call(const Token& nameTok) {
   expect(TokenType::OPENPARENTHESIS, "Expected '(' to start argument list");

   auto call = std::make_unique < CallExpressionNode > ();
   call->token = nameTok;
   call->callee = nameTok.value;

   if (peek().type != TokenType::CLOSEPARENTHESIS) {
      do {
         call->arguments.push_back(parse_expression());
      } while (match(TokenType::COMMA));
   }

   expect(TokenType::CLOSEPARENTHESIS, "Expected ')' after call arguments");
   return call;
}

std::unique_ptr < ExpressionNode > Parser::parse_primary() {
   Token t = peek();

   if (t.type == TokenType::INTEGER) {
      Token numTok = consume();
      int64_t value = 0;
      const char* first = numTok.value.data();
      const char* last = first + numTok.value.size();
      auto [ptr, ec] = std::from_chars(first, last, value);
      if (ec == std::errc::result_out_of_range) {
         throw GrimError(ErrorKind::SyntaxError,
            "Integer literal '" + numTok.value + "' does not fit in 64 bits.", numTok.loc);
      }
      if (ec != std::errc() || ptr != last) {
         throw GrimError(ErrorKind::SyntaxError, "Invalid integer literal '" + numTok.value + "'.", numTok.loc);
      }
      auto n = std::make_unique < IntegerLiteralNode > ();
      n->value = value;
      n->token = numTok;
      return n;
   }

   if (t.type == TokenType::FLOAT) {
      Token numTok = consume();
      char* end = nullptr;
      double value = std::strtod(numTok.value.c_str(), &end);
      if (end != numTok.value.c_str() + numTok.value.size()) {
         throw GrimError(ErrorKind::SyntaxError, "Invalid float literal '" + numTok.value + "'.", numTok.loc);
      }
      auto n = std::make_unique < FloatLiteralNode > ();
      n->value = value;
      n->token = numTok;
      return n;
   }

   if (t.type == TokenType::STRING) {
      Token s = consume();
      auto node = std::make_unique < StringLiteralNode > ();
      node->value = s.value;
      node->token = s;
      return node;
   }

   if (t.type == TokenType::BOOLEAN) {
      Token b = consume();
      auto node = std::make_unique < BooleanLiteralNode > ();
      node->value = (b.value == "true");
      node->token = b;
      return node;
   }

   if (t.type == TokenType::IDENTIFIER) {
      Token id = consume();
      if (peek().type == TokenType::OPENPARENTHESIS) {
         return parse_call(id);
      }
      auto node = std::make_unique < IdentifierNode > ();
      node->name = id.value;
      node->token = id;
      return node;
   }

   if (t.type == TokenType::OPENPARENTHESIS) {
      consume();
      auto inner = parse_expression();
      expect(TokenType::CLOSEPARENTHESIS, "Expected ')' after expression");
      return inner;
   }

   error_at(t, "Expected an expression");
}
