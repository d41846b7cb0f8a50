#pragma once

#include "ast.hpp"
#include "token.hpp"
#include "value.hpp"

// What a (binary operator, left kind, right kind) cell of the operator table allows.
enum class OperandRule {
    Reject,           // IncompatibleOperands
    IntegerOperands,  // both Integer, computed in 64-bit integer arithmetic
    FloatOperands,    // numeric, Integer side promoted to Float
    BooleanOperands,  // both Boolean
    SameKind,         // equality between values of the same kind
};

OperandRule binary_operand_rule(BinaryOperator op, ValueKind left, ValueKind right);
bool unary_operand_accepted(UnaryOperator op, ValueKind operand);

// Both throw GrimError (IncompatibleOperands, UnsupportedUnaryOperand,
// DivisionByZero, IntegerOverflow) located at `loc`.
Value apply_binary_operator(BinaryOperator op, const Value& left, const Value& right, const TokenLocation& loc);
Value apply_unary_operator(UnaryOperator op, const Value& operand, const TokenLocation& loc);
