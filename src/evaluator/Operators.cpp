// src/evaluator/Operators.cpp
#include "operators.hpp"

#include <cstdint>
#include <limits>

#include "GrimError.hpp"

namespace {
    constexpr OperandRule R = OperandRule::Reject;
    constexpr OperandRule I = OperandRule::IntegerOperands;
    constexpr OperandRule F = OperandRule::FloatOperands;
    constexpr OperandRule B = OperandRule::BooleanOperands;
    constexpr OperandRule S = OperandRule::SameKind;

    using Grid = OperandRule[kValueKindCount][kValueKindCount];

    // Rows: left operand, columns: right operand, both in Integer, Float, Boolean, String order.
    constexpr Grid kNumeric = {
        {I, F, R, R},
        {F, F, R, R},
        {R, R, R, R},
        {R, R, R, R},
    };
    constexpr Grid kIntegerOnly = {
        {I, R, R, R},
        {R, R, R, R},
        {R, R, R, R},
        {R, R, R, R},
    };
    constexpr Grid kBoolean = {
        {R, R, R, R},
        {R, R, R, R},
        {R, R, B, R},
        {R, R, R, R},
    };
    constexpr Grid kEquality = {
        {S, R, R, R},
        {R, S, R, R},
        {R, R, S, R},
        {R, R, R, S},
    };

    // Indexed by BinaryOperator
    constexpr const Grid* kOperatorTable[kBinaryOperatorCount] = {
        &kNumeric,      // +
        &kNumeric,      // -
        &kNumeric,      // *
        &kNumeric,      // /
        &kIntegerOnly,  // %
        &kBoolean,      // &&
        &kBoolean,      // ||
        &kNumeric,      // <
        &kNumeric,      // >
        &kNumeric,      // <=
        &kNumeric,      // >=
        &kEquality,     // ==
        &kEquality,     // !=
    };

    double as_float(const Value& v) {
        if (std::holds_alternative<int64_t>(v)) return static_cast<double>(std::get<int64_t>(v));
        return std::get<double>(v);
    }

    [[noreturn]] void overflow(BinaryOperator op, int64_t a, int64_t b, const TokenLocation& loc) {
        throw GrimError(ErrorKind::IntegerOverflow,
            "Integer overflow in " + std::to_string(a) + " " + binary_operator_symbol(op) + " " + std::to_string(b) + ".",
            loc, {Value{a}, Value{b}});
    }

    Value integer_arithmetic(BinaryOperator op, int64_t a, int64_t b, const TokenLocation& loc) {
        int64_t r = 0;
        switch (op) {
            case BinaryOperator::Add:
                if (__builtin_add_overflow(a, b, &r)) overflow(op, a, b, loc);
                return r;
            case BinaryOperator::Sub:
                if (__builtin_sub_overflow(a, b, &r)) overflow(op, a, b, loc);
                return r;
            case BinaryOperator::Mul:
                if (__builtin_mul_overflow(a, b, &r)) overflow(op, a, b, loc);
                return r;
            case BinaryOperator::Div:
            case BinaryOperator::Mod:
                if (b == 0) {
                    throw GrimError(ErrorKind::DivisionByZero,
                        std::string("Integer ") + (op == BinaryOperator::Div ? "division" : "modulo") + " by zero.",
                        loc, {Value{a}, Value{b}});
                }
                if (b == -1) {
                    if (op == BinaryOperator::Mod) return int64_t{0};
                    if (a == std::numeric_limits<int64_t>::min()) overflow(op, a, b, loc);
                    return -a;
                }
                if (op == BinaryOperator::Mod) return a % b;
                // exact division stays Integer, otherwise the true quotient
                if (a % b == 0) return a / b;
                return static_cast<double>(a) / static_cast<double>(b);
            case BinaryOperator::Less: return a < b;
            case BinaryOperator::Greater: return a > b;
            case BinaryOperator::LessEq: return a <= b;
            case BinaryOperator::GreaterEq: return a >= b;
            default: break;
        }
        throw GrimError(ErrorKind::InternalError,
            std::string("Operator '") + binary_operator_symbol(op) + "' has no integer rule.", loc);
    }

    Value float_arithmetic(BinaryOperator op, double a, double b, const TokenLocation& loc) {
        switch (op) {
            case BinaryOperator::Add: return a + b;
            case BinaryOperator::Sub: return a - b;
            case BinaryOperator::Mul: return a * b;
            case BinaryOperator::Div: return a / b;
            case BinaryOperator::Less: return a < b;
            case BinaryOperator::Greater: return a > b;
            case BinaryOperator::LessEq: return a <= b;
            case BinaryOperator::GreaterEq: return a >= b;
            default: break;
        }
        throw GrimError(ErrorKind::InternalError,
            std::string("Operator '") + binary_operator_symbol(op) + "' has no float rule.", loc);
    }
}  // namespace

OperandRule binary_operand_rule(BinaryOperator op, ValueKind left, ValueKind right) {
    const Grid& grid = *kOperatorTable[static_cast<int>(op)];
    return grid[static_cast<int>(left)][static_cast<int>(right)];
}

bool unary_operand_accepted(UnaryOperator op, ValueKind operand) {
    if (op == UnaryOperator::Minus) return operand == ValueKind::Integer || operand == ValueKind::Float;
    return operand == ValueKind::Boolean;
}

Value apply_binary_operator(BinaryOperator op, const Value& left, const Value& right, const TokenLocation& loc) {
    switch (binary_operand_rule(op, kind_of(left), kind_of(right))) {
        case OperandRule::IntegerOperands:
            return integer_arithmetic(op, std::get<int64_t>(left), std::get<int64_t>(right), loc);

        case OperandRule::FloatOperands:
            return float_arithmetic(op, as_float(left), as_float(right), loc);

        case OperandRule::BooleanOperands: {
            bool a = std::get<bool>(left);
            bool b = std::get<bool>(right);
            return op == BinaryOperator::And ? (a && b) : (a || b);
        }

        case OperandRule::SameKind:
            return op == BinaryOperator::CompareEq ? (left == right) : (left != right);

        case OperandRule::Reject:
            break;
    }
    throw GrimError(ErrorKind::IncompatibleOperands,
        std::string("Operator '") + binary_operator_symbol(op) + "' cannot be applied to " +
            value_debug_string(left) + " and " + value_debug_string(right) + ".",
        loc, {left, right});
}

Value apply_unary_operator(UnaryOperator op, const Value& operand, const TokenLocation& loc) {
    if (!unary_operand_accepted(op, kind_of(operand))) {
        throw GrimError(ErrorKind::UnsupportedUnaryOperand,
            std::string("Unary '") + unary_operator_symbol(op) + "' cannot be applied to " + value_debug_string(operand) + ".",
            loc, {operand});
    }
    if (op == UnaryOperator::Not) return !std::get<bool>(operand);
    if (std::holds_alternative<double>(operand)) return -std::get<double>(operand);

    int64_t v = std::get<int64_t>(operand);
    if (v == std::numeric_limits<int64_t>::min()) {
        throw GrimError(ErrorKind::IntegerOverflow, "Integer overflow in -(" + std::to_string(v) + ").", loc, {operand});
    }
    return -v;
}
