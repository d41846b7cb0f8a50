#include "GrimError.hpp"
#include "evaluator.hpp"
#include "operators.hpp"

Value Evaluator::evaluate_expression(ExpressionNode* expr, EnvPtr env) {
    if (!expr) {
        throw GrimError(ErrorKind::InternalError, "Missing expression node.", TokenLocation());
    }

    if (auto n = dynamic_cast<IntegerLiteralNode*>(expr)) return Value{
        n->value};
    if (auto f = dynamic_cast<FloatLiteralNode*>(expr)) return Value{
        f->value};
    if (auto b = dynamic_cast<BooleanLiteralNode*>(expr)) return Value{
        b->value};
    if (auto s = dynamic_cast<StringLiteralNode*>(expr)) return Value{
        s->value};

    if (auto id = dynamic_cast<IdentifierNode*>(expr)) {
        return env->lookup(id->name, id->token.loc);
    }

    if (auto call = dynamic_cast<CallExpressionNode*>(expr)) {
        return evaluate_call(call, env);
    }

    if (auto u = dynamic_cast<UnaryExpressionNode*>(expr)) {
        Value operand = evaluate_expression(u->operand.get(), env);
        return apply_unary_operator(u->op, operand, u->token.loc);
    }

    if (auto bin = dynamic_cast<BinaryExpressionNode*>(expr)) {
        // Both sides are always evaluated, && and || included.
        Value left = evaluate_expression(bin->left.get(), env);
        Value right = evaluate_expression(bin->right.get(), env);
        return apply_binary_operator(bin->op, left, right, bin->token.loc);
    }

    throw GrimError(ErrorKind::InternalError,
        "Unhandled expression node encountered in evaluator.",
        expr->token.loc);
}
