#include <string>

#include "GrimError.hpp"
#include "evaluator.hpp"

// ----------------- Statement evaluation -----------------

// Runs a statement list until it finishes or a `return` fires.
void Evaluator::execute_block(const std::vector<std::unique_ptr<StatementNode>>& body, EnvPtr env, Value* return_value, bool* did_return) {
    for (auto& s : body) {
        evaluate_statement(s.get(), env, return_value, did_return);
        if (did_return && *did_return) return;
    }
}

// Errors leave here tagged with the statement they passed through.
void Evaluator::evaluate_statement(StatementNode* stmt, EnvPtr env, Value* return_value, bool* did_return) {
    if (!stmt) return;
    try {
        execute_statement(stmt, env, return_value, did_return);
    } catch (GrimError& e) {
        e.add_context(describe_statement(stmt), stmt->token.loc);
        throw;
    }
}

bool Evaluator::evaluate_condition(ExpressionNode* expr, EnvPtr env, const char* statement) {
    Value cond = evaluate_expression(expr, env);
    if (!std::holds_alternative<bool>(cond)) {
        throw GrimError(ErrorKind::NonBooleanCondition,
            std::string("Condition of ") + statement + " must be a Boolean, got " + value_debug_string(cond) + ".",
            expr ? expr->token.loc : TokenLocation(),
            {cond});
    }
    return std::get<bool>(cond);
}

void Evaluator::execute_statement(StatementNode* stmt, EnvPtr env, Value* return_value, bool* did_return) {
    // --- VariableDeclarationNode (let) ---
    if (auto vd = dynamic_cast<VariableDeclarationNode*>(stmt)) {
        Value val = evaluate_expression(vd->value.get(), env);
        env->declare(vd->identifier, val, vd->token.loc);
        return;
    }

    if (auto an = dynamic_cast<AssignmentNode*>(stmt)) {
        Value val = evaluate_expression(an->value.get(), env);
        env->assign(an->name, val, an->token.loc);
        return;
    }

    if (auto ps = dynamic_cast<PrintStatementNode*>(stmt)) {
        Value val = evaluate_expression(ps->expression.get(), env);
        out_ << value_to_string(val) << "\n";
        out_.flush();
        return;
    }

    if (auto in = dynamic_cast<InputStatementNode*>(stmt)) {
        // target must exist before anything is read
        Value current = env->lookup(in->name, in->token.loc);
        Value read = read_input_value(in->token);
        if (kind_of(read) != kind_of(current)) {
            throw GrimError(ErrorKind::TypeMismatch,
                "Input " + value_debug_string(read) + " does not match the type of '" + in->name +
                    "' (" + type_name(current) + ").",
                in->token.loc,
                {current, read});
        }
        env->assign(in->name, read, in->token.loc);
        return;
    }

    if (auto es = dynamic_cast<ExpressionStatementNode*>(stmt)) {
        evaluate_expression(es->expression.get(), env);
        return;
    }

    if (auto fd = dynamic_cast<FunctionDeclarationNode*>(stmt)) {
        env->declare_function(make_function(fd), fd->token.loc);
        return;
    }

    if (auto rs = dynamic_cast<ReturnStatementNode*>(stmt)) {
        Value val = rs->value ? evaluate_expression(rs->value.get(), env) : Value{int64_t{0}};
        if (return_value) *return_value = val;
        if (did_return) *did_return = true;
        return;
    }

    // --- IfStatementNode ---
    if (auto ifn = dynamic_cast<IfStatementNode*>(stmt)) {
        bool taken = evaluate_condition(ifn->condition.get(), env, "if statement");
        if (taken) {
            auto blockEnv = env->enter_child();
            execute_block(ifn->then_body, blockEnv, return_value, did_return);
        } else if (ifn->has_else) {
            auto blockEnv = env->enter_child();
            execute_block(ifn->else_body, blockEnv, return_value, did_return);
        }
        return;
    }

    // --- WhileStatementNode ---
    if (auto wn = dynamic_cast<WhileStatementNode*>(stmt)) {
        EnvPtr bodyEnv;
        if (options_.loop_scope == LoopScope::Shared) bodyEnv = env->enter_child();

        while (evaluate_condition(wn->condition.get(), env, "while statement")) {
            if (options_.loop_scope == LoopScope::PerIteration) bodyEnv = env->enter_child();
            execute_block(wn->body, bodyEnv, return_value, did_return);
            if (did_return && *did_return) return;
        }
        return;
    }

    throw GrimError(ErrorKind::InternalError,
        "Unhandled statement node encountered in evaluator.",
        stmt->token.loc);
}
