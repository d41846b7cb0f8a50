#include <sstream>

#include "GrimError.hpp"
#include "evaluator.hpp"

Value Evaluator::evaluate_call(CallExpressionNode* call, EnvPtr env) {
    FunctionPtr fn = env->lookup_function(call->callee, call->token.loc);
    try {
        return call_function(fn, call, env);
    } catch (GrimError& e) {
        e.add_context("call to '" + fn->name + "'", call->token.loc);
        throw;
    }
}

Value Evaluator::call_function(FunctionPtr fn, CallExpressionNode* call, EnvPtr caller_env) {
    const Token& callToken = call->token;

    // arity is checked before any argument is evaluated
    if (call->arguments.size() != fn->parameters.size()) {
        std::ostringstream ss;
        ss << "Function '" << fn->name << "' expects " << fn->parameters.size()
           << " argument(s) but got " << call->arguments.size() << ".";
        throw GrimError(ErrorKind::ArityMismatch, ss.str(), callToken.loc);
    }

    // frame has no parent link: the body sees its parameters, its locals and global functions
    EnvPtr frame = caller_env->enter_function_frame(fn);

    // arguments are evaluated in the caller's environment, left to right
    std::vector<Value> args;
    args.reserve(call->arguments.size());
    for (auto& a : call->arguments) {
        args.push_back(evaluate_expression(a.get(), caller_env));
    }

    for (size_t i = 0; i < fn->parameters.size(); ++i) {
        const auto& pnode = fn->declaration->parameters[i];
        frame->declare(fn->parameters[i], args[i], pnode ? pnode->token.loc : fn->token.loc);
    }

    bool did_return = false;
    execute_block(fn->declaration->body, frame, &frame->return_value, &did_return);

    // no `return` leaves the default Integer(0)
    return frame->return_value;
}
