// src/evaluator/Evaluator.cpp
#include "evaluator.hpp"

#include <string>

#include "GrimError.hpp"

Evaluator::Evaluator(std::istream& in, std::ostream& out)
    : Evaluator(EvaluatorOptions{}, in, out) {}

Evaluator::Evaluator(const EvaluatorOptions& options, std::istream& in, std::ostream& out)
    : options_(options), in_(in), out_(out), global_env(std::make_shared<Environment>(nullptr)) {}

// ----------------- Program evaluation -----------------
void Evaluator::evaluate(ProgramNode* program) {
    if (!program) return;
    bool did_return = false;

    // a top-level `return` ends the program and its value lands in the program's return slot
    execute_block(program->body, global_env, &global_env->return_value, &did_return);
}

Value Evaluator::evaluate_expression(ExpressionNode* expr) {
    return evaluate_expression(expr, global_env);
}

Value Evaluator::read_input_value(const Token& tok) {
    std::string line;
    if (!std::getline(in_, line)) {
        throw GrimError(ErrorKind::IoFailure,
            in_.eof() ? "Unexpected end of input while reading a line." : "Failed to read a line from input.",
            tok.loc);
    }
    return parse_input_literal(line);
}
