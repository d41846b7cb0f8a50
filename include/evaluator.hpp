#pragma once

#include <iostream>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "ast.hpp"
#include "token.hpp"
#include "value.hpp"

// Forward declaration
class Environment;

// Environment
using EnvPtr = std::shared_ptr<Environment>;

// A declared function: its parameter names plus a private copy of the declaration,
// so the body outlives the ProgramNode it was parsed into.
struct FunctionValue {
    std::string name;
    std::vector<std::string> parameters;
    std::shared_ptr<FunctionDeclarationNode> declaration;
    Token token;
};
using FunctionPtr = std::shared_ptr<FunctionValue>;

FunctionPtr make_function(const FunctionDeclarationNode* decl);

// One lexical block: the program top level, a function call frame, an if/else
// branch or a loop body. Children point at parents, never the reverse.
class Environment : public std::enable_shared_from_this<Environment> {
   public:
    Environment(EnvPtr parent = nullptr);

    // bindings declared directly in this block
    std::unordered_map<std::string, Value> values;
    std::unordered_map<std::string, FunctionPtr> functions;

    // names declared here or in any ancestor; only used to reject shadowing
    std::unordered_set<std::string> visible_variables;
    std::unordered_set<std::string> visible_functions;

    EnvPtr parent;

    // Set on call frames: function lookups that miss the frame's own chain
    // continue in the program environment.
    EnvPtr globals;

    // written by `return` inside the call that owns this frame
    Value return_value = int64_t{0};

    // check if name is bound in this environment or any parent
    bool has(const std::string& name) const;
    bool has_function(const std::string& name) const;

    void declare(const std::string& name, const Value& value, const TokenLocation& loc = TokenLocation());
    void declare_function(const FunctionPtr& fn, const TokenLocation& loc = TokenLocation());

    // Throws UndefinedVariable / UndefinedFunction if not found.
    Value lookup(const std::string& name, const TokenLocation& loc = TokenLocation()) const;
    FunctionPtr lookup_function(const std::string& name, const TokenLocation& loc = TokenLocation()) const;

    // Overwrites the innermost existing binding; never creates one.
    void assign(const std::string& name, const Value& value, const TokenLocation& loc = TokenLocation());

    EnvPtr enter_child();
    EnvPtr enter_function_frame(const FunctionPtr& fn);

    // top of this chain's program: the globals of a frame, or the root of the parent chain
    EnvPtr program_environment();
};

// How a while loop scopes its body
enum class LoopScope {
    Shared,        // one child environment for the whole loop
    PerIteration,  // a fresh child environment for every pass
};

std::string loop_scope_name(LoopScope scope);

struct EvaluatorOptions {
    LoopScope loop_scope = LoopScope::Shared;
};

class Evaluator {
   public:
    Evaluator(std::istream& in = std::cin, std::ostream& out = std::cout);
    Evaluator(const EvaluatorOptions& options, std::istream& in = std::cin, std::ostream& out = std::cout);

    // Evaluate whole program (caller must ensure ProgramNode lifetime covers evaluation).
    // Statements run in the program environment, which persists across calls.
    void evaluate(ProgramNode* program);

    // Evaluate one expression in the program environment.
    Value evaluate_expression(ExpressionNode* expr);

    EnvPtr global_environment() const { return global_env; }
    const EvaluatorOptions& options() const { return options_; }

    // value stored by a top-level `return`, Integer(0) otherwise
    Value program_result() const { return global_env->return_value; }

   private:
    EvaluatorOptions options_;
    std::istream& in_;
    std::ostream& out_;
    EnvPtr global_env;

    Value evaluate_expression(ExpressionNode* expr, EnvPtr env);
    Value evaluate_call(CallExpressionNode* call, EnvPtr env);
    Value call_function(FunctionPtr fn, CallExpressionNode* call, EnvPtr caller_env);

    void evaluate_statement(StatementNode* stmt, EnvPtr env, Value* return_value, bool* did_return);
    void execute_statement(StatementNode* stmt, EnvPtr env, Value* return_value, bool* did_return);
    void execute_block(const std::vector<std::unique_ptr<StatementNode>>& body, EnvPtr env, Value* return_value, bool* did_return);

    bool evaluate_condition(ExpressionNode* expr, EnvPtr env, const char* statement);
    Value read_input_value(const Token& tok);
};

// Input literal parsing: Integer, else Float, else Boolean, else String
Value parse_input_literal(const std::string& text);

// Short statement label used in error trails ("if statement", "call to 'f'", ...)
std::string describe_statement(const StatementNode* stmt);
