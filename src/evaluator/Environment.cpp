//src/evaluator/Environment.cpp
#include "evaluator.hpp"
#include "GrimError.hpp"

// ----------------- Environment methods -----------------

Environment::Environment(EnvPtr parent) : parent(parent) {
   if (parent) {
      visible_variables = parent->visible_variables;
      visible_functions = parent->visible_functions;
   }
}

bool Environment::has(const std::string& name) const {
   auto it = values.find(name);
   if (it != values.end()) return true;
   if (parent) return parent->has(name);
   return false;
}

bool Environment::has_function(const std::string& name) const {
   if (functions.count(name)) return true;
   if (parent) return parent->has_function(name);
   if (globals && globals.get() != this) return globals->has_function(name);
   return false;
}

void Environment::declare(const std::string& name, const Value& value, const TokenLocation& loc) {
   if (values.count(name)) {
      throw GrimError(ErrorKind::NameAlreadyBound,
         "Variable '" + name + "' is already declared in this scope.", loc);
   }
   if (visible_variables.count(name)) {
      throw GrimError(ErrorKind::ShadowingViolation,
         "Variable '" + name + "' is already declared in an enclosing scope; shadowing is not allowed.", loc);
   }
   values.emplace(name, value);
   visible_variables.insert(name);
}

void Environment::declare_function(const FunctionPtr& fn, const TokenLocation& loc) {
   const std::string& name = fn->name;
   if (functions.count(name)) {
      throw GrimError(ErrorKind::NameAlreadyBound,
         "Function '" + name + "' is already declared in this scope.", loc);
   }
   if (visible_functions.count(name)) {
      throw GrimError(ErrorKind::ShadowingViolation,
         "Function '" + name + "' is already declared in an enclosing scope; shadowing is not allowed.", loc);
   }
   functions.emplace(name, fn);
   visible_functions.insert(name);
}

Value Environment::lookup(const std::string& name, const TokenLocation& loc) const {
   for (const Environment* walk = this; walk; walk = walk->parent.get()) {
      auto it = walk->values.find(name);
      if (it != walk->values.end()) return it->second;
   }
   throw GrimError(ErrorKind::UndefinedVariable, "Variable '" + name + "' is not defined.", loc);
}

FunctionPtr Environment::lookup_function(const std::string& name, const TokenLocation& loc) const {
   for (const Environment* walk = this; walk; walk = walk->parent.get()) {
      auto it = walk->functions.find(name);
      if (it != walk->functions.end()) return it->second;

      // end of a call frame's chain: fall back to the program's functions
      if (!walk->parent && walk->globals) {
         auto git = walk->globals->functions.find(name);
         if (git != walk->globals->functions.end()) return git->second;
      }
   }
   throw GrimError(ErrorKind::UndefinedFunction, "Function '" + name + "' is not defined.", loc);
}

void Environment::assign(const std::string& name, const Value& value, const TokenLocation& loc) {
   for (Environment* walk = this; walk; walk = walk->parent.get()) {
      auto it = walk->values.find(name);
      if (it != walk->values.end()) {
         it->second = value;
         return;
      }
   }
   throw GrimError(ErrorKind::UndefinedVariable,
      "Cannot assign to '" + name + "': variable is not declared.", loc);
}

EnvPtr Environment::enter_child() {
   return std::make_shared<Environment>(shared_from_this());
}

EnvPtr Environment::enter_function_frame(const FunctionPtr& fn) {
   EnvPtr program = program_environment();

   auto frame = std::make_shared<Environment>(nullptr);
   frame->globals = program;
   frame->visible_functions = program->visible_functions;

   // the callee resolves itself even when it was declared in a nested block
   frame->functions.emplace(fn->name, fn);
   frame->visible_functions.insert(fn->name);
   return frame;
}

EnvPtr Environment::program_environment() {
   Environment* root = this;
   while (root->parent) root = root->parent.get();
   if (root->globals) return root->globals;
   return root->shared_from_this();
}

std::string loop_scope_name(LoopScope scope) {
   return scope == LoopScope::PerIteration ? "per-iteration" : "shared";
}

FunctionPtr make_function(const FunctionDeclarationNode* decl) {
   auto fn = std::make_shared<FunctionValue>();
   fn->name = decl->name;
   fn->token = decl->token;
   for (const auto& p : decl->parameters) {
      if (p) fn->parameters.push_back(p->name);
   }
   // FunctionDeclarationNode::clone() returns a StatementNode; the dynamic type is known
   std::unique_ptr<StatementNode> copy = decl->clone();
   fn->declaration.reset(static_cast<FunctionDeclarationNode*>(copy.release()));
   return fn;
}
