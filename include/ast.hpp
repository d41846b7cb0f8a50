#pragma once
#include <cstdint>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "token.hpp"

enum class BinaryOperator {
    Add,
    Sub,
    Mul,
    Div,
    Mod,
    And,
    Or,
    Less,
    Greater,
    LessEq,
    GreaterEq,
    CompareEq,
    CompareNeq
};

constexpr int kBinaryOperatorCount = 13;

enum class UnaryOperator {
    Minus,
    Not
};

inline const char* binary_operator_symbol(BinaryOperator op) {
    switch (op) {
        case BinaryOperator::Add: return "+";
        case BinaryOperator::Sub: return "-";
        case BinaryOperator::Mul: return "*";
        case BinaryOperator::Div: return "/";
        case BinaryOperator::Mod: return "%";
        case BinaryOperator::And: return "&&";
        case BinaryOperator::Or: return "||";
        case BinaryOperator::Less: return "<";
        case BinaryOperator::Greater: return ">";
        case BinaryOperator::LessEq: return "<=";
        case BinaryOperator::GreaterEq: return ">=";
        case BinaryOperator::CompareEq: return "==";
        case BinaryOperator::CompareNeq: return "!=";
    }
    return "?";
}

inline const char* unary_operator_symbol(UnaryOperator op) {
    return op == UnaryOperator::Minus ? "-" : "!";
}

// Base class for all AST nodes
struct Node {
    virtual ~Node() = default;
    Token token;  // filename, line, column for this node (set by the parser)

    virtual std::string to_string() const {
        return "<node>";
    }
};

// Expressions
struct ExpressionNode : public Node {
    // Function declarations keep a private copy of their body, so every node must be clonable.
    virtual std::unique_ptr<ExpressionNode> clone() const = 0;
};

struct IntegerLiteralNode : public ExpressionNode {
    int64_t value = 0;
    std::string to_string() const override {
        return std::to_string(value);
    }
    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<IntegerLiteralNode>();
        n->value = value;
        n->token = token;
        return n;
    }
};

struct FloatLiteralNode : public ExpressionNode {
    double value = 0.0;
    std::string to_string() const override {
        std::ostringstream ss;
        ss << value;
        return ss.str();
    }
    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<FloatLiteralNode>();
        n->value = value;
        n->token = token;
        return n;
    }
};

struct StringLiteralNode : public ExpressionNode {
    std::string value;
    std::string to_string() const override {
        return "\"" + value + "\"";
    }
    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<StringLiteralNode>();
        n->value = value;
        n->token = token;
        return n;
    }
};

struct BooleanLiteralNode : public ExpressionNode {
    bool value = false;
    std::string to_string() const override {
        return value ? "true" : "false";
    }
    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<BooleanLiteralNode>();
        n->value = value;
        n->token = token;
        return n;
    }
};

struct IdentifierNode : public ExpressionNode {
    std::string name;
    std::string to_string() const override {
        return name;
    }
    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<IdentifierNode>();
        n->name = name;
        n->token = token;
        return n;
    }
};

struct UnaryExpressionNode : public ExpressionNode {
    UnaryOperator op = UnaryOperator::Minus;
    std::unique_ptr<ExpressionNode> operand;
    std::string to_string() const override {
        std::string opnd = operand ? operand->to_string() : "<null>";
        return std::string("(") + unary_operator_symbol(op) + opnd + ")";
    }
    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<UnaryExpressionNode>();
        n->op = op;
        n->token = token;
        if (operand) n->operand = operand->clone();
        return n;
    }
};

struct BinaryExpressionNode : public ExpressionNode {
    BinaryOperator op = BinaryOperator::Add;
    std::unique_ptr<ExpressionNode> left;
    std::unique_ptr<ExpressionNode> right;
    std::string to_string() const override {
        std::string l = left ? left->to_string() : "<null>";
        std::string r = right ? right->to_string() : "<null>";
        return "(" + l + " " + binary_operator_symbol(op) + " " + r + ")";
    }
    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<BinaryExpressionNode>();
        n->op = op;
        n->token = token;
        if (left) n->left = left->clone();
        if (right) n->right = right->clone();
        return n;
    }
};

// Calls are by name only: `add(1, 2)`
struct CallExpressionNode : public ExpressionNode {
    std::string callee;
    std::vector<std::unique_ptr<ExpressionNode>> arguments;

    std::string to_string() const override {
        std::string args;
        for (size_t i = 0; i < arguments.size(); ++i) {
            if (i) args += ", ";
            args += arguments[i] ? arguments[i]->to_string() : "<null>";
        }
        return callee + "(" + args + ")";
    }

    std::unique_ptr<ExpressionNode> clone() const override {
        auto n = std::make_unique<CallExpressionNode>();
        n->token = token;
        n->callee = callee;
        n->arguments.reserve(arguments.size());
        for (const auto& a : arguments) n->arguments.push_back(a ? a->clone() : nullptr);
        return n;
    }
};

// Statements
struct StatementNode : public Node {
    virtual std::unique_ptr<StatementNode> clone() const = 0;
};

struct VariableDeclarationNode : public StatementNode {
    std::string identifier;
    std::unique_ptr<ExpressionNode> value;

    std::string to_string() const override {
        return "let " + identifier + " = " + (value ? value->to_string() : "<null>") + ";";
    }
    std::unique_ptr<StatementNode> clone() const override {
        auto n = std::make_unique<VariableDeclarationNode>();
        n->token = token;
        n->identifier = identifier;
        n->value = value ? value->clone() : nullptr;
        return n;
    }
};

struct AssignmentNode : public StatementNode {
    std::string name;
    std::unique_ptr<ExpressionNode> value;

    std::string to_string() const override {
        return name + " = " + (value ? value->to_string() : "<null>") + ";";
    }
    std::unique_ptr<StatementNode> clone() const override {
        auto n = std::make_unique<AssignmentNode>();
        n->token = token;
        n->name = name;
        n->value = value ? value->clone() : nullptr;
        return n;
    }
};

struct PrintStatementNode : public StatementNode {
    std::unique_ptr<ExpressionNode> expression;

    std::unique_ptr<StatementNode> clone() const override {
        auto n = std::make_unique<PrintStatementNode>();
        n->token = token;
        n->expression = expression ? expression->clone() : nullptr;
        return n;
    }
};

// `input x;` reads one line from the interpreter's input stream into x
struct InputStatementNode : public StatementNode {
    std::string name;

    std::unique_ptr<StatementNode> clone() const override {
        auto n = std::make_unique<InputStatementNode>();
        n->token = token;
        n->name = name;
        return n;
    }
};

struct ExpressionStatementNode : public StatementNode {
    std::unique_ptr<ExpressionNode> expression;

    std::unique_ptr<StatementNode> clone() const override {
        auto n = std::make_unique<ExpressionStatementNode>();
        n->token = token;
        n->expression = expression ? expression->clone() : nullptr;
        return n;
    }
};

struct IfStatementNode : public StatementNode {
    std::unique_ptr<ExpressionNode> condition;
    std::vector<std::unique_ptr<StatementNode>> then_body;
    std::vector<std::unique_ptr<StatementNode>> else_body;
    bool has_else = false;

    std::unique_ptr<StatementNode> clone() const override {
        auto n = std::make_unique<IfStatementNode>();
        n->token = token;
        n->condition = condition ? condition->clone() : nullptr;
        n->has_else = has_else;
        n->then_body.reserve(then_body.size());
        for (const auto& s : then_body) n->then_body.push_back(s ? s->clone() : nullptr);
        n->else_body.reserve(else_body.size());
        for (const auto& s : else_body) n->else_body.push_back(s ? s->clone() : nullptr);
        return n;
    }
};

struct WhileStatementNode : public StatementNode {
    std::unique_ptr<ExpressionNode> condition;
    std::vector<std::unique_ptr<StatementNode>> body;

    std::unique_ptr<StatementNode> clone() const override {
        auto n = std::make_unique<WhileStatementNode>();
        n->token = token;
        n->condition = condition ? condition->clone() : nullptr;
        n->body.reserve(body.size());
        for (const auto& s : body) n->body.push_back(s ? s->clone() : nullptr);
        return n;
    }
};

struct ParameterNode : public Node {
    std::string name;

    ParameterNode() = default;

    std::unique_ptr<ParameterNode> clone() const {
        auto n = std::make_unique<ParameterNode>();
        n->token = token;
        n->name = name;
        return n;
    }
};

struct FunctionDeclarationNode : public StatementNode {
    std::string name;
    std::vector<std::unique_ptr<ParameterNode>> parameters;
    std::vector<std::unique_ptr<StatementNode>> body;  // function body statements

    std::unique_ptr<StatementNode> clone() const override {
        auto n = std::make_unique<FunctionDeclarationNode>();
        n->token = token;
        n->name = name;
        n->parameters.reserve(parameters.size());
        for (const auto& p : parameters) {
            n->parameters.push_back(p ? p->clone() : nullptr);
        }
        n->body.reserve(body.size());
        for (const auto& s : body) n->body.push_back(s ? s->clone() : nullptr);
        return n;
    }
};

struct ReturnStatementNode : public StatementNode {
    std::unique_ptr<ExpressionNode> value;  // expression to return

    std::unique_ptr<StatementNode> clone() const override {
        auto n = std::make_unique<ReturnStatementNode>();
        n->token = token;
        n->value = value ? value->clone() : nullptr;
        return n;
    }
};

struct ProgramNode : public Node {
    std::vector<std::unique_ptr<StatementNode>> body;
};
