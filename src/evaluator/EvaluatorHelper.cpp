#include <charconv>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

#include "evaluator.hpp"

// ----------------- Value helpers -----------------

std::string value_kind_name(ValueKind kind) {
    switch (kind) {
        case ValueKind::Integer: return "Integer";
        case ValueKind::Float: return "Float";
        case ValueKind::Boolean: return "Boolean";
        case ValueKind::String: return "String";
    }
    return "unknown";
}

std::string type_name(const Value& v) {
    return value_kind_name(kind_of(v));
}

std::string format_float(double d) {
    if (std::isnan(d)) return "NaN";
    if (std::isinf(d)) return d < 0 ? "-inf" : "inf";

    // fixed notation of a double needs at most ~330 characters (denormals)
    char buf[512];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d, std::chars_format::fixed);
    if (ec == std::errc()) return std::string(buf, ptr);

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(std::numeric_limits<double>::max_digits10) << d;
    return ss.str();
}

std::string value_to_string(const Value& v) {
    if (std::holds_alternative<int64_t>(v)) return std::to_string(std::get<int64_t>(v));
    if (std::holds_alternative<double>(v)) return format_float(std::get<double>(v));
    if (std::holds_alternative<bool>(v)) return std::get<bool>(v) ? "true" : "false";
    return std::get<std::string>(v);
}

std::string value_debug_string(const Value& v) {
    if (std::holds_alternative<std::string>(v)) {
        return "String(\"" + std::get<std::string>(v) + "\")";
    }
    return type_name(v) + "(" + value_to_string(v) + ")";
}

// ----------------- Input parsing -----------------

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\v\f";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

Value parse_input_literal(const std::string& text) {
    std::string s = trim(text);
    if (s.empty()) return s;

    // from_chars has no leading '+'
    std::string digits = s;
    if (digits.size() > 1 && digits[0] == '+' && digits[1] != '-') digits.erase(0, 1);

    const char* first = digits.data();
    const char* last = first + digits.size();

    int64_t i = 0;
    auto ir = std::from_chars(first, last, i);
    if (ir.ec == std::errc() && ir.ptr == last) return i;

    double d = 0.0;
    auto fr = std::from_chars(first, last, d);
    if (fr.ec == std::errc() && fr.ptr == last) return d;

    if (s == "true") return true;
    if (s == "false") return false;

    return s;
}

// ----------------- Statement labels -----------------

std::string describe_statement(const StatementNode* stmt) {
    if (auto vd = dynamic_cast<const VariableDeclarationNode*>(stmt)) {
        return "variable declaration '" + vd->identifier + "'";
    }
    if (auto an = dynamic_cast<const AssignmentNode*>(stmt)) {
        return "assignment to '" + an->name + "'";
    }
    if (dynamic_cast<const IfStatementNode*>(stmt)) return "if statement";
    if (dynamic_cast<const WhileStatementNode*>(stmt)) return "while statement";
    if (auto fd = dynamic_cast<const FunctionDeclarationNode*>(stmt)) {
        return "function declaration '" + fd->name + "'";
    }
    if (dynamic_cast<const ReturnStatementNode*>(stmt)) return "return statement";
    if (dynamic_cast<const PrintStatementNode*>(stmt)) return "print statement";
    if (auto in = dynamic_cast<const InputStatementNode*>(stmt)) {
        return "input statement '" + in->name + "'";
    }
    if (dynamic_cast<const ExpressionStatementNode*>(stmt)) return "expression statement";
    return "statement";
}
