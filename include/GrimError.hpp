#pragma once
#include <stdexcept>
#include <string>
#include <vector>

#include "token.hpp"
#include "value.hpp"

enum class ErrorKind {
    UndefinedVariable,
    UndefinedFunction,
    NameAlreadyBound,
    ShadowingViolation,
    IncompatibleOperands,
    UnsupportedUnaryOperand,
    NonBooleanCondition,
    ArityMismatch,
    TypeMismatch,
    IoFailure,
    DivisionByZero,
    IntegerOverflow,
    SyntaxError,
    InternalError
};

inline std::string error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UndefinedVariable: return "UndefinedVariable";
        case ErrorKind::UndefinedFunction: return "UndefinedFunction";
        case ErrorKind::NameAlreadyBound: return "NameAlreadyBound";
        case ErrorKind::ShadowingViolation: return "ShadowingViolation";
        case ErrorKind::IncompatibleOperands: return "IncompatibleOperands";
        case ErrorKind::UnsupportedUnaryOperand: return "UnsupportedUnaryOperand";
        case ErrorKind::NonBooleanCondition: return "NonBooleanCondition";
        case ErrorKind::ArityMismatch: return "ArityMismatch";
        case ErrorKind::TypeMismatch: return "TypeMismatch";
        case ErrorKind::IoFailure: return "IoFailure";
        case ErrorKind::DivisionByZero: return "DivisionByZero";
        case ErrorKind::IntegerOverflow: return "IntegerOverflow";
        case ErrorKind::SyntaxError: return "SyntaxError";
        case ErrorKind::InternalError: return "InternalError";
    }
    return "UnknownError";
}

// The one exception type raised by the lexer, parser and evaluator.
// The first error aborts the run; statements it passes through on the way
// out append themselves to the trail with add_context().
class GrimError : public std::runtime_error {
   public:
    GrimError(ErrorKind kind,
        const std::string& message,
        const TokenLocation& loc,
        std::vector<Value> operands = {})
        : std::runtime_error(error_kind_name(kind) + ": " + message),
          kind_(kind),
          message_(message),
          loc_(loc),
          operands_(std::move(operands)) {
        rebuild();
    }

    ErrorKind kind() const noexcept { return kind_; }
    const std::string& message() const { return message_; }
    const TokenLocation& location() const { return loc_; }

    // Offending operand(s) for IncompatibleOperands / UnsupportedUnaryOperand
    const std::vector<Value>& operands() const { return operands_; }

    // Statement kinds the error propagated through, innermost first
    const std::vector<std::string>& trail() const { return trail_; }

    void add_context(const std::string& statement_kind, const TokenLocation& where) {
        std::string entry = statement_kind;
        if (!where.filename.empty()) entry += " (" + where.to_string() + ")";
        trail_.push_back(entry);
        rebuild();
    }

    const char* what() const noexcept override {
        return formatted_.c_str();
    }

   private:
    ErrorKind kind_;
    std::string message_;
    TokenLocation loc_;
    std::vector<Value> operands_;
    std::vector<std::string> trail_;
    std::string formatted_;

    void rebuild() {
        formatted_ = format_message(error_kind_name(kind_), message_, loc_);
        for (const auto& t : trail_) {
            formatted_ += "\n --> while executing: " + t;
        }
    }

    static std::string format_message(const std::string& type,
        const std::string& message,
        const TokenLocation& loc) {
        // Errors raised outside any parsed source (e.g. a hand-built AST) carry no position
        if (loc.filename.empty()) {
            return type + "\n" + message;
        }
        return type + " at " + loc.to_string() + "\n" +
            message + "\n" +
            " --> Traced at:\n" +
            loc.get_line_trace();
    }
};
