#pragma once

#include <cstdint>
#include <string>
#include <type_traits>
#include <variant>

// Runtime value: Integer, Float, Boolean or String. Nothing else exists at runtime.
using Value = std::variant<int64_t, double, bool, std::string>;

// Mirrors the alternative order of Value so kind_of() is a plain index cast.
enum class ValueKind {
    Integer = 0,
    Float = 1,
    Boolean = 2,
    String = 3
};

constexpr int kValueKindCount = 4;

static_assert(std::variant_size_v<Value> == kValueKindCount);
static_assert(std::is_same_v<std::variant_alternative_t<0, Value>, int64_t>);
static_assert(std::is_same_v<std::variant_alternative_t<1, Value>, double>);
static_assert(std::is_same_v<std::variant_alternative_t<2, Value>, bool>);
static_assert(std::is_same_v<std::variant_alternative_t<3, Value>, std::string>);

inline ValueKind kind_of(const Value& v) {
    return static_cast<ValueKind>(v.index());
}

std::string value_kind_name(ValueKind kind);
std::string type_name(const Value& v);

// Display form used by `print`: 42, 3.5, -0, inf, NaN, true, raw string text.
std::string value_to_string(const Value& v);

// Diagnostic form: Integer(7), Float(3.5), Boolean(true), String("abc").
std::string value_debug_string(const Value& v);

// Shortest round-trip decimal text of a double, never in exponent notation.
std::string format_float(double d);
