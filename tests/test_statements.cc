#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "GrimError.hpp"
#include "evaluator.hpp"
#include "lexer.hpp"
#include "parser.hpp"

namespace {

struct RunResult {
    std::string output;
    bool failed = false;
    ErrorKind kind = ErrorKind::InternalError;
    std::vector<std::string> trail;
    std::string what;
    Value program_result = int64_t{0};
};

RunResult run(const std::string& source, const std::string& input = "", LoopScope scope = LoopScope::Shared) {
    RunResult r;
    std::istringstream in(input);
    std::ostringstream out;
    EvaluatorOptions options;
    options.loop_scope = scope;
    Evaluator evaluator(options, in, out);
    try {
        Lexer lexer(source, "t.grim");
        Parser parser(lexer.tokenize());
        auto program = parser.parse();
        evaluator.evaluate(program.get());
        r.program_result = evaluator.program_result();
    } catch (const GrimError& e) {
        r.failed = true;
        r.kind = e.kind();
        r.trail = e.trail();
        r.what = e.what();
    }
    r.output = out.str();
    return r;
}

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.rfind(prefix, 0) == 0;
}

}  // namespace

// ============================================================================
// PRINT
// ============================================================================

TEST(PrintTest, PrintsEachValueOnItsOwnLine) {
    auto r = run("print 42; print \"hi there\"; print true; print false;");
    ASSERT_FALSE(r.failed) << r.what;
    EXPECT_EQ(r.output, "42\nhi there\ntrue\nfalse\n");
}

TEST(PrintTest, FloatsUseShortestFixedNotation) {
    auto r = run("print 1.0; print 3.5; print 0.1 + 0.2; print 2.5e3; print -0.0; print 7 / 2;");
    ASSERT_FALSE(r.failed) << r.what;
    EXPECT_EQ(r.output, "1\n3.5\n0.30000000000000004\n2500\n-0\n3.5\n");
}

TEST(PrintTest, NonFiniteFloats) {
    auto r = run("print 1.0 / 0; print -1.0 / 0; print 0.0 / 0.0;");
    ASSERT_FALSE(r.failed) << r.what;
    EXPECT_EQ(r.output, "inf\n-inf\nNaN\n");
}

TEST(PrintTest, ParenthesizedFormIsTheSameStatement) {
    auto r = run("print(1 + 1);");
    EXPECT_EQ(r.output, "2\n");
}

TEST(ValueFormatTest, FormatFloat) {
    EXPECT_EQ(format_float(1.0), "1");
    EXPECT_EQ(format_float(-2.25), "-2.25");
    EXPECT_EQ(format_float(1e21), "1000000000000000000000");
    EXPECT_EQ(format_float(0.000001), "0.000001");
}

TEST(ValueFormatTest, DebugStrings) {
    EXPECT_EQ(value_debug_string(Value{int64_t{7}}), "Integer(7)");
    EXPECT_EQ(value_debug_string(Value{3.5}), "Float(3.5)");
    EXPECT_EQ(value_debug_string(Value{true}), "Boolean(true)");
    EXPECT_EQ(value_debug_string(Value{std::string("abc")}), "String(\"abc\")");
}

// ============================================================================
// VARIABLES AND BLOCKS
// ============================================================================

TEST(ScopeTest, AssignmentReachesTheDeclaringBlock) {
    auto r = run("let x = 1; if true { x = x + 1; } print x;");
    ASSERT_FALSE(r.failed) << r.what;
    EXPECT_EQ(r.output, "2\n");
}

TEST(ScopeTest, AssignmentMayChangeTheType) {
    auto r = run("let x = 1; x = \"one\"; print x;");
    ASSERT_FALSE(r.failed) << r.what;
    EXPECT_EQ(r.output, "one\n");
}

TEST(ScopeTest, BlockLocalsDisappearWhenTheBlockEnds) {
    auto r = run("if true { let inner = 1; } print inner;");
    ASSERT_TRUE(r.failed);
    EXPECT_EQ(r.kind, ErrorKind::UndefinedVariable);
}

TEST(ScopeTest, RedeclarationInTheSameBlock) {
    auto r = run("let x = 1; let x = 2;");
    ASSERT_TRUE(r.failed);
    EXPECT_EQ(r.kind, ErrorKind::NameAlreadyBound);
}

TEST(ScopeTest, ShadowingIsRejected) {
    auto r = run("let x = 1; if true { let x = 2; }");
    ASSERT_TRUE(r.failed);
    EXPECT_EQ(r.kind, ErrorKind::ShadowingViolation);
}

TEST(ScopeTest, SiblingBranchesMayReuseNames) {
    auto r = run(
        "let n = 0;\n"
        "if true { let t = 1; n = n + t; }\n"
        "if true { let t = 2; n = n + t; }\n"
        "print n;");
    ASSERT_FALSE(r.failed) << r.what;
    EXPECT_EQ(r.output, "3\n");
}

TEST(ScopeTest, AssigningAnUndeclaredName) {
    auto r = run("y = 3;");
    ASSERT_TRUE(r.failed);
    EXPECT_EQ(r.kind, ErrorKind::UndefinedVariable);
}

TEST(ScopeTest, ProgramEnvironmentPersistsAcrossEvaluations) {
    std::istringstream in;
    std::ostringstream out;
    Evaluator evaluator(in, out);

    Lexer first("let x = 40;", "t.grim");
    auto p1 = Parser(first.tokenize()).parse();
    evaluator.evaluate(p1.get());

    Lexer second("print x + 2;", "t.grim");
    auto p2 = Parser(second.tokenize()).parse();
    evaluator.evaluate(p2.get());

    EXPECT_EQ(out.str(), "42\n");
}

// ============================================================================
// CONTROL FLOW
// ============================================================================

TEST(ControlFlowTest, IfElseChain) {
    const char* src =
        "let x = 15;\n"
        "if x < 10 { print \"small\"; }\n"
        "else if x < 20 { print \"medium\"; }\n"
        "else { print \"large\"; }\n";
    auto r = run(src);
    ASSERT_FALSE(r.failed) << r.what;
    EXPECT_EQ(r.output, "medium\n");
}

TEST(ControlFlowTest, ParenthesizedConditionSelectsTheThenBranch) {
    auto r = run("let b = -1; if (3 + 10 - 3 <= 20) { b = 1; } else { b = 0; } print b;");
    ASSERT_FALSE(r.failed) << r.what;
    EXPECT_EQ(r.output, "1\n");
}

TEST(ControlFlowTest, WhileLoopCounts) {
    auto r = run("let i = 0; while i < 3 { print i; i = i + 1; }");
    ASSERT_FALSE(r.failed) << r.what;
    EXPECT_EQ(r.output, "0\n1\n2\n");
}

TEST(ControlFlowTest, WhileWithFalseConditionNeverRuns) {
    auto r = run("while false { print 1; } print 2;");
    EXPECT_EQ(r.output, "2\n");
}

TEST(ControlFlowTest, ConditionsMustBeBoolean) {
    auto r = run("if 1 { print 1; }");
    ASSERT_TRUE(r.failed);
    EXPECT_EQ(r.kind, ErrorKind::NonBooleanCondition);

    r = run("let s = \"yes\"; while s { }");
    ASSERT_TRUE(r.failed);
    EXPECT_EQ(r.kind, ErrorKind::NonBooleanCondition);
}

TEST(ControlFlowTest, SharedLoopScopeKeepsBodyLocalsBetweenIterations) {
    const char* src = "let i = 0; while i < 2 { let t = i; i = i + 1; }";
    auto r = run(src, "", LoopScope::Shared);
    ASSERT_TRUE(r.failed);
    EXPECT_EQ(r.kind, ErrorKind::NameAlreadyBound);
}

TEST(ControlFlowTest, PerIterationLoopScopeStartsFresh) {
    const char* src = "let i = 0; while i < 3 { let t = i * 10; print t; i = i + 1; }";
    auto r = run(src, "", LoopScope::PerIteration);
    ASSERT_FALSE(r.failed) << r.what;
    EXPECT_EQ(r.output, "0\n10\n20\n");
}

TEST(ControlFlowTest, LoopScopeNames) {
    EXPECT_EQ(loop_scope_name(LoopScope::Shared), "shared");
    EXPECT_EQ(loop_scope_name(LoopScope::PerIteration), "per-iteration");
}

TEST(ControlFlowTest, TopLevelReturnEndsTheProgram) {
    auto r = run("print 1; return 5; print 2;");
    ASSERT_FALSE(r.failed) << r.what;
    EXPECT_EQ(r.output, "1\n");
    EXPECT_EQ(r.program_result, Value{int64_t{5}});
}

TEST(ControlFlowTest, ProgramResultDefaultsToZero) {
    auto r = run("print 1;");
    EXPECT_EQ(r.program_result, Value{int64_t{0}});
}

// ============================================================================
// FUNCTIONS
// ============================================================================

TEST(FunctionTest, Factorial) {
    const char* src =
        "fn fact(n) {\n"
        "  if n <= 1 { return 1; }\n"
        "  return n * fact(n - 1);\n"
        "}\n"
        "print fact(5);\n";
    auto r = run(src);
    ASSERT_FALSE(r.failed) << r.what;
    EXPECT_EQ(r.output, "120\n");
}

TEST(FunctionTest, MissingReturnYieldsZero) {
    auto r = run("fn noop() { let a = 1; } print noop();");
    ASSERT_FALSE(r.failed) << r.what;
    EXPECT_EQ(r.output, "0\n");
}

TEST(FunctionTest, BareReturnYieldsZero) {
    auto r = run("fn early() { return; print 9; } print early();");
    ASSERT_FALSE(r.failed) << r.what;
    EXPECT_EQ(r.output, "0\n");
}

TEST(FunctionTest, ReturnInsideLoopLeavesTheWholeCall) {
    const char* src =
        "fn first() {\n"
        "  let i = 0;\n"
        "  while true {\n"
        "    if i == 3 { return i; }\n"
        "    i = i + 1;\n"
        "  }\n"
        "}\n"
        "print first();\n"
        "print \"after\";\n";
    auto r = run(src);
    ASSERT_FALSE(r.failed) << r.what;
    EXPECT_EQ(r.output, "3\nafter\n");
}

TEST(FunctionTest, ReturnInsideCallDoesNotEndTheCaller) {
    auto r = run("fn one() { return 1; } let a = one(); print a + 1;");
    ASSERT_FALSE(r.failed) << r.what;
    EXPECT_EQ(r.output, "2\n");
}

TEST(FunctionTest, ParametersMayReuseGlobalVariableNames) {
    auto r = run("let n = 5; fn id(n) { return n; } print id(1); print n;");
    ASSERT_FALSE(r.failed) << r.what;
    EXPECT_EQ(r.output, "1\n5\n");
}

TEST(FunctionTest, ArgumentsArePassedByValue) {
    auto r = run("let v = 1; fn bump(x) { x = x + 1; return x; } print bump(v); print v;");
    ASSERT_FALSE(r.failed) << r.what;
    EXPECT_EQ(r.output, "2\n1\n");
}

TEST(FunctionTest, CallerLocalsAreInvisible) {
    const char* src =
        "fn leak() { return hidden; }\n"
        "if true { let hidden = 1; print leak(); }\n";
    auto r = run(src);
    ASSERT_TRUE(r.failed);
    EXPECT_EQ(r.kind, ErrorKind::UndefinedVariable);
}

TEST(FunctionTest, DuplicateParameterIsNameAlreadyBound) {
    auto r = run("fn f(a, a) { return a; } print f(1, 2);");
    ASSERT_TRUE(r.failed);
    EXPECT_EQ(r.kind, ErrorKind::NameAlreadyBound);
}

TEST(FunctionTest, CallBeforeDeclaration) {
    auto r = run("print later(); fn later() { return 1; }");
    ASSERT_TRUE(r.failed);
    EXPECT_EQ(r.kind, ErrorKind::UndefinedFunction);
}

TEST(FunctionTest, BlockFunctionsAreLocalToTheirBlock) {
    const char* src =
        "if true {\n"
        "  fn count(n) { if n == 0 { return 0; } return 1 + count(n - 1); }\n"
        "  print count(3);\n"
        "}\n"
        "print count(1);\n";
    auto r = run(src);
    EXPECT_EQ(r.output, "3\n");
    ASSERT_TRUE(r.failed);
    EXPECT_EQ(r.kind, ErrorKind::UndefinedFunction);
}

TEST(FunctionTest, FunctionsCallOtherGlobalFunctions) {
    auto r = run("fn twice(x) { return x * 2; } fn quad(x) { return twice(twice(x)); } print quad(3);");
    ASSERT_FALSE(r.failed) << r.what;
    EXPECT_EQ(r.output, "12\n");
}

TEST(FunctionTest, FunctionRedeclaration) {
    auto r = run("fn f() { return 1; } fn f() { return 2; }");
    ASSERT_TRUE(r.failed);
    EXPECT_EQ(r.kind, ErrorKind::NameAlreadyBound);

    r = run("fn g() { return 1; } if true { fn g() { return 2; } }");
    ASSERT_TRUE(r.failed);
    EXPECT_EQ(r.kind, ErrorKind::ShadowingViolation);
}

// ============================================================================
// INPUT
// ============================================================================

TEST(InputTest, ReadsAnIntegerIntoAnIntegerVariable) {
    auto r = run("let n = 0; input n; print n + 1;", "41\n");
    ASSERT_FALSE(r.failed) << r.what;
    EXPECT_EQ(r.output, "42\n");
}

TEST(InputTest, ReadsEveryKind) {
    const char* src =
        "let f = 0.0; let b = false; let s = \"\";\n"
        "input f; input(b); input s;\n"
        "print f; print b; print s;\n";
    auto r = run(src, " 2.5 \ntrue\nhello world\n");
    ASSERT_FALSE(r.failed) << r.what;
    EXPECT_EQ(r.output, "2.5\ntrue\nhello world\n");
}

TEST(InputTest, KindMustMatchTheVariable) {
    auto r = run("let n = 0; input n;", "abc\n");
    ASSERT_TRUE(r.failed);
    EXPECT_EQ(r.kind, ErrorKind::TypeMismatch);

    r = run("let n = 0; input n;", "3.5\n");
    ASSERT_TRUE(r.failed);
    EXPECT_EQ(r.kind, ErrorKind::TypeMismatch);

    // "3" reads as an Integer, not a Float
    r = run("let f = 1.5; input f;", "3\n");
    ASSERT_TRUE(r.failed);
    EXPECT_EQ(r.kind, ErrorKind::TypeMismatch);
}

TEST(InputTest, EndOfInputIsIoFailure) {
    auto r = run("let n = 0; input n;", "");
    ASSERT_TRUE(r.failed);
    EXPECT_EQ(r.kind, ErrorKind::IoFailure);
}

TEST(InputTest, UndeclaredTargetFailsBeforeReading) {
    std::istringstream in("7\n");
    std::ostringstream out;
    Evaluator evaluator(in, out);
    Lexer lexer("input ghost;", "t.grim");
    auto program = Parser(lexer.tokenize()).parse();
    try {
        evaluator.evaluate(program.get());
        FAIL() << "expected UndefinedVariable";
    } catch (const GrimError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UndefinedVariable);
    }
    std::string rest;
    ASSERT_TRUE(std::getline(in, rest));
    EXPECT_EQ(rest, "7");
}

TEST(InputTest, ParseInputLiteral) {
    EXPECT_EQ(parse_input_literal("42"), Value{int64_t{42}});
    EXPECT_EQ(parse_input_literal("-3"), Value{int64_t{-3}});
    EXPECT_EQ(parse_input_literal("+7"), Value{int64_t{7}});
    EXPECT_EQ(parse_input_literal("2.5"), Value{2.5});
    EXPECT_EQ(parse_input_literal("1e3"), Value{1000.0});
    EXPECT_EQ(parse_input_literal("true"), Value{true});
    EXPECT_EQ(parse_input_literal("false"), Value{false});
    EXPECT_EQ(parse_input_literal("True"), Value{std::string("True")});
    EXPECT_EQ(parse_input_literal("12abc"), Value{std::string("12abc")});
    EXPECT_EQ(parse_input_literal("  padded  "), Value{std::string("padded")});
    EXPECT_EQ(parse_input_literal(""), Value{std::string("")});
}

// ============================================================================
// ERROR TRAIL
// ============================================================================

TEST(ErrorTrailTest, RecordsEveryStatementOnTheWayOut) {
    const char* src =
        "fn boom() { return 1 / 0; }\n"
        "let x = boom();\n";
    auto r = run(src);
    ASSERT_TRUE(r.failed);
    EXPECT_EQ(r.kind, ErrorKind::DivisionByZero);
    ASSERT_EQ(r.trail.size(), 3u);
    EXPECT_TRUE(startsWith(r.trail[0], "return statement (t.grim:1:")) << r.trail[0];
    EXPECT_TRUE(startsWith(r.trail[1], "call to 'boom' (t.grim:2:")) << r.trail[1];
    EXPECT_TRUE(startsWith(r.trail[2], "variable declaration 'x' (t.grim:2:")) << r.trail[2];

    EXPECT_TRUE(startsWith(r.what, "DivisionByZero at t.grim:1:")) << r.what;
    EXPECT_NE(r.what.find("Integer division by zero."), std::string::npos);
    EXPECT_NE(r.what.find(" --> while executing: call to 'boom'"), std::string::npos) << r.what;
}

TEST(ErrorTrailTest, NestedBlocksAppearInnermostFirst) {
    auto r = run("let i = 0;\nwhile i < 1 {\n  if true {\n    print missing;\n  }\n}\n");
    ASSERT_TRUE(r.failed);
    ASSERT_EQ(r.trail.size(), 3u);
    EXPECT_TRUE(startsWith(r.trail[0], "print statement")) << r.trail[0];
    EXPECT_TRUE(startsWith(r.trail[1], "if statement")) << r.trail[1];
    EXPECT_TRUE(startsWith(r.trail[2], "while statement")) << r.trail[2];
}

TEST(ErrorTrailTest, ErrorsWithoutALocationPrintKindAndMessageOnly) {
    GrimError e(ErrorKind::InternalError, "broken", TokenLocation());
    EXPECT_STREQ(e.what(), "InternalError\nbroken");
}
