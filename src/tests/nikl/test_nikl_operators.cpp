//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Tests for Nikl operators (arithmetic, comparison, logical, string) and the
// errors reported for unsupported operand kinds.
//
//===----------------------------------------------------------------------===//

#include "tests/nikl/NiklTestUtils.hpp"

#include "runtime/nikl/Operators.hpp"

using namespace nikl::runtime;
using nikl::frontends::BinaryOp;
using nikl::frontends::UnaryOp;
using nikl::test::runScript;

namespace
{

/// @brief Evaluate @p expr and return its display form, or the error text.
std::string eval(const std::string &expr)
{
    auto run = runScript(expr);
    return run.ok ? run.value.toString() : run.error;
}

} // namespace

//===----------------------------------------------------------------------===//
// Arithmetic
//===----------------------------------------------------------------------===//

TEST(NiklOperators, Precedence)
{
    EXPECT_EQ(eval("1 + 2 * 3"), "7");
    EXPECT_EQ(eval("(1 + 2) * 3"), "9");
    EXPECT_EQ(eval("10 - 4 - 3"), "3");
    EXPECT_EQ(eval("let a = 5 + 2 * 3\na - 4 / 2"), "9");
}

TEST(NiklOperators, IntegerDivisionTruncates)
{
    EXPECT_EQ(eval("7 / 2"), "3");
    EXPECT_EQ(eval("-7 / 2"), "-3");
}

TEST(NiklOperators, FloatArithmetic)
{
    EXPECT_EQ(eval("7.0 / 2"), "3.5");
    EXPECT_EQ(eval("1 + 0.5"), "1.5");
    EXPECT_EQ(eval("0.1 + 0.2"), "0.30000000000000004");
    EXPECT_EQ(eval("2.5 * 2"), "5");
    EXPECT_EQ(eval("type(2.5 * 2)"), "Float");
}

TEST(NiklOperators, DivisionByZeroForEveryNumericPairing)
{
    for (const char *expr : {"1 / 0", "1.0 / 0", "1 / 0.0", "1.5 / 0.0"})
        EXPECT_EQ(eval(expr), "Division by zero") << expr;
}

TEST(NiklOperators, IntegerOverflowIsAnError)
{
    EXPECT_EQ(eval("9223372036854775807 + 1"), "Integer overflow in '+'");
    EXPECT_EQ(eval("-9223372036854775807 - 2"), "Integer overflow in '-'");
    EXPECT_EQ(eval("4611686018427387904 * 2"), "Integer overflow in '*'");
}

//===----------------------------------------------------------------------===//
// Comparison and logic
//===----------------------------------------------------------------------===//

TEST(NiklOperators, Comparisons)
{
    EXPECT_EQ(eval("1 < 2"), "True");
    EXPECT_EQ(eval("2 <= 1"), "False");
    EXPECT_EQ(eval("2.5 >= 2"), "True");
    EXPECT_EQ(eval("3 > 2.5"), "True");
    EXPECT_EQ(eval("1 == 1.0"), "True");
    EXPECT_EQ(eval("\"a\" == \"a\""), "True");
    EXPECT_EQ(eval("\"a\" != \"b\""), "True");
    EXPECT_EQ(eval("True == False"), "False");
}

TEST(NiklOperators, BooleanLogic)
{
    EXPECT_EQ(eval("let a = True and False\nlet b = not a\nb or False"), "True");
    EXPECT_EQ(eval("not True"), "False");
    EXPECT_EQ(eval("False or False"), "False");
}

TEST(NiklOperators, LogicalOperatorsEvaluateBothSides)
{
    auto run = runScript(R"(
fn noisy() {
    print("evaluated")
    return True
}
False and noisy()
True or noisy()
)");
    ASSERT_TRUE(run.ok) << run.error;
    EXPECT_EQ(run.output, "evaluated\nevaluated\n");
}

//===----------------------------------------------------------------------===//
// Strings
//===----------------------------------------------------------------------===//

TEST(NiklOperators, StringConcatenation)
{
    EXPECT_EQ(eval("\"foo\" + \"bar\""), "foobar");
    EXPECT_EQ(eval("\"is \" + True"), "is True");
    EXPECT_EQ(eval("False + \"!\""), "False!");
}

//===----------------------------------------------------------------------===//
// Type errors
//===----------------------------------------------------------------------===//

TEST(NiklOperators, MismatchedOperandKinds)
{
    EXPECT_EQ(eval("\"a\" + 1"), "Type error: unsupported operator '+' for a (String) and 1 (Integer)");
    EXPECT_EQ(eval("\"a\" < \"b\""), "Type error: unsupported operator '<' for a (String) and b (String)");
    EXPECT_EQ(eval("1 and True"), "Type error: unsupported operator 'and' for 1 (Integer) and True (Boolean)");
    EXPECT_EQ(eval("[1] + [2]"), "Type error: unsupported operator '+' for [1] (Array) and [2] (Array)");
}

TEST(NiklOperators, UnaryOperatorKinds)
{
    EXPECT_EQ(eval("-(2 + 3)"), "-5");
    EXPECT_EQ(eval("-1.5"), "Unsupported unary operator '-' for 1.5 (Float)");
    EXPECT_EQ(eval("not 1"), "Unsupported unary operator 'not' for 1 (Integer)");
}

//===----------------------------------------------------------------------===//
// Direct evaluation
//===----------------------------------------------------------------------===//

TEST(NiklOperators, ApplyBinaryDirectly)
{
    auto sum = applyBinary(BinaryOp::Add, Value::integer(2), Value::floating(0.5));
    ASSERT_TRUE(sum.isOk()) << sum.error();
    ASSERT_TRUE(sum.value().is(ValueKind::Float));
    EXPECT_DOUBLE_EQ(sum.value().asFloat(), 2.5);

    auto cmp = applyBinary(BinaryOp::Ne, Value::boolean(true), Value::boolean(false));
    ASSERT_TRUE(cmp.isOk());
    EXPECT_TRUE(cmp.value().asBool());
}

TEST(NiklOperators, ApplyUnaryOverflow)
{
    auto neg = applyUnary(UnaryOp::Neg, Value::integer(INT64_MIN));
    ASSERT_FALSE(neg.isOk());
    EXPECT_EQ(neg.error(), "Integer overflow in '-'");
}
