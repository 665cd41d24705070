//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Tests for the Nikl parser: statement shapes, precedence, literals, type
// annotations and syntax diagnostics.
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "frontends/nikl/AST.hpp"
#include "frontends/nikl/Lexer.hpp"
#include "frontends/nikl/Parser.hpp"

#include <string>

using namespace nikl::frontends;

namespace
{

nikl::support::Expected<StmtList> parseSource(std::string_view source)
{
    auto tokens = tokenize(source);
    if (!tokens)
        return tokens.error();
    return parse(std::move(tokens.value()));
}

StmtList parseOk(std::string_view source)
{
    auto result = parseSource(source);
    EXPECT_TRUE(result.hasValue()) << (result ? "" : result.error().message);
    if (!result)
        return {};
    return std::move(result.value());
}

template <typename T> const T &as(const Stmt &stmt)
{
    return static_cast<const T &>(stmt);
}

template <typename T> const T &as(const Expr &expr)
{
    return static_cast<const T &>(expr);
}

const Expr &exprOf(const StmtList &program, size_t index = 0)
{
    return *as<ExprStmt>(*program.at(index)).expr;
}

} // namespace

//===----------------------------------------------------------------------===//
// Statements
//===----------------------------------------------------------------------===//

TEST(NiklParser, LetAndConst)
{
    auto program = parseOk("let x = 1\nconst y = 2");
    ASSERT_EQ(program.size(), 2u);
    ASSERT_EQ(program[0]->kind, StmtKind::Let);
    EXPECT_EQ(as<LetStmt>(*program[0]).name, "x");
    EXPECT_FALSE(as<LetStmt>(*program[0]).isConst);
    EXPECT_TRUE(as<LetStmt>(*program[1]).isConst);
    EXPECT_EQ(as<LetStmt>(*program[1]).init->kind, ExprKind::IntLiteral);
}

TEST(NiklParser, FunctionDefinition)
{
    auto program = parseOk("fn add(a, b,) { return a + b }");
    ASSERT_EQ(program.size(), 1u);
    const auto &fn = as<FnStmt>(*program[0]);
    EXPECT_EQ(fn.name, "add");
    ASSERT_EQ(fn.params.size(), 2u);
    EXPECT_EQ(fn.params[1], "b");
    ASSERT_EQ(fn.body.size(), 1u);
    EXPECT_EQ(fn.body[0]->kind, StmtKind::Return);
}

TEST(NiklParser, BareReturnHasNoValue)
{
    auto program = parseOk("fn f() { return }");
    const auto &fn = as<FnStmt>(*program.at(0));
    ASSERT_EQ(fn.body.size(), 1u);
    EXPECT_TRUE(as<ReturnStmt>(*fn.body[0]).value == nullptr);
}

TEST(NiklParser, IfElifElse)
{
    auto program = parseOk(R"(
if (x > 1) { a = 1 } elif (x > 0) { a = 2 } elif x == 0 { a = 3 } else { a = 4 }
)");
    ASSERT_EQ(program.size(), 1u);
    const auto &stmt = as<IfStmt>(*program[0]);
    EXPECT_EQ(stmt.primary.body.size(), 1u);
    EXPECT_EQ(stmt.elifs.size(), 2u);
    ASSERT_TRUE(stmt.elseBody.has_value());
    EXPECT_EQ(stmt.elseBody->size(), 1u);
}

TEST(NiklParser, IfWithoutElse)
{
    auto program = parseOk("if True { print(1) }");
    const auto &stmt = as<IfStmt>(*program.at(0));
    EXPECT_TRUE(stmt.elifs.empty());
    EXPECT_FALSE(stmt.elseBody.has_value());
}

TEST(NiklParser, Loops)
{
    auto program = parseOk(R"(
while (i < 3) { i = i + 1 }
loop { break }
for k, v in m { continue }
for c in "abc" { print(c) }
)");
    ASSERT_EQ(program.size(), 4u);
    EXPECT_EQ(program[0]->kind, StmtKind::While);
    EXPECT_EQ(program[1]->kind, StmtKind::Loop);
    EXPECT_EQ(as<LoopStmt>(*program[1]).body.at(0)->kind, StmtKind::Break);

    const auto &pairs = as<ForStmt>(*program[2]);
    ASSERT_EQ(pairs.names.size(), 2u);
    EXPECT_EQ(pairs.names[0], "k");
    EXPECT_EQ(pairs.names[1], "v");
    EXPECT_EQ(pairs.body.at(0)->kind, StmtKind::Continue);

    const auto &chars = as<ForStmt>(*program[3]);
    ASSERT_EQ(chars.names.size(), 1u);
    EXPECT_EQ(chars.iterable->kind, ExprKind::StringLiteral);
}

TEST(NiklParser, DelAndImport)
{
    auto program = parseOk("del x\nimport \"lib/util\" as util");
    ASSERT_EQ(program.size(), 2u);
    EXPECT_EQ(as<DelStmt>(*program[0]).name, "x");
    const auto &imp = as<ImportStmt>(*program[1]);
    EXPECT_EQ(imp.path, "lib/util");
    EXPECT_EQ(imp.alias, "util");
}

TEST(NiklParser, ImportRequiresAlias)
{
    auto result = parseSource("import \"os\"");
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().code, "N2001");
    EXPECT_EQ(result.error().message, "Expected 'as', found end of input at line 1, column 12");
}

//===----------------------------------------------------------------------===//
// Expressions
//===----------------------------------------------------------------------===//

TEST(NiklParser, MultiplicationBindsTighterThanAddition)
{
    auto program = parseOk("1 + 2 * 3");
    const auto &add = as<BinaryExpr>(exprOf(program));
    EXPECT_EQ(add.op, BinaryOp::Add);
    EXPECT_EQ(add.left->kind, ExprKind::IntLiteral);
    ASSERT_EQ(add.right->kind, ExprKind::Binary);
    EXPECT_EQ(as<BinaryExpr>(*add.right).op, BinaryOp::Mul);
}

TEST(NiklParser, SubtractionIsLeftAssociative)
{
    auto program = parseOk("8 - 4 - 2");
    const auto &outer = as<BinaryExpr>(exprOf(program));
    EXPECT_EQ(outer.op, BinaryOp::Sub);
    ASSERT_EQ(outer.left->kind, ExprKind::Binary);
    EXPECT_EQ(outer.right->kind, ExprKind::IntLiteral);
}

TEST(NiklParser, LogicalPrecedence)
{
    // or < and < equality < comparison
    auto program = parseOk("a or b and c == d < e");
    const auto &orExpr = as<BinaryExpr>(exprOf(program));
    EXPECT_EQ(orExpr.op, BinaryOp::Or);
    const auto &andExpr = as<BinaryExpr>(*orExpr.right);
    EXPECT_EQ(andExpr.op, BinaryOp::And);
    const auto &eqExpr = as<BinaryExpr>(*andExpr.right);
    EXPECT_EQ(eqExpr.op, BinaryOp::Eq);
    EXPECT_EQ(as<BinaryExpr>(*eqExpr.right).op, BinaryOp::Lt);
}

TEST(NiklParser, UnaryOperators)
{
    auto program = parseOk("not -x");
    const auto &notExpr = as<UnaryExpr>(exprOf(program));
    EXPECT_EQ(notExpr.op, UnaryOp::Not);
    EXPECT_EQ(as<UnaryExpr>(*notExpr.operand).op, UnaryOp::Neg);
}

TEST(NiklParser, AssignmentIsRightAssociative)
{
    auto program = parseOk("a = b = 3");
    const auto &outer = as<AssignExpr>(exprOf(program));
    EXPECT_EQ(outer.target, "a");
    ASSERT_EQ(outer.value->kind, ExprKind::Assign);
    EXPECT_EQ(as<AssignExpr>(*outer.value).target, "b");
}

TEST(NiklParser, PostfixChains)
{
    auto program = parseOk("f()(x).y()");
    const auto &call = as<CallExpr>(exprOf(program));
    EXPECT_TRUE(call.args.empty());
    const auto &dot = as<DotExpr>(*call.callee);
    EXPECT_EQ(dot.property, "y");
    const auto &inner = as<CallExpr>(*dot.object);
    ASSERT_EQ(inner.args.size(), 1u);
    EXPECT_EQ(inner.callee->kind, ExprKind::Call);
}

TEST(NiklParser, ParenthesesTuplesAndGrouping)
{
    auto grouped = parseOk("(1)");
    ASSERT_EQ(grouped.size(), 1u);
    EXPECT_EQ(exprOf(grouped, 0).kind, ExprKind::IntLiteral);

    auto empty = parseOk("()");
    ASSERT_EQ(empty.size(), 1u);
    EXPECT_TRUE(as<TupleLiteralExpr>(exprOf(empty, 0)).elements.empty());

    auto single = parseOk("(1,)");
    ASSERT_EQ(single.size(), 1u);
    EXPECT_EQ(as<TupleLiteralExpr>(exprOf(single, 0)).elements.size(), 1u);

    auto triple = parseOk("(1, 2, 3,)");
    ASSERT_EQ(triple.size(), 1u);
    EXPECT_EQ(as<TupleLiteralExpr>(exprOf(triple, 0)).elements.size(), 3u);
}

TEST(NiklParser, ParenthesisOnNextLineContinuesCall)
{
    // Newlines do not end statements, so a line starting with '(' calls the
    // previous expression.
    auto program = parseOk("f\n(1)\n(2, 3)");
    ASSERT_EQ(program.size(), 1u);
    const auto &outer = as<CallExpr>(exprOf(program, 0));
    ASSERT_EQ(outer.args.size(), 2u);
    const auto &inner = as<CallExpr>(*outer.callee);
    ASSERT_EQ(inner.args.size(), 1u);
    EXPECT_EQ(as<IdentExpr>(*inner.callee).name, "f");

    auto separated = parseOk("let t = (1,)\nlet u = ()");
    EXPECT_EQ(separated.size(), 2u);
}

TEST(NiklParser, ArrayAndMapLiterals)
{
    auto program = parseOk(R"([1, "two", [3],]
{"a": 1, "b": [2], "a": 3})");
    ASSERT_EQ(program.size(), 2u);
    EXPECT_EQ(as<ArrayLiteralExpr>(exprOf(program, 0)).elements.size(), 3u);
    // Duplicate keys are kept.
    EXPECT_EQ(as<MapLiteralExpr>(exprOf(program, 1)).entries.size(), 3u);
}

//===----------------------------------------------------------------------===//
// Type annotations
//===----------------------------------------------------------------------===//

TEST(NiklParser, AnnotationsAreAcceptedAndDiscarded)
{
    auto program = parseOk(R"(
let count: Int = 0
let names: Array[String] = []
let table: HashMap[String, [Int]] = {}
let pair: (Int, Float) = (1, 2.0)
fn add(a: int, b) -> Int { return a + b }
fn concat(a: str, b: bool, c: float, d: new_var_type) -> str { return a }
)");
    ASSERT_EQ(program.size(), 6u);
    EXPECT_EQ(as<FnStmt>(*program[4]).params.size(), 2u);
    EXPECT_EQ(as<FnStmt>(*program[5]).params.size(), 4u);
}

TEST(NiklParser, InvalidAnnotation)
{
    auto result = parseSource("let x: 5 = 1");
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().code, "N2004");
}

//===----------------------------------------------------------------------===//
// Diagnostics
//===----------------------------------------------------------------------===//

TEST(NiklParser, InvalidAssignmentTarget)
{
    auto result = parseSource("f() = 3");
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().code, "N2002");
    EXPECT_EQ(result.error().message, "Invalid assignment target");
}

TEST(NiklParser, ReservedKeywordsAreRejected)
{
    for (const char *source : {"spawn f()", "wait t", "pub fn f() {}"})
    {
        auto result = parseSource(source);
        ASSERT_FALSE(result.hasValue()) << source;
        EXPECT_EQ(result.error().code, "N2003") << source;
    }
}

TEST(NiklParser, MissingClosingBrace)
{
    auto result = parseSource("fn f() {\n  return 1\n");
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().code, "N2001");
    EXPECT_EQ(result.error().message, "Expected '}', found end of input at line 3, column 1");
}

TEST(NiklParser, MissingExpression)
{
    auto result = parseSource("let x = )");
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().message, "Expected expression, found ')' at line 1, column 9");
    EXPECT_EQ(result.error().loc.line, 1u);
    EXPECT_EQ(result.error().loc.column, 9u);
}

TEST(NiklParser, DeepNestingIsASyntaxError)
{
    std::string source(300, '(');
    source += "1";
    source += std::string(300, ')');
    auto result = parseSource(source);
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().code, "N2005");
}

TEST(NiklParser, DeepTypeAnnotationIsASyntaxError)
{
    std::string deep = "let x: " + std::string(300, '[') + "Int" + std::string(300, ']') + " = 1";
    auto result = parseSource(deep);
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().code, "N2005");
    EXPECT_EQ(result.error().message, "type annotation nesting too deep (limit: 256)");

    std::string shallow = "let x: " + std::string(50, '(') + "Int" + std::string(50, ')') + " = 1";
    EXPECT_TRUE(parseSource(shallow).hasValue());
}

TEST(NiklParser, NestingWithinLimitParses)
{
    std::string source(100, '(');
    source += "1";
    source += std::string(100, ')');
    auto program = parseOk(source);
    ASSERT_EQ(program.size(), 1u);
    EXPECT_EQ(exprOf(program).kind, ExprKind::IntLiteral);
}
