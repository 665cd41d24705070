//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Tests for the Nikl interpreter core: bindings, functions, closures, records
// and runtime errors.
//
//===----------------------------------------------------------------------===//

#include "tests/nikl/NiklTestUtils.hpp"

using nikl::runtime::ValueKind;
using nikl::test::runScript;

//===----------------------------------------------------------------------===//
// Bindings
//===----------------------------------------------------------------------===//

TEST(NiklInterpreter, VariableDeclarationAndAssignment)
{
    auto run = runScript(R"(
let x = 10
let y = 20
x = x + y
print(x)    // 30
)");
    ASSERT_TRUE(run.ok) << run.error;
    EXPECT_EQ(run.output, "30\n");
}

TEST(NiklInterpreter, NonAsciiIdentifiers)
{
    auto run = runScript("let caf\xC3\xA9 = 1\nprint(caf\xC3\xA9)");
    ASSERT_TRUE(run.ok) << run.error;
    EXPECT_EQ(run.output, "1\n");
}

TEST(NiklInterpreter, AssignmentYieldsAssignedValue)
{
    auto run = runScript("let a = 0\nlet b = 0\na = b = 4\nprint(a, b)");
    ASSERT_TRUE(run.ok) << run.error;
    EXPECT_EQ(run.output, "4 4\n");
}

TEST(NiklInterpreter, ConstantsCannotBeReassigned)
{
    auto run = runScript("const x = 5\nx = 10");
    ASSERT_FALSE(run.ok);
    EXPECT_EQ(run.error, "Cannot assign to constant 'x'");
}

TEST(NiklInterpreter, MutableRebindingIsObserved)
{
    auto run = runScript("let x = 5\nx = 10\nx");
    ASSERT_TRUE(run.ok) << run.error;
    ASSERT_TRUE(run.value.is(ValueKind::Integer));
    EXPECT_EQ(run.value.asInteger(), 10);
}

TEST(NiklInterpreter, RedeclarationInSameScopeFails)
{
    auto run = runScript("let x = 1\nlet x = 2");
    ASSERT_FALSE(run.ok);
    EXPECT_EQ(run.error, "Variable 'x' is already declared in this scope");
}

TEST(NiklInterpreter, UndefinedVariable)
{
    auto run = runScript("print(missing)");
    ASSERT_FALSE(run.ok);
    EXPECT_EQ(run.error, "Undefined variable 'missing'");
}

TEST(NiklInterpreter, AssignToUndefinedVariable)
{
    auto run = runScript("ghost = 1");
    ASSERT_FALSE(run.ok);
    EXPECT_EQ(run.error, "Variable 'ghost' is not defined");
}

TEST(NiklInterpreter, DeleteRemovesBinding)
{
    auto run = runScript("let x = 1\ndel x\nprint(x)");
    ASSERT_FALSE(run.ok);
    EXPECT_EQ(run.error, "Undefined variable 'x'");
}

TEST(NiklInterpreter, DeleteOfUndefinedNameNamesIt)
{
    auto run = runScript("del nothing");
    ASSERT_FALSE(run.ok);
    EXPECT_EQ(run.error, "Variable 'nothing' is not defined");
}

TEST(NiklInterpreter, DeleteIgnoresConstness)
{
    auto run = runScript("const c = 1\ndel c\nlet c = 2\nprint(c)");
    ASSERT_TRUE(run.ok) << run.error;
    EXPECT_EQ(run.output, "2\n");
}

TEST(NiklInterpreter, BuiltinsMayBeShadowed)
{
    auto run = runScript(R"(
let str = "Hello"
let len_ = len(str)
print(len_)
)");
    ASSERT_TRUE(run.ok) << run.error;
    EXPECT_EQ(run.output, "5\n");
}

TEST(NiklInterpreter, ErrorStopsExecution)
{
    auto run = runScript("print(1)\nlet a = 10 / 0\nprint(2)");
    ASSERT_FALSE(run.ok);
    EXPECT_EQ(run.error, "Division by zero");
    EXPECT_EQ(run.output, "1\n");
}

TEST(NiklInterpreter, RunYieldsLastExpressionValue)
{
    auto run = runScript("let a = 2\na * 21");
    ASSERT_TRUE(run.ok) << run.error;
    ASSERT_TRUE(run.value.is(ValueKind::Integer));
    EXPECT_EQ(run.value.asInteger(), 42);
}

//===----------------------------------------------------------------------===//
// Functions
//===----------------------------------------------------------------------===//

TEST(NiklInterpreter, FunctionDefinitionAndCall)
{
    auto run = runScript(R"(
fn add(a, b) {
    return a + b
}

let result = add(3, 4)
print(result)
)");
    ASSERT_TRUE(run.ok) << run.error;
    EXPECT_EQ(run.output, "7\n");
}

TEST(NiklInterpreter, ReturnFromInsideIf)
{
    auto run = runScript(R"(
fn max(a, b) {
    if (a > b) {
        return a
    } else {
        return b
    }
}
print(max(7, 4), max(2, 9))
)");
    ASSERT_TRUE(run.ok) << run.error;
    EXPECT_EQ(run.output, "7 9\n");
}

TEST(NiklInterpreter, NestedCalls)
{
    auto run = runScript(R"(
fn square(x) { return x * x }
fn double(x) { return x + x }
print(square(double(3)))
)");
    ASSERT_TRUE(run.ok) << run.error;
    EXPECT_EQ(run.output, "36\n");
}

TEST(NiklInterpreter, FunctionWithoutReturnYieldsNone)
{
    auto run = runScript("fn f() { 1 + 1 }\nfn g() { return }\nprint(f(), g())");
    ASSERT_TRUE(run.ok) << run.error;
    EXPECT_EQ(run.output, "None None\n");
}

TEST(NiklInterpreter, SelfRecursion)
{
    auto run = runScript(R"(
fn fact(n) {
    if n <= 1 { return 1 }
    return n * fact(n - 1)
}
print(fact(10))
)");
    ASSERT_TRUE(run.ok) << run.error;
    EXPECT_EQ(run.output, "3628800\n");
}

TEST(NiklInterpreter, ParametersAreMutable)
{
    auto run = runScript("fn bump(a) { a = a + 1\nreturn a }\nprint(bump(1))");
    ASSERT_TRUE(run.ok) << run.error;
    EXPECT_EQ(run.output, "2\n");
}

TEST(NiklInterpreter, ArityMismatchNamesFunction)
{
    auto run = runScript("fn add(a, b) { return a + b }\nadd(1)");
    ASSERT_FALSE(run.ok);
    EXPECT_EQ(run.error, "Function 'add' expects 2 arguments, but got 1");
}

TEST(NiklInterpreter, CallingNonFunction)
{
    auto run = runScript("let n = 5\nn()");
    ASSERT_FALSE(run.ok);
    EXPECT_EQ(run.error, "Tried to call non-function 5");
}

TEST(NiklInterpreter, ArgumentsEvaluatedBeforeCalleeCheck)
{
    auto run = runScript("let n = 5\nn(print(\"side effect\"))");
    ASSERT_FALSE(run.ok);
    EXPECT_EQ(run.output, "side effect\n");
}

TEST(NiklInterpreter, FunctionsAreValues)
{
    auto run = runScript(R"(
fn apply(f, x) { return f(x) }
fn inc(x) { return x + 1 }
let g = inc
print(apply(g, 41), type(g), g)
)");
    ASSERT_TRUE(run.ok) << run.error;
    EXPECT_EQ(run.output, "42 Function <function inc>\n");
}

TEST(NiklInterpreter, BreakEscapingFunctionIsAnError)
{
    auto run = runScript("fn f() { break }\nloop { f() }");
    ASSERT_FALSE(run.ok);
    EXPECT_EQ(run.error, "'break' outside of loop");
}

//===----------------------------------------------------------------------===//
// Scoping and closures
//===----------------------------------------------------------------------===//

TEST(NiklInterpreter, LocalShadowingLeavesOuterBinding)
{
    auto run = runScript(R"(
let x = 5
fn foo() {
    let x = 10
    print(x)
}
foo()
print(x)
)");
    ASSERT_TRUE(run.ok) << run.error;
    EXPECT_EQ(run.output, "10\n5\n");
}

TEST(NiklInterpreter, ClosureSeesDefiningEnvironment)
{
    auto run = runScript(R"(
let x = 100
fn show(y) {
    print(x + y)
}
show(50)
)");
    ASSERT_TRUE(run.ok) << run.error;
    EXPECT_EQ(run.output, "150\n");
}

TEST(NiklInterpreter, ClosureCapturesByValue)
{
    auto run = runScript(R"(
let x = 1
fn get() { return x }
x = 2
print(get(), x)
)");
    ASSERT_TRUE(run.ok) << run.error;
    EXPECT_EQ(run.output, "1 2\n");
}

TEST(NiklInterpreter, CallsCannotMutateCallerBindings)
{
    auto run = runScript(R"(
let count = 0
fn inc() { count = count + 1
return count }
print(inc(), inc(), count)
)");
    ASSERT_TRUE(run.ok) << run.error;
    EXPECT_EQ(run.output, "1 1 0\n");
}

TEST(NiklInterpreter, NestedFunctionCapturesParameters)
{
    auto run = runScript(R"(
fn adder(a) {
    fn add(b) { return a + b }
    return add
}
let add5 = adder(5)
print(add5(3))
)");
    ASSERT_TRUE(run.ok) << run.error;
    EXPECT_EQ(run.output, "8\n");
}

TEST(NiklInterpreter, FunctionsDoNotSeeLaterBindings)
{
    auto run = runScript(R"(
fn first() { return second() }
fn second() { return 2 }
first()
)");
    ASSERT_FALSE(run.ok);
    EXPECT_EQ(run.error, "Undefined variable 'second'");
}

TEST(NiklInterpreter, BindingsPersistAcrossRuns)
{
    nikl::runtime::Interpreter interp;
    EXPECT_EQ(nikl::test::runIn(interp, "let total = 1\nfn twice(n) { return n * 2 }"), "");
    std::string output;
    EXPECT_EQ(nikl::test::runIn(interp, "total = twice(total + 2)\nprint(total)", &output), "");
    EXPECT_EQ(output, "6\n");
}

TEST(NiklInterpreter, ExportBindingsExcludesPrelude)
{
    nikl::runtime::Interpreter interp;
    ASSERT_EQ(nikl::test::runIn(interp, "let b = 2\nlet a = 1"), "");
    auto record = interp.exportBindings();
    ASSERT_TRUE(record.is(ValueKind::HashMap));
    EXPECT_EQ(record.toString(), "{a: 1, b: 2}");
    EXPECT_EQ(record.lookup("print"), nullptr);
}

//===----------------------------------------------------------------------===//
// Records
//===----------------------------------------------------------------------===//

TEST(NiklInterpreter, DotAccessOnHashMap)
{
    auto run = runScript(R"(
fn twice(x) { return x * 2 }
let ops = {"twice": twice, "name": "ops", 1: "one"}
print(ops.name, ops.twice(4))
)");
    ASSERT_TRUE(run.ok) << run.error;
    EXPECT_EQ(run.output, "ops 8\n");
}

TEST(NiklInterpreter, DuplicateKeysResolveToFirst)
{
    auto run = runScript("let m = {\"k\": 1, \"k\": 2}\nprint(m.k, len(m))");
    ASSERT_TRUE(run.ok) << run.error;
    EXPECT_EQ(run.output, "1 2\n");
}

TEST(NiklInterpreter, MissingProperty)
{
    auto run = runScript("let m = {\"a\": 1}\nm.b");
    ASSERT_FALSE(run.ok);
    EXPECT_EQ(run.error, "Property 'b' not found");
}

TEST(NiklInterpreter, DotAccessOnNonRecord)
{
    auto run = runScript("let a = [1]\na.length");
    ASSERT_FALSE(run.ok);
    EXPECT_EQ(run.error, "Cannot access property 'length' on Array");
}

TEST(NiklInterpreter, CompositeDisplay)
{
    auto run = runScript(R"(print([1, [2, 3]], (1,), (), {"k": "v", 2: True}, 2.5))");
    ASSERT_TRUE(run.ok) << run.error;
    EXPECT_EQ(run.output, "[1, [2, 3]] (1) () {k: v, 2: True} 2.5\n");
}

TEST(NiklInterpreter, SyntaxErrorsReachTheCaller)
{
    auto run = runScript("let = 1");
    ASSERT_FALSE(run.ok);
    EXPECT_EQ(run.error, "Expected identifier, found '=' at line 1, column 5");
}
