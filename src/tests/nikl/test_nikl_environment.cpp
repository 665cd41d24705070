//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Tests for the scope chain: define/get/assign/remove, scope push and pop,
// flattening and deep copies.
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "runtime/nikl/Environment.hpp"

using namespace nikl::runtime;

TEST(NiklEnvironment, DefineAndGet)
{
    Environment env;
    ASSERT_TRUE(env.define("x", Value::integer(1), true).isOk());
    auto x = env.get("x");
    ASSERT_TRUE(x.isOk());
    EXPECT_EQ(x.value().asInteger(), 1);

    auto missing = env.get("y");
    ASSERT_FALSE(missing.isOk());
    EXPECT_EQ(missing.error(), "Undefined variable 'y'");
}

TEST(NiklEnvironment, DefineRejectsDuplicateInSameScopeOnly)
{
    Environment env;
    ASSERT_TRUE(env.define("x", Value::integer(1), true).isOk());
    auto again = env.define("x", Value::integer(2), true);
    ASSERT_FALSE(again.isOk());
    EXPECT_EQ(again.error(), "Variable 'x' is already declared in this scope");

    env.pushScope();
    EXPECT_TRUE(env.define("x", Value::integer(3), true).isOk());
    EXPECT_EQ(env.get("x").value().asInteger(), 3);
    env.popScope();
    EXPECT_EQ(env.get("x").value().asInteger(), 1);
}

TEST(NiklEnvironment, DeclareOverwrites)
{
    Environment env;
    env.declare("k", Value::integer(1), false);
    env.declare("k", Value::integer(2), true);
    ASSERT_NE(env.find("k"), nullptr);
    EXPECT_TRUE(env.find("k")->isMutable);
    EXPECT_EQ(env.find("k")->value.asInteger(), 2);
}

TEST(NiklEnvironment, AssignWalksOutward)
{
    Environment env;
    ASSERT_TRUE(env.define("x", Value::integer(1), true).isOk());
    env.pushScope();
    env.pushScope();
    ASSERT_TRUE(env.assign("x", Value::integer(9)).isOk());
    env.popScope();
    env.popScope();
    EXPECT_EQ(env.get("x").value().asInteger(), 9);
}

TEST(NiklEnvironment, AssignFailures)
{
    Environment env;
    ASSERT_TRUE(env.define("c", Value::integer(1), false).isOk());

    auto constant = env.assign("c", Value::integer(2));
    ASSERT_FALSE(constant.isOk());
    EXPECT_EQ(constant.error(), "Cannot assign to constant 'c'");

    auto unknown = env.assign("u", Value::integer(2));
    ASSERT_FALSE(unknown.isOk());
    EXPECT_EQ(unknown.error(), "Variable 'u' is not defined");
}

TEST(NiklEnvironment, AssignTargetsNearestBinding)
{
    Environment env;
    ASSERT_TRUE(env.define("x", Value::integer(1), true).isOk());
    env.pushScope();
    ASSERT_TRUE(env.define("x", Value::integer(2), false).isOk());
    // The nearest binding is constant even though the outer one is not.
    EXPECT_FALSE(env.assign("x", Value::integer(3)).isOk());
}

TEST(NiklEnvironment, RemoveFirstMatchOutward)
{
    Environment env;
    ASSERT_TRUE(env.define("x", Value::integer(1), true).isOk());
    env.pushScope();
    ASSERT_TRUE(env.define("x", Value::integer(2), true).isOk());

    ASSERT_TRUE(env.remove("x").isOk());
    EXPECT_EQ(env.get("x").value().asInteger(), 1);
    ASSERT_TRUE(env.remove("x").isOk());
    EXPECT_FALSE(env.get("x").isOk());

    auto again = env.remove("x");
    ASSERT_FALSE(again.isOk());
    EXPECT_EQ(again.error(), "Variable 'x' is not defined");
}

TEST(NiklEnvironment, DepthFollowsPushAndPop)
{
    Environment env;
    EXPECT_EQ(env.depth(), 1u);
    env.pushScope();
    env.pushScope();
    EXPECT_EQ(env.depth(), 3u);
    env.popScope();
    EXPECT_EQ(env.depth(), 2u);
    env.popScope();
    env.popScope();
    EXPECT_EQ(env.depth(), 1u);
}

TEST(NiklEnvironment, FlattenShadowsAndSkips)
{
    Environment env;
    env.declare("builtin", Value::integer(0), false);
    env.pushScope();
    env.declare("b", Value::integer(1), true);
    env.declare("a", Value::integer(1), true);
    env.pushScope();
    env.declare("b", Value::integer(2), true);

    auto all = env.flatten();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].first, "a");
    EXPECT_EQ(all[1].first, "b");
    EXPECT_EQ(all[1].second.asInteger(), 2);
    EXPECT_EQ(all[2].first, "builtin");

    auto user = env.flatten(1);
    ASSERT_EQ(user.size(), 2u);
    EXPECT_EQ(user[0].first, "a");
    EXPECT_EQ(user[1].first, "b");
}

TEST(NiklEnvironment, CopiesAreIndependent)
{
    Environment env;
    ASSERT_TRUE(env.define("x", Value::integer(1), true).isOk());
    env.pushScope();

    Environment snapshot = env;
    ASSERT_TRUE(env.assign("x", Value::integer(5)).isOk());

    EXPECT_EQ(snapshot.get("x").value().asInteger(), 1);
    EXPECT_EQ(snapshot.depth(), 2u);
    EXPECT_EQ(env.get("x").value().asInteger(), 5);
}
