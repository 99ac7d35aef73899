//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/EnvironmentTests.cpp
// Purpose: Verify scope lookup, shadowing, assignment and constants.
// Key invariants: Lookups walk the enclosing chain; definitions only touch
//                 the innermost scope.
// Ownership/Lifetime: Scopes are shared_ptr-owned by each test.
// Links: src/interp/Environment.cpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "interp/Environment.hpp"
#include "interp/RuntimeError.hpp"

#include <memory>

using namespace roadman::interp;
using roadman::support::SourceLoc;

TEST(EnvironmentTest, DefineAndGet)
{
    Environment env;
    env.define("a", Value::number(1));
    EXPECT_TRUE(env.containsLocal("a"));
    EXPECT_EQ(env.size(), 1u);
    EXPECT_DOUBLE_EQ(env.get("a", {}).asNumber(), 1.0);
}

TEST(EnvironmentTest, LookupWalksEnclosingChain)
{
    auto outer = std::make_shared<Environment>();
    outer->define("a", Value::number(10));
    auto inner = std::make_shared<Environment>(outer);
    inner->define("a", Value::number(20));
    inner->define("b", Value::string("x"));

    EXPECT_DOUBLE_EQ(inner->get("a", {}).asNumber(), 20.0);
    EXPECT_DOUBLE_EQ(outer->get("a", {}).asNumber(), 10.0);
    EXPECT_FALSE(outer->containsLocal("b"));
    EXPECT_EQ(inner->enclosing(), outer);
}

TEST(EnvironmentTest, AssignUpdatesNearestBinding)
{
    auto outer = std::make_shared<Environment>();
    outer->define("a", Value::number(1));
    auto inner = std::make_shared<Environment>(outer);

    inner->assign("a", Value::number(5), {});
    EXPECT_FALSE(inner->containsLocal("a"));
    EXPECT_DOUBLE_EQ(outer->get("a", {}).asNumber(), 5.0);
}

TEST(EnvironmentTest, UndefinedNameThrowsWithLocation)
{
    Environment env;
    SourceLoc loc{1, 4, 2};
    try
    {
        (void)env.get("missing", loc);
        FAIL() << "expected RuntimeError";
    }
    catch (const RuntimeError &err)
    {
        EXPECT_EQ(err.kind(), RuntimeErrorKind::UndefinedVariable);
        EXPECT_STREQ(err.what(), "Undefined variable 'missing'.");
        EXPECT_EQ(err.loc().line, 4u);
        EXPECT_EQ(err.loc().column, 2u);
    }

    EXPECT_THROW(env.assign("missing", Value(), loc), RuntimeError);
}

TEST(EnvironmentTest, ConstantsRejectAssignment)
{
    Environment env;
    env.define("k", Value::number(3), true);
    try
    {
        env.assign("k", Value::number(4), {});
        FAIL() << "expected RuntimeError";
    }
    catch (const RuntimeError &err)
    {
        EXPECT_EQ(err.kind(), RuntimeErrorKind::ConstAssignment);
        EXPECT_STREQ(err.what(), "Cannot assign to constant 'k'.");
    }
    EXPECT_DOUBLE_EQ(env.get("k", {}).asNumber(), 3.0);
}

TEST(EnvironmentTest, RedefinitionReplacesBinding)
{
    Environment env;
    env.define("k", Value::number(3), true);
    env.define("k", Value::string("now mutable"));
    EXPECT_EQ(env.size(), 1u);
    env.assign("k", Value::boolean(true), {});
    EXPECT_TRUE(env.get("k", {}).asBool());
}

TEST(EnvironmentTest, ClearDropsBindings)
{
    Environment env;
    env.define("a", Value::number(1));
    env.clear();
    EXPECT_EQ(env.size(), 0u);
    EXPECT_FALSE(env.containsLocal("a"));
}

TEST(EnvironmentTest, AssignPrefersShadowingBinding)
{
    auto outer = std::make_shared<Environment>();
    outer->define("a", Value::number(1));
    auto inner = std::make_shared<Environment>(outer);
    inner->define("a", Value::number(2));

    inner->assign("a", Value::number(3), {});
    EXPECT_DOUBLE_EQ(inner->get("a", {}).asNumber(), 3.0);
    EXPECT_DOUBLE_EQ(outer->get("a", {}).asNumber(), 1.0);
}

TEST(EnvironmentTest, ForEachValueVisitsLocalBindingsOnly)
{
    auto outer = std::make_shared<Environment>();
    outer->define("a", Value::number(1));
    Environment inner(outer);
    inner.define("b", Value::number(2));
    inner.define("c", Value::number(3));

    double sum = 0;
    inner.forEachValue([&](const Value &v) { sum += v.asNumber(); });
    EXPECT_DOUBLE_EQ(sum, 5.0);
}
