/**
 * @file test_env_mapper.cpp
 * @brief Unit tests for environment variable mapping (GoogleTest)
 */

#include <gtest/gtest.h>

#include "stringly/EnvMapper.hpp"
#include "stringly/Errors.hpp"
#include "fixtures.hpp"

#include <cstdlib>
#include <string>
#include <vector>

using namespace stringly;

// ============================================================================
// Test Utilities
// ============================================================================

/**
 * @brief RAII guard that sets environment variables and removes them
 */
class EnvGuard {
public:
    void set(const std::string& name, const std::string& value) {
#ifdef _WIN32
        _putenv_s(name.c_str(), value.c_str());
#else
        setenv(name.c_str(), value.c_str(), 1);
#endif
        names_.push_back(name);
    }

    ~EnvGuard() {
        for (const auto& name : names_) {
#ifdef _WIN32
            _putenv_s(name.c_str(), "");
#else
            unsetenv(name.c_str());
#endif
        }
    }

private:
    std::vector<std::string> names_;
};

// ============================================================================
// Name transformation
// ============================================================================

TEST(TransformEnvName, SingleUnderscoreBecomesDot) {
    EXPECT_EQ(transform_env_name("INNER_Y"), "inner.y");
}

TEST(TransformEnvName, DoubleUnderscoreBecomesUnderscore) {
    EXPECT_EQ(transform_env_name("INNER_KEY__VALUE__PAIR_KEY"), "inner.key_value_pair.key");
}

TEST(StripPrefix, CaseInsensitive) {
    EXPECT_EQ(strip_prefix("APP_INNER_Y", "app"), "INNER_Y");
    EXPECT_EQ(strip_prefix("app_inner_y", "APP"), "inner_y");
}

TEST(StripPrefix, TrailingUnderscoreOnPrefixIgnored) {
    EXPECT_EQ(strip_prefix("APP_INNER_Y", "APP_"), "INNER_Y");
}

TEST(StripPrefix, NoMatch) {
    EXPECT_EQ(strip_prefix("APPLE_X", "APP"), "");
    EXPECT_EQ(strip_prefix("OTHER", "APP"), "");
}

// ============================================================================
// Collection
// ============================================================================

TEST(CollectEnvVars, EmptyPrefixRejected) {
    EXPECT_THROW(collect_env_vars(""), Error);
    EXPECT_THROW(collect_env_vars("__"), Error);
}

TEST(CollectEnvVars, SortedAndFiltered) {
    EnvGuard env;
    env.set("STRINGLYTEST1_B", "2");
    env.set("STRINGLYTEST1_A", "1");
    env.set("STRINGLYTEST1X_C", "3");

    auto vars = collect_env_vars("STRINGLYTEST1");
    ASSERT_EQ(vars.size(), 2u);
    EXPECT_EQ(vars[0].first, "STRINGLYTEST1_A");
    EXPECT_EQ(vars[1].first, "STRINGLYTEST1_B");
}

TEST(EnvOverrides, ParsesValues) {
    EnvGuard env;
    env.set("STRINGLYTEST2_INNER_X", "0.5");
    env.set("STRINGLYTEST2_INNER_Y", "-3");

    auto ov = env_overrides("STRINGLYTEST2");
    ASSERT_EQ(ov.size(), 2u);
    EXPECT_EQ(ov[0].first, "inner.x");
    EXPECT_EQ(ov[0].second, Value(0.5));
    EXPECT_EQ(ov[1].first, "inner.y");
    EXPECT_EQ(ov[1].second, Value(-3));
}

// ============================================================================
// apply_env
// ============================================================================

TEST(ApplyEnv, UpdatesNestedFields) {
    EnvGuard env;
    env.set("STRINGLYTEST3_INNER_Y", "-7");
    env.set("STRINGLYTEST3_INNER_KEY__VALUE__PAIR_KEY", "from-env");

    fixtures::Outer outer = fixtures::make_outer();
    apply_env(outer, "STRINGLYTEST3");

    EXPECT_EQ(outer.inner.y, -7);
    EXPECT_EQ(outer.inner.key_value_pair.key, "from-env");
    EXPECT_DOUBLE_EQ(outer.inner.x, 3.14);
}

TEST(ApplyEnv, UnknownVariableRollsBack) {
    EnvGuard env;
    env.set("STRINGLYTEST4_INNER_Y", "1");
    env.set("STRINGLYTEST4_INNER_WHAT", "2");

    fixtures::Outer outer = fixtures::make_outer();
    EXPECT_THROW(apply_env(outer, "STRINGLYTEST4"), UnknownField);
    EXPECT_EQ(outer.inner.y, 42);
}

TEST(ApplyEnv, NoMatchingVariablesIsNoOp) {
    fixtures::Outer outer = fixtures::make_outer();
    apply_env(outer, "STRINGLYTEST_NOTHING_SET");
    EXPECT_EQ(outer.inner.y, 42);
}
