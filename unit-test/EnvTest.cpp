#include <string>
#include <utility>
#include <vector>
#include "common/utils.hpp"
#include "config.hpp"
#include "env.hpp"
#include "gtest/gtest.h"
#include "sandbox/limits.hpp"

using namespace std;
using namespace sandbox;

class EnvTest : public ::testing::Test {
protected:
    void SetUp() override {
        time_limit = TIME_LIMIT;
        memory_limit = MEMORY_LIMIT;
        output_limit = OUTPUT_LIMIT;
        for (auto key : {"SANDBOX_TIME_LIMIT", "SANDBOX_MEMORY_LIMIT", "SANDBOX_OUTPUT_LIMIT"})
            saved.emplace_back(key, get_env(key, ""));
    }

    void TearDown() override {
        TIME_LIMIT = time_limit;
        MEMORY_LIMIT = memory_limit;
        OUTPUT_LIMIT = output_limit;
        for (auto &[key, value] : saved)
            set_env(key, value);
    }

    int time_limit, memory_limit, output_limit;
    vector<pair<string, string>> saved;
};

TEST_F(EnvTest, OverridesDefaults) {
    set_env("SANDBOX_TIME_LIMIT", "7");
    set_env("SANDBOX_MEMORY_LIMIT", "64");
    set_env("SANDBOX_OUTPUT_LIMIT", "2");
    load_env_config();

    EXPECT_EQ(7, TIME_LIMIT);
    EXPECT_EQ(64, MEMORY_LIMIT);
    EXPECT_EQ(2, OUTPUT_LIMIT);

    resource_limits limits = resource_limits::defaults();
    EXPECT_EQ(7, limits.time_limit);
    EXPECT_EQ(64 * 1024 * 1024, limits.memory_limit);
    EXPECT_EQ(2048, limits.output_limit);
}

TEST_F(EnvTest, EmptyValueKeepsDefault) {
    set_env("SANDBOX_TIME_LIMIT", "");
    load_env_config();
    EXPECT_EQ(time_limit, TIME_LIMIT);
}

TEST_F(EnvTest, RejectsInvalidValues) {
    set_env("SANDBOX_TIME_LIMIT", "five");
    EXPECT_THROW(load_env_config(), invalid_argument);

    set_env("SANDBOX_TIME_LIMIT", "-1");
    EXPECT_THROW(load_env_config(), invalid_argument);
    EXPECT_EQ(time_limit, TIME_LIMIT);
}
