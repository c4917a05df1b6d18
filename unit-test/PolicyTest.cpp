#include "gtest/gtest.h"
#include "sandbox/policy.hpp"

using namespace std;
using namespace sandbox;

TEST(PolicyTest, AcceptsPureComputation) {
    EXPECT_FALSE(screen("print(2+2)"));
    EXPECT_FALSE(screen("x = [i * i for i in range(10)]\nprint(sum(x))"));
}

TEST(PolicyTest, RejectsImportOfOs) {
    auto violation = screen("import os\nprint(os.getcwd())");
    ASSERT_TRUE(violation);
    EXPECT_EQ("os", violation->token);
    EXPECT_EQ("Blocked operation detected: os", violation->message());
}

TEST(PolicyTest, MatchesCaseInsensitively) {
    auto violation = screen("SUBPROCESS.run(['ls'])");
    ASSERT_TRUE(violation);
    EXPECT_EQ("subprocess", violation->token);
}

TEST(PolicyTest, FirstTokenInListWins) {
    // "subprocess" 排在 "open" 之前，尽管 open 在代码中先出现
    auto violation = screen("open('x')\nsubprocess.call('ls')");
    ASSERT_TRUE(violation);
    EXPECT_EQ("subprocess", violation->token);
}

TEST(PolicyTest, OverBlocksSubstrings) {
    // cost 包含 os，注释和字符串也会被扫描
    auto violation = screen("cost = 3\nprint(cost)");
    ASSERT_TRUE(violation);
    EXPECT_EQ("os", violation->token);

    violation = screen("# we never eval anything\nprint(1)");
    ASSERT_TRUE(violation);
    EXPECT_EQ("eval", violation->token);
}

TEST(PolicyTest, BlocksDynamicEvaluationAndInput) {
    for (const string code : {"eval('1')", "exec('x=1')", "compile('1', 'f', 'eval')", "input()",
                              "__import__('math')"}) {
        EXPECT_TRUE(screen(code)) << code;
    }
}

TEST(PolicyTest, BlockedTokensAreOrdered) {
    const auto &tokens = blocked_tokens();
    ASSERT_EQ(17u, tokens.size());
    EXPECT_EQ("os", tokens.front());
    EXPECT_EQ("raw_input", tokens.back());
}
