#include <chrono>
#include <future>
#include <vector>
#include "common/utils.hpp"
#include "gtest/gtest.h"
#include "sandbox/pool.hpp"

using namespace std;
using namespace sandbox;

TEST(PoolTest, ResultsFollowSubmissions) {
    execution_pool pool(3);
    EXPECT_EQ(3u, pool.size());

    vector<future<execution_result>> results;
    for (int i = 0; i < 8; ++i)
        results.push_back(pool.submit("print(" + to_string(i) + " * 2)"));

    for (int i = 0; i < 8; ++i) {
        execution_result result = results[i].get();
        EXPECT_TRUE(result.outcome.succeeded()) << result.outcome.message;
        EXPECT_EQ(to_string(i * 2) + "\n", result.outcome.output);
    }
}

TEST(PoolTest, WorkersRunConcurrently) {
    resource_limits limits = resource_limits::defaults();
    limits.time_limit = 1;
    execution_pool pool(2, limits);

    elapsed_time timer;
    auto first = pool.submit("while True:\n    pass\n");
    auto second = pool.submit("while True:\n    pass\n");
    EXPECT_EQ(status::TIME_LIMIT_EXCEEDED, first.get().outcome.result);
    EXPECT_EQ(status::TIME_LIMIT_EXCEEDED, second.get().outcome.result);

    // 两个 1 秒的超时并行完成，总时间远小于串行执行的 2 秒
    EXPECT_LT(timer.duration<chrono::milliseconds>().count(), 1900);
}

TEST(PoolTest, DestructorFinishesPendingWork) {
    future<execution_result> result;
    {
        execution_pool pool(1);
        result = pool.submit(R"js({"code": "print('done')", "expected_output": "done"})js");
    }
    execution_result finished = result.get();
    EXPECT_TRUE(finished.outcome.succeeded());
    ASSERT_TRUE(finished.comparison);
    EXPECT_TRUE(finished.comparison->matched);
}

TEST(PoolTest, RequiresWorkers) {
    EXPECT_THROW(execution_pool(0), invalid_argument);
}
