#pragma once

#include <future>
#include <string>
#include <thread>
#include <vector>
#include "common/concurrent_queue.hpp"
#include "sandbox/facade.hpp"

namespace sandbox {

/**
 * @brief 执行池
 * 持有若干个 worker 线程，每个线程拥有自己的 execution_facade，从同一个队列中领取请求。
 * 不同 worker 之间的执行互不影响，各自有独立的子进程和计时器。
 * 析构时关闭队列，已经提交的请求会被执行完毕后 worker 才退出。
 */
struct execution_pool {
    execution_pool(std::size_t workers, const resource_limits &limits = resource_limits::defaults(),
                   const std::filesystem::path &runner = RUNNER_PATH);
    ~execution_pool();

    execution_pool(const execution_pool &) = delete;
    execution_pool &operator=(const execution_pool &) = delete;

    /**
     * @brief 提交一个工具输入（json 请求或者裸代码）
     * @return 执行结果，由某个 worker 完成执行后就绪
     */
    std::future<execution_result> submit(const std::string &input);

    std::size_t size() const;

private:
    using task = std::packaged_task<execution_result(execution_facade &)>;

    void work(std::size_t index, resource_limits limits, std::filesystem::path runner);

    concurrent_queue<task> tasks;
    std::vector<std::thread> threads;
};

}  // namespace sandbox
