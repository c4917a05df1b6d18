#include "sandbox/pool.hpp"
#include <glog/logging.h>
#include <stdexcept>

namespace sandbox {
using namespace std;

execution_pool::execution_pool(size_t workers, const resource_limits &limits, const filesystem::path &runner) {
    if (workers == 0) throw invalid_argument("execution pool requires at least one worker");
    limits.validate();
    for (size_t i = 0; i < workers; ++i)
        threads.emplace_back(&execution_pool::work, this, i, limits, runner);
}

execution_pool::~execution_pool() {
    tasks.close();
    for (auto &thread : threads)
        if (thread.joinable()) thread.join();
}

size_t execution_pool::size() const {
    return threads.size();
}

future<execution_result> execution_pool::submit(const string &input) {
    task t([input](execution_facade &facade) {
        return facade.execute_and_compare(input);
    });
    future<execution_result> result = t.get_future();
    if (!tasks.push(move(t)))
        throw logic_error("execution pool has been shut down");
    return result;
}

void execution_pool::work(size_t index, resource_limits limits, filesystem::path runner) {
    execution_facade facade(limits, runner);
    DLOG(INFO) << "Execution worker " << index << " started";
    task t;
    while (tasks.pop(t)) t(facade);
    DLOG(INFO) << "Execution worker " << index << " stopped";
}

}  // namespace sandbox
