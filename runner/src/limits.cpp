#include "limits.hpp"
#include <glog/logging.h>
#include <sys/resource.h>
#include <algorithm>
#include <unistd.h>
#include <sstream>
#include <system_error>
#include "common/io_utils.hpp"

using namespace std;

void set_rlimit(int resource, rlim_t cur, rlim_t max) {
    struct rlimit old;
    if (getrlimit(resource, &old) != 0)
        throw system_error(errno, generic_category(), "getrlimit");

    // 非特权进程不能提高硬上限
    if (old.rlim_max != RLIM_INFINITY) {
        max = min(max, old.rlim_max);
        cur = min(cur, max);
    }

    struct rlimit lim;
    lim.rlim_cur = cur;
    lim.rlim_max = max;
    if (setrlimit(resource, &lim) != 0)
        throw system_error(errno, generic_category(), "setrlimit");
}

void set_restrictions(const struct runner_options &opt) {
    if (opt.cpu_time > 0) {
        /* The host kills us on the wall clock deadline, the CPU limit is
           only a backstop one second past it. At the soft limit the kernel
           sends SIGXCPU, at the hard limit a SIGKILL. */
        rlim_t cputime_limit = opt.cpu_time + 1;
        set_rlimit(RLIMIT_CPU, cputime_limit, cputime_limit + 1);
    }

    // 用户代码不能创建文件，但 glog 需要写日志文件
    if (opt.log_dir.empty())
        set_rlimit(RLIMIT_FSIZE, 0, 0);
    else
        LOG(INFO) << "logging to " << opt.log_dir << ", file size is not limited";

    set_rlimit(RLIMIT_CORE, 0, 0);
}

int64_t current_virtual_memory() {
    istringstream statm(sandbox::read_file_content("/proc/self/statm"));
    int64_t pages = 0;
    statm >> pages;
    return pages * sysconf(_SC_PAGESIZE);
}

bool set_memory_limit(int64_t limit) {
#ifdef RLIMIT_AS
    if (limit <= 0) return false;

    int64_t baseline = current_virtual_memory();
    if (baseline >= limit)
        LOG(WARNING) << "virtual memory " << baseline << " already exceeds the limit " << limit
                     << ", any allocation will fail";

    set_rlimit(RLIMIT_AS, limit, limit);
    LOG(INFO) << "memory limited to " << limit << " bytes, baseline " << baseline << " bytes";
    return true;
#else
    LOG(WARNING) << "RLIMIT_AS is not supported on this platform, memory limit " << limit << " ignored";
    return false;
#endif
}
