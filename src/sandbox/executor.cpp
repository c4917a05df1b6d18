#include "sandbox/executor.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/mman.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>
#include <chrono>
#include <nlohmann/json.hpp>
#include <sstream>
#include <system_error>
#include <thread>
#include <vector>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"
#include "sandbox/policy.hpp"

namespace sandbox {
using namespace std;
using namespace std::chrono;
using namespace nlohmann;

// sandbox-runner 写执行报告使用的文件描述符
static const int REPORT_FD = 3;

// 执行报告只有几行 json，超过这个长度的部分直接丢弃
static const int64_t REPORT_LIMIT = 64 * 1024;

// 看门狗杀死进程组后，继续读取残留输出的最长时间
static const milliseconds KILL_DRAIN_TIME(100);

// 子进程在 exec 之前失败时的退出码，与 shell 找不到命令时一致
static const int EXIT_EXEC_FAILED = 127;

bool execution_outcome::succeeded() const {
    return result == status::SUCCESS;
}

/**
 * @brief 子进程一个输出管道的读取状态
 * 只保留前 limit 个字节，之后读到的数据仍然会被读走以免子进程阻塞在写管道上，但会被丢弃。
 * 读取时多保留一个字节，用于判断截断位置是否落在多字节字符的中间。
 */
struct stream_capture {
    unique_fd fd;
    string data;
    int64_t limit = 0;
    int64_t total = 0;

    bool truncated() const {
        return total > limit;
    }

    // 取出捕获的数据，截断时退到 UTF-8 字符边界
    string take() {
        utf8_truncate(data, (size_t)limit);
        return move(data);
    }

    // 读取当前可读的全部数据，管道到达 EOF 时关闭读端
    void pump() {
        char buf[4096];
        while (fd) {
            ssize_t n = read(fd.get(), buf, sizeof(buf));
            if (n < 0) {
                if (errno == EINTR) continue;
                if (errno == EAGAIN || errno == EWOULDBLOCK) return;
                throw system_error(errno, generic_category(), "unable to read output of sandbox-runner");
            }
            if (n == 0) {
                fd.reset();
                return;
            }
            total += n;
            if ((int64_t)data.size() <= limit)
                data.append(buf, (size_t)min<int64_t>(n, limit + 1 - (int64_t)data.size()));
        }
    }
};

static unique_fd make_code_file(const string &code) {
    unique_fd fd(memfd_create("sandbox-code", MFD_CLOEXEC));
    if (!fd) throw system_error(errno, generic_category(), "memfd_create");
    write_fully(fd.get(), code);
    if (lseek(fd.get(), 0, SEEK_SET) < 0)
        throw system_error(errno, generic_category(), "lseek");
    return fd;
}

static void kill_runner(pid_t pid) {
    // 子进程可能还没来得及 setsid，因此进程组和进程本身都要杀一次
    kill(-pid, SIGKILL);
    kill(pid, SIGKILL);
}

/**
 * @brief 在 fork 出的子进程中把管道接到 0~3 号描述符上并执行 sandbox-runner
 * 这里只能使用 async-signal-safe 的函数。
 */
[[noreturn]] static void exec_runner(const int (&sources)[4], char *const argv[]) {
    setsid();

    sigset_t mask;
    sigemptyset(&mask);
    sigprocmask(SIG_SETMASK, &mask, nullptr);
    signal(SIGPIPE, SIG_DFL);
    signal(SIGXCPU, SIG_DFL);

    // 先把所有来源移到 10 号以后，避免 dup2 时覆盖尚未转移的描述符
    int moved[4];
    for (int i = 0; i < 4; ++i)
        if ((moved[i] = fcntl(sources[i], F_DUPFD_CLOEXEC, 10)) < 0) _exit(EXIT_EXEC_FAILED);
    for (int i = 0; i < 4; ++i)
        if (dup2(moved[i], i) < 0) _exit(EXIT_EXEC_FAILED);

    execv(argv[0], argv);

    static const char message[] = "unable to start sandbox-runner\n";
    ssize_t ignored = write(STDERR_FILENO, message, sizeof(message) - 1);
    (void)ignored;
    _exit(EXIT_EXEC_FAILED);
}

/**
 * @brief 读取所有管道直到全部关闭或者到达截止时间
 * @return 所有管道都已关闭时返回 true，到达截止时间时返回 false
 */
static bool pump_until(steady_clock::time_point deadline, const vector<stream_capture *> &streams) {
    while (true) {
        vector<pollfd> fds;
        vector<stream_capture *> active;
        for (stream_capture *stream : streams) {
            if (stream->fd) {
                fds.push_back({stream->fd.get(), POLLIN, 0});
                active.push_back(stream);
            }
        }
        if (fds.empty()) return true;

        auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now());
        if (remaining.count() <= 0) return false;

        int ret = poll(fds.data(), fds.size(), (int)remaining.count());
        if (ret < 0) {
            if (errno == EINTR) continue;
            throw system_error(errno, generic_category(), "poll");
        }
        for (size_t i = 0; i < fds.size(); ++i)
            if (fds[i].revents) active[i]->pump();
    }
}

/**
 * @brief 等待子进程退出直到截止时间
 * @return 子进程已退出时返回 true
 */
static bool wait_until(pid_t pid, steady_clock::time_point deadline, int &wstatus) {
    while (true) {
        pid_t ret = waitpid(pid, &wstatus, WNOHANG);
        if (ret == pid) return true;
        if (ret < 0 && errno != EINTR)
            throw system_error(errno, generic_category(), "waitpid");
        if (steady_clock::now() >= deadline) return false;
        this_thread::sleep_for(milliseconds(5));
    }
}

static int reap(pid_t pid) {
    int wstatus = 0;
    while (waitpid(pid, &wstatus, 0) < 0) {
        if (errno != EINTR)
            throw system_error(errno, generic_category(), "waitpid");
    }
    return wstatus;
}

/**
 * @brief 解析 sandbox-runner 写出的执行报告
 * 报告是若干行 json 对象，后面的字段覆盖前面的字段。
 * 被杀死的进程可能只写了半行，无法解析的行会被忽略。
 */
static json parse_report(const string &text) {
    json report = json::object();
    istringstream is(text);
    string line;
    while (getline(is, line)) {
        if (line.empty()) continue;
        try {
            json object = json::parse(line);
            if (object.is_object()) report.update(object);
        } catch (json::parse_error &ex) {
            LOG(WARNING) << "Ignoring malformed report line from sandbox-runner: " << ex.what();
        }
    }
    return report;
}

static bool is_memory_fault(int signal) {
    return signal == SIGSEGV || signal == SIGBUS || signal == SIGABRT;
}

code_executor::code_executor(const resource_limits &limits, const filesystem::path &runner)
    : lim(limits), runner(runner) {
    lim.validate();
    error_code ec;
    if (!filesystem::exists(runner, ec))
        LOG(WARNING) << "sandbox-runner " << runner << " does not exist, every execution will fail";
    DLOG(INFO) << "Created code executor: time limit " << lim.time_limit << "s, memory limit "
               << lim.memory_limit << " bytes, output limit " << lim.output_limit << " bytes";
}

const resource_limits &code_executor::limits() const {
    return lim;
}

bool code_executor::memory_limit_supported() {
#ifdef RLIMIT_AS
    return true;
#else
    return false;
#endif
}

execution_outcome code_executor::execute(const string &code) {
    execution_outcome outcome;
    if (code.empty()) {
        outcome.result = status::INVALID_INPUT;
        outcome.message = "Invalid code input";
        return outcome;
    }

    if (auto violation = screen(code)) {
        LOG(INFO) << "Rejected code containing blocked token " << violation->token;
        outcome.result = status::POLICY_VIOLATION;
        outcome.message = violation->message();
        return outcome;
    }

    lock_guard<mutex> guard(mut);
    LOG(INFO) << "Executing code (" << code.size() << " chars)";
    elapsed_time timer;
    try {
        outcome = run(code);
    } catch (sandbox_exception &ex) {
        LOG(ERROR) << "Unable to execute code: " << ex;
        outcome = execution_outcome();
        outcome.message = string("Sandbox error: ") + ex.what();
    } catch (exception &ex) {
        LOG(ERROR) << "Unable to execute code: " << ex.what();
        outcome = execution_outcome();
        outcome.message = string("Sandbox error: ") + ex.what();
    }
    LOG(INFO) << "Execution finished in " << timer.duration<milliseconds>().count() << "ms: "
              << get_display_message(outcome.result);
    return outcome;
}

execution_outcome code_executor::run(const string &code) {
    unique_fd code_file = make_code_file(code);
    stream_capture out, err, report;
    unique_fd out_write, err_write, report_write;
    make_pipe(out.fd, out_write);
    make_pipe(err.fd, err_write);
    make_pipe(report.fd, report_write);
    out.limit = err.limit = lim.output_limit;
    report.limit = REPORT_LIMIT;

    vector<string> args = {runner.string(),
                           "--memory-limit", to_string(lim.memory_limit),
                           "--cpu-time", to_string(lim.time_limit),
                           "--report-fd", to_string(REPORT_FD)};
    if (!RUNNER_LOG_DIR.empty()) {
        args.push_back("--log-dir");
        args.push_back(RUNNER_LOG_DIR);
    }
    vector<char *> argv;
    for (auto &arg : args) argv.push_back(arg.data());
    argv.push_back(nullptr);

    const int sources[4] = {code_file.get(), out_write.get(), err_write.get(), report_write.get()};
    auto deadline = steady_clock::now() + seconds(lim.time_limit);
    pid_t pid = fork();
    if (pid < 0) throw system_error(errno, generic_category(), "unable to fork sandbox-runner");
    if (pid == 0) exec_runner(sources, argv.data());

    bool reaped = false;
    defer {
        if (!reaped) {
            kill_runner(pid);
            waitpid(pid, nullptr, 0);
        }
    };

    code_file.reset();
    out_write.reset();
    err_write.reset();
    report_write.reset();
    vector<stream_capture *> streams = {&out, &err, &report};
    for (stream_capture *stream : streams) set_nonblocking(stream->fd.get());

    int wstatus = 0;
    bool timed_out = !pump_until(deadline, streams) || !wait_until(pid, deadline, wstatus);
    if (timed_out) {
        LOG(WARNING) << "Time limit exceeded, killing sandbox-runner " << pid;
        kill_runner(pid);
        pump_until(steady_clock::now() + KILL_DRAIN_TIME, streams);
        wstatus = reap(pid);
    }
    reaped = true;

    execution_outcome outcome;
    outcome.output_truncated = out.truncated() || err.truncated();
    outcome.output = out.take();
    outcome.errors = err.take();
    if (outcome.output_truncated)
        LOG(WARNING) << "Output truncated to " << lim.output_limit << " bytes per stream";

    json result = parse_report(report.take());
    outcome.memory_limit_enforced = get_value_def(result, false, "memory_limit_enforced");
    optional<status> reported;
    if (auto name = get_value_def<string>(result, "", "status"); !name.empty()) {
        reported = parse_status_name(name);
        if (!reported) throw report_error("unknown status in report of sandbox-runner: " + name);
    }
    string detail = get_value_def<string>(result, "", "detail");

    if (timed_out || (WIFSIGNALED(wstatus) && WTERMSIG(wstatus) == SIGXCPU)) {
        outcome.result = status::TIME_LIMIT_EXCEEDED;
        outcome.message = fmt::format("Code execution exceeded {} seconds", lim.time_limit);
    } else if (reported) {
        outcome.result = *reported;
        switch (*reported) {
            case status::SUCCESS:
                outcome.message = "Code executed successfully";
                break;
            case status::SYNTAX_ERROR:
                outcome.message = "Syntax error: " + detail;
                break;
            case status::MEMORY_LIMIT_EXCEEDED:
                LOG(WARNING) << "Memory limit of " << lim.memory_limit << " bytes exhausted";
                outcome.message = "Memory limit exceeded";
                break;
            case status::RUNTIME_ERROR:
                outcome.message = fmt::format("Execution error: {}: {}",
                                              get_value_def<string>(result, "Exception", "kind"), detail);
                break;
            case status::SYSTEM_ERROR:
                outcome.message = "Sandbox error: " + detail;
                break;
            default:
                throw report_error(string("unexpected status in report of sandbox-runner: ") + get_status_name(*reported));
        }
    } else if (WIFSIGNALED(wstatus)) {
        int sig = WTERMSIG(wstatus);
        if (outcome.memory_limit_enforced && is_memory_fault(sig)) {
            // 解释器在内存不足时可能来不及抛出 MemoryError 就直接崩溃
            LOG(WARNING) << "sandbox-runner crashed with signal " << sig << " under memory limit";
            outcome.result = status::MEMORY_LIMIT_EXCEEDED;
            outcome.message = "Memory limit exceeded";
        } else {
            outcome.result = status::RUNTIME_ERROR;
            outcome.message = fmt::format("Execution error: Signal: terminated by signal {} ({})", sig, strsignal(sig));
        }
    } else {
        outcome.result = status::SYSTEM_ERROR;
        outcome.message = fmt::format("Sandbox error: sandbox-runner exited with code {} without a report",
                                      WEXITSTATUS(wstatus));
        LOG(ERROR) << outcome.message << ", stderr: " << outcome.errors;
    }
    return outcome;
}

}  // namespace sandbox
