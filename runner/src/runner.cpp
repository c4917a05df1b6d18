#include "interpreter.hpp"
#include <fcntl.h>
#include <glog/logging.h>
#include <unistd.h>
#include <boost/program_options.hpp>
#include <iostream>
#include <system_error>
#include "common/io_utils.hpp"
#include "limits.hpp"
#include "runner_options.hpp"

using namespace std;

static void init_logging(const char *program, const runner_options &opt) {
    using namespace google;
    if (!opt.log_dir.empty()) {
        FLAGS_log_dir = opt.log_dir;
    } else {
        // stderr belongs to the user code, keep glog silent
        FLAGS_minloglevel = GLOG_FATAL;
        FLAGS_stderrthreshold = NUM_SEVERITIES;
    }
    google::InitGoogleLogging(program);
}

// 代码读取完毕后，用户代码看到的标准输入是空的
static void detach_stdin() {
    int fd = open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (fd < 0) throw system_error(errno, generic_category(), "unable to open /dev/null");
    if (dup2(fd, STDIN_FILENO) < 0) throw system_error(errno, generic_category(), "unable to redirect stdin");
    close(fd);
}

/**
 * 1. 从标准输入读取全部代码，并将标准输入重定向到 /dev/null
 * 2. 限制 CPU 时间、文件大小、core dump
 * 3. 初始化解释器并构造受限环境
 * 4. 限制虚拟内存，报告内存上限是否生效
 * 5. 编译执行代码，报告执行结果
 */
static int run(const char *program, const runner_options &opt) {
    int report_fd = opt.report_fd;
    try {
        string code = sandbox::read_fully(STDIN_FILENO);
        detach_stdin();
        set_restrictions(opt);
        LOG(INFO) << "running " << code.size() << " bytes of code";

        interpreter_guard python(program);
        py_ref globals = build_environment();
        bool enforced = set_memory_limit(opt.memory_limit);
        write_report(report_fd, {{"memory_limit_enforced", enforced}});

        run_report report = run_code(code, globals);
        LOG(INFO) << "execution finished: " << sandbox::get_status_name(report.result);
        write_report(report_fd, report.to_json());
        return 0;
    } catch (exception &ex) {
        LOG(ERROR) << "sandbox-runner failed: " << ex.what();
        try {
            write_report(report_fd, {{"status", sandbox::get_status_name(sandbox::status::SYSTEM_ERROR)},
                                     {"detail", ex.what()}});
        } catch (exception &report_ex) {
            LOG(ERROR) << "unable to write report: " << report_ex.what();
        }
        return 1;
    }
}

int main(int argc, const char *argv[]) {
    namespace po = boost::program_options;
    po::options_description desc("sandbox-runner options");
    po::variables_map vm;

    struct runner_options opt;

    // clang-format off
    desc.add_options()
        ("memory-limit,m", po::value<int64_t>(), "set maximum virtual memory of the code in bytes")
        ("cpu-time,t", po::value<int>(), "set maximum CPU time of the code in seconds, enforced one second later by RLIMIT_CPU")
        ("report-fd,r", po::value<int>()->default_value(3), "write the json execution report to this file descriptor")
        ("log-dir,l", po::value<string>(), "write glog files to this directory, logging is disabled otherwise")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return 1;
    }

    if (vm.count("help")) {
        cout << "sandbox-runner: Run code read from standard input in a restricted interpreter." << endl
             << "Usage: " << argv[0] << " [options] < code" << endl;
        cout << desc << endl;
        return 0;
    }

    if (vm.count("version")) {
        cout << "sandbox-runner" << endl;
        return 0;
    }

    if (vm.count("memory-limit")) opt.memory_limit = vm["memory-limit"].as<int64_t>();
    if (vm.count("cpu-time")) opt.cpu_time = vm["cpu-time"].as<int>();
    opt.report_fd = vm["report-fd"].as<int>();
    if (vm.count("log-dir")) opt.log_dir = vm["log-dir"].as<string>();

    if ((vm.count("memory-limit") && opt.memory_limit <= 0) ||
        (vm.count("cpu-time") && opt.cpu_time <= 0) || opt.report_fd < 0) {
        cerr << "limits should be positive and report-fd should be a valid file descriptor" << endl
             << endl;
        cerr << desc << endl;
        return 1;
    }

    init_logging(argv[0], opt);
    return run(argv[0], opt);
}
