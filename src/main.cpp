#include <glog/logging.h>
#include <boost/program_options.hpp>
#include <filesystem>
#include <future>
#include <iostream>
#include <iterator>
#include <vector>
#include "common/io_utils.hpp"
#include "config.hpp"
#include "env.hpp"
#include "sandbox/facade.hpp"
#include "sandbox/pool.hpp"
using namespace std;

// 批处理模式：每行一个工具输入，按输入顺序输出每行一个 json 结果
static int run_batch(size_t jobs, const sandbox::resource_limits& limits) {
    sandbox::execution_pool pool(jobs, limits);
    vector<future<sandbox::execution_result>> results;
    string line;
    while (getline(cin, line)) {
        if (line.empty()) continue;
        results.push_back(pool.submit(line));
    }
    for (auto& result : results)
        cout << result.get().to_json().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << endl;
    return EXIT_SUCCESS;
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    // 默认情况下，假设 sandbox-runner 与本程序位于同一目录
    filesystem::path current(argv[0]);
    filesystem::path sibling_runner(filesystem::weakly_canonical(current).parent_path() / "sandbox-runner");
    if (filesystem::exists(sibling_runner)) {
        sandbox::RUNNER_PATH = sibling_runner;
    }

    try {
        sandbox::load_env_config();
    } catch (exception& ex) {
        cerr << ex.what() << endl;
        return EXIT_FAILURE;
    }

    namespace po = boost::program_options;
    po::options_description desc("code-sandbox options");
    po::positional_options_description pos;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("time-limit,t", po::value<int>(), "set wall clock time limit of each execution in seconds, default to 5. You can either pass it from environ SANDBOX_TIME_LIMIT")
        ("memory-limit,m", po::value<int>(), "set virtual memory limit of each execution in MB, default to 50. You can either pass it from environ SANDBOX_MEMORY_LIMIT")
        ("output-limit,o", po::value<int>(), "set the maximum size of captured stdout and stderr in KB, default to 1024. You can either pass it from environ SANDBOX_OUTPUT_LIMIT")
        ("runner", po::value<string>(), "set the location of sandbox-runner. You can either pass it from environ SANDBOX_RUNNER")
        ("runner-log-dir", po::value<string>(), "let sandbox-runner write glog files to this directory")
        ("input-file,f", po::value<string>(), "read the tool input from file")
        ("jobs,j", po::value<size_t>(), "read one tool input per line from standard input and execute them with this many workers")
        ("input", po::value<string>(), "tool input, either a json request {\"code\", \"expected_output\", \"compare_mode\"} or plain code")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    pos.add("input", 1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(pos)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "code-sandbox: Execute untrusted Python code with resource limits and compare its output" << endl
             << "Tool input is read from the argument, the input file, or standard input" << endl
             << "Usage: " << argv[0] << " [options] [input]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "code-sandbox 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("time-limit")) sandbox::TIME_LIMIT = vm["time-limit"].as<int>();
    if (vm.count("memory-limit")) sandbox::MEMORY_LIMIT = vm["memory-limit"].as<int>();
    if (vm.count("output-limit")) sandbox::OUTPUT_LIMIT = vm["output-limit"].as<int>();
    if (vm.count("runner")) sandbox::RUNNER_PATH = vm["runner"].as<string>();
    if (vm.count("runner-log-dir")) sandbox::RUNNER_LOG_DIR = vm["runner-log-dir"].as<string>();

    LOG(INFO) << "Using sandbox-runner " << sandbox::RUNNER_PATH;

    try {
        sandbox::resource_limits limits = sandbox::resource_limits::defaults();
        limits.validate();

        if (vm.count("jobs")) {
            return run_batch(vm["jobs"].as<size_t>(), limits);
        }

        string input;
        if (vm.count("input")) {
            input = vm["input"].as<string>();
        } else if (vm.count("input-file")) {
            input = sandbox::read_file_content(vm["input-file"].as<string>());
        } else {
            input.assign(istreambuf_iterator<char>(cin), istreambuf_iterator<char>());
        }

        auto tool = sandbox::make_tool_function(limits);
        cout << tool(input).dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << endl;
    } catch (exception& ex) {
        LOG(ERROR) << ex.what();
        cerr << ex.what() << endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
