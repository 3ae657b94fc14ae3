#include <curl/curl.h>
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <thread>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "server/redis.hpp"
#include "server/redis_assignment_store.hpp"
#include "server/sandbox/piston.hpp"
#include "worker.hpp"
using namespace std;

void sigintHandler(int /* signum */) {
    LOG(ERROR) << "Received SIGINT, stopping workers";
    gradeguard::stop_workers();
}

/**
 * @brief 读取只允许调小的时间限制
 * 命令行参数优先，其次是环境变量，都没有时保持默认值
 */
static void read_timeout(const boost::program_options::variables_map &vm, const char *option, const char *env, int &value) {
    int limit = value;
    string from_env = get_env(env, "");
    if (vm.count(option)) {
        value = vm[option].as<int>();
    } else if (!from_env.empty()) {
        value = boost::lexical_cast<int>(from_env);
    }
    CHECK(value > 0 && value <= limit)
        << option << " should be in (0, " << limit << "] milliseconds, got " << value;
}

/**
 * @brief 执行一个代码执行请求文件，并将回复打印到标准输出
 * 不连接 Redis，也不做频率限制
 */
static int execute_file(const string &path, gradeguard::server::execution_service &sandbox, const gradeguard::language_catalogue &catalogue) {
    CHECK(filesystem::is_regular_file(path)) << "Request file " << path << " does not exist";

    nlohmann::json body;
    try {
        body = nlohmann::json::parse(gradeguard::read_file_content(path));
    } catch (nlohmann::json::exception &e) {
        cerr << "Request file " << path << " is malformed: " << e.what() << endl;
        return EXIT_FAILURE;
    }

    gradeguard::code_validator validator;
    gradeguard::execution_orchestrator orchestrator(sandbox, catalogue);
    // execute 请求不会访问作业记录，连接不会被建立
    gradeguard::server::redis_conn conn;
    gradeguard::server::redis_assignment_store store(conn);
    gradeguard::grade_aggregator aggregator(store);
    gradeguard::server::grading_service service(validator, orchestrator, aggregator, nullptr);

    auto response = service.handle("execute", "cli", body);
    cout << response.body.dump(4) << endl;
    return response.status == 200 ? EXIT_SUCCESS : EXIT_FAILURE;
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    signal(SIGINT, sigintHandler);
    signal(SIGTERM, sigintHandler);

    namespace po = boost::program_options;
    po::options_description desc("gradeguard options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>(), "set the configuration file path. You can either pass it from environ CONFIG")
        ("workers", po::value<unsigned>(), "set the number of worker threads, default to the number of cores. You can either pass it from environ WORKERS")
        ("compile-timeout", po::value<int>(), "lower the compile time limit in milliseconds, default to 10000. You can either pass it from environ COMPILETIMEOUT")
        ("run-timeout", po::value<int>(), "lower the run time limit in milliseconds, default to 3000. You can either pass it from environ RUNTIMEOUT")
        ("execute", po::value<string>(), "run the execution request stored in the given file once and print the response, without connecting to redis")
        ("debug", "turn on the debug mode to log the programs sent to the sandbox and its replies. You can either pass it from environ DEBUG")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "gradeguard: Validate and execute student code, compute assignment grades" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "gradeguard 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug") || !get_env("DEBUG", "").empty()) {
        gradeguard::DEBUG = true;
    }

    read_timeout(vm, "compile-timeout", "COMPILETIMEOUT", gradeguard::COMPILE_TIMEOUT_MS);
    read_timeout(vm, "run-timeout", "RUNTIMEOUT", gradeguard::RUN_TIMEOUT_MS);

    gradeguard::server::service_config config;
    string config_path = get_env("CONFIG", "");
    if (vm.count("config")) {
        config_path = vm["config"].as<string>();
    }
    if (!config_path.empty()) {
        try {
            config = gradeguard::server::load_config(config_path);
        } catch (gradeguard::gradeguard_exception &e) {
            LOG(FATAL) << e.what();
        }
    }

    gradeguard::language_catalogue catalogue;
    for (auto &[lang, runtime] : config.sandbox.runtimes)
        catalogue.set_runtime(lang, runtime);

    // curl_global_init 不是线程安全的，必须在启动 worker 之前调用
    CHECK(curl_global_init(CURL_GLOBAL_ALL) == CURLE_OK) << "Unable to initialize libcurl";

    gradeguard::server::sandbox::piston_client sandbox(config.sandbox.url, gradeguard::TRANSPORT_SLACK_MS);

    if (vm.count("execute")) {
        int ret = execute_file(vm["execute"].as<string>(), sandbox, catalogue);
        curl_global_cleanup();
        return ret;
    }

    unsigned workers = max(1u, thread::hardware_concurrency());
    if (vm.count("workers")) {
        workers = vm["workers"].as<unsigned>();
    } else if (!get_env("WORKERS", "").empty()) {
        workers = boost::lexical_cast<unsigned>(get_env("WORKERS", ""));
    }
    CHECK(workers > 0) << "At least one worker is required";

    LOG(INFO) << "Starting " << workers << " workers, sandbox " << config.sandbox.url
              << ", compile timeout " << gradeguard::COMPILE_TIMEOUT_MS << "ms, run timeout " << gradeguard::RUN_TIMEOUT_MS << "ms";

    gradeguard::code_validator validator;
    vector<thread> worker_threads;
    for (unsigned i = 0; i < workers; ++i)
        worker_threads.push_back(gradeguard::start_worker(i, config, sandbox, catalogue, validator));

    for (auto &th : worker_threads)
        th.join();

    curl_global_cleanup();
    return 0;
}
