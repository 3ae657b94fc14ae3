#include "judge/execution_orchestrator.hpp"
#include <glog/logging.h>
#include <boost/throw_exception.hpp>
#include <thread>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace gradeguard {
using namespace std;

execution_orchestrator::execution_orchestrator(server::execution_service &service, const language_catalogue &catalogue)
    : service(service), catalogue(catalogue) {}

static string first_non_empty(initializer_list<string> candidates, const string &fallback) {
    for (auto &candidate : candidates)
        if (!candidate.empty()) return candidate;
    return fallback;
}

case_result execution_orchestrator::evaluate(const test_case &kase, const server::sandbox_result &result) {
    case_result res;
    res.kase = kase;

    if (result.compile && !result.compile->succeeded()) {
        res.result = status::COMPILATION_ERROR;
        res.error_detail = first_non_empty({result.compile->stderr_text, result.compile->output}, "Compilation failed");
        return res;
    }

    if (!result.run || !result.run->succeeded()) {
        string compile_stderr = result.compile ? result.compile->stderr_text : "";
        string run_stderr, killed;
        if (result.run) {
            run_stderr = result.run->stderr_text;
            if (result.run->signal) killed = "Killed by signal " + *result.run->signal;
        }
        res.result = status::RUNTIME_ERROR;
        res.error_detail = first_non_empty({run_stderr, compile_stderr, killed}, "Unknown error");
        return res;
    }

    res.actual_output = trim(result.run->stdout_text);
    res.passed = *res.actual_output == trim(kase.expected_output);
    res.result = res.passed ? status::ACCEPTED : status::WRONG_ANSWER;
    return res;
}

case_result execution_orchestrator::run_case(const code_submission &submit, size_t index) const {
    const test_case &kase = submit.test_cases[index];

    try {
        server::sandbox_request request;
        request.runtime = catalogue.runtime(submit.lang);
        request.program = language_catalogue::build_program(submit.lang, submit.source_code, kase.input);
        request.compile_timeout_ms = COMPILE_TIMEOUT_MS;
        request.run_timeout_ms = RUN_TIMEOUT_MS;
        return evaluate(kase, service.execute(request));
    } catch (network_error &e) {
        LOG(WARNING) << "Test case #" << index << " failed to reach sandbox: " << e.what();
        case_result res;
        res.kase = kase;
        res.result = status::SYSTEM_ERROR;
        res.error_detail = e.what();
        return res;
    } catch (std::exception &e) {
        LOG(ERROR) << "Test case #" << index << " failed unexpectedly: " << e.what();
        case_result res;
        res.kase = kase;
        res.result = status::SYSTEM_ERROR;
        res.error_detail = string("Internal error: ") + e.what();
        return res;
    }
}

execution_report execution_orchestrator::execute(const code_submission &submit, const validation_verdict &verdict) const {
    if (!verdict.accepted)
        BOOST_THROW_EXCEPTION(internal_error("Refusing to execute a submission rejected by validation"));

    execution_report report;
    report.total_count = submit.test_cases.size();
    report.results.resize(submit.test_cases.size());

    // 每个线程只写入自己的下标，无需加锁
    vector<thread> workers;
    workers.reserve(submit.test_cases.size());
    {
        // 创建线程失败时也要等待已经启动的线程结束
        defer {
            for (auto &worker : workers)
                if (worker.joinable()) worker.join();
        };
        for (size_t i = 0; i < submit.test_cases.size(); ++i)
            workers.emplace_back([this, &submit, &report, i] {
                report.results[i] = run_case(submit, i);
            });
    }

    for (auto &result : report.results)
        if (result.passed) ++report.passed_count;
    report.all_passed = report.passed_count == report.total_count;

    LOG(INFO) << "Executed " << get_language_name(submit.lang) << " submission: "
              << report.passed_count << "/" << report.total_count << " test cases passed";
    return report;
}

}  // namespace gradeguard
