#pragma once

#include "judge/language.hpp"
#include "judge/submission.hpp"
#include "server/sandbox/execution_service.hpp"

namespace gradeguard {

/**
 * @brief 将通过检查的提交逐个测试点发送到执行服务，并比对输出
 *
 * 每个测试点在独立的线程中执行，互不影响：某个测试点出现编译错误、运行错误、
 * 网络错误都只会让该测试点失败，不会中断其他测试点，也不会进行重试。
 * 本类不持有可变状态，可以被多个请求同时使用。
 */
struct execution_orchestrator {
    execution_orchestrator(server::execution_service &service, const language_catalogue &catalogue);

    /**
     * @brief 执行提交的所有测试点
     * @param submit 待执行的提交
     * @param verdict code_validator 对该提交的检查结论
     * @throw internal_error 若 verdict 没有通过，这说明调用方跳过了检查
     * @return 执行报告，测试点顺序与提交中的顺序一致
     */
    execution_report execute(const code_submission &submit, const validation_verdict &verdict) const;

    /**
     * @brief 根据执行服务的回复判定单个测试点
     * 只有运行阶段返回码为 0 时才比较输出，比较前去掉首尾空白字符
     */
    static case_result evaluate(const test_case &kase, const server::sandbox_result &result);

private:
    server::execution_service &service;
    const language_catalogue &catalogue;

    case_result run_case(const code_submission &submit, std::size_t index) const;
};

}  // namespace gradeguard
