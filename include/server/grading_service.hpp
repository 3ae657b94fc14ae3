#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include "judge/code_validator.hpp"
#include "judge/execution_orchestrator.hpp"
#include "judge/grade_aggregator.hpp"
#include "server/rate_limiter.hpp"

namespace gradeguard::server {

/**
 * @brief 服务对一个请求的回复，status 沿用 HTTP 状态码的含义
 */
struct service_response {
    int status;
    nlohmann::json body;
};

/**
 * @brief 将 JSON 请求分派到代码检查、代码执行和成绩计算
 *
 * 错误到状态码的映射：
 * 1. 400：请求格式错误、超出尺寸限制、不支持的语言，以及代码检查未通过（只返回 "validation failed"）
 * 2. 403：作业不属于调用者，或者作业状态不允许该操作
 * 3. 429：超出请求频率或每日配额，附带 retryAfter（单位为秒）
 * 4. 500：内部错误、存储错误
 */
struct grading_service {
    /**
     * @param limiter 请求频率限制，为空时不做限制（比如命令行单次执行）
     */
    grading_service(const code_validator &validator, const execution_orchestrator &orchestrator, grade_aggregator &aggregator, rate_limiter *limiter);

    /**
     * @brief 处理一个请求，不会抛出异常
     * @param type 请求类型，可选值：execute、submit、revise
     * @param caller 经过认证的调用者，由网关提供，不从请求体中读取
     * @param body 请求体
     */
    service_response handle(const std::string &type, const std::string &caller, const nlohmann::json &body);

    service_response execute(const std::string &caller, const nlohmann::json &body);

    service_response submit(const std::string &caller, const nlohmann::json &body);

    service_response revise(const std::string &caller, const nlohmann::json &body);

    /**
     * @brief 解析代码执行请求 {code, language, testCases: [{input, expectedOutput}]}
     * @throw invalid_request_error 若请求格式错误或者语言不受支持
     */
    static code_submission parse_execution_request(const nlohmann::json &body);

private:
    const code_validator &validator;
    const execution_orchestrator &orchestrator;
    grade_aggregator &aggregator;
    rate_limiter *limiter;
};

}  // namespace gradeguard::server
