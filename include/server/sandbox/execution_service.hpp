#pragma once

#include <optional>
#include <string>
#include "judge/language.hpp"

namespace gradeguard::server {

/**
 * @brief 发往执行服务的一次执行请求
 */
struct sandbox_request {
    language_runtime runtime;

    /**
     * @brief 拼接好的完整程序，见 language_catalogue::build_program
     */
    std::string program;

    /**
     * @brief 编译时间限制（单位为毫秒）
     */
    int compile_timeout_ms;

    /**
     * @brief 运行时间限制（单位为毫秒）
     */
    int run_timeout_ms;
};

/**
 * @brief 执行服务返回的某一阶段（编译或运行）的结果
 */
struct stage_result {
    std::string stdout_text;
    std::string stderr_text;

    /**
     * @brief 标准输出和标准错误交错合并后的内容
     */
    std::string output;

    /**
     * @brief 进程返回码，被信号杀死时为空
     */
    std::optional<int> code;

    /**
     * @brief 杀死进程的信号，比如 SIGKILL
     */
    std::optional<std::string> signal;

    bool succeeded() const;
};

/**
 * @brief 执行服务对一次执行请求的回复
 */
struct sandbox_result {
    /**
     * @brief 编译阶段的结果，解释型语言没有这一阶段
     */
    std::optional<stage_result> compile;

    /**
     * @brief 运行阶段的结果，编译失败时没有这一阶段
     */
    std::optional<stage_result> run;
};

/**
 * @brief 外部代码执行服务
 * 执行服务负责真正的隔离（进程、文件系统、网络、资源限制），
 * 本服务只负责在发送前做静态检查以及比对结果。
 * 实现必须允许多个线程同时调用 execute。
 */
struct execution_service {
    virtual ~execution_service() = default;

    /**
     * @brief 执行一个程序，不做任何重试
     * @throw network_error 若无法拿到执行服务的回复，包括超时、非 2xx 返回以及回复无法解析
     */
    virtual sandbox_result execute(const sandbox_request &request) = 0;
};

}  // namespace gradeguard::server
