#pragma once

#include "gmock/gmock.h"
#include "server/sandbox/execution_service.hpp"

namespace gradeguard::server::mock {

struct execution_service : public server::execution_service {
    MOCK_METHOD(sandbox_result, execute, (const sandbox_request &request), (override));
};

/**
 * @brief 程序正常结束，输出 stdout_text
 */
inline sandbox_result run_success(const std::string &stdout_text) {
    sandbox_result result;
    result.run = stage_result();
    result.run->stdout_text = stdout_text;
    result.run->output = stdout_text;
    result.run->code = 0;
    return result;
}

/**
 * @brief 程序以返回码 code 退出
 */
inline sandbox_result run_failure(const std::string &stderr_text, int code = 1) {
    sandbox_result result;
    result.run = stage_result();
    result.run->stderr_text = stderr_text;
    result.run->output = stderr_text;
    result.run->code = code;
    return result;
}

/**
 * @brief 编译失败，没有运行阶段
 */
inline sandbox_result compile_failure(const std::string &stderr_text) {
    sandbox_result result;
    result.compile = stage_result();
    result.compile->stderr_text = stderr_text;
    result.compile->output = stderr_text;
    result.compile->code = 1;
    return result;
}

}  // namespace gradeguard::server::mock
