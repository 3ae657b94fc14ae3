#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "judge/language.hpp"

/**
 * 这个头文件包含代码提交相关的数据结构
 * 包含：
 * 1. test_case 类（表示一个测试点）
 * 2. code_submission 类（表示一个编程题提交）
 * 3. validation_verdict 类（表示代码检查结果）
 * 4. case_result、execution_report 类（表示执行结果）
 */
namespace gradeguard {

/**
 * @brief 表示一个测试点，由教师提供
 */
struct test_case {
    /**
     * @brief 测试输入，是一个函数调用表达式，比如 add(2, 3)
     */
    std::string input;

    /**
     * @brief 标准输出，比较前会去掉首尾空白字符
     */
    std::string expected_output;
};

/**
 * @brief 表示一个编程题提交
 * 提交在构造后不再修改，评测结束后即被丢弃
 */
struct code_submission {
    std::string source_code;

    language lang;

    std::vector<test_case> test_cases;
};

/**
 * @brief 代码检查的结论
 * 若 accepted 为 false，该提交不会被执行
 */
struct validation_verdict {
    bool accepted = true;

    reason_code reason = reason_code::NONE;

    /**
     * @brief 拒绝的具体原因，比如命中的正则表达式
     * 只记录在服务端日志中，不返回给调用方，避免帮助攻击者试探黑名单
     */
    std::string detail;

    static validation_verdict accept();

    static validation_verdict reject(reason_code reason, const std::string &detail);
};

/**
 * @brief 表示一个测试点的执行结果
 */
struct case_result {
    test_case kase;

    /**
     * @brief 程序的标准输出（已去掉首尾空白字符）
     * 编译失败、运行失败、网络错误时为空
     */
    std::optional<std::string> actual_output;

    bool passed = false;

    /**
     * @brief 失败原因：编译器的错误输出、程序的错误输出或者网络错误信息
     * 通过或者答案错误时为空
     */
    std::optional<std::string> error_detail;

    status result = status::SYSTEM_ERROR;
};

/**
 * @brief 一个提交所有测试点的执行结果汇总
 */
struct execution_report {
    bool all_passed = false;

    std::size_t passed_count = 0;

    std::size_t total_count = 0;

    std::vector<case_result> results;
};

/**
 * @brief 序列化为 {input, expectedOutput, actualOutput, passed, error, status}
 */
void to_json(nlohmann::json &j, const case_result &result);

/**
 * @brief 序列化为代码执行请求的成功回复
 */
void to_json(nlohmann::json &j, const execution_report &report);

}  // namespace gradeguard
