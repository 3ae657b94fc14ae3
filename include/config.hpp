#pragma once

#include <cstddef>

namespace gradeguard {

/**
 * @brief 选手代码的最大长度（字符数）
 */
constexpr std::size_t MAX_SOURCE_LENGTH = 10000;

/**
 * @brief 一个提交最多允许的测试点数量
 */
constexpr std::size_t MAX_TEST_CASES = 20;

/**
 * @brief 单个测试输入的最大长度（字符数）
 */
constexpr std::size_t MAX_TEST_INPUT_LENGTH = 1000;

/**
 * @brief 括号嵌套的最大深度
 */
constexpr int MAX_NESTING_DEPTH = 20;

/**
 * @brief 执行服务的编译时间限制（单位为毫秒）
 * 只允许通过命令行或 COMPILETIMEOUT 调小，不能超过 10 秒
 */
extern int COMPILE_TIMEOUT_MS;

/**
 * @brief 执行服务的运行时间限制（单位为毫秒）
 * 只允许通过命令行或 RUNTIMEOUT 调小，不能超过 3 秒
 */
extern int RUN_TIMEOUT_MS;

/**
 * @brief 向执行服务发送请求时，在编译和运行时限之外额外等待的时间（单位为毫秒）
 */
extern int TRANSPORT_SLACK_MS;

/**
 * @brief 是否开启 DEBUG 模式
 * 开启后将记录发往执行服务的完整程序和返回内容
 */
extern bool DEBUG;

}  // namespace gradeguard
