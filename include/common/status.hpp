#pragma once

namespace gradeguard {

/**
 * @brief 表示一个测试点的执行结果
 */
enum class status {
    /**
     * @brief 程序正常运行结束，且输出与标准输出一致（忽略首尾空白字符）
     */
    ACCEPTED = 0,

    /**
     * @brief 程序正常运行结束，但输出与标准输出不一致
     */
    WRONG_ANSWER = 1,

    /**
     * @brief 执行服务报告编译失败
     */
    COMPILATION_ERROR = 2,

    /**
     * @brief 程序运行时以非零返回码退出，或者被信号终止（包括超时被杀死）
     */
    RUNTIME_ERROR = 3,

    /**
     * @brief 无法从执行服务拿到结果
     * 网络错误、非 2xx 返回、请求超时、返回内容无法解析
     */
    SYSTEM_ERROR = 4
};

const char *get_display_message(status);

/**
 * @brief 代码检查的拒绝原因
 */
enum class reason_code {
    /**
     * @brief 检查通过
     */
    NONE = 0,

    /**
     * @brief 代码过长、测试点过多或者测试输入过长
     */
    SIZE_LIMIT = 1,

    /**
     * @brief 代码或测试输入命中了黑名单模式
     */
    BLOCKED_PATTERN = 2,

    /**
     * @brief 检测到通过逐字符拼接或字符编码构造危险关键字
     */
    OBFUSCATION = 3,

    /**
     * @brief 括号嵌套层数超出限制
     */
    EXCESSIVE_NESTING = 4,

    /**
     * @brief 测试输入不是一个只包含字面量参数的函数调用
     */
    MALFORMED_TEST_INPUT = 5
};

const char *get_display_message(reason_code);

}  // namespace gradeguard
