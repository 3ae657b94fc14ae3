#pragma once

#include <optional>
#include <regex>
#include <string>
#include <vector>
#include "judge/submission.hpp"

namespace gradeguard {

/**
 * @brief 代码执行前的静态检查
 *
 * 这是一层基于黑名单的预过滤，用于在代码到达执行服务之前拦下明显恶意的提交，
 * 真正的隔离由外部执行服务负责。检查依次为：
 * 1. 尺寸限制：代码不超过 10000 字符，测试点不超过 20 个，每个测试输入不超过 1000 字符
 * 2. 黑名单：文件系统、网络、动态求值、创建进程、运行时内省、转义编码，
 *    同样的规则也作用于每个测试输入，因为测试输入会被拼接进最终执行的程序
 * 3. 混淆检测：逐字符拼接危险关键字，或者通过 chr()/fromCharCode() 构造关键字
 * 4. 嵌套深度：括号嵌套超过 20 层
 * 5. 测试输入语法：必须是只含字面量参数的函数调用
 *
 * 检查过程没有副作用，多个线程可以共享同一个 code_validator。
 */
struct code_validator {
    code_validator();

    validation_verdict validate(const std::string &source_code, const std::vector<test_case> &test_cases) const;

    validation_verdict validate(const code_submission &submit) const;

    /**
     * @brief 查找 text 命中的第一条黑名单规则
     * @return 命中规则的正则表达式源码，未命中时为空
     */
    std::optional<std::string> match_blocked_pattern(const std::string &text) const;

    /**
     * @brief 检测是否存在通过拼接或字符编码构造危险关键字的行为
     * @return 检测到的关键字，未检测到时为空
     */
    std::optional<std::string> detect_obfuscation(const std::string &code) const;

    /**
     * @brief 计算 ()[]{} 的最大嵌套深度
     * 不区分括号是否位于字符串字面量中
     */
    static int max_nesting_depth(const std::string &code);

    /**
     * @brief 检查测试输入是否是形如 name(arg, ...) 的函数调用
     * 函数名可以是以 . 连接的标识符，参数只能是数字、字符串、
     * true/false/True/False、null/None 以及由它们组成的列表 [...]
     */
    static bool is_call_expression(const std::string &input);

private:
    struct blocked_pattern {
        std::string source;
        std::regex regex;
    };

    struct obfuscation_rule {
        std::string keyword;
        std::regex concatenation;
    };

    std::vector<blocked_pattern> blocked_patterns;
    std::vector<obfuscation_rule> obfuscation_rules;
};

}  // namespace gradeguard
