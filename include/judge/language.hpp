#pragma once

#include <map>
#include <string>

namespace gradeguard {

/**
 * @brief 支持评测的编程语言
 */
enum class language {
    PYTHON,
    JAVASCRIPT,
    JAVA,
    CPP,
    C
};

/**
 * @brief 将请求中的语言名转换为 language，不区分大小写
 * @param name 可选值：python、javascript、java、cpp、c
 * @throw invalid_request_error 若语言不受支持
 */
language parse_language(const std::string &name);

/**
 * @brief 返回语言在请求和日志中使用的名字
 */
const char *get_language_name(language lang);

/**
 * @brief 执行服务中该语言对应的运行时
 * 比如 Piston 的 {"language": "python", "version": "3.10.0"}
 */
struct language_runtime {
    std::string name;
    std::string version;
};

/**
 * @brief 语言目录，记录每种语言在执行服务中的运行时版本，并负责拼接待执行的程序
 */
struct language_catalogue {
    /**
     * @brief 使用默认的运行时版本初始化
     */
    language_catalogue();

    const language_runtime &runtime(language lang) const;

    /**
     * @brief 覆盖某个语言的运行时，供配置文件使用
     */
    void set_runtime(language lang, const language_runtime &runtime);

    /**
     * @brief 构造发往执行服务的完整程序
     * 程序由选手代码和一段求值并打印测试输入的代码组成，比如对于 Python：
     * @code
     *     <source>
     *
     *     result = <input>
     *     print(result)
     * @endcode
     * 对于 Java，选手代码被放进 public class Main 中，因此选手写的方法必须是 static 的；
     * 代码开头的 import 语句被移到 Main 之前。
     * @param lang 选手代码的语言
     * @param source 选手代码
     * @param input 测试输入，已经通过检查，保证是只有字面量参数的函数调用
     */
    static std::string build_program(language lang, const std::string &source, const std::string &input);

private:
    std::map<language, language_runtime> runtimes;
};

}  // namespace gradeguard
