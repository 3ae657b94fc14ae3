#include "judge/language.hpp"
#include <fmt/core.h>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/assign.hpp>
#include <sstream>
#include <unordered_map>
#include "common/exceptions.hpp"

namespace gradeguard {
using namespace std;

// clang-format off
static const unordered_map<string, language> language_names = boost::assign::map_list_of
    ("python", language::PYTHON)
    ("javascript", language::JAVASCRIPT)
    ("java", language::JAVA)
    ("cpp", language::CPP)
    ("c", language::C);
// clang-format on

language parse_language(const string &name) {
    auto it = language_names.find(boost::algorithm::to_lower_copy(name));
    if (it == language_names.end())
        throw invalid_request_error("Unsupported language: " + name);
    return it->second;
}

const char *get_language_name(language lang) {
    switch (lang) {
        case language::PYTHON: return "python";
        case language::JAVASCRIPT: return "javascript";
        case language::JAVA: return "java";
        case language::CPP: return "cpp";
        case language::C: return "c";
    }
    throw internal_error("Unrecognized language");
}

language_catalogue::language_catalogue() {
    // 与公共 Piston 实例上安装的运行时版本一致
    runtimes[language::PYTHON] = {"python", "3.10.0"};
    runtimes[language::JAVASCRIPT] = {"javascript", "18.15.0"};
    runtimes[language::JAVA] = {"java", "15.0.2"};
    runtimes[language::CPP] = {"cpp", "10.2.0"};
    runtimes[language::C] = {"c", "10.2.0"};
}

const language_runtime &language_catalogue::runtime(language lang) const {
    return runtimes.at(lang);
}

void language_catalogue::set_runtime(language lang, const language_runtime &runtime) {
    runtimes[lang] = runtime;
}

// C 语言没有重载，借助 _Generic 根据表达式类型选择打印函数
static const char *c_print_prelude = R"(#include <stdio.h>
#include <stdbool.h>
#include <string.h>
#include <stdlib.h>
)";

static const char *c_print_harness = R"(
static void gradeguard_print_ll(long long v) { printf("%lld\n", v); }
static void gradeguard_print_ull(unsigned long long v) { printf("%llu\n", v); }
static void gradeguard_print_double(double v) { printf("%g\n", v); }
static void gradeguard_print_str(const char *v) { printf("%s\n", v); }
static void gradeguard_print_bool(_Bool v) { printf("%s\n", v ? "true" : "false"); }

#define GRADEGUARD_PRINT(x) _Generic((x), \
    _Bool: gradeguard_print_bool, \
    char: gradeguard_print_ll, \
    signed char: gradeguard_print_ll, \
    short: gradeguard_print_ll, \
    int: gradeguard_print_ll, \
    long: gradeguard_print_ll, \
    long long: gradeguard_print_ll, \
    unsigned char: gradeguard_print_ull, \
    unsigned short: gradeguard_print_ull, \
    unsigned int: gradeguard_print_ull, \
    unsigned long: gradeguard_print_ull, \
    unsigned long long: gradeguard_print_ull, \
    float: gradeguard_print_double, \
    double: gradeguard_print_double, \
    char *: gradeguard_print_str, \
    const char *: gradeguard_print_str)(x)
)";

/**
 * @brief 将 Java 代码开头的 import 语句与其余代码分开
 * import 不能出现在类的内部，需要放到 Main 之前；程序总是在默认包中运行，package 语句被丢弃
 * @return {import 语句, 其余代码}
 */
static pair<string, string> split_java_imports(const string &source) {
    istringstream in(source);
    string line, header, body;
    bool in_header = true;
    while (getline(in, line)) {
        string stripped = boost::algorithm::trim_copy(line);
        if (in_header && (stripped.empty() || boost::algorithm::starts_with(stripped, "package "))) continue;
        if (in_header && boost::algorithm::starts_with(stripped, "import ")) {
            header += stripped + "\n";
            continue;
        }
        in_header = false;
        body += line + "\n";
    }
    return {header, body};
}

string language_catalogue::build_program(language lang, const string &source, const string &input) {
    switch (lang) {
        case language::PYTHON:
            return fmt::format("{}\n\nresult = {}\nprint(result)\n", source, input);
        case language::JAVASCRIPT:
            return fmt::format("{}\n\nconst result = {};\nconsole.log(result);\n", source, input);
        case language::JAVA: {
            auto [imports, body] = split_java_imports(source);
            return fmt::format(
                "{}public class Main {{\n{}\n"
                "    public static void main(String[] args) {{\n"
                "        System.out.println({});\n"
                "    }}\n"
                "}}\n",
                imports, body, input);
        }
        case language::CPP:
            return fmt::format(
                "#include <iostream>\n#include <string>\n#include <vector>\n"
                "{}\n\n"
                "int main() {{\n"
                "    std::cout << std::boolalpha << ({}) << std::endl;\n"
                "    return 0;\n"
                "}}\n",
                source, input);
        case language::C:
            return fmt::format(
                "{}{}\n{}\n"
                "int main(void) {{\n"
                "    GRADEGUARD_PRINT({});\n"
                "    return 0;\n"
                "}}\n",
                c_print_prelude, source, c_print_harness, input);
    }
    throw internal_error("Unrecognized language");
}

}  // namespace gradeguard
