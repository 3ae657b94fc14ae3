#include "judge/code_validator.hpp"
#include <fmt/core.h>
#include <boost/algorithm/string/case_conv.hpp>
#include <cctype>
#include "config.hpp"

namespace gradeguard {
using namespace std;

validation_verdict validation_verdict::accept() {
    return validation_verdict();
}

validation_verdict validation_verdict::reject(reason_code reason, const string &detail) {
    validation_verdict verdict;
    verdict.accepted = false;
    verdict.reason = reason;
    verdict.detail = detail;
    return verdict;
}

// clang-format off
static const char *blocked_pattern_sources[] = {
    // 文件系统
    R"(\bopen\s*\()",
    R"(\bread\s*\()",
    R"(\bwrite\s*\()",
    R"(\bfs\.)",
    R"(\brequire\s*\(\s*['"]fs['"]\s*\))",
    R"(\bimport\s+.*\b(os|sys|subprocess|shutil|pickle|marshal)\b)",
    R"(\bfrom\s+(os|sys|subprocess|shutil|pickle|marshal)\b.*\bimport\b)",

    // 网络
    R"(\bfetch\s*\()",
    R"(\brequests\.)",
    R"(\bimport\s+.*\brequests\b)",
    R"(\bfrom\s+requests\b.*\bimport\b)",
    R"(\burllib)",
    R"(\bsocket\b)",
    R"(\bhttp\.)",

    // 动态求值
    R"(\beval\s*\()",
    R"(\bexec\s*\()",
    R"(\bcompile\s*\()",
    R"(\b__import__\s*\()",
    R"(\bFunction\s*\()",
    R"(\bimport\s*\()",
    R"(\brequire\s*\()",

    // 创建进程
    R"(\bos\.system\s*\()",
    R"(\bos\.popen\s*\()",
    R"(\bsubprocess\.)",
    R"(\bchild_process)",
    R"(\bspawn\s*\()",
    R"(\bexecSync\s*\()",
    R"(\bprocess\.)",

    // 运行时内省
    R"(\bglobals\s*\(\s*\))",
    R"(\blocals\s*\(\s*\))",
    R"(\bgetattr\s*\()",
    R"(\bsetattr\s*\()",
    R"(__builtins__)",
    R"(__class__)",
    R"(__mro__)",
    R"(__subclasses__)",
    R"(__bases__)",
    R"(\bimportlib)",
    R"(\bpkgutil)",

    // 转义编码
    R"(\\u00[0-9a-f]{2})",
    R"(\\x[0-9a-f]{2})",
    R"(\bbase64\.(decode|b64decode))",
    R"(\bcodecs\.(decode|encode))",
};
// clang-format on

static const char *obfuscated_keywords[] = {"eval", "exec", "open", "import", "require", "system", "popen"};

static string build_concatenation_pattern(const string &keyword) {
    // 'e' + 'v' + 'a' + 'l'，允许单双引号混用
    string pattern;
    for (size_t i = 0; i < keyword.size(); ++i) {
        if (i > 0) pattern += R"(\s*\+\s*)";
        pattern += fmt::format(R"(['"]{}['"])", keyword[i]);
    }
    return pattern;
}

code_validator::code_validator() {
    for (const char *source : blocked_pattern_sources)
        blocked_patterns.push_back({source, regex(source, regex::ECMAScript | regex::icase | regex::optimize)});

    for (const char *keyword : obfuscated_keywords)
        obfuscation_rules.push_back({keyword, regex(build_concatenation_pattern(keyword), regex::ECMAScript | regex::icase)});
}

optional<string> code_validator::match_blocked_pattern(const string &text) const {
    for (auto &pattern : blocked_patterns)
        if (regex_search(text, pattern.regex))
            return pattern.source;
    return nullopt;
}

optional<string> code_validator::detect_obfuscation(const string &code) const {
    for (auto &rule : obfuscation_rules)
        if (regex_search(code, rule.concatenation))
            return rule.keyword;

    string lower = boost::algorithm::to_lower_copy(code);
    for (auto &rule : obfuscation_rules) {
        for (char ch : rule.keyword) {
            int code_point = static_cast<unsigned char>(ch);
            if (lower.find(fmt::format("chr({})", code_point)) != string::npos ||
                lower.find(fmt::format("fromcharcode({})", code_point)) != string::npos)
                return rule.keyword;
        }
    }
    return nullopt;
}

int code_validator::max_nesting_depth(const string &code) {
    int depth = 0, max_depth = 0;
    for (char ch : code) {
        if (ch == '(' || ch == '[' || ch == '{') {
            max_depth = max(max_depth, ++depth);
        } else if ((ch == ')' || ch == ']' || ch == '}') && depth > 0) {
            --depth;
        }
    }
    return max_depth;
}

namespace {

/**
 * @brief 测试输入的递归下降解析器
 * 只做识别，不构造语法树
 */
struct call_expression_parser {
    explicit call_expression_parser(const string &text) : text(text) {}

    bool parse() {
        skip_spaces();
        if (!identifier()) return false;
        while (peek() == '.') {
            ++pos;
            if (!identifier()) return false;
        }
        skip_spaces();
        if (!consume('(')) return false;
        if (!argument_list(')')) return false;
        skip_spaces();
        return pos == text.size();
    }

private:
    const string &text;
    size_t pos = 0;

    char peek() const {
        return pos < text.size() ? text[pos] : '\0';
    }

    bool consume(char ch) {
        if (peek() != ch) return false;
        ++pos;
        return true;
    }

    void skip_spaces() {
        while (pos < text.size() && isspace(static_cast<unsigned char>(text[pos]))) ++pos;
    }

    static bool is_identifier_start(char ch) {
        return isalpha(static_cast<unsigned char>(ch)) || ch == '_' || ch == '$';
    }

    static bool is_identifier_char(char ch) {
        return isalnum(static_cast<unsigned char>(ch)) || ch == '_' || ch == '$';
    }

    bool identifier() {
        if (!is_identifier_start(peek())) return false;
        while (is_identifier_char(peek())) ++pos;
        return true;
    }

    // 开括号已经被读入，读到 close 为止，允许末尾多一个逗号
    bool argument_list(char close) {
        skip_spaces();
        if (consume(close)) return true;
        while (true) {
            if (!literal()) return false;
            skip_spaces();
            if (consume(close)) return true;
            if (!consume(',')) return false;
            skip_spaces();
            if (consume(close)) return true;
        }
    }

    bool literal() {
        char ch = peek();
        if (ch == '[') {
            ++pos;
            return argument_list(']');
        }
        if (ch == '"' || ch == '\'') return string_literal(ch);
        if (ch == '-' || ch == '+' || isdigit(static_cast<unsigned char>(ch))) return number();
        if (is_identifier_start(ch)) return keyword();
        return false;
    }

    bool digits() {
        size_t start = pos;
        while (isdigit(static_cast<unsigned char>(peek()))) ++pos;
        return pos > start;
    }

    bool number() {
        if (peek() == '-' || peek() == '+') ++pos;
        if (!digits()) return false;
        if (consume('.') && !digits()) return false;
        if (peek() == 'e' || peek() == 'E') {
            ++pos;
            if (peek() == '-' || peek() == '+') ++pos;
            if (!digits()) return false;
        }
        // 数字后不能紧跟标识符字符，避免 1abc 之类的输入
        return !is_identifier_char(peek());
    }

    bool string_literal(char quote) {
        ++pos;
        while (pos < text.size()) {
            char ch = text[pos++];
            if (ch == quote) return true;
            if (ch == '\n') return false;
            if (ch == '\\') {
                if (pos >= text.size()) return false;
                char escaped = text[pos++];
                switch (escaped) {
                    case 'n': case 't': case 'r': case '0':
                    case '\\': case '\'': case '"':
                        break;
                    default:
                        return false;
                }
            }
        }
        return false;
    }

    bool keyword() {
        size_t start = pos;
        identifier();
        string word = text.substr(start, pos - start);
        return word == "true" || word == "false" || word == "True" || word == "False" ||
               word == "null" || word == "None";
    }
};

}  // namespace

bool code_validator::is_call_expression(const string &input) {
    return call_expression_parser(input).parse();
}

validation_verdict code_validator::validate(const string &source_code, const vector<test_case> &test_cases) const {
    if (source_code.size() > MAX_SOURCE_LENGTH)
        return validation_verdict::reject(reason_code::SIZE_LIMIT,
                                          fmt::format("source code has {} characters, limit is {}", source_code.size(), MAX_SOURCE_LENGTH));
    if (test_cases.size() > MAX_TEST_CASES)
        return validation_verdict::reject(reason_code::SIZE_LIMIT,
                                          fmt::format("{} test cases submitted, limit is {}", test_cases.size(), MAX_TEST_CASES));
    for (size_t i = 0; i < test_cases.size(); ++i)
        if (test_cases[i].input.size() > MAX_TEST_INPUT_LENGTH)
            return validation_verdict::reject(reason_code::SIZE_LIMIT,
                                              fmt::format("input of test case #{} has {} characters, limit is {}", i, test_cases[i].input.size(), MAX_TEST_INPUT_LENGTH));

    if (auto pattern = match_blocked_pattern(source_code))
        return validation_verdict::reject(reason_code::BLOCKED_PATTERN, "source code matches " + *pattern);
    for (size_t i = 0; i < test_cases.size(); ++i)
        if (auto pattern = match_blocked_pattern(test_cases[i].input))
            return validation_verdict::reject(reason_code::BLOCKED_PATTERN, fmt::format("input of test case #{} matches {}", i, *pattern));

    if (auto keyword = detect_obfuscation(source_code))
        return validation_verdict::reject(reason_code::OBFUSCATION, "obfuscated keyword " + *keyword);

    int depth = max_nesting_depth(source_code);
    if (depth > MAX_NESTING_DEPTH)
        return validation_verdict::reject(reason_code::EXCESSIVE_NESTING,
                                          fmt::format("nesting depth {} exceeds {}", depth, MAX_NESTING_DEPTH));

    for (size_t i = 0; i < test_cases.size(); ++i)
        if (!is_call_expression(test_cases[i].input))
            return validation_verdict::reject(reason_code::MALFORMED_TEST_INPUT,
                                              fmt::format("input of test case #{} is not a call with literal arguments", i));

    return validation_verdict::accept();
}

validation_verdict code_validator::validate(const code_submission &submit) const {
    return validate(submit.source_code, submit.test_cases);
}

}  // namespace gradeguard
