#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "common/status.hpp"
#include "judge/language.hpp"

using namespace std;
using namespace gradeguard;

TEST(LanguageTest, ParseLanguage) {
    EXPECT_EQ(parse_language("python"), language::PYTHON);
    EXPECT_EQ(parse_language("JavaScript"), language::JAVASCRIPT);
    EXPECT_EQ(parse_language("java"), language::JAVA);
    EXPECT_EQ(parse_language("CPP"), language::CPP);
    EXPECT_EQ(parse_language("c"), language::C);
    EXPECT_THROW(parse_language("ruby"), invalid_request_error);
    EXPECT_THROW(parse_language(""), invalid_request_error);

    EXPECT_STREQ(get_language_name(language::JAVASCRIPT), "javascript");
}

TEST(LanguageTest, DefaultRuntimes) {
    language_catalogue catalogue;
    EXPECT_EQ(catalogue.runtime(language::PYTHON).version, "3.10.0");
    EXPECT_EQ(catalogue.runtime(language::JAVASCRIPT).version, "18.15.0");
    EXPECT_EQ(catalogue.runtime(language::JAVA).version, "15.0.2");
    EXPECT_EQ(catalogue.runtime(language::CPP).name, "cpp");
    EXPECT_EQ(catalogue.runtime(language::C).version, "10.2.0");

    catalogue.set_runtime(language::PYTHON, {"python", "3.12.0"});
    EXPECT_EQ(catalogue.runtime(language::PYTHON).version, "3.12.0");
}

TEST(LanguageTest, PythonHarness) {
    EXPECT_EQ(language_catalogue::build_program(language::PYTHON, "def add(a, b):\n    return a + b", "add(2, 3)"),
              "def add(a, b):\n    return a + b\n\nresult = add(2, 3)\nprint(result)\n");
}

TEST(LanguageTest, JavaScriptHarness) {
    string program = language_catalogue::build_program(language::JAVASCRIPT, "function add(a, b) { return a + b; }", "add(2, 3)");
    EXPECT_NE(program.find("function add(a, b)"), string::npos);
    EXPECT_NE(program.find("const result = add(2, 3);\nconsole.log(result);"), string::npos);
}

TEST(LanguageTest, JavaHarness) {
    string program = language_catalogue::build_program(language::JAVA, "static int add(int a, int b) { return a + b; }", "add(2, 3)");
    EXPECT_EQ(program.rfind("public class Main {", 0), 0u);
    EXPECT_NE(program.find("System.out.println(add(2, 3));"), string::npos);
}

TEST(LanguageTest, JavaImportsAreHoisted) {
    string program = language_catalogue::build_program(language::JAVA,
                                                       "package solution;\nimport java.util.*;\n  import java.util.stream.Collectors;\n\n"
                                                       "static int f() { return new ArrayList<Integer>().size(); }",
                                                       "f()");
    EXPECT_EQ(program.rfind("import java.util.*;\nimport java.util.stream.Collectors;\npublic class Main {\n", 0), 0u);
    EXPECT_EQ(program.find("package"), string::npos);
    EXPECT_EQ(program.find("import", program.find("public class Main")), string::npos);
    EXPECT_NE(program.find("static int f()"), string::npos);
}

TEST(LanguageTest, NativeHarnesses) {
    string cpp = language_catalogue::build_program(language::CPP, "int add(int a, int b) { return a + b; }", "add(2, 3)");
    EXPECT_NE(cpp.find("#include <iostream>"), string::npos);
    EXPECT_NE(cpp.find("std::cout << std::boolalpha << (add(2, 3))"), string::npos);

    string c = language_catalogue::build_program(language::C, "int add(int a, int b) { return a + b; }", "add(2, 3)");
    EXPECT_NE(c.find("#include <stdio.h>"), string::npos);
    EXPECT_NE(c.find("GRADEGUARD_PRINT(add(2, 3));"), string::npos);
    // 选手代码必须出现在 main 之前
    EXPECT_LT(c.find("int add(int a, int b)"), c.find("int main(void)"));
}

TEST(LanguageTest, DisplayMessages) {
    EXPECT_STREQ(get_display_message(status::ACCEPTED), "Accepted");
    EXPECT_STREQ(get_display_message(status::SYSTEM_ERROR), "System Error");
    EXPECT_STREQ(get_display_message(reason_code::BLOCKED_PATTERN), "BLOCKED_PATTERN");
    EXPECT_STREQ(get_display_message(reason_code::MALFORMED_TEST_INPUT), "MALFORMED_TEST_INPUT");
}
