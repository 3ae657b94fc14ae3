#pragma once

#include <chrono>
#include <string>

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 去掉字符串首尾的空白字符
 * 测试点输出与标准输出比较前都要经过这一步
 */
std::string trim(const std::string &s);

/**
 * @brief 将分数保留两位小数
 * 所有持久化的成绩都经过这一步，以保证同样的输入总是得到同样的成绩
 */
double round_grade(double value);

struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};
