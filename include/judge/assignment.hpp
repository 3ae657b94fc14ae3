#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

/**
 * 这个头文件包含作业相关的数据结构
 * 作业记录由服务端保存，成绩只能由 grade_aggregator 计算后写入
 */
namespace gradeguard {

/**
 * @brief 题目类型
 */
enum class question_kind {
    MULTIPLE_CHOICE,
    SHORT_ANSWER,
    CODING
};

/**
 * @brief 题目的评分方式，在创建题目时确定，评分时不再推断
 */
enum class grading_mode {
    /**
     * @brief 提交时由服务端自动评分（选择题），或者由异步评分流程给出分数
     */
    AUTO,

    /**
     * @brief 需要人工评分，提交时成绩为待定
     */
    MANUAL
};

/**
 * @brief 成绩字段的状态
 * UNSET -> PENDING | FINAL，PENDING -> FINAL，FINAL -> FINAL（重新评分）
 */
enum class grade_state {
    /**
     * @brief 尚未提交
     */
    UNSET,

    /**
     * @brief 已提交，存在等待人工评分的简答题，成绩为空
     */
    PENDING,

    /**
     * @brief 已提交，成绩已确定
     */
    FINAL
};

/**
 * @brief 表示作业中的一道题
 */
struct question_spec {
    question_kind kind = question_kind::MULTIPLE_CHOICE;

    grading_mode mode = grading_mode::AUTO;

    /**
     * @brief 选择题的标准答案，比较时去掉首尾空白字符
     * 其他题型为空
     */
    std::optional<std::string> correct_answer;
};

/**
 * @brief 表示一个学生的一份作业
 */
struct assignment_record {
    std::string id;

    /**
     * @brief 作业所属学生，只有该学生可以提交或者重新计算成绩
     */
    std::string student_id;

    /**
     * @brief 是否已经提交
     */
    bool completed = false;

    grade_state state = grade_state::UNSET;

    std::vector<question_spec> questions;

    /**
     * @brief 学生的作答，键为题目下标
     */
    std::map<std::size_t, std::string> answers;

    /**
     * @brief 当前成绩，PENDING 或 UNSET 时为空
     */
    std::optional<double> grade;

    /**
     * @brief 最近一次重新评分时采用的简答题分数，键为题目下标
     */
    std::map<std::size_t, double> short_answer_scores;
};

const char *get_question_kind_name(question_kind kind);
const char *get_grading_mode_name(grading_mode mode);
const char *get_grade_state_name(grade_state state);

void from_json(const nlohmann::json &j, question_spec &question);
void to_json(nlohmann::json &j, const question_spec &question);

void from_json(const nlohmann::json &j, assignment_record &record);
void to_json(nlohmann::json &j, const assignment_record &record);

}  // namespace gradeguard
