#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "judge/assignment.hpp"
#include "server/assignment_store.hpp"

namespace gradeguard {

/**
 * @brief 计算得到的成绩，取值范围 [0, 100]，为空表示等待人工评分
 * 只能由 grade_aggregator 构造，不能从请求中反序列化得到
 */
struct composite_grade {
    const std::optional<double> &value() const;

    /**
     * @brief 成绩为空时为 PENDING，否则为 FINAL
     */
    grade_state state() const;

private:
    explicit composite_grade(std::optional<double> value);

    std::optional<double> grade;

    friend struct grade_aggregator;
};

/**
 * @brief 首次提交时的评分结果
 */
struct initial_grading {
    composite_grade grade;

    /**
     * @brief 答对的选择题数量
     */
    std::size_t correct;

    /**
     * @brief 选择题数量
     */
    std::size_t total;
};

/**
 * @brief 重新计算成绩的结果及其组成
 */
struct grade_revision {
    composite_grade grade;
    double mc_grade;
    double short_answer_avg;
    std::size_t mc_count;
    std::size_t short_answer_count;
};

/**
 * @brief 成绩的唯一计算者和写入者
 *
 * 选择题成绩总是根据服务端保存的作答和标准答案重新计算，
 * 不采用客户端提交的或者记录中已有的成绩。
 * 所有计算得到的成绩都保留两位小数。
 */
struct grade_aggregator {
    explicit grade_aggregator(server::assignment_store &store);

    /**
     * @brief 首次提交的评分
     * 若存在人工评分的简答题，成绩为空；否则为选择题的正确率乘以 100，
     * 没有选择题时为 0。
     * @param questions 作业的所有题目
     * @param answers 学生的作答，键为题目下标
     */
    static initial_grading initial_grade(const std::vector<question_spec> &questions, const std::map<std::size_t, std::string> &answers);

    /**
     * @brief 按题目数量加权合并选择题成绩和简答题成绩
     * (mc_grade * mc_count + avg * n) / (mc_count + n)，
     * 不在 [0, 100] 中的简答题分数直接丢弃；没有有效的简答题分数时原样返回 mc_grade。
     * @param mc_grade 选择题成绩
     * @param mc_count 选择题数量
     * @param short_answer_scores 简答题分数
     */
    static grade_revision revise_grade(double mc_grade, std::size_t mc_count, const std::vector<double> &short_answer_scores);

    /**
     * @brief 根据作业记录和新的简答题分数重新计算成绩
     * 下标不是该作业中简答题的分数会被忽略
     */
    static grade_revision revise_grade(const assignment_record &record, const std::map<std::size_t, double> &short_answer_grades);

    /**
     * @brief 学生首次提交作业
     * @param caller 经过认证的调用者
     * @param assignment_id 作业编号
     * @param answers 学生的作答，必须恰好回答每一道题
     * @throw authorization_error 若作业不存在、不属于 caller 或者已经提交
     * @throw invalid_request_error 若作答数量与题目数量不一致，或者题目下标越界
     */
    initial_grading submit(const std::string &caller, const std::string &assignment_id, const std::map<std::size_t, std::string> &answers);

    /**
     * @brief 人工或异步评分结束后重新计算成绩
     * @param caller 经过认证的调用者
     * @param assignment_id 作业编号
     * @param short_answer_grades 简答题分数，键为题目下标
     * @throw authorization_error 若作业不存在、不属于 caller 或者尚未提交
     */
    grade_revision revise(const std::string &caller, const std::string &assignment_id, const std::map<std::size_t, double> &short_answer_grades);

private:
    server::assignment_store &store;

    assignment_record load_owned(const std::string &caller, const std::string &assignment_id);
};

}  // namespace gradeguard
