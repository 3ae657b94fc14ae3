#include "judge/grade_aggregator.hpp"
#include <glog/logging.h>
#include <cmath>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace gradeguard {
using namespace std;

composite_grade::composite_grade(optional<double> value) : grade(value) {}

const optional<double> &composite_grade::value() const {
    return grade;
}

grade_state composite_grade::state() const {
    return grade ? grade_state::FINAL : grade_state::PENDING;
}

grade_aggregator::grade_aggregator(server::assignment_store &store) : store(store) {}

static bool is_correct(const question_spec &q, const map<size_t, string> &answers, size_t index) {
    auto it = answers.find(index);
    return it != answers.end() && q.correct_answer && trim(it->second) == trim(*q.correct_answer);
}

/**
 * @brief 统计选择题数量和答对的数量
 */
static pair<size_t, size_t> count_multiple_choice(const vector<question_spec> &questions, const map<size_t, string> &answers) {
    size_t correct = 0, total = 0;
    for (size_t i = 0; i < questions.size(); ++i) {
        if (questions[i].kind != question_kind::MULTIPLE_CHOICE) continue;
        ++total;
        if (is_correct(questions[i], answers, i)) ++correct;
    }
    return {correct, total};
}

// 只接受简答题的分数，选择题和编程题的分数不能由客户端提供
static bool is_short_answer(const assignment_record &record, size_t index) {
    return index < record.questions.size() && record.questions[index].kind == question_kind::SHORT_ANSWER;
}

static double multiple_choice_grade(size_t correct, size_t total) {
    return total == 0 ? 0 : round_grade(100.0 * correct / total);
}

initial_grading grade_aggregator::initial_grade(const vector<question_spec> &questions, const map<size_t, string> &answers) {
    auto [correct, total] = count_multiple_choice(questions, answers);

    bool manual = false;
    for (auto &q : questions)
        if (q.kind == question_kind::SHORT_ANSWER && q.mode == grading_mode::MANUAL)
            manual = true;

    optional<double> grade;
    if (!manual) grade = multiple_choice_grade(correct, total);
    return {composite_grade(grade), correct, total};
}

grade_revision grade_aggregator::revise_grade(double mc_grade, size_t mc_count, const vector<double> &short_answer_scores) {
    double sum = 0;
    size_t n = 0;
    for (double score : short_answer_scores) {
        // 越界的分数丢弃而不是截断
        if (!isfinite(score) || score < 0 || score > 100) continue;
        sum += score;
        ++n;
    }

    if (n == 0)
        return {composite_grade(mc_grade), mc_grade, 0, mc_count, 0};

    double avg = sum / n;
    // 没有选择题时成绩就是简答题的平均分，不做舍入
    if (mc_count == 0)
        return {composite_grade(avg), mc_grade, round_grade(avg), mc_count, n};

    double combined = (mc_grade * mc_count + avg * n) / (mc_count + n);
    return {composite_grade(round_grade(combined)), mc_grade, round_grade(avg), mc_count, n};
}

grade_revision grade_aggregator::revise_grade(const assignment_record &record, const map<size_t, double> &short_answer_grades) {
    auto [correct, total] = count_multiple_choice(record.questions, record.answers);

    vector<double> scores;
    for (auto &[index, score] : short_answer_grades) {
        if (!is_short_answer(record, index)) {
            LOG(WARNING) << "Ignoring score for question #" << index << " of assignment " << record.id;
            continue;
        }
        scores.push_back(score);
    }
    return revise_grade(multiple_choice_grade(correct, total), total, scores);
}

assignment_record grade_aggregator::load_owned(const string &caller, const string &assignment_id) {
    auto record = store.load(assignment_id);
    if (!record || record->student_id != caller) {
        LOG(WARNING) << "Caller " << caller << " is not allowed to grade assignment " << assignment_id;
        throw authorization_error("Assignment not found or unauthorized");
    }
    return *record;
}

initial_grading grade_aggregator::submit(const string &caller, const string &assignment_id, const map<size_t, string> &answers) {
    assignment_record record = load_owned(caller, assignment_id);
    if (record.completed)
        throw authorization_error("Assignment already completed");

    if (answers.size() != record.questions.size())
        throw invalid_request_error("Answer count mismatch: expected " + to_string(record.questions.size()) +
                                    ", got " + to_string(answers.size()));
    for (auto &entry : answers)
        if (entry.first >= record.questions.size())
            throw invalid_request_error("Answer for unknown question #" + to_string(entry.first));

    initial_grading result = initial_grade(record.questions, answers);

    record.answers = answers;
    record.completed = true;
    record.grade = result.grade.value();
    record.state = result.grade.state();
    store.save(record);

    LOG(INFO) << "Assignment " << assignment_id << " submitted by " << caller << ": "
              << result.correct << "/" << result.total << " multiple choice correct, state "
              << get_grade_state_name(record.state);
    return result;
}

grade_revision grade_aggregator::revise(const string &caller, const string &assignment_id, const map<size_t, double> &short_answer_grades) {
    assignment_record record = load_owned(caller, assignment_id);
    if (!record.completed)
        throw authorization_error("Assignment not completed");

    grade_revision result = revise_grade(record, short_answer_grades);

    record.short_answer_scores.clear();
    for (auto &[index, score] : short_answer_grades)
        if (is_short_answer(record, index))
            record.short_answer_scores[index] = score;
    record.grade = result.grade.value();
    record.state = grade_state::FINAL;
    store.save(record);

    LOG(INFO) << "Assignment " << assignment_id << " regraded: " << *result.grade.value()
              << " (mc " << result.mc_grade << " x" << result.mc_count
              << ", short answer " << result.short_answer_avg << " x" << result.short_answer_count << ")";
    return result;
}

}  // namespace gradeguard
