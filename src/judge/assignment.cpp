#include "judge/assignment.hpp"
#include <boost/assign.hpp>
#include <boost/lexical_cast.hpp>
#include <stdexcept>
#include <unordered_map>
#include "common/json_utils.hpp"

namespace gradeguard {
using namespace std;
using namespace nlohmann;

// clang-format off
static const unordered_map<string, question_kind> question_kinds = boost::assign::map_list_of
    ("multiple_choice", question_kind::MULTIPLE_CHOICE)
    ("short_answer", question_kind::SHORT_ANSWER)
    ("coding", question_kind::CODING);

static const unordered_map<string, grading_mode> grading_modes = boost::assign::map_list_of
    ("auto", grading_mode::AUTO)
    ("manual", grading_mode::MANUAL);

static const unordered_map<string, grade_state> grade_states = boost::assign::map_list_of
    ("unset", grade_state::UNSET)
    ("pending", grade_state::PENDING)
    ("final", grade_state::FINAL);
// clang-format on

template <typename T>
static T parse_name(const unordered_map<string, T> &names, const string &name, const char *what) {
    auto it = names.find(name);
    if (it == names.end())
        throw invalid_argument(string("Unrecognized ") + what + ": " + name);
    return it->second;
}

const char *get_question_kind_name(question_kind kind) {
    switch (kind) {
        case question_kind::MULTIPLE_CHOICE: return "multiple_choice";
        case question_kind::SHORT_ANSWER: return "short_answer";
        case question_kind::CODING: return "coding";
    }
    return "unknown";
}

const char *get_grading_mode_name(grading_mode mode) {
    switch (mode) {
        case grading_mode::AUTO: return "auto";
        case grading_mode::MANUAL: return "manual";
    }
    return "unknown";
}

const char *get_grade_state_name(grade_state state) {
    switch (state) {
        case grade_state::UNSET: return "unset";
        case grade_state::PENDING: return "pending";
        case grade_state::FINAL: return "final";
    }
    return "unknown";
}

void from_json(const json &j, question_spec &question) {
    question.kind = parse_name(question_kinds, get_value<string>(j, "kind"), "question kind");
    question.mode = parse_name(grading_modes, get_value_def<string>(j, "auto", "gradingMode"), "grading mode");
    question.correct_answer.reset();
    if (exists(j, "correctAnswer"))
        question.correct_answer = get_value<string>(j, "correctAnswer");
    if (question.kind == question_kind::MULTIPLE_CHOICE && !question.correct_answer)
        throw invalid_argument("Multiple choice question without correctAnswer");
}

void to_json(json &j, const question_spec &question) {
    j = {{"kind", get_question_kind_name(question.kind)},
         {"gradingMode", get_grading_mode_name(question.mode)}};
    if (question.correct_answer)
        j["correctAnswer"] = *question.correct_answer;
}

template <typename T>
static map<size_t, T> parse_indexed(const json &j, const char *key) {
    map<size_t, T> result;
    if (!exists(j, key)) return result;
    for (auto &item : j.at(key).items()) {
        const string &index = item.key();
        try {
            result[boost::lexical_cast<size_t>(index)] = item.value().template get<T>();
        } catch (boost::bad_lexical_cast &) {
            throw invalid_argument(string("Invalid question index in ") + key + ": " + index);
        } catch (json::exception &) {
            throw invalid_argument(string("Unexpected value type of: ") + key + "." + index);
        }
    }
    return result;
}

template <typename T>
static json dump_indexed(const map<size_t, T> &values) {
    json j = json::object();
    for (auto &[index, value] : values)
        j[to_string(index)] = value;
    return j;
}

void from_json(const json &j, assignment_record &record) {
    record.id = get_value<string>(j, "id");
    record.student_id = get_value<string>(j, "studentId");
    record.completed = get_value_def<bool>(j, false, "completed");
    record.state = parse_name(grade_states, get_value_def<string>(j, "unset", "state"), "grade state");
    record.questions.clear();
    if (exists(j, "questions"))
        record.questions = get_value<vector<question_spec>>(j, "questions");
    record.answers = parse_indexed<string>(j, "answers");
    record.grade.reset();
    if (exists(j, "grade"))
        record.grade = get_value<double>(j, "grade");
    record.short_answer_scores = parse_indexed<double>(j, "shortAnswerScores");
}

void to_json(json &j, const assignment_record &record) {
    j = {{"id", record.id},
         {"studentId", record.student_id},
         {"completed", record.completed},
         {"state", get_grade_state_name(record.state)},
         {"questions", record.questions},
         {"answers", dump_indexed(record.answers)},
         {"grade", record.grade ? json(*record.grade) : json()},
         {"shortAnswerScores", dump_indexed(record.short_answer_scores)}};
}

}  // namespace gradeguard
