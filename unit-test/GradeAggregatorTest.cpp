#include <cmath>
#include <limits>
#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "judge/grade_aggregator.hpp"
#include "test/memory_assignment_store.hpp"

using namespace std;
using namespace gradeguard;

static question_spec multiple_choice(const string &answer) {
    return {question_kind::MULTIPLE_CHOICE, grading_mode::AUTO, answer};
}

static question_spec short_answer(grading_mode mode) {
    return {question_kind::SHORT_ANSWER, mode, nullopt};
}

class GradeAggregatorTest : public ::testing::Test {
protected:
    server::mock::memory_assignment_store store;
    grade_aggregator aggregator{store};

    assignment_record make_record(vector<question_spec> questions) {
        assignment_record record;
        record.id = "a1";
        record.student_id = "alice";
        record.questions = move(questions);
        store.put(record);
        return record;
    }
};

TEST_F(GradeAggregatorTest, TwoOfThreeMultipleChoice) {
    vector<question_spec> questions = {multiple_choice("A"), multiple_choice("B"), multiple_choice("C")};
    auto result = grade_aggregator::initial_grade(questions, {{0, "A"}, {1, "B"}, {2, "D"}});
    EXPECT_EQ(result.correct, 2u);
    EXPECT_EQ(result.total, 3u);
    ASSERT_TRUE(result.grade.value());
    EXPECT_DOUBLE_EQ(*result.grade.value(), 66.67);
    EXPECT_EQ(result.grade.state(), grade_state::FINAL);
}

TEST_F(GradeAggregatorTest, AnswersAreComparedAfterTrimming) {
    vector<question_spec> questions = {multiple_choice("A")};
    auto result = grade_aggregator::initial_grade(questions, {{0, " A\n"}});
    EXPECT_DOUBLE_EQ(*result.grade.value(), 100);
}

TEST_F(GradeAggregatorTest, NoMultipleChoiceGradesZero) {
    vector<question_spec> questions = {short_answer(grading_mode::AUTO)};
    auto result = grade_aggregator::initial_grade(questions, {{0, "because"}});
    ASSERT_TRUE(result.grade.value());
    EXPECT_DOUBLE_EQ(*result.grade.value(), 0);
    EXPECT_EQ(result.total, 0u);
}

TEST_F(GradeAggregatorTest, ManualShortAnswerIsPending) {
    vector<question_spec> questions = {multiple_choice("A"), short_answer(grading_mode::MANUAL)};
    auto result = grade_aggregator::initial_grade(questions, {{0, "A"}, {1, "because"}});
    EXPECT_FALSE(result.grade.value());
    EXPECT_EQ(result.grade.state(), grade_state::PENDING);
    EXPECT_EQ(result.correct, 1u);
}

TEST_F(GradeAggregatorTest, InitialGradeIsDeterministic) {
    vector<question_spec> questions = {multiple_choice("A"), multiple_choice("B"), multiple_choice("C")};
    map<size_t, string> answers = {{0, "A"}, {1, "C"}, {2, "C"}};
    EXPECT_EQ(grade_aggregator::initial_grade(questions, answers).grade.value(),
              grade_aggregator::initial_grade(questions, answers).grade.value());
}

TEST_F(GradeAggregatorTest, WeightedComposite) {
    auto revision = grade_aggregator::revise_grade(80, 2, {60, 90});
    EXPECT_DOUBLE_EQ(*revision.grade.value(), 77.5);
    EXPECT_DOUBLE_EQ(revision.mc_grade, 80);
    EXPECT_DOUBLE_EQ(revision.short_answer_avg, 75);
    EXPECT_EQ(revision.mc_count, 2u);
    EXPECT_EQ(revision.short_answer_count, 2u);
}

TEST_F(GradeAggregatorTest, OutOfRangeScoresAreDiscarded) {
    auto revision = grade_aggregator::revise_grade(80, 2, {101, 60, -1, numeric_limits<double>::quiet_NaN()});
    EXPECT_EQ(revision.short_answer_count, 1u);
    EXPECT_DOUBLE_EQ(revision.short_answer_avg, 60);
    EXPECT_DOUBLE_EQ(*revision.grade.value(), 73.33);

    auto boundary = grade_aggregator::revise_grade(0, 0, {0, 100});
    EXPECT_EQ(boundary.short_answer_count, 2u);
    EXPECT_DOUBLE_EQ(*boundary.grade.value(), 50);
}

TEST_F(GradeAggregatorTest, WithoutMultipleChoiceUsesMean) {
    auto revision = grade_aggregator::revise_grade(0, 0, {60, 90});
    EXPECT_DOUBLE_EQ(*revision.grade.value(), 75);

    // 平均分不做舍入
    auto repeating = grade_aggregator::revise_grade(0, 0, {60, 91, 70});
    EXPECT_EQ(*repeating.grade.value(), (60.0 + 91.0 + 70.0) / 3);
    EXPECT_DOUBLE_EQ(repeating.short_answer_avg, 73.67);
}

TEST_F(GradeAggregatorTest, WithoutShortAnswersKeepsMultipleChoiceGrade) {
    auto revision = grade_aggregator::revise_grade(66.666, 3, {});
    EXPECT_DOUBLE_EQ(*revision.grade.value(), 66.666);
    EXPECT_EQ(revision.short_answer_count, 0u);

    auto discarded = grade_aggregator::revise_grade(50, 2, {150});
    EXPECT_DOUBLE_EQ(*discarded.grade.value(), 50);
}

TEST_F(GradeAggregatorTest, CodingScoresAreNotAccepted) {
    assignment_record record;
    record.id = "a1";
    record.student_id = "alice";
    record.completed = true;
    record.state = grade_state::PENDING;
    record.questions = {multiple_choice("A"), {question_kind::CODING, grading_mode::AUTO, nullopt}, short_answer(grading_mode::MANUAL)};
    record.answers = {{0, "A"}, {1, "def f(): pass"}, {2, "because"}};
    store.put(record);

    auto revision = aggregator.revise("alice", "a1", {{1, 100}, {2, 50}});
    EXPECT_EQ(revision.short_answer_count, 1u);
    EXPECT_DOUBLE_EQ(*revision.grade.value(), 75);

    auto stored = store.load("a1");
    EXPECT_EQ(stored->short_answer_scores.count(1), 0u);
    EXPECT_DOUBLE_EQ(stored->short_answer_scores.at(2), 50);
}

TEST_F(GradeAggregatorTest, SubmitStoresGrade) {
    make_record({multiple_choice("A"), multiple_choice("B")});

    auto result = aggregator.submit("alice", "a1", {{0, "A"}, {1, "C"}});
    EXPECT_DOUBLE_EQ(*result.grade.value(), 50);

    auto record = store.load("a1");
    ASSERT_TRUE(record);
    EXPECT_TRUE(record->completed);
    EXPECT_EQ(record->state, grade_state::FINAL);
    EXPECT_EQ(record->grade, optional<double>(50));
    EXPECT_EQ(record->answers.at(1), "C");
}

TEST_F(GradeAggregatorTest, SubmitRejectsOtherCaller) {
    make_record({multiple_choice("A")});
    EXPECT_THROW(aggregator.submit("mallory", "a1", {{0, "A"}}), authorization_error);
    EXPECT_THROW(aggregator.submit("alice", "missing", {{0, "A"}}), authorization_error);
    EXPECT_EQ(store.save_count, 0u);
    EXPECT_FALSE(store.load("a1")->completed);
}

TEST_F(GradeAggregatorTest, SubmitOnlyOnce) {
    make_record({multiple_choice("A")});
    aggregator.submit("alice", "a1", {{0, "B"}});
    EXPECT_THROW(aggregator.submit("alice", "a1", {{0, "A"}}), authorization_error);
    EXPECT_EQ(store.load("a1")->grade, optional<double>(0));
}

TEST_F(GradeAggregatorTest, SubmitRequiresEveryAnswer) {
    make_record({multiple_choice("A"), short_answer(grading_mode::MANUAL)});
    EXPECT_THROW(aggregator.submit("alice", "a1", {{0, "A"}}), invalid_request_error);
    EXPECT_THROW(aggregator.submit("alice", "a1", {{0, "A"}, {5, "x"}}), invalid_request_error);
    EXPECT_EQ(store.save_count, 0u);
}

TEST_F(GradeAggregatorTest, ReviseRequiresCompletedOwnedAssignment) {
    make_record({multiple_choice("A"), short_answer(grading_mode::MANUAL)});
    EXPECT_THROW(aggregator.revise("alice", "a1", {{1, 80}}), authorization_error);

    aggregator.submit("alice", "a1", {{0, "A"}, {1, "because"}});
    EXPECT_THROW(aggregator.revise("mallory", "a1", {{1, 80}}), authorization_error);
    EXPECT_EQ(store.load("a1")->state, grade_state::PENDING);
}

TEST_F(GradeAggregatorTest, ReviseRecomputesFromStoredAnswers) {
    assignment_record record;
    record.id = "a1";
    record.student_id = "alice";
    record.completed = true;
    record.state = grade_state::PENDING;
    record.questions = {multiple_choice("A"), multiple_choice("B"), short_answer(grading_mode::MANUAL)};
    record.answers = {{0, "A"}, {1, "C"}, {2, "because"}};
    // 记录中的成绩不可信，重新计算时应当被忽略
    record.grade = 100;
    store.put(record);

    // 下标 0 是选择题，下标 9 不存在，两者都被忽略
    auto revision = aggregator.revise("alice", "a1", {{0, 100}, {2, 80}, {9, 100}});
    EXPECT_DOUBLE_EQ(revision.mc_grade, 50);
    EXPECT_EQ(revision.mc_count, 2u);
    EXPECT_EQ(revision.short_answer_count, 1u);
    EXPECT_DOUBLE_EQ(*revision.grade.value(), 60);

    auto stored = store.load("a1");
    EXPECT_EQ(stored->state, grade_state::FINAL);
    EXPECT_EQ(stored->grade, optional<double>(60));
    EXPECT_EQ(stored->short_answer_scores.size(), 1u);
    EXPECT_DOUBLE_EQ(stored->short_answer_scores.at(2), 80);
}

TEST_F(GradeAggregatorTest, RegradeRecomputes) {
    make_record({multiple_choice("A"), short_answer(grading_mode::MANUAL)});
    aggregator.submit("alice", "a1", {{0, "A"}, {1, "because"}});

    EXPECT_DOUBLE_EQ(*aggregator.revise("alice", "a1", {{1, 60}}).grade.value(), 80);
    EXPECT_DOUBLE_EQ(*aggregator.revise("alice", "a1", {{1, 60}}).grade.value(), 80);
    EXPECT_DOUBLE_EQ(*aggregator.revise("alice", "a1", {{1, 100}}).grade.value(), 100);
}

TEST_F(GradeAggregatorTest, RecordJsonRoundTrip) {
    assignment_record record;
    record.id = "a1";
    record.student_id = "alice";
    record.completed = true;
    record.state = grade_state::FINAL;
    record.questions = {multiple_choice("A"), short_answer(grading_mode::MANUAL)};
    record.answers = {{0, "A"}, {1, "because"}};
    record.grade = 75.5;
    record.short_answer_scores = {{1, 51}};

    nlohmann::json j = record;
    EXPECT_EQ(j.at("questions").at(1).at("gradingMode"), "manual");
    EXPECT_EQ(j.at("answers").at("1"), "because");

    auto parsed = j.get<assignment_record>();
    EXPECT_EQ(parsed.student_id, "alice");
    EXPECT_EQ(parsed.state, grade_state::FINAL);
    EXPECT_EQ(parsed.questions[1].mode, grading_mode::MANUAL);
    EXPECT_EQ(parsed.answers, record.answers);
    EXPECT_EQ(parsed.grade, optional<double>(75.5));

    j["questions"][0].erase("correctAnswer");
    EXPECT_THROW(j.get<assignment_record>(), std::invalid_argument);
}
