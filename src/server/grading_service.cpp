#include "server/grading_service.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string/classification.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"

namespace gradeguard::server {
using namespace std;
using namespace nlohmann;

grading_service::grading_service(const code_validator &validator, const execution_orchestrator &orchestrator, grade_aggregator &aggregator, rate_limiter *limiter)
    : validator(validator), orchestrator(orchestrator), aggregator(aggregator), limiter(limiter) {}

static service_response failure(int status, const string &reason, const string &message) {
    return {status, {{"success", false}, {"reason", reason}, {"error", message}}};
}

static const json &require_object(const json &body) {
    if (!body.is_object())
        throw invalid_request_error("Request body must be an object");
    return body;
}

static string require_string(const json &body, const char *key) {
    if (!exists(body, key) || !body.at(key).is_string())
        throw invalid_request_error(string("Missing or invalid field: ") + key);
    return body.at(key).get<string>();
}

static size_t parse_question_index(const string &key) {
    if (key.empty() || key.size() > 9 || !boost::algorithm::all(key, boost::algorithm::is_digit()))
        throw invalid_request_error("Invalid question index: " + key);
    return stoul(key);
}

code_submission grading_service::parse_execution_request(const json &body) {
    require_object(body);

    code_submission submit;
    submit.source_code = require_string(body, "code");
    submit.lang = parse_language(require_string(body, "language"));

    if (!exists(body, "testCases") || !body.at("testCases").is_array())
        throw invalid_request_error("Missing or invalid field: testCases");
    const json &cases = body.at("testCases");
    if (cases.empty())
        throw invalid_request_error("At least one test case is required");

    for (auto &item : cases) {
        if (!item.is_object())
            throw invalid_request_error("Test case must be an object");
        test_case kase;
        kase.input = require_string(item, "input");
        kase.expected_output = require_string(item, "expectedOutput");
        submit.test_cases.push_back(kase);
    }
    return submit;
}

service_response grading_service::execute(const string &caller, const json &body) {
    if (limiter) limiter->acquire("execute", caller);

    code_submission submit = parse_execution_request(body);

    validation_verdict verdict = validator.validate(submit);
    if (!verdict.accepted) {
        LOG(WARNING) << "Rejected " << get_language_name(submit.lang) << " submission from " << caller
                     << ": " << get_display_message(verdict.reason) << " (" << verdict.detail << ")";
        if (verdict.reason == reason_code::SIZE_LIMIT)
            return failure(400, "SIZE_LIMIT", "Submission exceeds size limits");
        return failure(400, "VALIDATION_FAILED", "validation failed");
    }

    execution_report report = orchestrator.execute(submit, verdict);
    return {200, report};
}

service_response grading_service::submit(const string &caller, const json &body) {
    if (limiter) limiter->acquire("submit", caller);

    require_object(body);
    string assignment_id = require_string(body, "assignmentId");
    if (!exists(body, "answers") || !body.at("answers").is_object())
        throw invalid_request_error("Missing or invalid field: answers");

    map<size_t, string> answers;
    for (auto &item : body.at("answers").items()) {
        if (!item.value().is_string())
            throw invalid_request_error("Answer must be a string: " + item.key());
        answers[parse_question_index(item.key())] = item.value().get<string>();
    }

    initial_grading result = aggregator.submit(caller, assignment_id, answers);
    const auto &grade = result.grade.value();
    return {200,
            {{"success", true},
             {"grade", grade ? json(*grade) : json()},
             {"correct", result.correct},
             {"total", result.total},
             {"state", get_grade_state_name(result.grade.state())}}};
}

service_response grading_service::revise(const string &caller, const json &body) {
    if (limiter) limiter->acquire("revise", caller);

    require_object(body);
    string assignment_id = require_string(body, "assignmentId");

    map<size_t, double> grades;
    if (exists(body, "shortAnswerGrades")) {
        const json &supplied = body.at("shortAnswerGrades");
        if (!supplied.is_object())
            throw invalid_request_error("Invalid field: shortAnswerGrades");
        for (auto &item : supplied.items()) {
            if (!item.value().is_number())
                throw invalid_request_error("Score must be a number: " + item.key());
            grades[parse_question_index(item.key())] = item.value().get<double>();
        }
    }

    grade_revision result = aggregator.revise(caller, assignment_id, grades);
    return {200,
            {{"success", true},
             {"grade", *result.grade.value()},
             {"mcGrade", result.mc_grade},
             {"shortAnswerAvg", result.short_answer_avg},
             {"mcCount", result.mc_count},
             {"shortAnswerCount", result.short_answer_count}}};
}

service_response grading_service::handle(const string &type, const string &caller, const json &body) {
    try {
        if (caller.empty())
            throw authorization_error("Unauthenticated request");
        if (type == "execute") return execute(caller, body);
        if (type == "submit") return submit(caller, body);
        if (type == "revise") return revise(caller, body);
        throw invalid_request_error("Unrecognized request type: " + type);
    } catch (invalid_request_error &e) {
        LOG(INFO) << "Invalid " << type << " request from " << caller << ": " << e.what();
        return failure(400, "INVALID_REQUEST", e.what());
    } catch (authorization_error &e) {
        return failure(403, "UNAUTHORIZED", e.what());
    } catch (rate_limit_error &e) {
        service_response response = failure(429, "RATE_LIMITED", e.what());
        response.body["retryAfter"] = e.retry_after;
        return response;
    } catch (gradeguard_exception &e) {
        LOG(ERROR) << "Failed to handle " << type << " request from " << caller << ": " << e;
        return failure(500, "INTERNAL_ERROR", "Internal server error");
    } catch (std::exception &e) {
        LOG(ERROR) << "Failed to handle " << type << " request from " << caller << ": " << boost::diagnostic_information(e);
        return failure(500, "INTERNAL_ERROR", "Internal server error");
    }
}

}  // namespace gradeguard::server
