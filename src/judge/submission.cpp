#include "judge/submission.hpp"

namespace gradeguard {
using namespace std;
using namespace nlohmann;

void to_json(json &j, const case_result &result) {
    j = {{"input", result.kase.input},
         {"expectedOutput", result.kase.expected_output},
         {"actualOutput", result.actual_output ? json(*result.actual_output) : json()},
         {"passed", result.passed},
         {"error", result.error_detail ? json(*result.error_detail) : json()},
         {"status", get_display_message(result.result)}};
}

void to_json(json &j, const execution_report &report) {
    j = {{"success", true},
         {"allPassed", report.all_passed},
         {"passedCount", report.passed_count},
         {"totalCount", report.total_count},
         {"results", report.results}};
}

}  // namespace gradeguard
