#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace gradeguard {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::ACCEPTED, "Accepted")
    (status::WRONG_ANSWER, "Wrong Answer")
    (status::COMPILATION_ERROR, "Compilation Error")
    (status::RUNTIME_ERROR, "Runtime Error")
    (status::SYSTEM_ERROR, "System Error");

static const unordered_map<reason_code, const char *> reason_string = boost::assign::map_list_of
    (reason_code::NONE, "NONE")
    (reason_code::SIZE_LIMIT, "SIZE_LIMIT")
    (reason_code::BLOCKED_PATTERN, "BLOCKED_PATTERN")
    (reason_code::OBFUSCATION, "OBFUSCATION")
    (reason_code::EXCESSIVE_NESTING, "EXCESSIVE_NESTING")
    (reason_code::MALFORMED_TEST_INPUT, "MALFORMED_TEST_INPUT");
// clang-format on

const char *get_display_message(status stat) {
    return status_string.at(stat);
}

const char *get_display_message(reason_code code) {
    return reason_string.at(code);
}

}  // namespace gradeguard
