#include "common/utils.hpp"
#include <boost/algorithm/string/trim.hpp>
#include <cmath>
#include <cstdlib>
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

string trim(const string &s) {
    return boost::algorithm::trim_copy(s);
}

double round_grade(double value) {
    return round(value * 100) / 100;
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}
