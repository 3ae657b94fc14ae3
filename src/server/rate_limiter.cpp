#include "server/rate_limiter.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/exceptions.hpp"

namespace gradeguard::server {
using namespace std;

static constexpr long long SECONDS_PER_MINUTE = 60;
static constexpr long long SECONDS_PER_DAY = 86400;

rate_limiter::rate_limiter(counter_store &store, const rate_limit_config &config, clock_type now)
    : store(store), config(config), now(move(now)) {}

long long rate_limiter::epoch_seconds() const {
    return chrono::duration_cast<chrono::seconds>(now().time_since_epoch()).count();
}

void rate_limiter::check_window(const string &scope, const string &caller, long long limit) {
    if (limit <= 0) return;
    long long seconds = epoch_seconds();
    long long window = seconds / SECONDS_PER_MINUTE;
    string key = fmt::format("ratelimit:{}:{}:{}", scope, caller, window);
    long long count = store.increment(key, SECONDS_PER_MINUTE);
    if (count > limit) {
        long long retry_after = (window + 1) * SECONDS_PER_MINUTE - seconds;
        LOG(WARNING) << "Caller " << caller << " exceeded " << scope << " rate limit: " << count << "/" << limit;
        throw rate_limit_error("Rate limit exceeded. Please try again later.", retry_after);
    }
}

void rate_limiter::check_cooldown(const string &scope, const string &caller, long long seconds) {
    if (seconds <= 0) return;
    long long remaining = store.hold(fmt::format("cooldown:{}:{}", scope, caller), seconds);
    if (remaining > 0) {
        LOG(WARNING) << "Caller " << caller << " is cooling down on " << scope << " for " << remaining << "s";
        throw rate_limit_error(fmt::format("Please wait {} seconds before sending again.", remaining), remaining);
    }
}

void rate_limiter::check_daily_quota(const string &scope, const string &caller, long long quota) {
    if (quota <= 0) return;
    long long seconds = epoch_seconds();
    long long day = seconds / SECONDS_PER_DAY;
    long long reset_in = (day + 1) * SECONDS_PER_DAY - seconds;
    string key = fmt::format("quota:{}:{}:{}", scope, caller, day);
    // 多保留一分钟，避免跨过零点时的时钟误差
    long long count = store.increment(key, reset_in + SECONDS_PER_MINUTE);
    if (count > quota) {
        LOG(WARNING) << "Caller " << caller << " exhausted daily " << scope << " quota " << quota;
        throw rate_limit_error(fmt::format("Daily limit of {} reached. Resets at midnight UTC.", quota), reset_in);
    }
}

void rate_limiter::acquire(const string &scope, const string &caller) {
    if (scope == "execute") {
        check_window(scope, caller, config.execute);
        check_cooldown(scope, caller, config.send_cooldown_seconds);
        check_daily_quota(scope, caller, config.daily_quota);
    } else if (scope == "submit") {
        check_window(scope, caller, config.submit);
    } else if (scope == "revise") {
        check_window(scope, caller, config.revise);
    } else {
        throw internal_error("Unrecognized rate limit scope: " + scope);
    }
}

}  // namespace gradeguard::server
