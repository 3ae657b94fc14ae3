#include "server/redis_counter_store.hpp"
#include "common/exceptions.hpp"

namespace gradeguard::server {
using namespace std;

redis_counter_store::redis_counter_store(redis_conn &conn) : conn(conn) {}

/**
 * @brief 取出 EXEC 的回复，replies 中依次是 MULTI、若干个 QUEUED 和 EXEC 的回复
 */
static const vector<cpp_redis::reply> &transaction_result(const vector<cpp_redis::reply> &replies, size_t commands) {
    const cpp_redis::reply &exec = replies.back();
    if (!exec.is_array() || exec.as_array().size() != commands)
        throw store_error("Redis: transaction aborted");
    return exec.as_array();
}

long long redis_counter_store::increment(const string &key, long long ttl_seconds) {
    auto replies = conn.execute([&](cpp_redis::client &redis, vector<future<cpp_redis::reply>> &futures) {
        futures.push_back(redis.multi());
        futures.push_back(redis.incr(key));
        futures.push_back(redis.expire(key, static_cast<int>(ttl_seconds)));
        futures.push_back(redis.exec());
    });

    const cpp_redis::reply &count = transaction_result(replies, 2).at(0);
    if (!count.is_integer())
        throw store_error("Redis: unexpected reply to INCR " + key);
    return count.as_integer();
}

long long redis_counter_store::hold(const string &key, long long ttl_seconds) {
    auto replies = conn.execute([&](cpp_redis::client &redis, vector<future<cpp_redis::reply>> &futures) {
        futures.push_back(redis.multi());
        futures.push_back(redis.set_advanced(key, "1", true, static_cast<int>(ttl_seconds), false, 0, true));
        futures.push_back(redis.ttl(key));
        futures.push_back(redis.exec());
    });

    auto &result = transaction_result(replies, 2);
    // SET NX 在 key 已存在时返回 nil
    if (!result.at(0).is_null()) return 0;
    long long ttl = result.at(1).is_integer() ? result.at(1).as_integer() : 0;
    return max(ttl, 1LL);
}

}  // namespace gradeguard::server
