#pragma once

#include "server/rate_limiter.hpp"
#include "server/redis.hpp"

namespace gradeguard::server {

/**
 * @brief 使用 Redis 事务（MULTI/EXEC）实现的计数器存储
 */
struct redis_counter_store : public counter_store {
    explicit redis_counter_store(redis_conn &conn);

    long long increment(const std::string &key, long long ttl_seconds) override;

    long long hold(const std::string &key, long long ttl_seconds) override;

private:
    redis_conn &conn;
};

}  // namespace gradeguard::server
