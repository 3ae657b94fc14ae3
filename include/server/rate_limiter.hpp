#pragma once

#include <chrono>
#include <functional>
#include <string>
#include "server/config.hpp"

namespace gradeguard::server {

/**
 * @brief 原子计数器的存储
 * 服务可能以多个实例同时运行，计数器不能保存在进程内存中。
 */
struct counter_store {
    virtual ~counter_store() = default;

    /**
     * @brief 原子地将 key 加一，并将 key 的过期时间设为 ttl_seconds
     * @return 加一之后的值
     */
    virtual long long increment(const std::string &key, long long ttl_seconds) = 0;

    /**
     * @brief 若 key 不存在，则原子地创建 key 并设置过期时间
     * @return 创建成功时为 0，否则为 key 剩余的过期时间（单位为秒，至少为 1）
     */
    virtual long long hold(const std::string &key, long long ttl_seconds) = 0;
};

/**
 * @brief 基于固定时间窗口的请求频率限制
 *
 * 窗口的编号是计数器键名的一部分，比如 ratelimit:execute:<caller>:<分钟编号>，
 * 因此窗口在整分钟（或 UTC 零点）重置，不会因为持续请求而顺延。
 */
struct rate_limiter {
    using clock_type = std::function<std::chrono::system_clock::time_point()>;

    rate_limiter(counter_store &store, const rate_limit_config &config, clock_type now = std::chrono::system_clock::now);

    /**
     * @brief 对 scope 类型的请求执行配置中的所有限制
     * @param scope 可选值：execute、submit、revise
     * @param caller 经过认证的调用者
     * @throw rate_limit_error 若超出任一限制
     */
    void acquire(const std::string &scope, const std::string &caller);

    /**
     * @brief 每分钟最多 limit 次请求，limit 为 0 时不限制
     */
    void check_window(const std::string &scope, const std::string &caller, long long limit);

    /**
     * @brief 两次请求之间至少间隔 seconds 秒，seconds 为 0 时不限制
     */
    void check_cooldown(const std::string &scope, const std::string &caller, long long seconds);

    /**
     * @brief 每个 UTC 自然日最多 quota 次请求，quota 为 0 时不限制
     */
    void check_daily_quota(const std::string &scope, const std::string &caller, long long quota);

private:
    counter_store &store;
    rate_limit_config config;
    clock_type now;

    long long epoch_seconds() const;
};

}  // namespace gradeguard::server
