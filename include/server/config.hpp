#pragma once

#include <map>
#include <string>
#include "common/json_utils.hpp"
#include "judge/language.hpp"

namespace gradeguard::server {

/**
 * redis 的登录情况
 */
struct redis {
    /**
     * @brief redis 服务器地址
     */
    std::string host = "127.0.0.1";

    /**
     * @brief redis 服务器端口
     */
    int port = 6379;

    /**
     * @brief 重试时间间隔，单位毫秒
     */
    unsigned retry_interval = 1000;

    /**
     * @brief 密码，若不为空，则使用该密码登录
     */
    std::string password;
};

void from_json(const nlohmann::json &j, redis &redis_config);

/**
 * @brief 执行服务的配置
 */
struct sandbox_config {
    /**
     * @brief Piston 执行服务的根地址
     */
    std::string url = "https://emkc.org";

    /**
     * @brief 覆盖默认运行时版本的语言，比如 {"python": {"language": "python", "version": "3.12.0"}}
     */
    std::map<language, language_runtime> runtimes;
};

void from_json(const nlohmann::json &j, sandbox_config &config);

/**
 * @brief 请求频率限制
 * 计数器保存在 Redis 中，所有服务实例共享。
 */
struct rate_limit_config {
    /**
     * @brief 每个调用者每分钟最多执行代码的次数
     */
    long long execute = 20;

    /**
     * @brief 每个调用者每分钟最多提交作业的次数
     */
    long long submit = 10;

    /**
     * @brief 每个调用者每分钟最多重新计算成绩的次数
     */
    long long revise = 30;

    /**
     * @brief 两次执行代码之间的最短间隔（单位为秒），为 0 时不限制
     */
    long long send_cooldown_seconds = 0;

    /**
     * @brief 每个调用者每个 UTC 自然日最多执行代码的次数，为 0 时不限制
     */
    long long daily_quota = 200;
};

void from_json(const nlohmann::json &j, rate_limit_config &config);

/**
 * @brief 服务的全部配置，对应 --config 指定的 JSON 文件
 */
struct service_config {
    redis redis_config;

    sandbox_config sandbox;

    rate_limit_config rate_limits;

    /**
     * @brief 请求所在的 Redis 列表
     */
    std::string request_queue = "gradeguard:requests";

    /**
     * @brief 发布回复的通道名
     * 如果为空，那么回复通过 set response:<id> 保存
     */
    std::string response_channel;

    /**
     * @brief 通过 set 保存的回复的过期时间（单位为秒）
     */
    long long response_ttl = 3600;
};

void from_json(const nlohmann::json &j, service_config &config);

/**
 * @brief 从文件中读取服务配置
 * @throw internal_error 若文件不存在、不是合法的 JSON 或者字段类型不对
 */
service_config load_config(const std::string &path);

}  // namespace gradeguard::server
