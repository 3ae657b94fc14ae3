#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace gradeguard {

struct gradeguard_exception : std::exception {
    gradeguard_exception();
    explicit gradeguard_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const gradeguard_exception &ex);

    template <typename T>
    gradeguard_exception operator<<(const T &t) const {
        return gradeguard_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示服务的内部错误
 * 对调用方返回 500
 */
struct internal_error : public gradeguard_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示网络错误，通常由 CURL 产生
 * 执行服务的网络错误只会让单个测试点失败，不会上抛到请求层
 */
struct network_error : public gradeguard_exception {
    network_error();
    explicit network_error(const std::string &message);
};

/**
 * @brief 表示存储层（作业记录、计数器）读写错误
 */
struct store_error : public gradeguard_exception {
    store_error();
    explicit store_error(const std::string &message);
};

/**
 * @brief 表示请求格式错误、超出尺寸限制、不支持的语言
 * 对调用方返回 400，不产生任何副作用
 */
struct invalid_request_error : public gradeguard_exception {
    invalid_request_error();
    explicit invalid_request_error(const std::string &message);
};

/**
 * @brief 表示调用方无权操作该作业，或者作业状态不允许该操作
 * 对调用方返回 403，不进行任何计算
 */
struct authorization_error : public gradeguard_exception {
    authorization_error();
    explicit authorization_error(const std::string &message);
};

/**
 * @brief 表示调用方超出了请求频率或每日配额
 * 对调用方返回 429，并附带 retryAfter
 */
struct rate_limit_error : public gradeguard_exception {
    rate_limit_error(const std::string &message, long long retry_after);

    /**
     * @brief 建议调用方等待多少秒后重试
     */
    long long retry_after;
};

}  // namespace gradeguard
