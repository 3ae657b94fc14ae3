#pragma once

#include "server/assignment_store.hpp"
#include "server/redis.hpp"

namespace gradeguard::server {

/**
 * @brief 将作业记录以 JSON 文档的形式保存在 Redis 的 assignment:<id> 中
 */
struct redis_assignment_store : public assignment_store {
    explicit redis_assignment_store(redis_conn &conn);

    std::optional<assignment_record> load(const std::string &assignment_id) override;

    void save(const assignment_record &record) override;

    static std::string key_of(const std::string &assignment_id);

private:
    redis_conn &conn;
};

}  // namespace gradeguard::server
