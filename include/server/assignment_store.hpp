#pragma once

#include <optional>
#include <string>
#include "judge/assignment.hpp"

namespace gradeguard::server {

/**
 * @brief 作业记录的存储
 * 每次评分只对一份记录做一次读取和一次写入，不需要跨记录的事务。
 */
struct assignment_store {
    virtual ~assignment_store() = default;

    /**
     * @brief 读取一份作业记录
     * @return 作业记录，不存在时为空
     * @throw store_error 若存储不可用或者记录无法解析
     */
    virtual std::optional<assignment_record> load(const std::string &assignment_id) = 0;

    /**
     * @brief 写入一份作业记录，覆盖已有的记录
     * @throw store_error 若存储不可用
     */
    virtual void save(const assignment_record &record) = 0;
};

}  // namespace gradeguard::server
