#pragma once

#include <map>
#include <mutex>
#include "server/assignment_store.hpp"

namespace gradeguard::server::mock {

/**
 * @brief 保存在内存中的作业记录
 */
struct memory_assignment_store : public assignment_store {
    std::optional<assignment_record> load(const std::string &assignment_id) override;

    void save(const assignment_record &record) override;

    /**
     * @brief 直接放入一份记录，不计入 save_count
     */
    void put(const assignment_record &record);

    /**
     * @brief save 被调用的次数
     */
    std::size_t save_count = 0;

private:
    std::mutex mut;
    std::map<std::string, assignment_record> records;
};

}  // namespace gradeguard::server::mock
