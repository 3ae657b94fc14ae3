#include "server/redis_assignment_store.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"

namespace gradeguard::server {
using namespace std;
using namespace nlohmann;

redis_assignment_store::redis_assignment_store(redis_conn &conn) : conn(conn) {}

string redis_assignment_store::key_of(const string &assignment_id) {
    return "assignment:" + assignment_id;
}

optional<assignment_record> redis_assignment_store::load(const string &assignment_id) {
    auto results = conn.execute([&](cpp_redis::client &redis, auto &replies) {
        replies.push_back(redis.get(key_of(assignment_id)));
    });

    const cpp_redis::reply &reply = results.at(0);
    if (reply.is_null()) return nullopt;
    if (!reply.is_string())
        throw store_error("Unexpected reply type for " + key_of(assignment_id));

    try {
        return json::parse(reply.as_string()).get<assignment_record>();
    } catch (json::exception &e) {
        LOG(ERROR) << "Assignment " << assignment_id << " is corrupted: " << e.what();
        throw store_error("Malformed assignment record " + assignment_id);
    } catch (invalid_argument &e) {
        LOG(ERROR) << "Assignment " << assignment_id << " is corrupted: " << e.what();
        throw store_error("Malformed assignment record " + assignment_id);
    }
}

void redis_assignment_store::save(const assignment_record &record) {
    string document = json(record).dump();
    conn.execute([&](cpp_redis::client &redis, auto &replies) {
        replies.push_back(redis.set(key_of(record.id), document));
    });
}

}  // namespace gradeguard::server
