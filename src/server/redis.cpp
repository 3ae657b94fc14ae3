#include "server/redis.hpp"
#include <glog/logging.h>
#include <boost/throw_exception.hpp>
#include <chrono>
#include <thread>
#include "common/exceptions.hpp"

namespace gradeguard::server {
using namespace std;

static bool connect_to_server(cpp_redis::client &redis_client, const redis &redis_config) {
    LOG(INFO) << "Redis: Setup connection with server " << redis_config.host << ":" << redis_config.port;
    redis_client.connect(redis_config.host, redis_config.port,
                         [](const string &host, size_t port, cpp_redis::connect_state status) {
                             if (status == cpp_redis::connect_state::dropped)
                                 LOG(INFO) << "Redis: client disconnected from " << host << ":" << port;
                         });
    if (!redis_config.password.empty()) {
        auto future = redis_client.auth(redis_config.password);
        redis_client.sync_commit();
        cpp_redis::reply reply = future.get();
        if (reply.is_error())
            LOG(ERROR) << "Redis: Auth failed: " << reply.error();
    }
    if (redis_client.is_connected()) {
        LOG(INFO) << "Redis: Connecting to redis server succeeded " << redis_config.host << ":" << redis_config.port;
        return true;
    } else {
        LOG(ERROR) << "Redis: Unable to connect to redis server " << redis_config.host << ":" << redis_config.port;
        return false;
    }
}

void redis_conn::reconnect(bool force) {
    int fail = 0;
    if (force) {
        if (redis_client.is_connected()) redis_client.disconnect(true);
        try {
            connect_to_server(redis_client, redis_config);
        } catch (cpp_redis::redis_error &e) {
            LOG(ERROR) << "Redis: " << e.what();
        }
    }
    for (; !redis_client.is_connected() && fail < 5; ++fail) {
        LOG(INFO) << "Redis: Lost connection, trying to reconnect";
        if (fail > 0)
            this_thread::sleep_for(chrono::milliseconds(redis_config.retry_interval));
        try {
            connect_to_server(redis_client, redis_config);
        } catch (cpp_redis::redis_error &e) {
            LOG(ERROR) << "Redis: " << e.what();
        }
    }
    if (fail >= 5) {
        BOOST_THROW_EXCEPTION(store_error("unable to connect to redis server"));
    }
}

void redis_conn::init(const redis &redis_config) noexcept {
    this->redis_config = redis_config;
}

vector<cpp_redis::reply> redis_conn::execute(function<void(cpp_redis::client &, vector<future<cpp_redis::reply>> &)> callback) {
    // cpp_redis 的 is_connected 在服务器断开后仍可能返回真，操作的回复会是 network error，
    // 因此操作失败时也做一次强制重连。
    reconnect(false);
    string message;
    for (int fail = 0; fail < 5; ++fail) {
        bool reconn = false;
        vector<future<cpp_redis::reply>> replies;
        vector<cpp_redis::reply> results;
        callback(redis_client, replies);
        redis_client.sync_commit();
        for (auto &reply : replies) {
            cpp_redis::reply r = reply.get();
            if (r.is_error()) reconn = true, message = r.error();
            results.push_back(r);
        }
        if (!reconn) return results;
        reconnect(true);
    }
    BOOST_THROW_EXCEPTION(store_error("Redis: unable to finish execution: " + message));
}

}  // namespace gradeguard::server
