#include "worker.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <atomic>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"
#include "server/redis.hpp"
#include "server/redis_assignment_store.hpp"
#include "server/redis_counter_store.hpp"

namespace gradeguard {
using namespace std;
using namespace nlohmann;
using namespace gradeguard::server;

// 停止 worker 的标记
static atomic<bool> stop(false);

// brpop 的阻塞时间（单位为秒），决定了 worker 响应停止标记的延迟
static const int POP_TIMEOUT_SECONDS = 1;

void stop_workers() {
    stop = true;
}

json process_envelope(grading_service &service, const json &envelope) {
    if (!envelope.is_object() || !envelope.count("id") || !envelope.at("id").is_string()) {
        LOG(ERROR) << "Dropping request without id: " << envelope.dump().substr(0, 200);
        return json();
    }

    string id = envelope.at("id").get<string>();
    string caller = get_value_def<string>(envelope, "", "caller");
    string type = get_value_def<string>(envelope, "", "type");
    json body = access_optional(envelope, "body");

    elapsed_time timer;
    service_response response = service.handle(type, caller, body);
    LOG(INFO) << "Request " << id << " (" << type << ") from " << caller << " answered "
              << response.status << " in " << timer.duration<chrono::milliseconds>().count() << "ms";

    return {{"id", id}, {"status", response.status}, {"body", response.body}};
}

static void send_response(redis_conn &conn, const service_config &config, const json &response) {
    string id = response.at("id").get<string>();
    string message = response.dump();
    conn.execute([&](cpp_redis::client &redis, vector<future<cpp_redis::reply>> &replies) {
        if (!config.response_channel.empty())
            replies.push_back(redis.publish(config.response_channel, message));
        else
            replies.push_back(redis.setex("response:" + id, static_cast<int>(config.response_ttl), message));
    });
}

/**
 * @brief 从请求列表中取出一个请求
 * @return 请求内容，超时未取到请求时为空
 */
static optional<string> pop_request(redis_conn &conn, const service_config &config) {
    auto replies = conn.execute([&](cpp_redis::client &redis, vector<future<cpp_redis::reply>> &futures) {
        futures.push_back(redis.brpop({config.request_queue}, POP_TIMEOUT_SECONDS));
    });

    // brpop 的回复为 [列表名, 元素]，超时时为 nil
    const cpp_redis::reply &reply = replies.at(0);
    if (!reply.is_array() || reply.as_array().size() != 2 || !reply.as_array()[1].is_string())
        return nullopt;
    return reply.as_array()[1].as_string();
}

static void worker_loop(size_t worker_id, const service_config &config, execution_service &sandbox,
                        const language_catalogue &catalogue, const code_validator &validator) {
    redis_conn conn;
    conn.init(config.redis_config);

    redis_assignment_store store(conn);
    redis_counter_store counters(conn);
    rate_limiter limiter(counters, config.rate_limits);
    grade_aggregator aggregator(store);
    execution_orchestrator orchestrator(sandbox, catalogue);
    grading_service service(validator, orchestrator, aggregator, &limiter);

    LOG(INFO) << "Worker " << worker_id << " listening on " << config.request_queue;

    while (!stop) {
        try {
            auto raw = pop_request(conn, config);
            if (!raw) continue;

            json envelope;
            try {
                envelope = json::parse(*raw);
            } catch (json::exception &e) {
                LOG(ERROR) << "Worker " << worker_id << " dropping malformed request: " << e.what();
                continue;
            }

            json response = process_envelope(service, envelope);
            if (!response.is_null())
                send_response(conn, config, response);
        } catch (std::exception &ex) {
            // Redis 不可用时等待一段时间再重试，避免忙等
            LOG(ERROR) << "Worker " << worker_id << " failed to process request: " << boost::diagnostic_information(ex);
            this_thread::sleep_for(chrono::milliseconds(config.redis_config.retry_interval));
        }
    }

    LOG(INFO) << "Worker " << worker_id << " stopped";
}

thread start_worker(size_t worker_id, const service_config &config, execution_service &sandbox,
                    const language_catalogue &catalogue, const code_validator &validator) {
    return thread([worker_id, &config, &sandbox, &catalogue, &validator] {
        worker_loop(worker_id, config, sandbox, catalogue, validator);
    });
}

}  // namespace gradeguard
