#pragma once

#include <nlohmann/json.hpp>
#include <thread>
#include "judge/code_validator.hpp"
#include "judge/language.hpp"
#include "server/config.hpp"
#include "server/grading_service.hpp"
#include "server/sandbox/execution_service.hpp"

/**
 * 请求处理相关函数
 *
 * 网关完成认证后，将请求以
 * @code
 *     {"id": "<请求编号>", "caller": "<调用者>", "type": "execute|submit|revise", "body": {...}}
 * @endcode
 * 的形式推入 Redis 列表 requestQueue。每个 worker 线程持有自己的 Redis 连接，
 * 不断从列表中取出请求，交给 grading_service 处理，然后将
 * @code
 *     {"id": "<请求编号>", "status": 200, "body": {...}}
 * @endcode
 * 发布到 responseChannel；若未配置通道，则保存在 response:<id> 中，并在 responseTtl 秒后过期。
 */
namespace gradeguard {

/**
 * @brief 停止所有的 worker
 * worker 在处理完当前请求后退出，已经取出的请求仍会得到回复。
 */
void stop_workers();

/**
 * @brief 处理一个请求信封
 * @param service 处理请求的服务
 * @param envelope 请求信封
 * @return 回复信封 {id, status, body}；若信封中没有请求编号则无法回复，返回 null
 */
nlohmann::json process_envelope(server::grading_service &service, const nlohmann::json &envelope);

/**
 * @brief 启动 worker 线程
 * @param worker_id worker 编号，仅用于日志
 * @param config 服务配置，worker 根据其中的 Redis 配置建立自己的连接
 * @param sandbox 执行服务，需要能够被多个线程同时使用
 * @param catalogue 语言目录
 * @param validator 代码检查器
 * @return 产生的线程
 */
std::thread start_worker(std::size_t worker_id, const server::service_config &config, server::execution_service &sandbox,
                         const language_catalogue &catalogue, const code_validator &validator);

}  // namespace gradeguard
