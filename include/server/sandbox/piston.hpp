#pragma once

#include <nlohmann/json.hpp>
#include "server/sandbox/execution_service.hpp"

namespace gradeguard::server::sandbox {

/**
 * @brief Piston 执行服务的客户端
 * 通过 POST <url>/api/v2/execute 提交程序，每个请求使用独立的 CURL 句柄，
 * 因此可以被多个线程同时使用。进程启动时需要先调用 curl_global_init。
 */
struct piston_client : public execution_service {
    /**
     * @param url 执行服务的根地址，比如 https://emkc.org
     * @param transport_slack_ms 在编译和运行时限之外额外等待回复的时间
     */
    piston_client(const std::string &url, int transport_slack_ms);

    sandbox_result execute(const sandbox_request &request) override;

    /**
     * @brief 构造 Piston 的请求体
     * 内存限制保持执行服务的默认值 -1
     */
    static nlohmann::json build_request_body(const sandbox_request &request);

    /**
     * @brief 解析 Piston 的回复
     * @throw network_error 若回复中缺少必要字段或者字段类型不对
     */
    static sandbox_result parse_response(const nlohmann::json &response);

private:
    std::string endpoint;
    int transport_slack_ms;
};

}  // namespace gradeguard::server::sandbox
