#include "server/sandbox/piston.hpp"
#include <curl/curl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/predicate.hpp>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"
#include "config.hpp"

namespace gradeguard::server::sandbox {
using namespace std;
using namespace nlohmann;

piston_client::piston_client(const string &url, int transport_slack_ms)
    : endpoint(boost::algorithm::ends_with(url, "/") ? url + "api/v2/execute" : url + "/api/v2/execute"),
      transport_slack_ms(transport_slack_ms) {}

json piston_client::build_request_body(const sandbox_request &request) {
    return {
        {"language", request.runtime.name},
        {"version", request.runtime.version},
        {"files", json::array({{{"content", request.program}}})},
        {"stdin", ""},
        {"args", json::array()},
        {"compile_timeout", request.compile_timeout_ms},
        {"run_timeout", request.run_timeout_ms},
        {"compile_memory_limit", -1},
        {"run_memory_limit", -1}};
}

static stage_result parse_stage(const json &stage) {
    if (!stage.is_object())
        throw network_error("Malformed sandbox response: stage is not an object");

    stage_result result;
    try {
        result.stdout_text = get_value_def<string>(stage, "", "stdout");
        result.stderr_text = get_value_def<string>(stage, "", "stderr");
        result.output = get_value_def<string>(stage, "", "output");
        if (exists(stage, "code")) result.code = stage.at("code").get<int>();
        if (exists(stage, "signal")) result.signal = stage.at("signal").get<string>();
    } catch (json::exception &e) {
        throw network_error(string("Malformed sandbox response: ") + e.what());
    }
    return result;
}

sandbox_result piston_client::parse_response(const json &response) {
    if (!response.is_object())
        throw network_error("Malformed sandbox response: not an object");

    sandbox_result result;
    if (exists(response, "compile"))
        result.compile = parse_stage(response.at("compile"));
    if (exists(response, "run"))
        result.run = parse_stage(response.at("run"));

    if (!result.compile && !result.run) {
        // Piston 拒绝请求时返回 {"message": "..."}
        if (exists(response, "message") && response.at("message").is_string())
            throw network_error("Sandbox rejected the request: " + response.at("message").get<string>());
        throw network_error("Malformed sandbox response: neither compile nor run stage present");
    }
    return result;
}

static size_t write_to_string(char *data, size_t size, size_t nmemb, void *userp) {
    static_cast<string *>(userp)->append(data, size * nmemb);
    return size * nmemb;
}

sandbox_result piston_client::execute(const sandbox_request &request) {
    string body = build_request_body(request).dump();
    string response_text;
    long timeout_ms = request.compile_timeout_ms + request.run_timeout_ms + transport_slack_ms;

    LOG_IF(INFO, DEBUG) << "Sending program to " << endpoint << ":\n" << request.program;

    CURL *curl = curl_easy_init();
    if (!curl) throw network_error("Unable to initialize CURL");
    defer { curl_easy_cleanup(curl); };

    struct curl_slist *headers = curl_slist_append(nullptr, "Content-Type: application/json");
    defer { curl_slist_free_all(headers); };

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_to_string);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_text);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK)
        throw network_error(fmt::format("Unable to reach sandbox {}: {}", endpoint, curl_easy_strerror(res)));

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    LOG_IF(INFO, DEBUG) << "Sandbox replied " << http_code << ": " << response_text;

    if (http_code < 200 || http_code >= 300)
        throw network_error(fmt::format("Sandbox returned HTTP {}: {}", http_code, response_text.substr(0, 200)));

    json response;
    try {
        response = json::parse(response_text);
    } catch (json::exception &e) {
        throw network_error(string("Malformed sandbox response: ") + e.what());
    }
    return parse_response(response);
}

}  // namespace gradeguard::server::sandbox
