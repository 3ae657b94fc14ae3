#include "server/config.hpp"
#include <filesystem>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace gradeguard::server {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, redis &redis_config) {
    j.at("host").get_to(redis_config.host);
    j.at("port").get_to(redis_config.port);
    if (j.count("retryInterval"))
        j.at("retryInterval").get_to(redis_config.retry_interval);
    if (j.count("password"))
        j.at("password").get_to(redis_config.password);
    else
        redis_config.password = "";
}

void from_json(const json &j, sandbox_config &config) {
    if (j.count("url"))
        j.at("url").get_to(config.url);
    if (j.count("languages")) {
        for (auto &item : j.at("languages").items()) {
            language_runtime runtime;
            item.value().at("language").get_to(runtime.name);
            item.value().at("version").get_to(runtime.version);
            config.runtimes[parse_language(item.key())] = runtime;
        }
    }
}

void from_json(const json &j, rate_limit_config &config) {
    config.execute = get_value_def<long long>(j, config.execute, "execute");
    config.submit = get_value_def<long long>(j, config.submit, "submit");
    config.revise = get_value_def<long long>(j, config.revise, "revise");
    config.send_cooldown_seconds = get_value_def<long long>(j, config.send_cooldown_seconds, "sendCooldownSeconds");
    config.daily_quota = get_value_def<long long>(j, config.daily_quota, "dailyQuota");
}

void from_json(const json &j, service_config &config) {
    if (j.count("redis"))
        j.at("redis").get_to(config.redis_config);
    if (j.count("sandbox"))
        j.at("sandbox").get_to(config.sandbox);
    if (j.count("rateLimits"))
        j.at("rateLimits").get_to(config.rate_limits);
    if (j.count("requestQueue"))
        j.at("requestQueue").get_to(config.request_queue);
    if (j.count("responseChannel"))
        j.at("responseChannel").get_to(config.response_channel);
    if (j.count("responseTtl"))
        j.at("responseTtl").get_to(config.response_ttl);
}

service_config load_config(const string &path) {
    if (!filesystem::exists(path))
        throw internal_error("Configuration file " + path + " does not exist");
    try {
        return json::parse(read_file_content(path)).get<service_config>();
    } catch (json::exception &e) {
        throw internal_error("Malformed configuration file " + path + ": " + e.what());
    } catch (invalid_request_error &e) {
        throw internal_error("Malformed configuration file " + path + ": " + e.what());
    }
}

}  // namespace gradeguard::server
