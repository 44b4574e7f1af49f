#pragma once

#include <chrono>
#include <string>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "obs/logging.h"
#include "obs/metrics.h"

namespace cloudpulse {
namespace obs {

// Logs http_request_start on construction and http_request_end (or a single
// http_request_error) when the scope closes.
class HttpRequestLogScope {
public:
    HttpRequestLogScope(const httplib::Request& req,
                        httplib::Response& res,
                        const std::string& component,
                        const std::string& request_id)
        : res_(&res),
          component_(component),
          route_(req.path),
          start_(std::chrono::steady_clock::now()) {
        fields_["route"] = req.path;
        fields_["method"] = req.method;
        if (!request_id.empty()) {
            fields_["request_id"] = request_id;
        }
        LogEvent(LogLevel::Info, "http_request_start", component_, fields_);
    }

    void AddFields(const nlohmann::json& extra) {
        for (auto it = extra.begin(); it != extra.end(); ++it) {
            fields_[it.key()] = it.value();
        }
    }

    void RecordError(const std::string& error_code, const std::string& message, int status_code) {
        if (error_logged_) return;
        nlohmann::json payload = fields_;
        payload["status_code"] = status_code;
        payload["duration_ms"] = ElapsedMs();
        payload["error_code"] = error_code;
        payload["error"] = message;
        LogEvent(LogLevel::Error, "http_request_error", component_, payload);
        error_logged_ = true;
    }

    ~HttpRequestLogScope() {
        double duration_ms = ElapsedMs();
        metrics::MetricsRegistry::Instance().RecordLatency("http_request_duration_ms", {{"route", route_}}, duration_ms);
        if (error_logged_) return;
        nlohmann::json payload = fields_;
        payload["status_code"] = res_->status;
        payload["duration_ms"] = duration_ms;
        LogEvent(LogLevel::Info, "http_request_end", component_, payload);
    }

    HttpRequestLogScope(const HttpRequestLogScope&) = delete;
    HttpRequestLogScope& operator=(const HttpRequestLogScope&) = delete;

private:
    auto ElapsedMs() const -> double {
        return std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start_).count();
    }

    httplib::Response* res_;
    std::string component_;
    std::string route_;
    nlohmann::json fields_ = nlohmann::json::object();
    std::chrono::steady_clock::time_point start_;
    bool error_logged_ = false;
};

} // namespace obs
} // namespace cloudpulse
