#include "harness/report.hpp"

#include "common/utf8.hpp"
#include "log/log.hpp"

namespace probeci::harness {

auto ReportClient::make_request(const std::string& key, const TestResult& result) const
    -> HttpRequest {
    HttpRequest request;
    request.url = endpoint_;
    request.content_type = "application/json";
    request.body = to_json(result).to_string();
    request.username = key;
    request.password = "";
    return request;
}

auto ReportClient::send(const std::string& key, const TestResult& result)
    -> Result<bool, HarnessError> {
    HttpRequest request = make_request(key, result);
    PROBECI_LOG_INFO("report", "Posting " << request.body.size() << " bytes to " << endpoint_);

    auto response = transport_.post(request);
    if (is_err(response)) {
        PROBECI_LOG_ERROR("report", "Request failed: " << unwrap_err(response).message);
        return unwrap_err(response);
    }

    auto& reply = unwrap(response);
    if (reply.status != 200) {
        PROBECI_LOG_ERROR("report", "Endpoint answered " << http_status_text(reply.status));
        return HarnessError::response(reply.status, utf8_lossy(reply.body));
    }

    PROBECI_LOG_INFO("report", "Result accepted by " << endpoint_);
    return true;
}

} // namespace probeci::harness
