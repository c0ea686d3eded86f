//! # Result Reporting
//!
//! Delivers the `TestResult` to the remote endpoint as one authenticated
//! JSON POST.
//!
//! ## Request
//!
//! | Part           | Value                                       |
//! |----------------|---------------------------------------------|
//! | Method         | `POST`                                      |
//! | Content-Type   | `application/json`                          |
//! | Authorization  | `Basic base64(<key>:)` (empty password)     |
//! | Body           | `to_json(result)`                           |
//!
//! ## Outcome
//!
//! - `200` is the only accepted status
//! - any other status is a `Response` error carrying status and body
//! - a request that gets no response at all is a `Transport` error
//!
//! There is no retry; a failed report fails the run.

#pragma once

#include "common.hpp"
#include "harness/error.hpp"
#include "harness/result.hpp"

#include <string>
#include <utility>
#include <vector>

namespace probeci::harness {

inline constexpr const char* SEND_RESULT_CONTEXT = "error sending result";

struct HttpRequest {
    std::string url;
    std::string content_type;
    std::string body;
    std::string username; ///< Basic auth user; empty disables auth
    std::string password;
};

struct HttpResponse {
    long status = 0;
    std::string body;
};

/// Performs a blocking HTTP POST.
///
/// Returns the response for any status code; only a request that produced
/// no response is an error.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual auto post(const HttpRequest& request) -> Result<HttpResponse, HarnessError> = 0;
};

class ReportClient {
public:
    ReportClient(HttpTransport& transport, std::string endpoint)
        : transport_(transport), endpoint_(std::move(endpoint)) {}

    /// Builds the request that `send()` would post.
    [[nodiscard]] auto make_request(const std::string& key, const TestResult& result) const
        -> HttpRequest;

    /// Posts `result` authenticated with `key`. Returns `true` on HTTP 200.
    [[nodiscard]] auto send(const std::string& key, const TestResult& result)
        -> Result<bool, HarnessError>;

    [[nodiscard]] auto endpoint() const -> const std::string& {
        return endpoint_;
    }

private:
    HttpTransport& transport_;
    std::string endpoint_;
};

} // namespace probeci::harness
