//! # libcurl Transport
//!
//! `HttpTransport` implementation on top of the libcurl easy interface.
//! Connection and TLS use libcurl defaults; there is no request timeout.
//! Redirects are followed, up to `MAX_REDIRECTS` hops, and keep the POST
//! method and body. The status reported is that of the final response.

#pragma once

#include "harness/report.hpp"

namespace probeci::harness {

class CurlTransport : public HttpTransport {
public:
    static constexpr long MAX_REDIRECTS = 10;

    CurlTransport();

    auto post(const HttpRequest& request) -> Result<HttpResponse, HarnessError> override;
};

} // namespace probeci::harness
