#include "harness/curl_transport.hpp"

#include "log/log.hpp"

#include <curl/curl.h>

#include <cstdlib>
#include <memory>
#include <mutex>
#include <string>

namespace probeci::harness {

namespace {

/// Initializes libcurl once per process; cleaned up at exit.
void ensure_curl_global_init() {
    static std::once_flag once;
    std::call_once(once, [] {
        curl_global_init(CURL_GLOBAL_DEFAULT);
        std::atexit([] { curl_global_cleanup(); });
    });
}

struct CurlDeleter {
    void operator()(CURL* handle) const {
        curl_easy_cleanup(handle);
    }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const {
        curl_slist_free_all(list);
    }
};

using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;
using CurlHeaders = std::unique_ptr<curl_slist, SlistDeleter>;

} // namespace

CurlTransport::CurlTransport() {
    ensure_curl_global_init();
}

auto CurlTransport::post(const HttpRequest& request) -> Result<HttpResponse, HarnessError> {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        return HarnessError::transport("failed to initialize the HTTP client");
    }

    CurlHeaders headers;
    if (!request.content_type.empty()) {
        std::string content_type = "Content-Type: " + request.content_type;
        headers.reset(curl_slist_append(headers.release(), content_type.c_str()));
    }

    HttpResponse response;
    char error_buffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    // A redirected report is posted again, body included, to the new location.
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, MAX_REDIRECTS);
    curl_easy_setopt(curl.get(), CURLOPT_POSTREDIR, static_cast<long>(CURL_REDIR_POST_ALL));
    if (!request.username.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
        curl_easy_setopt(curl.get(), CURLOPT_USERNAME, request.username.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_PASSWORD, request.password.c_str());
    }
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION,
                     +[](char* ptr, size_t size, size_t nmemb, void* userdata) -> size_t {
                         auto* out = static_cast<std::string*>(userdata);
                         out->append(ptr, size * nmemb);
                         return size * nmemb;
                     });
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

    PROBECI_LOG_DEBUG("report", "POST " << request.url);
    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        std::string detail = error_buffer[0] ? error_buffer : curl_easy_strerror(res);
        return HarnessError::transport("error sending request to " + request.url + ": " + detail);
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    PROBECI_LOG_DEBUG("report", "Received " << response.status << " with " << response.body.size()
                                            << " bytes");
    return response;
}

} // namespace probeci::harness
