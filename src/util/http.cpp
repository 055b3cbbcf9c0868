#include <stencil/http.hpp>
#include <stencil/git.hpp>
#include <stencil/log.hpp>
#include <curl/curl.h>

#include <memory>
#include <mutex>

namespace stencil {

static size_t write_callback(char* data, size_t size, size_t nmemb, void* userp) {
    auto* body = static_cast<std::string*>(userp);
    body->append(data, size * nmemb);
    return size * nmemb;
}

static void ensure_curl_initialized() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_ALL); });
}

CurlHttpClient::CurlHttpClient(int timeout_seconds)
    : timeout_seconds_(timeout_seconds) {
    ensure_curl_initialized();
}

Result<HttpResponse> CurlHttpClient::get(const std::string& url,
                                         const HttpHeaders& headers,
                                         const std::optional<HttpAuth>& auth) {
    std::unique_ptr<CURL, void (*)(CURL*)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        return StencilError{StencilError::IO, "curl_easy_init failed"};
    }
    CURL* h = curl.get();

    HttpResponse response;

    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(timeout_seconds_));
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, 30L);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_USERAGENT, "stencil/0.1");
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &response.body);

    std::unique_ptr<curl_slist, void (*)(curl_slist*)> header_list(nullptr, curl_slist_free_all);
    auto append_header = [&](const std::string& line) {
        curl_slist* next = curl_slist_append(header_list.get(), line.c_str());
        if (next) {
            header_list.release();
            header_list.reset(next);
        }
    };
    for (const auto& [key, value] : headers) {
        append_header(key + ": " + value);
    }

    if (auth) {
        if (auth->bearer_token) {
            append_header("Authorization: Bearer " + *auth->bearer_token);
        } else if (auth->basic_auth) {
            curl_easy_setopt(h, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
            curl_easy_setopt(h, CURLOPT_USERNAME, auth->basic_auth->first.c_str());
            curl_easy_setopt(h, CURLOPT_PASSWORD, auth->basic_auth->second.c_str());
        }
    }
    if (header_list) {
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, header_list.get());
    }

    stencil::log::debug("GET %s", redact_url(url).c_str());
    CURLcode rc = curl_easy_perform(h);
    if (rc != CURLE_OK) {
        return StencilError{StencilError::SourceUnavailable,
            "GET " + redact_url(url) + " failed: " + curl_easy_strerror(rc)};
    }

    long code = 0;
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &code);
    response.status_code = static_cast<int>(code);
    return Result<HttpResponse>::ok(std::move(response));
}

} // namespace stencil
