#pragma once

#include <stencil/result.hpp>
#include <stencil/source.hpp>
#include <optional>
#include <string>
#include <unordered_map>

namespace stencil {

using HttpHeaders = std::unordered_map<std::string, std::string>;

struct HttpResponse {
    int status_code = 0;
    std::string body;

    bool ok() const { return status_code >= 200 && status_code < 300; }
};

// Blocking HTTP GET. Transport failures (DNS, TLS, connect, timeout) are
// SourceUnavailable errors; HTTP error statuses come back as responses.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual Result<HttpResponse> get(const std::string& url,
                                     const HttpHeaders& headers = {},
                                     const std::optional<HttpAuth>& auth = std::nullopt) = 0;
};

// libcurl implementation. Each request uses its own easy handle, so one
// client may serve concurrent callers.
class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(int timeout_seconds = 300);

    Result<HttpResponse> get(const std::string& url,
                             const HttpHeaders& headers = {},
                             const std::optional<HttpAuth>& auth = std::nullopt) override;

private:
    int timeout_seconds_;
};

} // namespace stencil
