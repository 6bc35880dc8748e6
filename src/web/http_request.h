#pragma once

#include "infrastructure/error_handling.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace avatarcli {
namespace web {

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
};

struct HttpResponse {
    int status = 0;
    std::string body;

    bool success() const { return status >= 200 && status < 300; }
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual Result<HttpResponse> send(const HttpRequest& request) = 0;
};

struct CurlOptions {
    uint32_t timeoutSeconds = 30;
    size_t maxBytes = 8 * 1024 * 1024;
    std::string userAgent = "avatarcli/0.1";
};

// Runs the curl binary; headers and body travel through temp files so the
// credential never shows up in the process list.
class CurlTransport : public HttpTransport {
public:
    explicit CurlTransport(CurlOptions options = CurlOptions());
    Result<HttpResponse> send(const HttpRequest& request) override;

private:
    CurlOptions options_;
};

}
}
