#include "web/http_request.h"
#include "utils/logger.h"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <sys/wait.h>
#include <unistd.h>

namespace avatarcli {
namespace web {

static const char* STATUS_MARKER = "\n__AVATARCLI_HTTP_STATUS__:";

static std::string shellEscape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('\'');
    for (char c : s) {
        if (c == '\'') out.append("'\\''");
        else out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

static std::string readSmallFile(const std::string& path, size_t maxBytes) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return {};
    std::string out;
    out.resize(maxBytes);
    in.read(out.data(), static_cast<std::streamsize>(maxBytes));
    out.resize(static_cast<size_t>(in.gcount()));
    return out;
}

static int decodeExitCode(int rc) {
    if (rc == -1) return -1;
    if (WIFEXITED(rc)) return WEXITSTATUS(rc);
    if (WIFSIGNALED(rc)) return 128 + WTERMSIG(rc);
    return rc;
}

static std::string makeTempPath(const std::string& prefix) {
    std::string tmpl = "/tmp/" + prefix + "XXXXXX";
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    int fd = mkstemp(buf.data());
    if (fd < 0) return {};
    close(fd);
    return std::string(buf.data());
}

namespace {

class TempFile {
public:
    explicit TempFile(const std::string& prefix) : path_(makeTempPath(prefix)) {}
    ~TempFile() {
        if (!path_.empty()) std::remove(path_.c_str());
    }
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    bool valid() const { return !path_.empty(); }
    const std::string& path() const { return path_; }

    bool write(const std::string& content) const {
        std::ofstream out(path_, std::ios::binary | std::ios::trunc);
        if (!out) return false;
        out << content;
        return static_cast<bool>(out);
    }

private:
    std::string path_;
};

}

CurlTransport::CurlTransport(CurlOptions options) : options_(std::move(options)) {}

Result<HttpResponse> CurlTransport::send(const HttpRequest& request) {
    if (request.url.empty()) {
        return makeError(ErrorCode::INVALID_ARGUMENT, "empty request URL");
    }

    TempFile errFile("avatarcli_curl_err_");
    TempFile headerFile("avatarcli_curl_hdr_");
    TempFile bodyFile("avatarcli_curl_body_");
    if (!errFile.valid() || !headerFile.valid() || !bodyFile.valid()) {
        return makeError(ErrorCode::INTERNAL_ERROR, "mkstemp failed");
    }

    std::ostringstream headers;
    for (const auto& h : request.headers) {
        headers << h.first << ": " << h.second << "\n";
    }
    if (!request.body.empty()) {
        headers << "Content-Type: application/json\n";
    }
    headers << "Accept: application/json\n";
    if (!headerFile.write(headers.str())) {
        return makeError(ErrorCode::INTERNAL_ERROR, "failed to write request headers");
    }
    if (!request.body.empty() && !bodyFile.write(request.body)) {
        return makeError(ErrorCode::INTERNAL_ERROR, "failed to write request body");
    }

    std::ostringstream cmd;
    cmd << "curl -sS ";
    cmd << "-X " << shellEscape(request.method) << " ";
    cmd << "--max-time " << options_.timeoutSeconds << " ";
    cmd << "--connect-timeout " << options_.timeoutSeconds << " ";
    if (!options_.userAgent.empty()) {
        cmd << "-A " << shellEscape(options_.userAgent) << " ";
    }
    cmd << "-H @" << shellEscape(headerFile.path()) << " ";
    if (!request.body.empty()) {
        cmd << "--data-binary @" << shellEscape(bodyFile.path()) << " ";
    }
    cmd << "-w " << shellEscape(std::string(STATUS_MARKER) + "%{http_code}") << " ";
    cmd << shellEscape(request.url) << " 2>" << shellEscape(errFile.path());

    utils::Logger::log(utils::LogLevel::DEBUG, "http", request.method + " " + request.url);

    FILE* fp = popen(cmd.str().c_str(), "r");
    if (!fp) {
        return makeError(ErrorCode::NETWORK_ERROR, "popen failed");
    }

    std::string out;
    out.reserve(std::min<size_t>(options_.maxBytes, 256 * 1024));
    char buf[4096];
    bool truncated = false;
    // Past the cap the pipe is still drained to EOF so curl exits cleanly.
    while (true) {
        size_t n = fread(buf, 1, sizeof(buf), fp);
        if (n == 0) break;
        if (truncated) continue;
        size_t take = n;
        if (out.size() + take > options_.maxBytes) {
            take = options_.maxBytes - out.size();
            truncated = true;
        }
        if (take > 0) out.append(buf, take);
    }

    int exitCode = decodeExitCode(pclose(fp));
    if (truncated) {
        return makeError(ErrorCode::PARSE_ERROR, "response exceeded " + std::to_string(options_.maxBytes) + " bytes");
    }
    if (exitCode != 0) {
        std::string err = readSmallFile(errFile.path(), 16 * 1024);
        while (!err.empty() && (err.back() == '\n' || err.back() == '\r')) err.pop_back();
        if (err.empty()) err = "curl exit " + std::to_string(exitCode);
        ErrorCode code = exitCode == 28 ? ErrorCode::TIMEOUT : ErrorCode::NETWORK_ERROR;
        return makeError(code, err, request.method + " " + request.url);
    }

    size_t marker = out.rfind(STATUS_MARKER);
    if (marker == std::string::npos) {
        return makeError(ErrorCode::PARSE_ERROR, "missing HTTP status in curl output");
    }

    HttpResponse response;
    try {
        response.status = std::stoi(out.substr(marker + std::string(STATUS_MARKER).size()));
    } catch (const std::exception&) {
        return makeError(ErrorCode::PARSE_ERROR, "malformed HTTP status in curl output");
    }
    response.body = out.substr(0, marker);

    utils::Logger::log(utils::LogLevel::DEBUG, "http",
                       request.method + " " + request.url + " -> " + std::to_string(response.status));
    return response;
}

}
}
