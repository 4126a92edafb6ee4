#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace utils
{

struct Header
{
    std::string name;
    std::string value;
};

struct SessionConfig
{
    int connect_timeout_ms = 5000;
    int timeout_ms = 30000;
    std::atomic<bool>* cancel_flag = nullptr;
};

struct HttpResponse
{
    int status_code = 0;
    std::string text;
    std::string error; // non-empty on network/transport errors

    bool ok() const { return error.empty() && status_code >= 200 && status_code < 300; }
};

// Blocking HTTP client. Tests substitute a scripted implementation.
class HttpClient
{
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse postJson(const std::string& url, const std::string& body, const std::vector<Header>& headers,
                                  const SessionConfig& cfg) = 0;

    virtual HttpResponse get(const std::string& url, const std::vector<Header>& headers,
                             const SessionConfig& cfg) = 0;
};

class CprHttpClient : public HttpClient
{
public:
    HttpResponse postJson(const std::string& url, const std::string& body, const std::vector<Header>& headers,
                          const SessionConfig& cfg) override;

    HttpResponse get(const std::string& url, const std::vector<Header>& headers, const SessionConfig& cfg) override;
};

enum class HttpErrorType
{
    Success,
    Timeout,
    PayloadTooLarge,
    NetworkError,
    ServerError,
    ClientError,
    Other
};

HttpErrorType categorize_http_error(int status_code, const std::string& error_msg);

// Human-readable description of a failed response, suitable for error results.
std::string describe_http_failure(const HttpResponse& resp);

// Joins a base URL and a relative path with exactly one '/' between them.
std::string join_url(const std::string& base, const std::string& path);

// Escapes a multi-segment path such as "owner/name"; '/' is kept.
std::string url_escape_path(const std::string& s);

// Escapes a single path segment; '/' is escaped too.
std::string url_escape_segment(const std::string& s);

} // namespace utils
