#include "HttpCommon.hpp"

#include <cpr/cpr.h>
#include <cctype>

namespace
{

inline void apply_common(cpr::Session& s, const utils::SessionConfig& cfg)
{
    s.SetConnectTimeout(cpr::ConnectTimeout{ cfg.connect_timeout_ms });
    s.SetTimeout(cpr::Timeout{ cfg.timeout_ms });
    if (cfg.cancel_flag)
    {
        // Returning false from the progress callback aborts the transfer.
        s.SetProgressCallback(cpr::ProgressCallback(
            [](cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, intptr_t userdata) -> bool
            {
                auto flag = reinterpret_cast<std::atomic<bool>*>(userdata);
                return !(flag && flag->load());
            },
            reinterpret_cast<intptr_t>(cfg.cancel_flag)));
    }
}

inline bool iequals(const std::string& a, const char* b)
{
    std::size_t i = 0;
    for (; i < a.size() && b[i] != '\0'; ++i)
    {
        char x = static_cast<char>(std::tolower(static_cast<unsigned char>(a[i])));
        char y = static_cast<char>(std::tolower(static_cast<unsigned char>(b[i])));
        if (x != y)
            return false;
    }
    return i == a.size() && b[i] == '\0';
}

inline cpr::Header make_header(const std::vector<utils::Header>& headers, bool ensure_json)
{
    cpr::Header h;
    bool has_ct = false;
    for (auto& kv : headers)
    {
        if (!has_ct && iequals(kv.name, "Content-Type"))
            has_ct = true;
        h.emplace(kv.name, kv.value);
    }
    if (ensure_json && !has_ct)
        h.emplace("Content-Type", "application/json");
    return h;
}

inline utils::HttpResponse to_response(cpr::Response&& r)
{
    utils::HttpResponse hr;
    if (r.error)
    {
        hr.error = r.error.message;
        return hr;
    }
    hr.status_code = static_cast<int>(r.status_code);
    hr.text = std::move(r.text);
    return hr;
}

} // namespace

namespace utils
{

HttpResponse CprHttpClient::postJson(const std::string& url, const std::string& body,
                                     const std::vector<Header>& headers, const SessionConfig& cfg)
{
    cpr::Session s;
    s.SetUrl(cpr::Url{ url });
    s.SetHeader(make_header(headers, /*ensure_json*/ true));
    s.SetBody(cpr::Body{ body });
    apply_common(s, cfg);
    return to_response(s.Post());
}

HttpResponse CprHttpClient::get(const std::string& url, const std::vector<Header>& headers, const SessionConfig& cfg)
{
    cpr::Session s;
    s.SetUrl(cpr::Url{ url });
    s.SetHeader(make_header(headers, /*ensure_json*/ false));
    apply_common(s, cfg);
    return to_response(s.Get());
}

HttpErrorType categorize_http_error(int status_code, const std::string& error_msg)
{
    if (!error_msg.empty())
    {
        if (error_msg.find("timeout") != std::string::npos || error_msg.find("Timeout") != std::string::npos ||
            error_msg.find("timed out") != std::string::npos)
        {
            return HttpErrorType::Timeout;
        }
        return HttpErrorType::NetworkError;
    }

    if (status_code >= 200 && status_code < 300)
        return HttpErrorType::Success;

    switch (status_code)
    {
    case 408:
    case 504:
        return HttpErrorType::Timeout;
    case 413:
        return HttpErrorType::PayloadTooLarge;
    case 400:
    case 401:
    case 403:
    case 404:
    case 422:
    case 429:
        return HttpErrorType::ClientError;
    default:
        if (status_code >= 500)
            return HttpErrorType::ServerError;
        return HttpErrorType::Other;
    }
}

std::string describe_http_failure(const HttpResponse& resp)
{
    const std::string snippet = !resp.error.empty() ? resp.error : resp.text;
    switch (categorize_http_error(resp.status_code, resp.error))
    {
    case HttpErrorType::Success:
        return {};
    case HttpErrorType::Timeout:
        if (!resp.error.empty())
            return "Request timeout: " + resp.error;
        return "Request timeout (HTTP " + std::to_string(resp.status_code) + ")";
    case HttpErrorType::PayloadTooLarge:
        return "HTTP 413 Payload Too Large: " + snippet;
    case HttpErrorType::NetworkError:
        return "Network error: " + snippet;
    case HttpErrorType::ServerError:
        return "Server error (HTTP " + std::to_string(resp.status_code) + "): " + snippet;
    case HttpErrorType::ClientError:
        return "Client error (HTTP " + std::to_string(resp.status_code) + "): " + snippet;
    default:
        return "HTTP " + std::to_string(resp.status_code) + ": " + snippet;
    }
}

std::string join_url(const std::string& base, const std::string& path)
{
    std::string url = base;
    while (!url.empty() && url.back() == '/')
        url.pop_back();

    std::size_t start = 0;
    while (start < path.size() && path[start] == '/')
        ++start;

    url.push_back('/');
    url.append(path, start, std::string::npos);
    return url;
}

namespace
{

std::string percent_escape(const std::string& s, bool keep_slash)
{
    std::string out;
    out.reserve(s.size() * 3);
    const char* hex = "0123456789ABCDEF";
    for (unsigned char c : s)
    {
        if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '_' ||
            c == '.' || c == '~' || (keep_slash && c == '/'))
        {
            out.push_back(static_cast<char>(c));
        }
        else
        {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

} // namespace

std::string url_escape_path(const std::string& s)
{
    return percent_escape(s, true);
}

std::string url_escape_segment(const std::string& s)
{
    // "." and ".." would still be resolved as path steps
    if (s == "." || s == "..")
        return s == "." ? "%2E" : "%2E%2E";
    return percent_escape(s, false);
}

} // namespace utils
