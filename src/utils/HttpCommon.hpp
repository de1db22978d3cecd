#pragma once

#include "CancellationToken.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
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
    int timeout_ms = 30000; // 0 disables the overall limit (long downloads)
    int low_speed_time_s = 0; // Abort when a read stalls this long; 0 disables
    const CancellationToken* cancel = nullptr;
};

struct HttpResponse
{
    int status_code = 0;
    std::string text;
    std::string error; // non-empty on network/transport errors
    std::vector<Header> headers;
    bool cancelled = false;

    bool ok() const { return error.empty() && !cancelled && status_code >= 200 && status_code < 300; }

    // Case-insensitive header lookup, empty when absent
    std::string header(const std::string& name) const;
};

// Callbacks driven while a response body streams in
struct StreamHandlers
{
    // Final response status and declared Content-Length (0 if none), before the first chunk
    std::function<void(int status_code, std::uint64_t content_length)> on_start;
    // Returns false to abort the transfer
    std::function<bool(std::string_view chunk)> on_chunk;
};

// Transport seam between the pipeline and the HTTP library
class IHttpClient
{
public:
    virtual ~IHttpClient() = default;

    virtual HttpResponse get(const std::string& url, const std::vector<Header>& headers,
                             const SessionConfig& cfg) = 0;

    // Streams the body through handlers instead of buffering it; the returned
    // response carries status, headers and transport errors but no text
    virtual HttpResponse stream(const std::string& url, const std::vector<Header>& headers, const SessionConfig& cfg,
                                const StreamHandlers& handlers) = 0;
};

// libcurl-backed client (cpr)
class CprHttpClient : public IHttpClient
{
public:
    HttpResponse get(const std::string& url, const std::vector<Header>& headers, const SessionConfig& cfg) override;

    HttpResponse stream(const std::string& url, const std::vector<Header>& headers, const SessionConfig& cfg,
                        const StreamHandlers& handlers) override;
};

bool iequals(std::string_view a, std::string_view b);

} // namespace utils
