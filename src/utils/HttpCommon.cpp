#include "HttpCommon.hpp"

#include <cpr/cpr.h>
#include <plog/Log.h>

#include <cctype>

namespace
{

inline void apply_common(cpr::Session& s, const utils::SessionConfig& cfg)
{
    s.SetConnectTimeout(cpr::ConnectTimeout{ cfg.connect_timeout_ms });
    s.SetTimeout(cpr::Timeout{ cfg.timeout_ms });
    if (cfg.low_speed_time_s > 0)
    {
        // Less than 1 byte/s for low_speed_time_s seconds counts as a stalled read
        s.SetLowSpeed(cpr::LowSpeed{ 1, cfg.low_speed_time_s });
    }
    if (cfg.cancel)
    {
        s.SetProgressCallback(cpr::ProgressCallback(
            [](cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, intptr_t userdata) -> bool
            {
                auto token = reinterpret_cast<const utils::CancellationToken*>(userdata);
                return !(token && token->isCancelled());
            },
            reinterpret_cast<intptr_t>(cfg.cancel)));
    }
}

inline cpr::Header make_header(const std::vector<utils::Header>& headers)
{
    cpr::Header h;
    for (auto& kv : headers)
        h.emplace(kv.name, kv.value);
    return h;
}

inline std::vector<utils::Header> copy_headers(const cpr::Header& header)
{
    std::vector<utils::Header> out;
    out.reserve(header.size());
    for (const auto& kv : header)
        out.push_back({ kv.first, kv.second });
    return out;
}

inline std::string trim(std::string_view s)
{
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string(s.substr(b, e - b));
}

} // namespace

namespace utils
{

bool iequals(std::string_view a, std::string_view b)
{
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i)
    {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

std::string HttpResponse::header(const std::string& name) const
{
    for (const auto& h : headers)
    {
        if (iequals(h.name, name))
            return h.value;
    }
    return {};
}

HttpResponse CprHttpClient::get(const std::string& url, const std::vector<Header>& headers, const SessionConfig& cfg)
{
    HttpResponse hr;
    if (isCancelled(cfg.cancel))
    {
        hr.cancelled = true;
        return hr;
    }

    cpr::Session s;
    s.SetUrl(cpr::Url{ url });
    s.SetHeader(make_header(headers));
    apply_common(s, cfg);
    auto r = s.Get();

    if (isCancelled(cfg.cancel))
    {
        hr.cancelled = true;
        return hr;
    }
    if (r.error)
    {
        hr.error = r.error.message;
        return hr;
    }
    hr.status_code = static_cast<int>(r.status_code);
    hr.text = std::move(r.text);
    hr.headers = copy_headers(r.header);
    return hr;
}

HttpResponse CprHttpClient::stream(const std::string& url, const std::vector<Header>& headers,
                                   const SessionConfig& cfg, const StreamHandlers& handlers)
{
    HttpResponse hr;
    if (isCancelled(cfg.cancel))
    {
        hr.cancelled = true;
        return hr;
    }

    // Redirects produce one header block per hop; only the last one describes the body
    int status = 0;
    std::uint64_t contentLength = 0;
    bool started = false;
    bool aborted = false;

    cpr::Session s;
    s.SetUrl(cpr::Url{ url });
    s.SetHeader(make_header(headers));
    apply_common(s, cfg);
    s.SetHeaderCallback(cpr::HeaderCallback{ [&](std::string_view line, intptr_t) -> bool
                                             {
                                                 if (line.rfind("HTTP/", 0) == 0)
                                                 {
                                                     status = 0;
                                                     contentLength = 0;
                                                     auto sp = line.find(' ');
                                                     if (sp != std::string_view::npos)
                                                     {
                                                         try
                                                         {
                                                             status = std::stoi(std::string(line.substr(sp + 1, 3)));
                                                         }
                                                         catch (const std::exception&)
                                                         {
                                                             status = 0;
                                                         }
                                                     }
                                                     return true;
                                                 }
                                                 auto colon = line.find(':');
                                                 if (colon != std::string_view::npos &&
                                                     iequals(trim(line.substr(0, colon)), "Content-Length"))
                                                 {
                                                     try
                                                     {
                                                         contentLength = std::stoull(trim(line.substr(colon + 1)));
                                                     }
                                                     catch (const std::exception&)
                                                     {
                                                         contentLength = 0;
                                                     }
                                                 }
                                                 return true;
                                             } });

    auto r = s.Download(cpr::WriteCallback{ [&](std::string_view data, intptr_t) -> bool
                                            {
                                                if (!started)
                                                {
                                                    started = true;
                                                    if (handlers.on_start)
                                                        handlers.on_start(status, contentLength);
                                                }
                                                if (handlers.on_chunk && !handlers.on_chunk(data))
                                                {
                                                    aborted = true;
                                                    return false;
                                                }
                                                return true;
                                            } });

    if (!started && handlers.on_start && !r.error)
    {
        handlers.on_start(static_cast<int>(r.status_code), contentLength);
    }

    hr.status_code = static_cast<int>(r.status_code);
    hr.headers = copy_headers(r.header);
    if (aborted || isCancelled(cfg.cancel))
    {
        hr.cancelled = true;
        return hr;
    }
    if (r.error)
    {
        PLOG_DEBUG << "Transfer error for " << url << ": " << r.error.message;
        hr.error = r.error.message;
    }
    return hr;
}

} // namespace utils
