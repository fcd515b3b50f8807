#include "HttpTransport.hpp"

#include <cpr/cpr.h>

#include <algorithm>
#include <cctype>

namespace
{

std::string to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void apply_common(cpr::Session& s, const tracker::SessionConfig& cfg)
{
    s.SetConnectTimeout(cpr::ConnectTimeout{ cfg.connect_timeout_ms });
    s.SetTimeout(cpr::Timeout{ cfg.timeout_ms });
}

cpr::Header make_header(const std::vector<tracker::Header>& headers, bool ensure_json)
{
    cpr::Header h;
    bool has_ct = false;
    for (const auto& kv : headers)
    {
        if (!has_ct && to_lower(kv.name) == "content-type")
            has_ct = true;
        h.emplace(kv.name, kv.value);
    }
    if (ensure_json && !has_ct)
        h.emplace("Content-Type", "application/json");
    return h;
}

tracker::HttpResponse to_response(cpr::Response&& r)
{
    tracker::HttpResponse hr;
    if (r.error)
    {
        hr.error = r.error.message;
        return hr;
    }
    hr.status_code = static_cast<int>(r.status_code);
    hr.text = std::move(r.text);
    for (const auto& kv : r.header)
    {
        hr.headers[to_lower(kv.first)] = kv.second;
    }
    return hr;
}

} // namespace

namespace tracker
{

std::string HttpResponse::header(const std::string& name) const
{
    auto it = headers.find(to_lower(name));
    return it == headers.end() ? std::string{} : it->second;
}

CprTransport::CprTransport(SessionConfig cfg)
    : cfg_(cfg)
{
}

HttpResponse CprTransport::get(const std::string& url, const std::vector<Header>& headers)
{
    cpr::Session s;
    s.SetUrl(cpr::Url{ url });
    s.SetHeader(make_header(headers, /*ensure_json*/ false));
    apply_common(s, cfg_);
    return to_response(s.Get());
}

HttpResponse CprTransport::postJson(const std::string& url, const std::string& body,
                                    const std::vector<Header>& headers)
{
    cpr::Session s;
    s.SetUrl(cpr::Url{ url });
    s.SetHeader(make_header(headers, /*ensure_json*/ true));
    s.SetBody(cpr::Body{ body });
    apply_common(s, cfg_);
    return to_response(s.Post());
}

HttpResponse CprTransport::putJson(const std::string& url, const std::string& body,
                                   const std::vector<Header>& headers)
{
    cpr::Session s;
    s.SetUrl(cpr::Url{ url });
    s.SetHeader(make_header(headers, /*ensure_json*/ true));
    s.SetBody(cpr::Body{ body });
    apply_common(s, cfg_);
    return to_response(s.Put());
}

} // namespace tracker
