#pragma once

#include <map>
#include <string>
#include <vector>

namespace tracker
{

struct Header
{
    std::string name;
    std::string value;
};

struct SessionConfig
{
    int connect_timeout_ms = 5000;
    int timeout_ms = 15000;
};

struct HttpResponse
{
    int status_code = 0;
    std::string text;
    std::map<std::string, std::string> headers; // keys lower-cased
    std::string error; // non-empty on network/transport errors

    bool ok() const { return error.empty() && status_code >= 200 && status_code < 300; }

    /// Case-insensitive header lookup, empty when absent
    std::string header(const std::string& name) const;
};

class IHttpTransport
{
public:
    virtual ~IHttpTransport() = default;

    virtual HttpResponse get(const std::string& url, const std::vector<Header>& headers) = 0;
    virtual HttpResponse postJson(const std::string& url, const std::string& body,
                                  const std::vector<Header>& headers) = 0;
    virtual HttpResponse putJson(const std::string& url, const std::string& body,
                                 const std::vector<Header>& headers) = 0;
};

/// IHttpTransport backed by cpr
class CprTransport final : public IHttpTransport
{
public:
    explicit CprTransport(SessionConfig cfg = {});

    HttpResponse get(const std::string& url, const std::vector<Header>& headers) override;
    HttpResponse postJson(const std::string& url, const std::string& body,
                          const std::vector<Header>& headers) override;
    HttpResponse putJson(const std::string& url, const std::string& body,
                         const std::vector<Header>& headers) override;

private:
    SessionConfig cfg_;
};

} // namespace tracker
