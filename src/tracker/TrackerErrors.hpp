#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace tracker
{

/// Failure talking to the issue tracker (transport, HTTP status or response body)
class TrackerApiError : public std::runtime_error
{
public:
    explicit TrackerApiError(const std::string& message, int status_code = 0, std::string response_body = {})
        : std::runtime_error(message)
        , status_code_(status_code)
        , response_body_(std::move(response_body))
    {
    }

    /// 0 when no HTTP response was received
    int statusCode() const noexcept { return status_code_; }
    const std::string& responseBody() const noexcept { return response_body_; }

private:
    int status_code_;
    std::string response_body_;
};

/// 401 / 403
class AuthError : public TrackerApiError
{
public:
    using TrackerApiError::TrackerApiError;
};

/// 404
class NotFoundError : public TrackerApiError
{
public:
    using TrackerApiError::TrackerApiError;
};

} // namespace tracker
