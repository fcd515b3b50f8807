#pragma once

#include "HttpTransport.hpp"
#include "ITrackerClient.hpp"

#include <memory>
#include <string>

namespace tracker
{

class GitLabApi;

/**
 * ITrackerClient speaking the GitLab REST API (v4).
 *
 * Construction performs no network traffic. Requests authenticate with a
 * private token. Issue listing is paged (100 per page) and follows the
 * X-Next-Page header lazily as the cursor is consumed.
 */
class GitLabClient final : public ITrackerClient
{
public:
    GitLabClient(std::string host, std::string private_token, std::shared_ptr<IHttpTransport> transport = nullptr);
    ~GitLabClient() override;

    std::unique_ptr<IProject> getProject(std::int64_t project_id) override;

    const std::string& host() const;
    const std::string& privateToken() const;

private:
    std::shared_ptr<GitLabApi> api_;
};

/// Default client factory: GitLab over cpr with default timeouts
std::shared_ptr<ITrackerClient> MakeGitLabClient(const std::string& host, const std::string& private_token);

} // namespace tracker
