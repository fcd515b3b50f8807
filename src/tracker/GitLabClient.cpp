#include "GitLabClient.hpp"
#include "TrackerErrors.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <charconv>
#include <system_error>
#include <optional>
#include <utility>

using json = nlohmann::json;

namespace tracker
{

class GitLabApi
{
public:
    GitLabApi(std::string host, std::string token, std::shared_ptr<IHttpTransport> transport)
        : host_(std::move(host))
        , token_(std::move(token))
        , transport_(std::move(transport))
    {
        while (!host_.empty() && host_.back() == '/')
            host_.pop_back();
        if (!transport_)
            transport_ = std::make_shared<CprTransport>();
    }

    const std::string& host() const { return host_; }
    const std::string& token() const { return token_; }

    std::string projectUrl(std::int64_t project_id) const
    {
        return host_ + "/api/v4/projects/" + std::to_string(project_id);
    }

    HttpResponse get(const std::string& url, const std::string& what)
    {
        auto r = transport_->get(url, headers());
        check(r, what);
        return r;
    }

    json postJson(const std::string& url, const json& body, const std::string& what)
    {
        auto r = transport_->postJson(url, body.dump(), headers());
        check(r, what);
        return parse(r, what);
    }

    json putJson(const std::string& url, const json& body, const std::string& what)
    {
        auto r = transport_->putJson(url, body.dump(), headers());
        check(r, what);
        return parse(r, what);
    }

    static json parse(const HttpResponse& r, const std::string& what)
    {
        try
        {
            return json::parse(r.text);
        }
        catch (const json::exception& e)
        {
            throw TrackerApiError(what + " returned invalid JSON: " + e.what(), r.status_code, r.text);
        }
    }

private:
    std::vector<Header> headers() const
    {
        return { { "PRIVATE-TOKEN", token_ }, { "User-Agent", "gitlab-reporter" } };
    }

    static void check(const HttpResponse& r, const std::string& what)
    {
        if (!r.error.empty())
            throw TrackerApiError(what + " failed: " + r.error);

        if (r.ok())
            return;

        const std::string message = what + " failed: HTTP " + std::to_string(r.status_code);
        if (r.status_code == 401 || r.status_code == 403)
            throw AuthError(message, r.status_code, r.text);
        if (r.status_code == 404)
            throw NotFoundError(message, r.status_code, r.text);
        throw TrackerApiError(message, r.status_code, r.text);
    }

    std::string host_;
    std::string token_;
    std::shared_ptr<IHttpTransport> transport_;
};

namespace
{

constexpr int kIssuesPerPage = 100;

struct IssueFields
{
    std::int64_t iid = 0;
    std::string title;
    std::string description;
    IssueState state = IssueState::Open;
};

IssueFields ParseIssue(const json& j)
{
    try
    {
        IssueFields fields;
        fields.iid = j.at("iid").get<std::int64_t>();
        fields.title = j.at("title").get<std::string>();
        // description is null for issues created without one
        if (j.contains("description") && j["description"].is_string())
            fields.description = j["description"].get<std::string>();
        fields.state = j.value("state", "opened") == "closed" ? IssueState::Closed : IssueState::Open;
        return fields;
    }
    catch (const json::exception& e)
    {
        throw TrackerApiError(std::string("Malformed issue in response: ") + e.what(), 0, j.dump());
    }
}

class GitLabIssue final : public IIssue
{
public:
    GitLabIssue(std::shared_ptr<GitLabApi> api, std::int64_t project_id, IssueFields fields)
        : api_(std::move(api))
        , project_id_(project_id)
        , fields_(std::move(fields))
    {
    }

    std::int64_t iid() const override { return fields_.iid; }
    const std::string& title() const override { return fields_.title; }

    const std::string& description() const override
    {
        return pending_description_ ? *pending_description_ : fields_.description;
    }

    IssueState state() const override { return pending_state_.value_or(fields_.state); }

    void setState(IssueState state) override { pending_state_ = state; }
    void setDescription(std::string description) override { pending_description_ = std::move(description); }

    void save() override
    {
        json body = json::object();
        if (pending_state_ && *pending_state_ != fields_.state)
            body["state_event"] = *pending_state_ == IssueState::Open ? "reopen" : "close";
        if (pending_description_ && *pending_description_ != fields_.description)
            body["description"] = *pending_description_;

        if (!body.empty())
        {
            const std::string url = api_->projectUrl(project_id_) + "/issues/" + std::to_string(fields_.iid);
            fields_ = ParseIssue(api_->putJson(url, body, "Update issue #" + std::to_string(fields_.iid)));
        }

        pending_state_.reset();
        pending_description_.reset();
    }

private:
    std::shared_ptr<GitLabApi> api_;
    std::int64_t project_id_;
    IssueFields fields_;
    std::optional<IssueState> pending_state_;
    std::optional<std::string> pending_description_;
};

class GitLabIssueCursor final : public IIssueCursor
{
public:
    GitLabIssueCursor(std::shared_ptr<GitLabApi> api, std::int64_t project_id)
        : api_(std::move(api))
        , project_id_(project_id)
    {
    }

    std::unique_ptr<IIssue> next() override
    {
        while (index_ >= page_.size())
        {
            if (!next_page_)
                return nullptr;
            fetchPage(*next_page_);
        }
        return std::make_unique<GitLabIssue>(api_, project_id_, ParseIssue(page_[index_++]));
    }

private:
    void fetchPage(int page)
    {
        const std::string url = api_->projectUrl(project_id_) + "/issues?per_page=" + std::to_string(kIssuesPerPage) +
                                "&page=" + std::to_string(page);
        auto r = api_->get(url, "List issues");
        json body = GitLabApi::parse(r, "List issues");
        if (!body.is_array())
            throw TrackerApiError("List issues returned a non-array body", r.status_code, r.text);

        page_ = std::move(body);
        index_ = 0;

        // An empty X-Next-Page marks the last page
        next_page_.reset();
        const std::string next = r.header("X-Next-Page");
        int value = 0;
        auto [ptr, ec] = std::from_chars(next.data(), next.data() + next.size(), value);
        if (ec == std::errc() && ptr == next.data() + next.size() && value > page)
            next_page_ = value;
    }

    std::shared_ptr<GitLabApi> api_;
    std::int64_t project_id_;
    json page_ = json::array();
    std::size_t index_ = 0;
    std::optional<int> next_page_ = 1;
};

class GitLabProject final : public IProject
{
public:
    GitLabProject(std::shared_ptr<GitLabApi> api, std::int64_t project_id)
        : api_(std::move(api))
        , project_id_(project_id)
    {
    }

    std::int64_t id() const override { return project_id_; }

    std::unique_ptr<IIssueCursor> listIssues() override
    {
        return std::make_unique<GitLabIssueCursor>(api_, project_id_);
    }

    std::unique_ptr<IIssue> createIssue(const NewIssue& issue) override
    {
        json body = { { "title", issue.title }, { "description", issue.description } };
        if (issue.assignee_id)
            body["assignee_ids"] = json::array({ *issue.assignee_id });

        json created = api_->postJson(api_->projectUrl(project_id_) + "/issues", body, "Create issue");
        return std::make_unique<GitLabIssue>(api_, project_id_, ParseIssue(created));
    }

private:
    std::shared_ptr<GitLabApi> api_;
    std::int64_t project_id_;
};

} // namespace

GitLabClient::GitLabClient(std::string host, std::string private_token, std::shared_ptr<IHttpTransport> transport)
    : api_(std::make_shared<GitLabApi>(std::move(host), std::move(private_token), std::move(transport)))
{
}

GitLabClient::~GitLabClient() = default;

std::unique_ptr<IProject> GitLabClient::getProject(std::int64_t project_id)
{
    api_->get(api_->projectUrl(project_id), "Get project " + std::to_string(project_id));
    PLOG_DEBUG << "GitLab project " << project_id << " reachable at " << api_->host();
    return std::make_unique<GitLabProject>(api_, project_id);
}

const std::string& GitLabClient::host() const { return api_->host(); }

const std::string& GitLabClient::privateToken() const { return api_->token(); }

std::shared_ptr<ITrackerClient> MakeGitLabClient(const std::string& host, const std::string& private_token)
{
    return std::make_shared<GitLabClient>(host, private_token);
}

} // namespace tracker
