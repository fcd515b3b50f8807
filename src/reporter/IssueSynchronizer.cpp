#include "IssueSynchronizer.hpp"
#include "ReporterErrors.hpp"
#include "tracker/TrackerErrors.hpp"

#include <plog/Log.h>

namespace reporter
{

IssueSynchronizer::IssueSynchronizer(tracker::ITrackerClient& client)
    : client_(client)
{
}

std::unique_ptr<tracker::IProject> IssueSynchronizer::openProject(std::int64_t project_id)
{
    if (project_id <= 0)
        throw ConfigurationError("Invalid project id " + std::to_string(project_id));

    try
    {
        auto project = client_.getProject(project_id);
        if (!project)
            throw ConfigurationError("Tracker returned no project for id " + std::to_string(project_id));
        return project;
    }
    catch (const tracker::NotFoundError& e)
    {
        throw ConfigurationError("Project " + std::to_string(project_id) + " not found: " + e.what());
    }
    catch (const tracker::AuthError& e)
    {
        throw ConfigurationError("Not authorized for project " + std::to_string(project_id) + ": " + e.what());
    }
}

SyncResult IssueSynchronizer::sync(std::int64_t project_id, const std::string& title, const std::string& description,
                                   std::optional<std::int64_t> assignee_id)
{
    auto project = openProject(project_id);

    auto issues = project->listIssues();
    while (auto issue = issues->next())
    {
        if (issue->title() != title)
            continue;

        PLOG_DEBUG << "Found existing issue #" << issue->iid() << " (" << tracker::IssueStateToString(issue->state())
                   << ") for '" << title << "'";
        ReopenIssue(*issue, description);
        return SyncResult{ std::move(issue), SyncAction::Reopened };
    }

    return SyncResult{ CreateIssue(*project, title, description, assignee_id), SyncAction::Created };
}

std::unique_ptr<tracker::IIssue> IssueSynchronizer::CreateIssue(tracker::IProject& project, const std::string& title,
                                                                const std::string& description,
                                                                std::optional<std::int64_t> assignee_id)
{
    tracker::NewIssue issue;
    issue.title = title;
    issue.description = description;
    issue.assignee_id = assignee_id;
    return project.createIssue(issue);
}

void IssueSynchronizer::ReopenIssue(tracker::IIssue& issue, const std::string& description)
{
    issue.setState(tracker::IssueState::Open);
    issue.setDescription(description);
    issue.save();
}

const char* SyncActionToString(SyncAction action)
{
    switch (action)
    {
    case SyncAction::Created:
        return "Created";
    case SyncAction::Reopened:
        return "Reopened";
    default:
        return "Unknown";
    }
}

} // namespace reporter
