#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace tracker
{

enum class IssueState
{
    Open,
    Closed
};

const char* IssueStateToString(IssueState state);

struct NewIssue
{
    std::string title;
    std::string description;
    std::optional<std::int64_t> assignee_id;
};

/**
 * Handle to a remote issue. Field setters only stage changes; save() sends
 * them. Handles are owned by the caller and are not cached anywhere.
 */
class IIssue
{
public:
    virtual ~IIssue() = default;

    virtual std::int64_t iid() const = 0;
    virtual const std::string& title() const = 0;
    virtual const std::string& description() const = 0;
    virtual IssueState state() const = 0;

    virtual void setState(IssueState state) = 0;
    virtual void setDescription(std::string description) = 0;
    virtual void save() = 0;
};

/// Lazy, single-pass sequence of issues. next() returns null once exhausted.
class IIssueCursor
{
public:
    virtual ~IIssueCursor() = default;
    virtual std::unique_ptr<IIssue> next() = 0;
};

class IProject
{
public:
    virtual ~IProject() = default;

    virtual std::int64_t id() const = 0;
    virtual std::unique_ptr<IIssueCursor> listIssues() = 0;
    virtual std::unique_ptr<IIssue> createIssue(const NewIssue& issue) = 0;
};

/**
 * Issue tracker capability used by the reporter.
 *
 * All operations throw tracker::TrackerApiError (or a subclass) on failure.
 */
class ITrackerClient
{
public:
    virtual ~ITrackerClient() = default;

    /// Throws NotFoundError / AuthError when the project is not reachable
    virtual std::unique_ptr<IProject> getProject(std::int64_t project_id) = 0;
};

} // namespace tracker
