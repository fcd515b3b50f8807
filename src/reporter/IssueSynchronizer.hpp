#pragma once

#include "tracker/ITrackerClient.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace reporter
{

enum class SyncAction
{
    Created,
    Reopened
};

struct SyncResult
{
    std::unique_ptr<tracker::IIssue> issue;
    SyncAction action = SyncAction::Created;
};

/**
 * Finds-or-creates the issue for an error title.
 *
 * The project's issues are scanned once, in the order the tracker returns
 * them; the first issue whose title matches byte for byte is reopened and its
 * description replaced. No match means a new issue is created. Either way
 * exactly one mutation is sent.
 *
 * Scan-then-mutate is not atomic: two processes reporting the same title at
 * the same time can both create an issue.
 */
class IssueSynchronizer
{
public:
    explicit IssueSynchronizer(tracker::ITrackerClient& client);

    /// Throws ConfigurationError when the project is unreachable, TrackerApiError otherwise
    SyncResult sync(std::int64_t project_id, const std::string& title, const std::string& description,
                    std::optional<std::int64_t> assignee_id = std::nullopt);

    static std::unique_ptr<tracker::IIssue> CreateIssue(tracker::IProject& project, const std::string& title,
                                                        const std::string& description,
                                                        std::optional<std::int64_t> assignee_id = std::nullopt);

    /// Opens the issue (whatever its state) and replaces its description
    static void ReopenIssue(tracker::IIssue& issue, const std::string& description);

private:
    std::unique_ptr<tracker::IProject> openProject(std::int64_t project_id);

    tracker::ITrackerClient& client_;
};

const char* SyncActionToString(SyncAction action);

} // namespace reporter
