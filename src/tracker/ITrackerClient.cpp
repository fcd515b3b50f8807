#include "ITrackerClient.hpp"

namespace tracker
{

const char* IssueStateToString(IssueState state)
{
    switch (state)
    {
    case IssueState::Open:
        return "open";
    case IssueState::Closed:
        return "closed";
    default:
        return "unknown";
    }
}

} // namespace tracker
