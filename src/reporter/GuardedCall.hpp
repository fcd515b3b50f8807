#pragma once

#include "runtime/UncaughtError.hpp"
#include "tracker/TrackerErrors.hpp"

#include <plog/Log.h>

#include <exception>
#include <typeinfo>
#include <utility>

namespace reporter
{

/**
 * Runs fn and absorbs anything it throws, logging the failure with its
 * exception type and details. Returns whether fn completed.
 *
 * Used on the crash-handling path, where an escaping exception would take the
 * handler itself down.
 */
template <typename Fn>
bool RunGuarded(const char* operation, Fn&& fn)
{
    try
    {
        std::forward<Fn>(fn)();
        return true;
    }
    catch (const tracker::TrackerApiError& e)
    {
        PLOG_ERROR << operation << " failed: " << runtime::DemangleTypeName(typeid(e).name()) << ": " << e.what()
                   << " (HTTP status " << e.statusCode() << ")"
                   << (e.responseBody().empty() ? "" : " | Response: ") << e.responseBody();
    }
    catch (const std::exception& e)
    {
        PLOG_ERROR << operation << " failed: " << runtime::DemangleTypeName(typeid(e).name()) << ": " << e.what();
    }
    catch (...)
    {
        PLOG_ERROR << operation << " failed: non-standard exception of type "
                   << runtime::DescribeException(std::current_exception()).type_name;
    }
    return false;
}

} // namespace reporter
