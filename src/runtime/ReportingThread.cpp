#include "ReportingThread.hpp"

#include <cpptrace/from_current.hpp>

#include <optional>

namespace runtime
{

void RunReported(const std::string& thread_name, const std::function<void()>& fn, IHostRuntime& host)
{
    std::optional<UncaughtError> error;

    CPPTRACE_TRY
    {
        fn();
    }
    CPPTRACE_CATCH(const std::exception& e)
    {
        error = DescribeException(e, cpptrace::from_current_exception());
    }
    catch (...)
    {
        // The throw point is only captured for std::exception
        error = DescribeException(std::current_exception());
    }

    if (!error)
        return;

    ThreadErrorArgs args{ std::move(*error), std::this_thread::get_id(), thread_name };

    auto hook = host.hasThreadHook() ? host.threadUncaughtHook() : ThreadUncaughtHook{};
    if (hook)
        hook(args);
    else
        ProcessRuntime::DefaultThreadUncaughtHook(args);
}

std::thread StartReportingThread(std::string thread_name, std::function<void()> fn)
{
    return std::thread(
        [name = std::move(thread_name), body = std::move(fn)]()
        {
            RunReported(name, body);
        });
}

} // namespace runtime
