#include "HostRuntime.hpp"
#include "Traceback.hpp"

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <mutex>
#include <sstream>

namespace runtime
{

namespace
{

std::terminate_handler g_prev_terminate = nullptr;
std::mutex g_terminate_mutex;
thread_local bool t_in_terminate = false;

[[noreturn]] void ChainPreviousTerminate()
{
    if (g_prev_terminate)
        g_prev_terminate();
    std::abort();
}

[[noreturn]] void OnTerminate()
{
    // A terminate raised from inside the hook goes straight to the old handler
    if (t_in_terminate)
        ChainPreviousTerminate();
    t_in_terminate = true;

    // Other crashing threads wait here; the first report finishes before anything aborts
    std::lock_guard<std::mutex> lock(g_terminate_mutex);

    try
    {
        UncaughtError error = DescribeException(std::current_exception(), cpptrace::generate_trace(1));
        if (auto hook = ProcessRuntime::Instance().uncaughtHook())
            hook(error);
    }
    catch (const std::exception& e)
    {
        std::fprintf(stderr, "Uncaught error hook failed: %s\n", e.what());
    }
    catch (...)
    {
        std::fprintf(stderr, "Uncaught error hook failed: unknown exception\n");
    }

    ChainPreviousTerminate();
}

} // namespace

ProcessRuntime& ProcessRuntime::Instance()
{
    static ProcessRuntime instance;
    return instance;
}

ProcessRuntime::ProcessRuntime()
    : uncaught_hook_(&ProcessRuntime::DefaultUncaughtHook)
    , thread_hook_(&ProcessRuntime::DefaultThreadUncaughtHook)
{
    g_prev_terminate = std::set_terminate(OnTerminate);
}

UncaughtHook ProcessRuntime::uncaughtHook() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return uncaught_hook_;
}

void ProcessRuntime::setUncaughtHook(UncaughtHook hook)
{
    std::lock_guard<std::mutex> lock(mutex_);
    uncaught_hook_ = std::move(hook);
}

ThreadUncaughtHook ProcessRuntime::threadUncaughtHook() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return thread_hook_;
}

void ProcessRuntime::setThreadUncaughtHook(ThreadUncaughtHook hook)
{
    std::lock_guard<std::mutex> lock(mutex_);
    thread_hook_ = std::move(hook);
}

void ProcessRuntime::DefaultUncaughtHook(const UncaughtError& error)
{
    const std::string text = FormatTraceback(error);
    std::fputs(text.c_str(), stderr);
    std::fflush(stderr);
}

void ProcessRuntime::DefaultThreadUncaughtHook(const ThreadErrorArgs& args)
{
    std::ostringstream header;
    header << "Exception in thread ";
    if (args.thread_name.empty())
        header << args.thread_id;
    else
        header << args.thread_name;
    header << ":\n";

    const std::string text = header.str() + FormatTraceback(args.error);
    std::fputs(text.c_str(), stderr);
    std::fflush(stderr);
}

} // namespace runtime
