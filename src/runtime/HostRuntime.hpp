#pragma once

#include "UncaughtError.hpp"

#include <mutex>

namespace runtime
{

/**
 * The process's two uncaught-error slots.
 *
 * Each slot holds exactly one hook. Replacing a hook is the caller's business;
 * whoever replaces one is expected to keep the previous value and chain to it.
 * A runtime that cannot observe thread deaths reports hasThreadHook() == false.
 */
class IHostRuntime
{
public:
    virtual ~IHostRuntime() = default;

    virtual UncaughtHook uncaughtHook() const = 0;
    virtual void setUncaughtHook(UncaughtHook hook) = 0;

    virtual bool hasThreadHook() const = 0;
    virtual ThreadUncaughtHook threadUncaughtHook() const = 0;
    virtual void setThreadUncaughtHook(ThreadUncaughtHook hook) = 0;
};

/**
 * Hook slots of the running process.
 *
 * The primary slot is fed by a std::terminate handler registered on first use:
 * the hook runs, then the previously registered terminate handler (normally
 * abort). The thread slot is fed by threads started with StartReportingThread.
 */
class ProcessRuntime final : public IHostRuntime
{
public:
    static ProcessRuntime& Instance();

    UncaughtHook uncaughtHook() const override;
    void setUncaughtHook(UncaughtHook hook) override;

    bool hasThreadHook() const override { return true; }
    ThreadUncaughtHook threadUncaughtHook() const override;
    void setThreadUncaughtHook(ThreadUncaughtHook hook) override;

    /// Writes the traceback to stderr
    static void DefaultUncaughtHook(const UncaughtError& error);

    /// Writes "Exception in thread <name>:" and the traceback to stderr
    static void DefaultThreadUncaughtHook(const ThreadErrorArgs& args);

    ProcessRuntime(const ProcessRuntime&) = delete;
    ProcessRuntime& operator=(const ProcessRuntime&) = delete;

private:
    ProcessRuntime();

    mutable std::mutex mutex_;
    UncaughtHook uncaught_hook_;
    ThreadUncaughtHook thread_hook_;
};

} // namespace runtime
