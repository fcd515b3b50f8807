#pragma once

#include <cpptrace/cpptrace.hpp>

#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <thread>

namespace runtime
{

/**
 * An error that escaped every handler and reached the runtime boundary.
 *
 * type_name is the demangled dynamic type of the thrown object and message is
 * what() for std::exception (empty for anything else). The trace is absent
 * when the throw point could not be captured.
 */
struct UncaughtError
{
    std::string type_name;
    std::string message;
    std::optional<cpptrace::stacktrace> trace;
};

/// Arguments handed to the thread hook when a secondary thread dies from an error
struct ThreadErrorArgs
{
    UncaughtError error;
    std::thread::id thread_id;
    std::string thread_name;
};

using UncaughtHook = std::function<void(const UncaughtError&)>;
using ThreadUncaughtHook = std::function<void(const ThreadErrorArgs&)>;

/// Demangles a name obtained from std::type_info::name()
std::string DemangleTypeName(const char* mangled);

UncaughtError DescribeException(const std::exception& e, std::optional<cpptrace::stacktrace> trace = std::nullopt);

/**
 * Describes the exception held by ep. A null ep describes a bare
 * std::terminate() call.
 */
UncaughtError DescribeException(std::exception_ptr ep, std::optional<cpptrace::stacktrace> trace = std::nullopt);

} // namespace runtime
