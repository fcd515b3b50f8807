#pragma once

#include "HostRuntime.hpp"

#include <functional>
#include <string>
#include <thread>

namespace runtime
{

/**
 * Runs fn on the calling thread. An exception escaping fn is handed to the
 * runtime's thread hook together with the thread's identity and does not
 * propagate further.
 */
void RunReported(const std::string& thread_name, const std::function<void()>& fn,
                 IHostRuntime& host = ProcessRuntime::Instance());

/// Starts a std::thread whose body is wrapped by RunReported
std::thread StartReportingThread(std::string thread_name, std::function<void()> fn);

} // namespace runtime
