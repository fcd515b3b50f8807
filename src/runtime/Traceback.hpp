#pragma once

#include "UncaughtError.hpp"

#include <string>

namespace runtime
{

/**
 * Renders an error the conventional way, oldest frame first:
 *
 *   Traceback (most recent call last):
 *     File "src/app/Main.cpp", line 42, in app::run()
 *       process(job);
 *   std::runtime_error: boom
 *
 * Without a trace only the final exception line is produced.
 */
std::string FormatTraceback(const UncaughtError& error);

/// Renders only the frames block (header and frame entries); empty without a trace
std::string FormatFrames(const cpptrace::stacktrace& trace);

/// "<type_name>: <message>", or just the type name when there is no message
std::string FormatExceptionLine(const UncaughtError& error);

} // namespace runtime
