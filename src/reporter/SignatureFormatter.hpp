#pragma once

#include "runtime/UncaughtError.hpp"

#include <string>
#include <string_view>

namespace reporter
{

inline constexpr std::string_view kProvenanceFooter = "(*This issue was automatically opened by gitlab-reporter*)";

/**
 * Deduplication key of an error: "<TypeName>: <message>".
 *
 * Depends on nothing but its arguments, so the same error always yields the
 * same title across calls and across runs.
 */
std::string FormatTitle(std::string_view type_name, std::string_view message);
std::string FormatTitle(const runtime::UncaughtError& error);

/**
 * Issue body for an occurrence of error:
 *
 *   # Uncaught exception '<title>'
 *
 *   ```text
 *   <traceback>
 *   ```
 *   The error lastly occurred at: **<ISO-8601 local time>**
 *
 *   (*This issue was automatically opened by gitlab-reporter*)
 *
 * An error without a trace gets an empty fenced block.
 * Throws FormattingError if the local time cannot be determined.
 */
std::string FormatDescription(const runtime::UncaughtError& error);

/// Local time as YYYY-MM-DDTHH:MM:SS.ffffff
std::string CurrentTimestamp();

} // namespace reporter
