#include "SignatureFormatter.hpp"
#include "ReporterErrors.hpp"
#include "runtime/Traceback.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace reporter
{

std::string FormatTitle(std::string_view type_name, std::string_view message)
{
    std::string title;
    title.reserve(type_name.size() + message.size() + 2);
    title.append(type_name);
    title.append(": ");
    title.append(message);
    return title;
}

std::string FormatTitle(const runtime::UncaughtError& error) { return FormatTitle(error.type_name, error.message); }

std::string CurrentTimestamp()
{
    const auto now = std::chrono::system_clock::now();
    const auto time_t_now = std::chrono::system_clock::to_time_t(now);
    const auto micros =
        std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() % 1000000;

    std::tm tm_buf{};
#ifdef _WIN32
    if (localtime_s(&tm_buf, &time_t_now) != 0)
        throw FormattingError("localtime_s failed");
#else
    if (localtime_r(&time_t_now, &tm_buf) == nullptr)
        throw FormattingError("localtime_r failed");
#endif

    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6) << std::setfill('0') << micros;
    return ss.str();
}

std::string FormatDescription(const runtime::UncaughtError& error)
{
    std::string traceback;
    if (error.trace)
        traceback = runtime::FormatTraceback(error);

    std::ostringstream out;
    out << "# Uncaught exception '" << FormatTitle(error) << "'\n\n";
    out << "```text\n";
    out << traceback;
    out << "```\n";
    out << "The error lastly occurred at: **" << CurrentTimestamp() << "**\n";
    out << "\n\n\n" << kProvenanceFooter;
    return out.str();
}

} // namespace reporter
