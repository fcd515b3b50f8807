#include "Traceback.hpp"

#include <cctype>
#include <cstdint>
#include <fstream>
#include <sstream>

namespace runtime
{

namespace
{

std::string Strip(const std::string& s)
{
    size_t l = 0;
    while (l < s.size() && std::isspace(static_cast<unsigned char>(s[l])))
        ++l;
    size_t r = s.size();
    while (r > l && std::isspace(static_cast<unsigned char>(s[r - 1])))
        --r;
    return s.substr(l, r - l);
}

// Source text of a single line, empty when the file is not readable here
std::string ReadSourceLine(const std::string& filename, std::uint32_t line_number)
{
    if (filename.empty() || line_number == 0)
        return {};

    std::ifstream in(filename);
    if (!in)
        return {};

    std::string line;
    for (std::uint32_t i = 0; i < line_number; ++i)
    {
        if (!std::getline(in, line))
            return {};
    }
    return Strip(line);
}

void AppendFrame(std::ostringstream& out, const cpptrace::stacktrace_frame& frame)
{
    std::string function = frame.symbol;
    if (function.empty())
    {
        std::ostringstream addr;
        addr << "0x" << std::hex << frame.raw_address;
        function = addr.str();
    }

    out << "  File \"" << (frame.filename.empty() ? "<unknown>" : frame.filename) << "\"";
    if (frame.line.has_value())
        out << ", line " << frame.line.value();
    out << ", in " << function << "\n";

    if (frame.line.has_value())
    {
        std::string source = ReadSourceLine(frame.filename, frame.line.value());
        if (!source.empty())
            out << "    " << source << "\n";
    }
}

} // namespace

std::string FormatFrames(const cpptrace::stacktrace& trace)
{
    if (trace.frames.empty())
        return {};

    std::ostringstream out;
    out << "Traceback (most recent call last):\n";
    // cpptrace stores the innermost frame first
    for (auto it = trace.frames.rbegin(); it != trace.frames.rend(); ++it)
    {
        AppendFrame(out, *it);
    }
    return out.str();
}

std::string FormatExceptionLine(const UncaughtError& error)
{
    if (error.message.empty())
        return error.type_name;
    return error.type_name + ": " + error.message;
}

std::string FormatTraceback(const UncaughtError& error)
{
    std::string text;
    if (error.trace)
        text = FormatFrames(*error.trace);
    text += FormatExceptionLine(error);
    text += "\n";
    return text;
}

} // namespace runtime
