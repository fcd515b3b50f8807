#include "LogManager.hpp"

#include <filesystem>
#include <fstream>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>

namespace utils
{

bool LogManager::s_initialized = false;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(const config::LogSettings& settings)
{
    if (s_initialized)
        return true;

    if (!PrepareLogDirectory(settings.file))
        return false;

    try
    {
        if (!settings.append)
        {
            std::ofstream(settings.file, std::ios::trunc).close();
        }

        const plog::Severity level = ToSeverity(settings.level);

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            settings.file.c_str(), settings.max_file_size, static_cast<int>(settings.backup_count));

        // An existing default logger keeps its own severity; level only applies to one created here
        auto& logger = plog::init(level, file_appender.get());
        s_appenders.push_back(std::move(file_appender));

        if (settings.console)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>();
            logger.addAppender(console_appender.get());
            s_appenders.push_back(std::move(console_appender));
        }

        s_initialized = true;
        PLOG_INFO << "Logging to " << settings.file;
        return true;
    }
    catch (const std::exception& ex)
    {
        PLOG_ERROR << "Failed to set up logging to " << settings.file << ": " << ex.what();
        return false;
    }
}

bool LogManager::IsInitialized() { return s_initialized; }

plog::Severity LogManager::ToSeverity(int level)
{
    if (level < plog::none || level > plog::verbose)
        return plog::info;
    return static_cast<plog::Severity>(level);
}

bool LogManager::PrepareLogDirectory(const std::string& filepath)
{
    const std::filesystem::path dir = std::filesystem::path(filepath).parent_path();
    if (dir.empty())
        return true;

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec)
    {
        PLOG_WARNING << "Unable to prepare log directory " << dir.string() << ": " << ec.message();
        return false;
    }
    return true;
}

} // namespace utils
