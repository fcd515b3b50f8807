#pragma once

#include "config/ReporterSettings.hpp"

#include <memory>
#include <vector>

#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

/**
 * Attaches file (and optionally console) appenders to plog's default instance.
 *
 * Appenders live until process exit so records written from crash handlers
 * never reach a destroyed sink. A host application that already initialized
 * plog keeps its own appenders and severity; ours are added next to them and
 * the configured level only applies when this call creates the logger.
 */
class LogManager
{
public:
    static bool Initialize(const config::LogSettings& settings);

    static bool IsInitialized();
    static plog::Severity ToSeverity(int level);

private:
    LogManager() = default;

    static bool PrepareLogDirectory(const std::string& filepath);

    static bool s_initialized;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
