#include "GuardedCall.hpp"
#include "Reporter.hpp"
#include "utils/LogManager.hpp"

#include <plog/Log.h>

namespace reporter
{

bool Setup(const std::string& config_path)
{
    std::string error;
    auto settings = config::LoadReporterSettings(config_path, error);
    if (!settings)
    {
        PLOG_ERROR << "gitlab-reporter: cannot use " << config_path << ": " << error;
        return false;
    }

    if (settings->logging && !utils::LogManager::Initialize(*settings->logging))
    {
        PLOG_WARNING << "gitlab-reporter: continuing without file logging";
    }

    if (!settings->enabled)
    {
        PLOG_INFO << "gitlab-reporter disabled by " << config_path;
        return false;
    }

    return RunGuarded("gitlab-reporter setup", [&] { Reporter::Global().initialize(*settings); });
}

} // namespace reporter
