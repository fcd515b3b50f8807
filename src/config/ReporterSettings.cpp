#include "ReporterSettings.hpp"

#include <toml++/toml.h>

#include <cstdlib>
#include <limits>

namespace config
{

namespace
{

std::optional<ReporterSettings> FromTable(const toml::table& root, std::string& out_error)
{
    const toml::table* reporter = root["reporter"].as_table();
    if (!reporter)
    {
        out_error = "missing [reporter] table";
        return std::nullopt;
    }

    ReporterSettings settings;
    settings.enabled = (*reporter)["enabled"].value_or(true);
    settings.host = (*reporter)["host"].value_or(std::string{});
    settings.token = (*reporter)["token"].value_or(std::string{});
    settings.project_id = (*reporter)["project_id"].value_or(std::int64_t{ 0 });
    if (auto assignee = (*reporter)["assignee_id"].value<std::int64_t>())
        settings.assignee_id = *assignee;
    settings.connect_timeout_ms =
        static_cast<int>((*reporter)["connect_timeout_ms"].value_or(std::int64_t{ settings.connect_timeout_ms }));
    settings.timeout_ms = static_cast<int>((*reporter)["timeout_ms"].value_or(std::int64_t{ settings.timeout_ms }));

    if (settings.token.empty())
    {
        if (auto env_name = (*reporter)["token_env"].value<std::string>())
        {
            if (const char* env = std::getenv(env_name->c_str()))
                settings.token = env;
        }
    }

    if (const toml::table* logging = root["logging"].as_table())
    {
        LogSettings log;
        log.level = static_cast<int>((*logging)["level"].value_or(std::int64_t{ log.level }));
        log.file = (*logging)["file"].value_or(log.file);
        log.console = (*logging)["console"].value_or(log.console);
        log.append = (*logging)["append"].value_or(log.append);
        const auto max_file_size = (*logging)["max_file_size"].value_or(std::int64_t{ 10 * 1024 * 1024 });
        const auto backup_count = (*logging)["backup_count"].value_or(std::int64_t{ 3 });

        if (log.level < 0 || log.level > 6)
        {
            out_error = "logging.level must be between 0 and 6";
            return std::nullopt;
        }
        if (max_file_size < 0)
        {
            out_error = "logging.max_file_size must not be negative";
            return std::nullopt;
        }
        if (backup_count < 0 || backup_count > std::numeric_limits<int>::max())
        {
            out_error = "logging.backup_count must be between 0 and " + std::to_string(std::numeric_limits<int>::max());
            return std::nullopt;
        }
        log.max_file_size = static_cast<std::size_t>(max_file_size);
        log.backup_count = static_cast<std::size_t>(backup_count);
        settings.logging = log;
    }

    // A disabled reporter may leave the connection settings blank
    if (!settings.enabled)
        return settings;

    if (settings.host.empty())
    {
        out_error = "reporter.host is required";
        return std::nullopt;
    }
    if (settings.project_id <= 0)
    {
        out_error = "reporter.project_id must be a positive integer";
        return std::nullopt;
    }
    if (settings.token.empty())
    {
        out_error = "reporter.token (or a set reporter.token_env) is required";
        return std::nullopt;
    }
    if (settings.connect_timeout_ms <= 0 || settings.timeout_ms <= 0)
    {
        out_error = "reporter timeouts must be positive";
        return std::nullopt;
    }

    return settings;
}

} // namespace

std::optional<ReporterSettings> ParseReporterSettings(std::string_view toml_text, std::string& out_error)
{
    try
    {
        toml::table root = toml::parse(toml_text);
        return FromTable(root, out_error);
    }
    catch (const toml::parse_error& e)
    {
        out_error = std::string("TOML parse error: ") + std::string(e.description());
        return std::nullopt;
    }
}

std::optional<ReporterSettings> LoadReporterSettings(const std::string& path, std::string& out_error)
{
    try
    {
        toml::table root = toml::parse_file(path);
        return FromTable(root, out_error);
    }
    catch (const toml::parse_error& e)
    {
        out_error = path + ": " + std::string(e.description());
        return std::nullopt;
    }
}

} // namespace config
