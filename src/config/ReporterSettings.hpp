#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace config
{

struct LogSettings
{
    int level = 4; // plog::info
    std::string file = "logs/gitlab-reporter.log";
    bool console = false;
    bool append = true;
    std::size_t max_file_size = 10 * 1024 * 1024;
    std::size_t backup_count = 3;
};

struct ReporterSettings
{
    bool enabled = true;
    std::string host;
    std::string token;
    std::int64_t project_id = 0;
    std::optional<std::int64_t> assignee_id;
    int connect_timeout_ms = 5000;
    int timeout_ms = 15000;

    // Only present when the file has a [logging] table
    std::optional<LogSettings> logging;
};

/**
 * Parses the [reporter] and [logging] tables of a TOML document.
 *
 * The token may be given directly (token = "...") or through an environment
 * variable (token_env = "GITLAB_TOKEN"). Returns nullopt and fills out_error
 * on syntax or validation errors.
 */
std::optional<ReporterSettings> ParseReporterSettings(std::string_view toml_text, std::string& out_error);

/// Same as ParseReporterSettings, reading from a file
std::optional<ReporterSettings> LoadReporterSettings(const std::string& path, std::string& out_error);

} // namespace config
