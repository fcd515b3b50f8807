#pragma once

#include "IssueSynchronizer.hpp"
#include "config/ReporterSettings.hpp"
#include "runtime/HostRuntime.hpp"
#include "tracker/GitLabClient.hpp"
#include "tracker/ITrackerClient.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace reporter
{

struct ReporterConfig
{
    std::shared_ptr<tracker::ITrackerClient> client;
    std::int64_t project_id = 0;
    std::optional<std::int64_t> assignee_id;
};

using ClientFactory =
    std::function<std::shared_ptr<tracker::ITrackerClient>(const std::string& host, const std::string& token)>;

/**
 * Turns uncaught errors into tracker issues.
 *
 * initialize() stores the configuration and installs the reporter's handlers
 * into both hook slots of the host runtime. The hooks found there on the first
 * install (before that, the ones present at construction) are always chained
 * to after reporting, so the process still behaves as it would without the
 * reporter. Re-initializing replaces the configuration but never the chain
 * target.
 *
 * Handlers may run concurrently from several threads. Reporting failures are
 * logged and dropped.
 *
 * Usage:
 *   reporter::Reporter::Global().initialize("https://gitlab.example.com", token, 42);
 */
class Reporter
{
public:
    explicit Reporter(runtime::IHostRuntime& host, ClientFactory client_factory = tracker::MakeGitLabClient);
    ~Reporter();

    Reporter(const Reporter&) = delete;
    Reporter& operator=(const Reporter&) = delete;

    /// Process-wide instance bound to runtime::ProcessRuntime
    static Reporter& Global();

    void initialize(const std::string& host, const std::string& token, std::int64_t project_id,
                    std::optional<std::int64_t> assignee_id = std::nullopt);
    void initialize(std::shared_ptr<tracker::ITrackerClient> client, std::int64_t project_id,
                    std::optional<std::int64_t> assignee_id = std::nullopt);
    void initialize(const config::ReporterSettings& settings);

    bool isConfigured() const;

    void handleUncaughtError(const runtime::UncaughtError& error);
    void handleUncaughtThreadError(const runtime::ThreadErrorArgs& args);

    /**
     * Reports an error through the guarded path without chaining to any hook.
     * Returns nullopt when not configured or when reporting failed.
     */
    std::optional<SyncResult> reportNow(const runtime::UncaughtError& error);

    /**
     * Formats and synchronizes one issue. Unlike the handlers this throws:
     * ConfigurationError before initialize(), tracker errors as they come.
     */
    SyncResult createOrReopenIssue(const runtime::UncaughtError& error);

    /// Titles with a report currently in flight
    std::size_t pendingTitleCount() const;

private:
    std::optional<ReporterConfig> currentConfig() const;
    void installHooks();
    std::shared_ptr<std::mutex> acquireTitleMutex(const std::string& title);
    void releaseTitleMutex(const std::string& title, std::shared_ptr<std::mutex> entry);

    runtime::IHostRuntime& host_;
    ClientFactory client_factory_;

    mutable std::mutex mutex_;
    std::optional<ReporterConfig> config_;

    bool installed_ = false;
    bool thread_hook_installed_ = false;
    runtime::UncaughtHook original_uncaught_hook_;
    runtime::ThreadUncaughtHook original_thread_hook_;

    // One entry per title being reported, removed when its last report ends
    mutable std::mutex title_mutex_;
    std::map<std::string, std::shared_ptr<std::mutex>> title_locks_;
};

/**
 * Loads settings from a TOML file, sets up logging and initializes
 * Reporter::Global(). Returns false, without throwing, when the file is
 * unusable or reporting is disabled.
 */
bool Setup(const std::string& config_path);

} // namespace reporter
